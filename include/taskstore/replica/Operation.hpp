#pragma once

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QUuid>

#include <optional>
#include <variant>
#include <vector>

namespace taskstore {
namespace replica {

struct CreateOp
{
    QUuid uuid;
    QJsonObject data;
};

struct UpdateOp
{
    QUuid uuid;
    QString key;
    QJsonValue oldValue;
    QJsonValue newValue;
};

struct SetFieldOp
{
    QUuid uuid;
    QString key;
    QString value;
};

struct UnsetFieldOp
{
    QUuid uuid;
    QString key;
};

struct AddTagOp
{
    QUuid uuid;
    QString tag;
};

struct RemoveTagOp
{
    QUuid uuid;
    QString tag;
};

struct AddAnnotationOp
{
    QUuid uuid;
    QDateTime entry;
    QString description;
};

struct AddDependencyOp
{
    QUuid uuid;
    QUuid dependsOn;
};

struct RemoveDependencyOp
{
    QUuid uuid;
    QUuid dependsOn;
};

struct DeleteOp
{
    QUuid uuid;
};

struct UndoPointOp
{
};

bool operator==(const CreateOp &lhs, const CreateOp &rhs);
bool operator==(const UpdateOp &lhs, const UpdateOp &rhs);
bool operator==(const SetFieldOp &lhs, const SetFieldOp &rhs);
bool operator==(const UnsetFieldOp &lhs, const UnsetFieldOp &rhs);
bool operator==(const AddTagOp &lhs, const AddTagOp &rhs);
bool operator==(const RemoveTagOp &lhs, const RemoveTagOp &rhs);
bool operator==(const AddAnnotationOp &lhs, const AddAnnotationOp &rhs);
bool operator==(const AddDependencyOp &lhs, const AddDependencyOp &rhs);
bool operator==(const RemoveDependencyOp &lhs, const RemoveDependencyOp &rhs);
bool operator==(const DeleteOp &lhs, const DeleteOp &rhs);
bool operator==(const UndoPointOp &lhs, const UndoPointOp &rhs);

// One atomic mutation of one task. Batches of these are applied in order and
// committed as a unit.
using Operation = std::variant<CreateOp,
                               UpdateOp,
                               SetFieldOp,
                               UnsetFieldOp,
                               AddTagOp,
                               RemoveTagOp,
                               AddAnnotationOp,
                               AddDependencyOp,
                               RemoveDependencyOp,
                               DeleteOp,
                               UndoPointOp>;

using OperationBatch = std::vector<Operation>;

// Null for UndoPoint.
QUuid targetUuid(const Operation &operation);
QString operationName(const Operation &operation);
bool isUndoPoint(const Operation &operation);

QJsonObject operationToJson(const Operation &operation);
std::optional<Operation> operationFromJson(const QJsonObject &json);

QJsonArray batchToJson(const OperationBatch &batch);
std::optional<OperationBatch> batchFromJson(const QJsonArray &json);

} // namespace replica
} // namespace taskstore
