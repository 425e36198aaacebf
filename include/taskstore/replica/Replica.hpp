#pragma once

#include <QJsonObject>
#include <QSqlDatabase>
#include <QString>
#include <QUuid>

#include <optional>
#include <vector>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/replica/TaskFields.hpp"

namespace taskstore {
namespace replica {

// Primitive the store understands. Everything richer is mapped down to these
// by OperationMapper before a commit.
struct ReplicaOperation
{
    enum class Kind
    {
        Create,
        Update,
        Delete,
        UndoPoint,
    };

    Kind kind = Kind::UndoPoint;
    QUuid uuid;
    QString property;
    // std::nullopt removes the property.
    std::optional<QString> value;

    static ReplicaOperation create(const QUuid &uuid);
    static ReplicaOperation update(const QUuid &uuid, const QString &property, std::optional<QString> value);
    static ReplicaOperation remove(const QUuid &uuid);
    static ReplicaOperation undoPoint();
};

bool operator==(const ReplicaOperation &lhs, const ReplicaOperation &rhs);

// The embedded, operation-logged task database. A Replica keeps a QtSql
// connection, so an instance must only ever be used from the thread that
// opened it.
class Replica
{
public:
    enum class AccessMode
    {
        ReadWrite,
        ReadOnly,
    };

    struct TaskRecord
    {
        QUuid uuid;
        TaskFields fields;
    };

    Replica();
    ~Replica();

    Replica(const Replica &) = delete;
    Replica &operator=(const Replica &) = delete;

    static QString databasePath(const QString &directory);

    // ReadWrite creates the directory and the schema when missing; ReadOnly
    // requires an existing store.
    bool open(const QString &directory, AccessMode mode = AccessMode::ReadWrite,
              core::StorageError *error = nullptr);
    void close();
    bool isOpen() const;
    QString directory() const;

    std::optional<TaskFields> taskFields(const QUuid &uuid, core::StorageError *error = nullptr) const;
    std::optional<std::vector<TaskRecord>> allTaskFields(core::StorageError *error = nullptr) const;

    // One SQL transaction; on failure nothing is written.
    bool commitOperations(const std::vector<ReplicaOperation> &operations,
                          core::StorageError *error = nullptr);

    bool undo(bool *undone = nullptr, core::StorageError *error = nullptr);

    std::optional<int> operationCount(core::StorageError *error = nullptr) const;

private:
    bool ensureSchema(core::StorageError *error);
    bool applyOperation(const ReplicaOperation &operation, core::StorageError *error);
    bool appendLog(const QJsonObject &entry, core::StorageError *error);
    bool revertEntry(const QJsonObject &entry, core::StorageError *error);

    std::optional<TaskFields> loadFields(const QUuid &uuid, core::StorageError *error) const;
    bool storeFields(const QUuid &uuid, const TaskFields &fields, core::StorageError *error);
    bool removeTask(const QUuid &uuid, core::StorageError *error);

    QSqlDatabase m_db;
    QString m_directory;
    AccessMode m_mode = AccessMode::ReadWrite;
};

} // namespace replica
} // namespace taskstore
