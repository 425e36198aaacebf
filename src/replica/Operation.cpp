#include "taskstore/replica/Operation.hpp"

#include <type_traits>
#include <utility>

namespace taskstore {
namespace replica {

namespace {
template<typename T>
constexpr bool dependentFalse = false;

QString uuidText(const QUuid &uuid)
{
    return uuid.toString(QUuid::WithoutBraces);
}

QJsonObject withTarget(const QString &type, const QUuid &uuid)
{
    QJsonObject json;
    json.insert(QStringLiteral("type"), type);
    json.insert(QStringLiteral("uuid"), uuidText(uuid));
    return json;
}

std::optional<QUuid> readUuid(const QJsonObject &json, const QString &key)
{
    const QUuid uuid = QUuid::fromString(json.value(key).toString());
    if (uuid.isNull()) {
        return std::nullopt;
    }
    return uuid;
}

std::optional<QString> readString(const QJsonObject &json, const QString &key)
{
    const QJsonValue value = json.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

QJsonValue readAny(const QJsonObject &json, const QString &key)
{
    if (!json.contains(key)) {
        return QJsonValue();
    }
    return json.value(key);
}
} // namespace

bool operator==(const CreateOp &lhs, const CreateOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.data == rhs.data;
}

bool operator==(const UpdateOp &lhs, const UpdateOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.key == rhs.key && lhs.oldValue == rhs.oldValue
           && lhs.newValue == rhs.newValue;
}

bool operator==(const SetFieldOp &lhs, const SetFieldOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator==(const UnsetFieldOp &lhs, const UnsetFieldOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.key == rhs.key;
}

bool operator==(const AddTagOp &lhs, const AddTagOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.tag == rhs.tag;
}

bool operator==(const RemoveTagOp &lhs, const RemoveTagOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.tag == rhs.tag;
}

bool operator==(const AddAnnotationOp &lhs, const AddAnnotationOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.entry == rhs.entry && lhs.description == rhs.description;
}

bool operator==(const AddDependencyOp &lhs, const AddDependencyOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.dependsOn == rhs.dependsOn;
}

bool operator==(const RemoveDependencyOp &lhs, const RemoveDependencyOp &rhs)
{
    return lhs.uuid == rhs.uuid && lhs.dependsOn == rhs.dependsOn;
}

bool operator==(const DeleteOp &lhs, const DeleteOp &rhs)
{
    return lhs.uuid == rhs.uuid;
}

bool operator==(const UndoPointOp &, const UndoPointOp &)
{
    return true;
}

QUuid targetUuid(const Operation &operation)
{
    return std::visit(
        [](const auto &op) -> QUuid {
            using T = std::decay_t<decltype(op)>;
            if constexpr (std::is_same_v<T, UndoPointOp>) {
                return QUuid();
            } else {
                return op.uuid;
            }
        },
        operation);
}

QString operationName(const Operation &operation)
{
    return std::visit(
        [](const auto &op) -> QString {
            using T = std::decay_t<decltype(op)>;
            if constexpr (std::is_same_v<T, CreateOp>) {
                return QStringLiteral("create");
            } else if constexpr (std::is_same_v<T, UpdateOp>) {
                return QStringLiteral("update");
            } else if constexpr (std::is_same_v<T, SetFieldOp>) {
                return QStringLiteral("set_field");
            } else if constexpr (std::is_same_v<T, UnsetFieldOp>) {
                return QStringLiteral("unset_field");
            } else if constexpr (std::is_same_v<T, AddTagOp>) {
                return QStringLiteral("add_tag");
            } else if constexpr (std::is_same_v<T, RemoveTagOp>) {
                return QStringLiteral("remove_tag");
            } else if constexpr (std::is_same_v<T, AddAnnotationOp>) {
                return QStringLiteral("add_annotation");
            } else if constexpr (std::is_same_v<T, AddDependencyOp>) {
                return QStringLiteral("add_dependency");
            } else if constexpr (std::is_same_v<T, RemoveDependencyOp>) {
                return QStringLiteral("remove_dependency");
            } else if constexpr (std::is_same_v<T, DeleteOp>) {
                return QStringLiteral("delete");
            } else if constexpr (std::is_same_v<T, UndoPointOp>) {
                return QStringLiteral("undo_point");
            } else {
                static_assert(dependentFalse<T>, "unhandled operation type");
            }
        },
        operation);
}

bool isUndoPoint(const Operation &operation)
{
    return std::holds_alternative<UndoPointOp>(operation);
}

QJsonObject operationToJson(const Operation &operation)
{
    const QString type = operationName(operation);
    return std::visit(
        [&type](const auto &op) -> QJsonObject {
            using T = std::decay_t<decltype(op)>;
            if constexpr (std::is_same_v<T, UndoPointOp>) {
                QJsonObject json;
                json.insert(QStringLiteral("type"), type);
                return json;
            } else {
                QJsonObject json = withTarget(type, op.uuid);
                if constexpr (std::is_same_v<T, CreateOp>) {
                    json.insert(QStringLiteral("data"), op.data);
                } else if constexpr (std::is_same_v<T, UpdateOp>) {
                    json.insert(QStringLiteral("key"), op.key);
                    json.insert(QStringLiteral("old"), op.oldValue);
                    json.insert(QStringLiteral("new"), op.newValue);
                } else if constexpr (std::is_same_v<T, SetFieldOp>) {
                    json.insert(QStringLiteral("key"), op.key);
                    json.insert(QStringLiteral("value"), op.value);
                } else if constexpr (std::is_same_v<T, UnsetFieldOp>) {
                    json.insert(QStringLiteral("key"), op.key);
                } else if constexpr (std::is_same_v<T, AddTagOp> || std::is_same_v<T, RemoveTagOp>) {
                    json.insert(QStringLiteral("tag"), op.tag);
                } else if constexpr (std::is_same_v<T, AddAnnotationOp>) {
                    json.insert(QStringLiteral("entry"), op.entry.toUTC().toString(Qt::ISODateWithMs));
                    json.insert(QStringLiteral("description"), op.description);
                } else if constexpr (std::is_same_v<T, AddDependencyOp>
                                     || std::is_same_v<T, RemoveDependencyOp>) {
                    json.insert(QStringLiteral("depends_on"), uuidText(op.dependsOn));
                }
                return json;
            }
        },
        operation);
}

std::optional<Operation> operationFromJson(const QJsonObject &json)
{
    const QString type = json.value(QStringLiteral("type")).toString();
    if (type == QLatin1String("undo_point")) {
        return Operation(UndoPointOp{});
    }

    const auto uuid = readUuid(json, QStringLiteral("uuid"));
    if (!uuid) {
        return std::nullopt;
    }

    if (type == QLatin1String("create")) {
        const QJsonValue data = json.value(QStringLiteral("data"));
        if (!data.isObject()) {
            return std::nullopt;
        }
        return Operation(CreateOp{*uuid, data.toObject()});
    }
    if (type == QLatin1String("delete")) {
        return Operation(DeleteOp{*uuid});
    }
    if (type == QLatin1String("update")) {
        const auto key = readString(json, QStringLiteral("key"));
        if (!key) {
            return std::nullopt;
        }
        return Operation(UpdateOp{*uuid, *key, readAny(json, QStringLiteral("old")),
                                  readAny(json, QStringLiteral("new"))});
    }
    if (type == QLatin1String("set_field")) {
        const auto key = readString(json, QStringLiteral("key"));
        const auto value = readString(json, QStringLiteral("value"));
        if (!key || !value) {
            return std::nullopt;
        }
        return Operation(SetFieldOp{*uuid, *key, *value});
    }
    if (type == QLatin1String("unset_field")) {
        const auto key = readString(json, QStringLiteral("key"));
        if (!key) {
            return std::nullopt;
        }
        return Operation(UnsetFieldOp{*uuid, *key});
    }
    if (type == QLatin1String("add_tag") || type == QLatin1String("remove_tag")) {
        const auto tag = readString(json, QStringLiteral("tag"));
        if (!tag) {
            return std::nullopt;
        }
        if (type == QLatin1String("add_tag")) {
            return Operation(AddTagOp{*uuid, *tag});
        }
        return Operation(RemoveTagOp{*uuid, *tag});
    }
    if (type == QLatin1String("add_annotation")) {
        const auto entryText = readString(json, QStringLiteral("entry"));
        const auto description = readString(json, QStringLiteral("description"));
        if (!entryText || !description) {
            return std::nullopt;
        }
        const QDateTime entry = QDateTime::fromString(*entryText, Qt::ISODateWithMs);
        if (!entry.isValid()) {
            return std::nullopt;
        }
        return Operation(AddAnnotationOp{*uuid, entry.toUTC(), *description});
    }
    if (type == QLatin1String("add_dependency") || type == QLatin1String("remove_dependency")) {
        const auto dependsOn = readUuid(json, QStringLiteral("depends_on"));
        if (!dependsOn) {
            return std::nullopt;
        }
        if (type == QLatin1String("add_dependency")) {
            return Operation(AddDependencyOp{*uuid, *dependsOn});
        }
        return Operation(RemoveDependencyOp{*uuid, *dependsOn});
    }
    return std::nullopt;
}

QJsonArray batchToJson(const OperationBatch &batch)
{
    QJsonArray array;
    for (const Operation &operation : batch) {
        array.append(operationToJson(operation));
    }
    return array;
}

std::optional<OperationBatch> batchFromJson(const QJsonArray &json)
{
    OperationBatch batch;
    batch.reserve(static_cast<size_t>(json.size()));
    for (const QJsonValue &value : json) {
        auto operation = operationFromJson(value.toObject());
        if (!operation) {
            return std::nullopt;
        }
        batch.push_back(std::move(*operation));
    }
    return batch;
}

} // namespace replica
} // namespace taskstore
