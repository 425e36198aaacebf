#include "taskstore/replica/OperationBatch.hpp"

#include "taskstore/data/TaskJson.hpp"
#include "taskstore/replica/TaskFields.hpp"

#include <QSet>
#include <QStringList>

#include <algorithm>
#include <iterator>

namespace taskstore {
namespace replica {

namespace {
QJsonValue optionalText(const QString &value)
{
    if (value.isEmpty()) {
        return QJsonValue(QJsonValue::Null);
    }
    return value;
}

QString uuidText(const QUuid &uuid)
{
    return uuid.isNull() ? QString() : uuid.toString(QUuid::WithoutBraces);
}

QString priorityText(const std::optional<data::Priority> &priority)
{
    return priority ? data::priorityToString(*priority) : QString();
}

// Scalar fields travel as plain strings; an empty string means "not set".
void diffField(OperationBatch &ops, const QUuid &uuid, const QString &key,
               const QString &oldValue, const QString &newValue)
{
    if (oldValue == newValue) {
        return;
    }
    if (newValue.isEmpty()) {
        ops.push_back(UnsetFieldOp{uuid, key});
    } else {
        ops.push_back(SetFieldOp{uuid, key, newValue});
    }
}

QStringList sorted(QSet<QString> values)
{
    QStringList list = values.values();
    list.sort();
    return list;
}

QList<QUuid> sorted(QSet<QUuid> values)
{
    QList<QUuid> list = values.values();
    std::sort(list.begin(), list.end());
    return list;
}
} // namespace

CreateOp createFromTask(const data::Task &task)
{
    return CreateOp{task.id, data::taskToJson(task)};
}

OperationBatch computeUpdateOps(const data::Task &old, const data::Task &updated)
{
    OperationBatch ops;
    const QUuid uuid = old.id;

    if (old.description != updated.description) {
        ops.push_back(UpdateOp{uuid, QStringLiteral("description"), old.description,
                               updated.description});
    }

    if (old.project != updated.project) {
        ops.push_back(UpdateOp{uuid, QStringLiteral("project"), optionalText(old.project),
                               optionalText(updated.project)});
    }

    if (old.tags != updated.tags) {
        for (const QString &tag : sorted(updated.tags - old.tags)) {
            ops.push_back(AddTagOp{uuid, tag});
        }
        for (const QString &tag : sorted(old.tags - updated.tags)) {
            ops.push_back(RemoveTagOp{uuid, tag});
        }
    }

    if (old.status != updated.status) {
        ops.push_back(UpdateOp{uuid, QStringLiteral("status"), data::statusToString(old.status),
                               data::statusToString(updated.status)});
    }

    if (old.depends != updated.depends) {
        for (const QUuid &dependency : sorted(updated.depends - old.depends)) {
            ops.push_back(AddDependencyOp{uuid, dependency});
        }
        for (const QUuid &dependency : sorted(old.depends - updated.depends)) {
            ops.push_back(RemoveDependencyOp{uuid, dependency});
        }
    }

    if (old.annotations != updated.annotations) {
        // Compared in stored form: whole seconds, single line.
        QSet<QString> stored;
        for (const data::Annotation &annotation : old.annotations) {
            stored.insert(formatAnnotationLine(annotation));
        }
        for (const data::Annotation &annotation : updated.annotations) {
            const QString line = formatAnnotationLine(annotation);
            if (!stored.contains(line)) {
                stored.insert(line);
                ops.push_back(AddAnnotationOp{uuid, annotation.entry, annotation.description});
            }
        }
    }

    diffField(ops, uuid, QStringLiteral("priority"), priorityText(old.priority),
              priorityText(updated.priority));
    diffField(ops, uuid, QStringLiteral("due"), data::formatTimestamp(old.due),
              data::formatTimestamp(updated.due));
    diffField(ops, uuid, QStringLiteral("scheduled"), data::formatTimestamp(old.scheduled),
              data::formatTimestamp(updated.scheduled));
    diffField(ops, uuid, QStringLiteral("wait"), data::formatTimestamp(old.wait),
              data::formatTimestamp(updated.wait));
    diffField(ops, uuid, QStringLiteral("end"), data::formatTimestamp(old.end),
              data::formatTimestamp(updated.end));
    diffField(ops, uuid, QStringLiteral("start"), data::formatTimestamp(old.start),
              data::formatTimestamp(updated.start));
    diffField(ops, uuid, QStringLiteral("modified"), data::formatTimestamp(old.modified),
              data::formatTimestamp(updated.modified));
    diffField(ops, uuid, QStringLiteral("recur"), old.recur, updated.recur);
    diffField(ops, uuid, QStringLiteral("parent"), uuidText(old.parent), uuidText(updated.parent));
    diffField(ops, uuid, QStringLiteral("mask"), old.mask, updated.mask);
    diffField(ops, uuid, QStringLiteral("active"),
              old.active ? QStringLiteral("true") : QString(),
              updated.active ? QStringLiteral("true") : QString());

    for (auto it = updated.udas.constBegin(); it != updated.udas.constEnd(); ++it) {
        if (data::isReservedTaskKey(it.key())) {
            continue;
        }
        const QString newValue = data::udaValueToString(it.value());
        const auto previous = old.udas.constFind(it.key());
        const QString oldValue = previous == old.udas.constEnd()
                                     ? QString()
                                     : data::udaValueToString(previous.value());
        diffField(ops, uuid, it.key(), oldValue, newValue);
    }
    for (auto it = old.udas.constBegin(); it != old.udas.constEnd(); ++it) {
        if (!updated.udas.contains(it.key()) && !data::isReservedTaskKey(it.key())) {
            ops.push_back(UnsetFieldOp{uuid, it.key()});
        }
    }

    return ops;
}

OperationBatch buildSaveBatch(const std::optional<data::Task> &existing, const data::Task &task)
{
    OperationBatch batch;
    batch.push_back(UndoPointOp{});
    if (!existing) {
        batch.push_back(createFromTask(task));
        return batch;
    }
    OperationBatch updates = computeUpdateOps(*existing, task);
    batch.insert(batch.end(), std::make_move_iterator(updates.begin()),
                 std::make_move_iterator(updates.end()));
    return batch;
}

OperationBatch buildDeleteBatch(const QUuid &id)
{
    return OperationBatch{UndoPointOp{}, DeleteOp{id}};
}

} // namespace replica
} // namespace taskstore
