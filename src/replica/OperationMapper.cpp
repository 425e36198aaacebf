#include "taskstore/replica/OperationMapper.hpp"

#include "taskstore/core/Logging.hpp"
#include "taskstore/data/TaskJson.hpp"

#include <QJsonArray>
#include <QLocale>
#include <QStringList>

#include <utility>
#include <variant>

namespace taskstore {
namespace replica {

using core::StorageError;

namespace {
QString uuidText(const QUuid &uuid)
{
    return uuid.toString(QUuid::WithoutBraces);
}

QString numberText(double value)
{
    return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

bool isValidTag(const QString &tag)
{
    if (tag.isEmpty()) {
        return false;
    }
    for (const QChar c : tag) {
        if (c.isSpace()) {
            return false;
        }
    }
    return true;
}

// Scalar JSON to the replica's string form. Null clears the field.
bool scalarText(const QJsonValue &value, std::optional<QString> *text)
{
    switch (value.type()) {
    case QJsonValue::String:
        *text = value.toString();
        return true;
    case QJsonValue::Double:
        *text = numberText(value.toDouble());
        return true;
    case QJsonValue::Bool:
        *text = value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
        return true;
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        *text = std::nullopt;
        return true;
    case QJsonValue::Array:
    case QJsonValue::Object:
        break;
    }
    return false;
}

std::optional<QString> stringList(const QJsonArray &array)
{
    QStringList values;
    for (const QJsonValue &value : array) {
        if (!value.isString()) {
            return std::nullopt;
        }
        values << value.toString();
    }
    return joinList(values);
}

std::optional<QString> annotationList(const QJsonArray &array)
{
    QStringList lines;
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        const QJsonObject object = value.toObject();
        data::Annotation annotation;
        annotation.entry = data::parseTimestamp(object.value(QStringLiteral("entry")).toString());
        annotation.description = object.value(QStringLiteral("description")).toString();
        lines << formatAnnotationLine(annotation);
    }
    return lines.join(QLatin1Char('\n'));
}

// Flattens a Create payload into string fields. Returns std::nullopt and
// names the offending key in `problem` for values that have no string form.
std::optional<TaskFields> fieldsFromPayload(const QJsonObject &data, QString *problem)
{
    TaskFields fields;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        const QString &key = it.key();
        const QJsonValue value = it.value();
        if (key == QLatin1String("uuid") || key == QLatin1String("id")
            || key == QLatin1String("urgency")) {
            continue;
        }
        if (isFallbackKey(key)) {
            *problem = key;
            return std::nullopt;
        }

        if (value.isArray()) {
            std::optional<QString> joined;
            if (key == fields::Tags || key == fields::Depends) {
                joined = stringList(value.toArray());
            } else if (key == fields::Annotations) {
                joined = annotationList(value.toArray());
            }
            if (!joined) {
                *problem = key;
                return std::nullopt;
            }
            if (!joined->isEmpty()) {
                fields.insert(key, *joined);
            }
            continue;
        }

        std::optional<QString> text;
        if (!scalarText(value, &text)) {
            *problem = key;
            return std::nullopt;
        }
        if (text) {
            fields.insert(key, *text);
        }
    }
    return fields;
}
} // namespace

OperationMapper::OperationMapper(SnapshotLookup lookup)
    : m_lookup(std::move(lookup))
{
}

bool OperationMapper::map(const OperationBatch &batch, std::vector<ReplicaOperation> *result,
                          StorageError *error)
{
    m_snapshots.clear();
    m_pending.clear();
    m_error = error;

    std::vector<ReplicaOperation> mapped;
    m_result = &mapped;

    bool ok = true;
    for (const Operation &operation : batch) {
        ok = std::visit([this](const auto &op) { return apply(op); }, operation);
        if (!ok) {
            break;
        }
    }

    qCDebug(lcReplica) << "Mapped" << batch.size() << "operations to" << mapped.size()
                       << "replica operations" << (ok ? "" : "(failed)");

    m_result = nullptr;
    m_error = nullptr;
    m_snapshots.clear();
    m_pending.clear();

    if (!ok) {
        return false;
    }
    if (result) {
        *result = std::move(mapped);
    }
    return true;
}

bool OperationMapper::fail(const QString &message)
{
    core::setError(m_error, StorageError::database(QStringLiteral("cannot map operation: %1").arg(message)));
    return false;
}

bool OperationMapper::resolve(const QUuid &uuid, TaskFields **snapshot)
{
    *snapshot = nullptr;
    if (uuid.isNull()) {
        return fail(QStringLiteral("operation has no task uuid"));
    }

    auto it = m_snapshots.find(uuid);
    if (it != m_snapshots.end()) {
        *snapshot = &it.value();
        return true;
    }
    if (m_pending.contains(uuid)) {
        return true;
    }

    StorageError lookupError;
    std::optional<TaskFields> fields;
    if (m_lookup) {
        fields = m_lookup(uuid, &lookupError);
    }
    if (lookupError.isValid()) {
        core::setError(m_error, lookupError.withContext(QStringLiteral("cannot load task %1").arg(uuidText(uuid))));
        return false;
    }
    if (fields) {
        it = m_snapshots.insert(uuid, std::move(*fields));
        *snapshot = &it.value();
        return true;
    }

    m_result->push_back(ReplicaOperation::create(uuid));
    m_pending.insert(uuid);
    return true;
}

void OperationMapper::write(const QUuid &uuid, TaskFields *snapshot, const QString &key,
                            std::optional<QString> value)
{
    if (snapshot) {
        if (value) {
            snapshot->insert(key, *value);
        } else {
            snapshot->remove(key);
        }
    }
    m_result->push_back(ReplicaOperation::update(uuid, key, std::move(value)));
}

bool OperationMapper::apply(const CreateOp &operation)
{
    if (operation.uuid.isNull()) {
        return fail(QStringLiteral("create has no task uuid"));
    }
    if (operation.data.isEmpty()) {
        return fail(QStringLiteral("create for %1 carries no data").arg(uuidText(operation.uuid)));
    }

    QString problem;
    std::optional<TaskFields> fields = fieldsFromPayload(operation.data, &problem);
    if (!fields) {
        if (isFallbackKey(problem)) {
            return fail(QStringLiteral("field name '%1' of %2 is reserved").arg(problem, uuidText(operation.uuid)));
        }
        return fail(QStringLiteral("field '%1' of %2 has no string form").arg(problem, uuidText(operation.uuid)));
    }

    m_result->push_back(ReplicaOperation::create(operation.uuid));
    for (auto it = fields->constBegin(); it != fields->constEnd(); ++it) {
        m_result->push_back(ReplicaOperation::update(operation.uuid, it.key(), it.value()));
    }

    // Later operations in this batch see the created fields, the lookup
    // does not until the batch is committed.
    m_pending.remove(operation.uuid);
    m_snapshots.insert(operation.uuid, std::move(*fields));
    return true;
}

bool OperationMapper::checkFieldName(const QUuid &uuid, const QString &key)
{
    if (key.isEmpty()) {
        return fail(QStringLiteral("field change on %1 has no key").arg(uuidText(uuid)));
    }
    if (isFallbackKey(key) || key == QLatin1String("uuid") || key == QLatin1String("id")
        || key == QLatin1String("urgency")) {
        return fail(QStringLiteral("field name '%1' of %2 is reserved").arg(key, uuidText(uuid)));
    }
    return true;
}

bool OperationMapper::apply(const UpdateOp &operation)
{
    if (!checkFieldName(operation.uuid, operation.key)) {
        return false;
    }
    std::optional<QString> text;
    if (!scalarText(operation.newValue, &text)) {
        return fail(QStringLiteral("value for '%1' has no string form").arg(operation.key));
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    write(operation.uuid, snapshot, operation.key, std::move(text));
    return true;
}

bool OperationMapper::apply(const SetFieldOp &operation)
{
    if (!checkFieldName(operation.uuid, operation.key)) {
        return false;
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    write(operation.uuid, snapshot, operation.key, operation.value);
    return true;
}

bool OperationMapper::apply(const UnsetFieldOp &operation)
{
    if (!checkFieldName(operation.uuid, operation.key)) {
        return false;
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    write(operation.uuid, snapshot, operation.key, std::nullopt);
    return true;
}

bool OperationMapper::apply(const AddTagOp &operation)
{
    if (!isValidTag(operation.tag)) {
        return fail(QStringLiteral("invalid tag '%1'").arg(operation.tag));
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    if (!snapshot) {
        write(operation.uuid, nullptr, tagKey(operation.tag), QStringLiteral(""));
        return true;
    }

    QStringList tags = splitList(snapshot->value(fields::Tags));
    if (tags.contains(operation.tag)) {
        return true;
    }
    tags << operation.tag;
    tags.sort();
    write(operation.uuid, snapshot, fields::Tags, joinList(tags));
    return true;
}

bool OperationMapper::apply(const RemoveTagOp &operation)
{
    if (!isValidTag(operation.tag)) {
        return fail(QStringLiteral("invalid tag '%1'").arg(operation.tag));
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    if (!snapshot) {
        write(operation.uuid, nullptr, tagKey(operation.tag), std::nullopt);
        return true;
    }

    QStringList tags = splitList(snapshot->value(fields::Tags));
    if (tags.removeAll(operation.tag) > 0) {
        write(operation.uuid, snapshot, fields::Tags,
              tags.isEmpty() ? std::nullopt : std::optional<QString>(joinList(tags)));
    }
    // A tag written through the per-item key earlier.
    if (snapshot->contains(tagKey(operation.tag))) {
        write(operation.uuid, snapshot, tagKey(operation.tag), std::nullopt);
    }
    return true;
}

bool OperationMapper::apply(const AddAnnotationOp &operation)
{
    if (!operation.entry.isValid()) {
        return fail(QStringLiteral("annotation on %1 has no timestamp").arg(uuidText(operation.uuid)));
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    if (!snapshot) {
        write(operation.uuid, nullptr, annotationKey(operation.entry), operation.description);
        return true;
    }

    // The stored line drops sub-second precision and newlines, compare in that form.
    const QString line = formatAnnotationLine(data::Annotation{operation.entry, operation.description});
    QString annotations = snapshot->value(fields::Annotations);
    if (annotations.split(QLatin1Char('\n'), Qt::SkipEmptyParts).contains(line)) {
        return true;
    }
    if (!annotations.isEmpty()) {
        annotations += QLatin1Char('\n');
    }
    annotations += line;
    write(operation.uuid, snapshot, fields::Annotations, annotations);
    return true;
}

bool OperationMapper::apply(const AddDependencyOp &operation)
{
    if (operation.dependsOn.isNull()) {
        return fail(QStringLiteral("dependency of %1 has no target").arg(uuidText(operation.uuid)));
    }
    if (operation.dependsOn == operation.uuid) {
        return fail(QStringLiteral("task %1 cannot depend on itself").arg(uuidText(operation.uuid)));
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    if (!snapshot) {
        write(operation.uuid, nullptr, dependencyKey(operation.dependsOn), QStringLiteral(""));
        return true;
    }

    QStringList depends = splitList(snapshot->value(fields::Depends));
    const QString target = uuidText(operation.dependsOn);
    if (depends.contains(target)) {
        return true;
    }
    depends << target;
    write(operation.uuid, snapshot, fields::Depends, joinList(depends));
    return true;
}

bool OperationMapper::apply(const RemoveDependencyOp &operation)
{
    if (operation.dependsOn.isNull()) {
        return fail(QStringLiteral("dependency of %1 has no target").arg(uuidText(operation.uuid)));
    }
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    if (!snapshot) {
        write(operation.uuid, nullptr, dependencyKey(operation.dependsOn), std::nullopt);
        return true;
    }

    QStringList depends = splitList(snapshot->value(fields::Depends));
    if (depends.removeAll(uuidText(operation.dependsOn)) > 0) {
        write(operation.uuid, snapshot, fields::Depends,
              depends.isEmpty() ? std::nullopt : std::optional<QString>(joinList(depends)));
    }
    if (snapshot->contains(dependencyKey(operation.dependsOn))) {
        write(operation.uuid, snapshot, dependencyKey(operation.dependsOn), std::nullopt);
    }
    return true;
}

bool OperationMapper::apply(const DeleteOp &operation)
{
    TaskFields *snapshot = nullptr;
    if (!resolve(operation.uuid, &snapshot)) {
        return false;
    }
    write(operation.uuid, snapshot, fields::Status, data::statusToString(data::TaskStatus::Deleted));
    return true;
}

bool OperationMapper::apply(const UndoPointOp &)
{
    m_result->push_back(ReplicaOperation::undoPoint());
    return true;
}

} // namespace replica
} // namespace taskstore
