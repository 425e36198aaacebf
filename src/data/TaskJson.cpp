#include "taskstore/data/TaskJson.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QLocale>
#include <QStringList>
#include <QtGlobal>

#include <algorithm>

namespace taskstore {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

const QStringList &reservedKeys()
{
    static const QStringList keys{
        QStringLiteral("uuid"),     QStringLiteral("id"),          QStringLiteral("description"),
        QStringLiteral("status"),   QStringLiteral("entry"),       QStringLiteral("modified"),
        QStringLiteral("due"),      QStringLiteral("scheduled"),   QStringLiteral("wait"),
        QStringLiteral("end"),      QStringLiteral("start"),       QStringLiteral("priority"),
        QStringLiteral("project"),  QStringLiteral("tags"),        QStringLiteral("annotations"),
        QStringLiteral("depends"),  QStringLiteral("urgency"),     QStringLiteral("recur"),
        QStringLiteral("parent"),   QStringLiteral("mask"),        QStringLiteral("active"),
    };
    return keys;
}

void insertTimestamp(QJsonObject &json, const QString &key, const QDateTime &value)
{
    if (value.isValid()) {
        json.insert(key, formatTimestamp(value));
    }
}

QDateTime readTimestamp(const QJsonObject &json, const QString &key)
{
    const QJsonValue value = json.value(key);
    if (value.isString()) {
        return parseTimestamp(value.toString());
    }
    if (value.isDouble()) {
        return QDateTime::fromSecsSinceEpoch(static_cast<qint64>(value.toDouble()), Qt::UTC);
    }
    return QDateTime();
}

QUuid parseUuid(const QString &value)
{
    return QUuid::fromString(value.trimmed());
}
} // namespace

QString formatTimestamp(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime parseTimestamp(const QString &value, bool allowEpoch)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return QDateTime();
    }
    if (trimmed.length() == 8) {
        const QDate date = QDate::fromString(trimmed, QLatin1String(DATE_FORMAT));
        if (date.isValid()) {
            return QDateTime(date, QTime(0, 0), Qt::UTC);
        }
    }
    if (allowEpoch) {
        bool ok = false;
        const qint64 seconds = trimmed.toLongLong(&ok);
        if (ok) {
            return QDateTime::fromSecsSinceEpoch(seconds, Qt::UTC);
        }
    }
    if (trimmed.endsWith(QLatin1Char('Z')) && !trimmed.contains(QLatin1Char('-'))) {
        QDateTime dt = QDateTime::fromString(trimmed, QLatin1String(DATE_TIME_FORMAT));
        if (dt.isValid()) {
            dt.setTimeSpec(Qt::UTC);
            return dt;
        }
    }
    QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODate);
    if (!dt.isValid()) {
        return QDateTime();
    }
    if (dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeSpec(Qt::UTC);
    }
    return dt.toUTC();
}

UdaValue inferUdaValue(const QString &text)
{
    bool ok = false;
    const double number = text.trimmed().toDouble(&ok);
    if (ok && qIsFinite(number)) {
        return number;
    }
    const QDateTime date = parseTimestamp(text, false);
    if (date.isValid()) {
        return date;
    }
    return text;
}

QString udaValueToString(const UdaValue &value)
{
    if (const auto *number = std::get_if<double>(&value)) {
        return QString::number(*number, 'g', QLocale::FloatingPointShortest);
    }
    if (const auto *date = std::get_if<QDateTime>(&value)) {
        return formatTimestamp(*date);
    }
    return std::get<QString>(value);
}

QJsonValue udaValueToJson(const UdaValue &value)
{
    if (const auto *number = std::get_if<double>(&value)) {
        return *number;
    }
    return udaValueToString(value);
}

bool isReservedTaskKey(const QString &key)
{
    return reservedKeys().contains(key);
}

QJsonObject taskToJson(const Task &task)
{
    QJsonObject json;
    json.insert(QStringLiteral("uuid"), task.id.toString(QUuid::WithoutBraces));
    json.insert(QStringLiteral("description"), task.description);
    json.insert(QStringLiteral("status"), statusToString(task.status));
    insertTimestamp(json, QStringLiteral("entry"), task.entry);
    insertTimestamp(json, QStringLiteral("modified"), task.modified);
    insertTimestamp(json, QStringLiteral("due"), task.due);
    insertTimestamp(json, QStringLiteral("scheduled"), task.scheduled);
    insertTimestamp(json, QStringLiteral("wait"), task.wait);
    insertTimestamp(json, QStringLiteral("end"), task.end);
    insertTimestamp(json, QStringLiteral("start"), task.start);
    if (task.priority) {
        json.insert(QStringLiteral("priority"), priorityToString(*task.priority));
    }
    if (!task.project.isEmpty()) {
        json.insert(QStringLiteral("project"), task.project);
    }
    if (!task.tags.isEmpty()) {
        QStringList tags = task.tags.values();
        tags.sort();
        json.insert(QStringLiteral("tags"), QJsonArray::fromStringList(tags));
    }
    if (!task.annotations.isEmpty()) {
        QJsonArray annotations;
        for (const Annotation &annotation : task.annotations) {
            QJsonObject entry;
            entry.insert(QStringLiteral("entry"), formatTimestamp(annotation.entry));
            entry.insert(QStringLiteral("description"), annotation.description);
            annotations.append(entry);
        }
        json.insert(QStringLiteral("annotations"), annotations);
    }
    if (!task.depends.isEmpty()) {
        QStringList depends;
        for (const QUuid &dependency : task.depends) {
            depends << dependency.toString(QUuid::WithoutBraces);
        }
        depends.sort();
        json.insert(QStringLiteral("depends"), QJsonArray::fromStringList(depends));
    }
    json.insert(QStringLiteral("urgency"), task.urgency);
    if (!task.recur.isEmpty()) {
        json.insert(QStringLiteral("recur"), task.recur);
    }
    if (!task.parent.isNull()) {
        json.insert(QStringLiteral("parent"), task.parent.toString(QUuid::WithoutBraces));
    }
    if (!task.mask.isEmpty()) {
        json.insert(QStringLiteral("mask"), task.mask);
    }
    if (task.active) {
        json.insert(QStringLiteral("active"), true);
    }
    for (auto it = task.udas.constBegin(); it != task.udas.constEnd(); ++it) {
        if (isReservedTaskKey(it.key())) {
            continue;
        }
        json.insert(it.key(), udaValueToJson(it.value()));
    }
    return json;
}

std::optional<Task> taskFromJson(const QJsonObject &json, core::StorageError *error)
{
    const QUuid id = parseUuid(json.value(QStringLiteral("uuid")).toString());
    if (id.isNull()) {
        core::setError(error, core::StorageError::serialization(
                                  QStringLiteral("task object has no valid uuid")));
        return std::nullopt;
    }

    Task task;
    task.id = id;
    task.description = json.value(QStringLiteral("description")).toString();
    task.status = statusFromString(json.value(QStringLiteral("status")).toString());
    const QDateTime entry = readTimestamp(json, QStringLiteral("entry"));
    if (entry.isValid()) {
        task.entry = entry;
    }
    task.modified = readTimestamp(json, QStringLiteral("modified"));
    task.due = readTimestamp(json, QStringLiteral("due"));
    task.scheduled = readTimestamp(json, QStringLiteral("scheduled"));
    task.wait = readTimestamp(json, QStringLiteral("wait"));
    task.end = readTimestamp(json, QStringLiteral("end"));
    task.start = readTimestamp(json, QStringLiteral("start"));
    task.priority = priorityFromString(json.value(QStringLiteral("priority")).toString());
    task.project = json.value(QStringLiteral("project")).toString();

    const QJsonArray tags = json.value(QStringLiteral("tags")).toArray();
    for (const QJsonValue &tag : tags) {
        if (tag.isString() && !tag.toString().isEmpty()) {
            task.tags.insert(tag.toString());
        }
    }

    const QJsonArray annotations = json.value(QStringLiteral("annotations")).toArray();
    for (const QJsonValue &value : annotations) {
        const QJsonObject object = value.toObject();
        Annotation annotation;
        annotation.entry = readTimestamp(object, QStringLiteral("entry"));
        annotation.description = object.value(QStringLiteral("description")).toString();
        task.annotations.append(annotation);
    }

    const QJsonArray depends = json.value(QStringLiteral("depends")).toArray();
    for (const QJsonValue &value : depends) {
        const QUuid dependency = parseUuid(value.toString());
        if (!dependency.isNull()) {
            task.depends.insert(dependency);
        }
    }

    task.urgency = json.value(QStringLiteral("urgency")).toDouble();
    task.recur = json.value(QStringLiteral("recur")).toString();
    task.parent = parseUuid(json.value(QStringLiteral("parent")).toString());
    task.mask = json.value(QStringLiteral("mask")).toString();
    task.active = json.value(QStringLiteral("active")).toBool();

    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (isReservedTaskKey(it.key())) {
            continue;
        }
        if (it.value().isDouble()) {
            task.udas.insert(it.key(), it.value().toDouble());
        } else if (it.value().isString()) {
            const QString text = it.value().toString();
            const QDateTime date = parseTimestamp(text, false);
            task.udas.insert(it.key(), date.isValid() ? UdaValue(date) : UdaValue(text));
        }
    }
    return task;
}

QByteArray serializeTasks(const std::vector<Task> &tasks)
{
    QJsonArray array;
    for (const Task &task : tasks) {
        array.append(taskToJson(task));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

std::optional<std::vector<Task>> deserializeTasks(const QByteArray &json, core::StorageError *error)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        core::setError(error, core::StorageError::serialization(
                                  QStringLiteral("invalid task JSON at offset %1: %2")
                                      .arg(parseError.offset)
                                      .arg(parseError.errorString())));
        return std::nullopt;
    }
    if (!document.isArray()) {
        core::setError(error, core::StorageError::serialization(
                                  QStringLiteral("task JSON must be an array")));
        return std::nullopt;
    }

    std::vector<Task> tasks;
    const QJsonArray array = document.array();
    tasks.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : array) {
        auto task = taskFromJson(value.toObject(), error);
        if (!task) {
            return std::nullopt;
        }
        tasks.push_back(std::move(*task));
    }
    return tasks;
}

} // namespace data
} // namespace taskstore
