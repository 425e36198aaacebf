#include "taskstore/replica/TaskFields.hpp"

#include "taskstore/data/TaskJson.hpp"

#include <QRegularExpression>

#include <algorithm>

namespace taskstore {
namespace replica {

namespace {
QUuid parseUuid(const QString &value)
{
    return QUuid::fromString(value.trimmed());
}

bool parseFlag(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("true") || normalized == QLatin1String("1");
}
} // namespace

QString tagKey(const QString &tag)
{
    return fields::TagPrefix + tag;
}

QString dependencyKey(const QUuid &dependency)
{
    return fields::DependencyPrefix + dependency.toString(QUuid::WithoutBraces);
}

QString annotationKey(const QDateTime &entry)
{
    return fields::AnnotationPrefix + QString::number(entry.toSecsSinceEpoch());
}

bool isFallbackKey(const QString &key)
{
    return key.startsWith(fields::TagPrefix) || key.startsWith(fields::DependencyPrefix)
           || key.startsWith(fields::AnnotationPrefix);
}

QStringList splitList(const QString &value)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return value.split(whitespace, Qt::SkipEmptyParts);
}

QString joinList(const QStringList &values)
{
    return values.join(QLatin1Char(' '));
}

QString formatAnnotationLine(const data::Annotation &annotation)
{
    QString description = annotation.description;
    description.replace(QLatin1Char('\n'), QLatin1Char(' '));
    return data::formatTimestamp(annotation.entry) + QLatin1Char(' ') + description;
}

QVector<data::Annotation> parseAnnotationLines(const QString &value)
{
    QVector<data::Annotation> annotations;
    const QStringList lines = value.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const int separator = line.indexOf(QLatin1Char(' '));
        data::Annotation annotation;
        if (separator < 0) {
            annotation.entry = data::parseTimestamp(line);
        } else {
            annotation.entry = data::parseTimestamp(line.left(separator));
            annotation.description = line.mid(separator + 1);
        }
        if (!annotation.entry.isValid()) {
            // No leading timestamp, keep the whole line as text.
            annotation.entry = QDateTime();
            annotation.description = line;
        }
        annotations.append(annotation);
    }
    return annotations;
}

data::Task taskFromFields(const QUuid &uuid, const TaskFields &fields)
{
    data::Task task;
    task.id = uuid;

    QVector<data::Annotation> fallbackAnnotations;

    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        const QString &key = it.key();
        const QString &value = it.value();

        if (key == fields::Description) {
            task.description = value;
        } else if (key == fields::Status) {
            task.status = data::statusFromString(value);
        } else if (key == fields::Entry) {
            const QDateTime entry = data::parseTimestamp(value);
            if (entry.isValid()) {
                task.entry = entry;
            }
        } else if (key == fields::Modified) {
            task.modified = data::parseTimestamp(value);
        } else if (key == fields::Due) {
            task.due = data::parseTimestamp(value);
        } else if (key == fields::Scheduled) {
            task.scheduled = data::parseTimestamp(value);
        } else if (key == fields::Wait) {
            task.wait = data::parseTimestamp(value);
        } else if (key == fields::End) {
            task.end = data::parseTimestamp(value);
        } else if (key == fields::Start) {
            task.start = data::parseTimestamp(value);
        } else if (key == fields::Priority) {
            task.priority = data::priorityFromString(value);
        } else if (key == fields::Project) {
            task.project = value;
        } else if (key == fields::Tags) {
            for (const QString &tag : splitList(value)) {
                task.tags.insert(tag);
            }
        } else if (key == fields::Depends) {
            for (const QString &text : splitList(value)) {
                const QUuid dependency = parseUuid(text);
                if (!dependency.isNull()) {
                    task.depends.insert(dependency);
                }
            }
        } else if (key == fields::Annotations) {
            task.annotations += parseAnnotationLines(value);
        } else if (key == fields::Recur) {
            task.recur = value;
        } else if (key == fields::Parent) {
            task.parent = parseUuid(value);
        } else if (key == fields::Mask) {
            task.mask = value;
        } else if (key == fields::Active) {
            task.active = parseFlag(value);
        } else if (key.startsWith(fields::TagPrefix) && key.size() > fields::TagPrefix.size()) {
            task.tags.insert(key.mid(fields::TagPrefix.size()));
        } else if (key.startsWith(fields::DependencyPrefix)
                   && !parseUuid(key.mid(fields::DependencyPrefix.size())).isNull()) {
            task.depends.insert(parseUuid(key.mid(fields::DependencyPrefix.size())));
        } else if (key.startsWith(fields::AnnotationPrefix)) {
            bool ok = false;
            const qint64 seconds = key.mid(fields::AnnotationPrefix.size()).toLongLong(&ok);
            if (ok) {
                fallbackAnnotations.append(
                    data::Annotation{QDateTime::fromSecsSinceEpoch(seconds, Qt::UTC), value});
            } else {
                task.udas.insert(key, data::inferUdaValue(value));
            }
        } else {
            task.udas.insert(key, data::inferUdaValue(value));
        }
    }

    std::stable_sort(fallbackAnnotations.begin(), fallbackAnnotations.end(),
                     [](const data::Annotation &lhs, const data::Annotation &rhs) {
                         return lhs.entry < rhs.entry;
                     });
    for (const data::Annotation &annotation : fallbackAnnotations) {
        if (!task.annotations.contains(annotation)) {
            task.annotations.append(annotation);
        }
    }
    return task;
}

} // namespace replica
} // namespace taskstore
