#include "taskstore/data/Task.hpp"

#include <algorithm>
#include <utility>

namespace taskstore {
namespace data {

QDateTime currentTimestamp()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    return QDateTime::fromSecsSinceEpoch(now.toSecsSinceEpoch(), Qt::UTC);
}

bool operator==(const Annotation &lhs, const Annotation &rhs)
{
    return lhs.entry == rhs.entry && lhs.description == rhs.description;
}

bool operator!=(const Annotation &lhs, const Annotation &rhs)
{
    return !(lhs == rhs);
}

void Task::complete()
{
    status = TaskStatus::Completed;
    end = currentTimestamp();
    modified = end;
    active = false;
    start = QDateTime();
}

void Task::remove()
{
    status = TaskStatus::Deleted;
    end = currentTimestamp();
    modified = end;
    active = false;
    start = QDateTime();
}

void Task::startTracking()
{
    active = true;
    start = currentTimestamp();
    modified = start;
}

void Task::stopTracking()
{
    active = false;
    start = QDateTime();
    modified = currentTimestamp();
}

void Task::addTag(const QString &tag)
{
    tags.insert(tag);
    modified = currentTimestamp();
}

bool Task::removeTag(const QString &tag)
{
    if (!tags.remove(tag)) {
        return false;
    }
    modified = currentTimestamp();
    return true;
}

bool Task::hasTag(const QString &tag) const
{
    return tags.contains(tag);
}

void Task::addAnnotation(Annotation annotation)
{
    if (!annotation.entry.isValid()) {
        annotation.entry = currentTimestamp();
    }
    annotations.append(std::move(annotation));
    modified = currentTimestamp();
}

bool Task::removeAnnotation(const QString &description)
{
    const auto it = std::remove_if(annotations.begin(), annotations.end(),
                                   [&description](const Annotation &annotation) {
                                       return annotation.description == description;
                                   });
    if (it == annotations.end()) {
        return false;
    }
    annotations.erase(it, annotations.end());
    modified = currentTimestamp();
    return true;
}

bool Task::isOverdue() const
{
    return status == TaskStatus::Pending && due.isValid() && due < QDateTime::currentDateTimeUtc();
}

bool Task::isActive() const
{
    return active && start.isValid();
}

QString statusToString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Completed:
        return QStringLiteral("completed");
    case TaskStatus::Deleted:
        return QStringLiteral("deleted");
    case TaskStatus::Waiting:
        return QStringLiteral("waiting");
    case TaskStatus::Recurring:
        return QStringLiteral("recurring");
    case TaskStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

TaskStatus statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("completed")) {
        return TaskStatus::Completed;
    }
    if (normalized == QLatin1String("deleted")) {
        return TaskStatus::Deleted;
    }
    if (normalized == QLatin1String("waiting")) {
        return TaskStatus::Waiting;
    }
    if (normalized == QLatin1String("recurring")) {
        return TaskStatus::Recurring;
    }
    return TaskStatus::Pending;
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return QStringLiteral("H");
    case Priority::Medium:
        return QStringLiteral("M");
    case Priority::Low:
    default:
        return QStringLiteral("L");
    }
}

std::optional<Priority> priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("H")) {
        return Priority::High;
    }
    if (normalized == QLatin1String("M")) {
        return Priority::Medium;
    }
    if (normalized == QLatin1String("L")) {
        return Priority::Low;
    }
    return std::nullopt;
}

} // namespace data
} // namespace taskstore
