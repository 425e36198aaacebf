#pragma once

#include <QDateTime>
#include <QMap>
#include <QSet>
#include <QString>
#include <QUuid>
#include <QVector>

#include <optional>
#include <variant>

namespace taskstore {
namespace data {

enum class TaskStatus
{
    Pending,
    Completed,
    Deleted,
    Waiting,
    Recurring,
};

enum class Priority
{
    Low,
    Medium,
    High,
};

// Current UTC time truncated to whole seconds, the precision tasks are stored at.
QDateTime currentTimestamp();

struct Annotation
{
    QDateTime entry;
    QString description;
};

bool operator==(const Annotation &lhs, const Annotation &rhs);
bool operator!=(const Annotation &lhs, const Annotation &rhs);

using UdaValue = std::variant<QString, double, QDateTime>;

struct Task
{
    QUuid id = QUuid::createUuid();
    QString description;
    TaskStatus status = TaskStatus::Pending;
    QDateTime entry = currentTimestamp();
    QDateTime modified;
    QDateTime due;
    QDateTime scheduled;
    QDateTime wait;
    QDateTime end;
    QDateTime start;
    std::optional<Priority> priority;
    QString project;
    QSet<QString> tags;
    QVector<Annotation> annotations;
    QSet<QUuid> depends;
    double urgency = 0.0;
    QMap<QString, UdaValue> udas;
    QString recur;
    QUuid parent;
    QString mask;
    bool active = false;

    void complete();
    void remove();
    void startTracking();
    void stopTracking();

    void addTag(const QString &tag);
    bool removeTag(const QString &tag);
    bool hasTag(const QString &tag) const;

    void addAnnotation(Annotation annotation);
    bool removeAnnotation(const QString &description);

    bool isOverdue() const;
    bool isActive() const;
};

QString statusToString(TaskStatus status);
TaskStatus statusFromString(const QString &value);

QString priorityToString(Priority priority);
std::optional<Priority> priorityFromString(const QString &value);

} // namespace data
} // namespace taskstore
