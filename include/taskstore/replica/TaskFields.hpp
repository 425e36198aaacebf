#pragma once

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVector>

#include "taskstore/data/Task.hpp"

namespace taskstore {
namespace replica {

// Raw string field map of one task as the replica stores it.
using TaskFields = QMap<QString, QString>;

namespace fields {
inline const QString Description = QStringLiteral("description");
inline const QString Status = QStringLiteral("status");
inline const QString Entry = QStringLiteral("entry");
inline const QString Modified = QStringLiteral("modified");
inline const QString Due = QStringLiteral("due");
inline const QString Scheduled = QStringLiteral("scheduled");
inline const QString Wait = QStringLiteral("wait");
inline const QString End = QStringLiteral("end");
inline const QString Start = QStringLiteral("start");
inline const QString Priority = QStringLiteral("priority");
inline const QString Project = QStringLiteral("project");
inline const QString Tags = QStringLiteral("tags");
inline const QString Depends = QStringLiteral("depends");
inline const QString Annotations = QStringLiteral("annotations");
inline const QString Recur = QStringLiteral("recur");
inline const QString Parent = QStringLiteral("parent");
inline const QString Mask = QStringLiteral("mask");
inline const QString Active = QStringLiteral("active");

// Per-item keys written when no snapshot of the task is available.
inline const QString TagPrefix = QStringLiteral("tag_");
inline const QString DependencyPrefix = QStringLiteral("dep_");
inline const QString AnnotationPrefix = QStringLiteral("annotation_");
} // namespace fields

QString tagKey(const QString &tag);
QString dependencyKey(const QUuid &dependency);
QString annotationKey(const QDateTime &entry);
// True for names starting with one of the per-item prefixes. Such names are
// reserved and cannot be used for user-defined attributes.
bool isFallbackKey(const QString &key);

QStringList splitList(const QString &value);
QString joinList(const QStringList &values);

QString formatAnnotationLine(const data::Annotation &annotation);
QVector<data::Annotation> parseAnnotationLines(const QString &value);

// Rebuilds a task from its field map. Known keys are parsed, per-item
// fallback keys are folded into tags/depends/annotations and every remaining
// key becomes a user-defined attribute.
data::Task taskFromFields(const QUuid &uuid, const TaskFields &fields);

} // namespace replica
} // namespace taskstore
