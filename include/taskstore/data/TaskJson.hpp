#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <vector>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/data/Task.hpp"

namespace taskstore {
namespace data {

// Compact UTC form used by Taskwarrior exports, e.g. 20240131T081500Z.
QString formatTimestamp(const QDateTime &dt);

// Accepts the compact form, ISO 8601 and, when allowEpoch is set, integral
// seconds since the epoch. Returns an invalid QDateTime when nothing matches.
QDateTime parseTimestamp(const QString &value, bool allowEpoch = true);

// Typed reading of an untyped user-defined attribute: number, then
// date/time, then plain string.
UdaValue inferUdaValue(const QString &text);
QString udaValueToString(const UdaValue &value);
QJsonValue udaValueToJson(const UdaValue &value);

bool isReservedTaskKey(const QString &key);

QJsonObject taskToJson(const Task &task);
std::optional<Task> taskFromJson(const QJsonObject &json, core::StorageError *error = nullptr);

QByteArray serializeTasks(const std::vector<Task> &tasks);
std::optional<std::vector<Task>> deserializeTasks(const QByteArray &json, core::StorageError *error = nullptr);

} // namespace data
} // namespace taskstore
