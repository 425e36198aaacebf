#pragma once

#include <QString>
#include <QUuid>

#include <optional>
#include <vector>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/data/Task.hpp"
#include "taskstore/data/TaskQuery.hpp"

namespace taskstore {
namespace data {

class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    virtual bool initialize(core::StorageError *error = nullptr) = 0;

    virtual bool saveTask(const Task &task, core::StorageError *error = nullptr) = 0;
    // std::nullopt with `error` left untouched means there is no such task.
    virtual std::optional<Task> loadTask(const QUuid &id, core::StorageError *error = nullptr) const = 0;
    virtual bool deleteTask(const QUuid &id, core::StorageError *error = nullptr) = 0;

    virtual std::optional<std::vector<Task>> loadAllTasks(core::StorageError *error = nullptr) const = 0;
    virtual std::optional<std::vector<Task>> queryTasks(const TaskQuery &query,
                                                        const UserContext *activeContext = nullptr,
                                                        core::StorageError *error = nullptr) const = 0;

    virtual std::optional<QString> backup(core::StorageError *error = nullptr) const = 0;
    virtual bool restore(const QString &backupData, core::StorageError *error = nullptr) = 0;

    virtual bool undo(bool *undone = nullptr, core::StorageError *error = nullptr) = 0;
};

} // namespace data
} // namespace taskstore
