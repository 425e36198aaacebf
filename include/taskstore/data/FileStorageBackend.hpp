#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QUuid>

#include "taskstore/data/StorageBackend.hpp"

namespace taskstore {
namespace data {

// Keeps every task in `<dir>/tasks.json`. Each write replaces the file
// atomically after copying the previous version into `<dir>/backups/`.
class FileStorageBackend : public StorageBackend
{
public:
    explicit FileStorageBackend(QString dataDirectory);
    ~FileStorageBackend() override = default;

    QString tasksFilePath() const;
    QString backupDirectory() const;

    bool initialize(core::StorageError *error = nullptr) override;

    bool saveTask(const Task &task, core::StorageError *error = nullptr) override;
    std::optional<Task> loadTask(const QUuid &id, core::StorageError *error = nullptr) const override;
    bool deleteTask(const QUuid &id, core::StorageError *error = nullptr) override;

    std::optional<std::vector<Task>> loadAllTasks(core::StorageError *error = nullptr) const override;
    std::optional<std::vector<Task>> queryTasks(const TaskQuery &query,
                                                const UserContext *activeContext = nullptr,
                                                core::StorageError *error = nullptr) const override;

    std::optional<QString> backup(core::StorageError *error = nullptr) const override;
    bool restore(const QString &backupData, core::StorageError *error = nullptr) override;

    bool undo(bool *undone = nullptr, core::StorageError *error = nullptr) override;

private:
    bool initializeLocked(core::StorageError *error);
    std::optional<QHash<QUuid, Task>> currentTasks(core::StorageError *error) const;
    std::optional<QHash<QUuid, Task>> readFile(core::StorageError *error) const;
    bool writeFile(const QHash<QUuid, Task> &tasks, core::StorageError *error) const;
    bool writeText(const QByteArray &contents, core::StorageError *error) const;
    bool createBackup(core::StorageError *error) const;

    QString m_dataDirectory;
    QString m_tasksFile;
    QString m_backupDirectory;

    mutable QMutex m_mutex;
    bool m_initialized = false;
    QHash<QUuid, Task> m_cache;
};

} // namespace data
} // namespace taskstore
