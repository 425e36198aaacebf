#pragma once

#include <QString>

#include <memory>

#include "taskstore/data/StorageBackend.hpp"
#include "taskstore/replica/ReplicaWrapper.hpp"

namespace taskstore {
namespace data {

// Storage on top of the embedded replica. Mutations are turned into operation
// batches and committed through the injected ReplicaWrapper; reads open their
// own read-only connection to the store on the calling thread.
class ReplicaStorageBackend : public StorageBackend
{
public:
    explicit ReplicaStorageBackend(QString storePath);
    ~ReplicaStorageBackend() override;

    QString storePath() const;

    void setReplica(std::unique_ptr<replica::ReplicaWrapper> replica);
    replica::ReplicaWrapper *replica() const;

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
    bool requireReplica(core::StorageError *error) const;

    QString m_storePath;
    std::unique_ptr<replica::ReplicaWrapper> m_replica;
};

} // namespace data
} // namespace taskstore
