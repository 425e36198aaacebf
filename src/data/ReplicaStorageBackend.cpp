#include "taskstore/data/ReplicaStorageBackend.hpp"

#include "taskstore/core/Logging.hpp"
#include "taskstore/replica/OperationBatch.hpp"
#include "taskstore/replica/Replica.hpp"
#include "taskstore/replica/TaskFields.hpp"

#include <utility>

namespace taskstore {
namespace data {

using core::StorageError;
using core::setError;

ReplicaStorageBackend::ReplicaStorageBackend(QString storePath)
    : m_storePath(std::move(storePath))
{
}

ReplicaStorageBackend::~ReplicaStorageBackend() = default;

QString ReplicaStorageBackend::storePath() const
{
    return m_storePath;
}

void ReplicaStorageBackend::setReplica(std::unique_ptr<replica::ReplicaWrapper> replica)
{
    m_replica = std::move(replica);
}

replica::ReplicaWrapper *ReplicaStorageBackend::replica() const
{
    return m_replica.get();
}

bool ReplicaStorageBackend::requireReplica(StorageError *error) const
{
    if (!m_replica) {
        setError(error, StorageError::configuration(QStringLiteral("write path not configured")));
        return false;
    }
    return true;
}

bool ReplicaStorageBackend::initialize(StorageError *error)
{
    replica::Replica store;
    StorageError openError;
    if (!store.open(m_storePath, replica::Replica::AccessMode::ReadOnly, &openError)) {
        setError(error, openError.withContext(QStringLiteral("Failed to initialize task store")));
        return false;
    }
    qCInfo(lcStorage) << "Using replica store at" << m_storePath;
    return true;
}

bool ReplicaStorageBackend::saveTask(const Task &task, StorageError *error)
{
    if (!requireReplica(error)) {
        return false;
    }

    StorageError readError;
    std::optional<Task> existing = m_replica->readTask(task.id, &readError);
    if (readError.isValid()) {
        qCWarning(lcStorage) << "Saving" << task.id << "as a new task, reading it failed:" << readError.toString();
        existing.reset();
    }

    StorageError commitError;
    if (!m_replica->commitOperations(replica::buildSaveBatch(existing, task), &commitError)) {
        setError(error, commitError.withContext(QStringLiteral("Failed to commit operations")));
        return false;
    }
    return true;
}

std::optional<Task> ReplicaStorageBackend::loadTask(const QUuid &id, StorageError *error) const
{
    replica::Replica store;
    StorageError storeError;
    if (!store.open(m_storePath, replica::Replica::AccessMode::ReadOnly, &storeError)) {
        setError(error, storeError.withContext(QStringLiteral("Failed to load task")));
        return std::nullopt;
    }
    const std::optional<replica::TaskFields> fields = store.taskFields(id, &storeError);
    if (storeError.isValid()) {
        setError(error, storeError.withContext(QStringLiteral("Failed to load task")));
        return std::nullopt;
    }
    if (!fields) {
        return std::nullopt;
    }
    return replica::taskFromFields(id, *fields);
}

bool ReplicaStorageBackend::deleteTask(const QUuid &id, StorageError *error)
{
    if (!requireReplica(error)) {
        return false;
    }
    StorageError commitError;
    if (!m_replica->commitOperations(replica::buildDeleteBatch(id), &commitError)) {
        setError(error, commitError.withContext(QStringLiteral("Failed to commit operations")));
        return false;
    }
    return true;
}

std::optional<std::vector<Task>> ReplicaStorageBackend::loadAllTasks(StorageError *error) const
{
    replica::Replica store;
    StorageError storeError;
    if (!store.open(m_storePath, replica::Replica::AccessMode::ReadOnly, &storeError)) {
        setError(error, storeError.withContext(QStringLiteral("Failed to load tasks")));
        return std::nullopt;
    }
    const auto records = store.allTaskFields(&storeError);
    if (!records) {
        setError(error, storeError.withContext(QStringLiteral("Failed to load tasks")));
        return std::nullopt;
    }

    std::vector<Task> tasks;
    tasks.reserve(records->size());
    for (const replica::Replica::TaskRecord &record : *records) {
        tasks.push_back(replica::taskFromFields(record.uuid, record.fields));
    }
    return tasks;
}

std::optional<std::vector<Task>> ReplicaStorageBackend::queryTasks(const TaskQuery &query,
                                                                   const UserContext *activeContext,
                                                                   StorageError *error) const
{
    auto tasks = loadAllTasks(error);
    if (!tasks) {
        return std::nullopt;
    }
    return applyQuery(std::move(*tasks), query, activeContext);
}

std::optional<QString> ReplicaStorageBackend::backup(StorageError *error) const
{
    setError(error, StorageError::unsupported(QStringLiteral("backup is not supported for the replica backend")));
    return std::nullopt;
}

bool ReplicaStorageBackend::restore(const QString &, StorageError *error)
{
    setError(error, StorageError::unsupported(QStringLiteral("restore is not supported for the replica backend")));
    return false;
}

bool ReplicaStorageBackend::undo(bool *undone, StorageError *error)
{
    if (undone) {
        *undone = false;
    }
    if (!requireReplica(error)) {
        return false;
    }
    StorageError undoError;
    if (!m_replica->undo(undone, &undoError)) {
        setError(error, undoError.withContext(QStringLiteral("Failed to undo")));
        return false;
    }
    return true;
}

} // namespace data
} // namespace taskstore
