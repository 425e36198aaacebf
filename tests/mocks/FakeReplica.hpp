#pragma once

#include <QHash>
#include <QUuid>

#include <optional>
#include <vector>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/data/Task.hpp"
#include "taskstore/replica/Operation.hpp"
#include "taskstore/replica/ReplicaWrapper.hpp"

namespace taskstore {
namespace tests {

// In-memory ReplicaWrapper that records every committed batch. Tasks are
// stored as whole snapshots, so only the operations the storage backend
// emits are interpreted.
class FakeReplica : public replica::ReplicaWrapper
{
public:
    bool open(const QString &path, core::StorageError *error = nullptr) override
    {
        Q_UNUSED(error);
        openedPath = path;
        return true;
    }

    bool commitOperations(replica::OperationBatch operations, core::StorageError *error = nullptr) override
    {
        if (commitError.isValid()) {
            core::setError(error, commitError);
            return false;
        }
        QHash<QUuid, data::Task> next = tasks;
        for (const replica::Operation &operation : operations) {
            apply(next, operation);
        }
        tasks = next;
        commits.push_back(std::move(operations));
        return true;
    }

    std::optional<data::Task> readTask(const QUuid &id, core::StorageError *error = nullptr) const override
    {
        ++reads;
        if (readError.isValid()) {
            core::setError(error, readError);
            return std::nullopt;
        }
        const auto it = tasks.constFind(id);
        if (it == tasks.constEnd()) {
            return std::nullopt;
        }
        return it.value();
    }

    bool undo(bool *undone = nullptr, core::StorageError *error = nullptr) override
    {
        Q_UNUSED(error);
        if (undone) {
            *undone = !commits.empty();
        }
        ++undoCalls;
        return true;
    }

    QString openedPath;
    core::StorageError commitError;
    core::StorageError readError;

    QHash<QUuid, data::Task> tasks;
    std::vector<replica::OperationBatch> commits;
    mutable int reads = 0;
    int undoCalls = 0;

private:
    static void apply(QHash<QUuid, data::Task> &tasks, const replica::Operation &operation)
    {
        if (const auto *create = std::get_if<replica::CreateOp>(&operation)) {
            data::Task task;
            task.id = create->uuid;
            task.description = create->data.value(QStringLiteral("description")).toString();
            tasks.insert(create->uuid, task);
        } else if (const auto *addTag = std::get_if<replica::AddTagOp>(&operation)) {
            tasks[addTag->uuid].tags.insert(addTag->tag);
        } else if (const auto *removeTag = std::get_if<replica::RemoveTagOp>(&operation)) {
            tasks[removeTag->uuid].tags.remove(removeTag->tag);
        } else if (const auto *remove = std::get_if<replica::DeleteOp>(&operation)) {
            tasks[remove->uuid].status = data::TaskStatus::Deleted;
        }
    }
};

} // namespace tests
} // namespace taskstore
