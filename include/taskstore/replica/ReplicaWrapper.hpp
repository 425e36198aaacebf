#pragma once

#include <QString>
#include <QUuid>

#include <optional>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/data/Task.hpp"
#include "taskstore/replica/Operation.hpp"

namespace taskstore {
namespace replica {

// What a replica-backed storage needs from the embedded store. Implemented by
// ReplicaActor; tests substitute in-memory doubles.
class ReplicaWrapper
{
public:
    virtual ~ReplicaWrapper() = default;

    // (Re)points the wrapper at the store in `path`. Calling it again with the
    // path that is already open is a no-op.
    virtual bool open(const QString &path, core::StorageError *error = nullptr) = 0;

    // Applies the whole batch or nothing.
    virtual bool commitOperations(OperationBatch operations, core::StorageError *error = nullptr) = 0;

    // std::nullopt with `error` left untouched means the task does not exist.
    virtual std::optional<data::Task> readTask(const QUuid &id, core::StorageError *error = nullptr) const = 0;

    // Reverts everything up to the most recent undo point. `undone` reports
    // whether there was anything to revert.
    virtual bool undo(bool *undone = nullptr, core::StorageError *error = nullptr) = 0;
};

} // namespace replica
} // namespace taskstore
