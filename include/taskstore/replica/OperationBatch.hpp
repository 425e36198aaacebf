#pragma once

#include <optional>

#include "taskstore/data/Task.hpp"
#include "taskstore/replica/Operation.hpp"

namespace taskstore {
namespace replica {

// Builds operation batches from task snapshots. Everything here is pure and
// never touches a replica.

CreateOp createFromTask(const data::Task &task);

// Minimal operations turning `old` into `updated`. Annotation removals are not
// represented; annotations are treated as append-only.
OperationBatch computeUpdateOps(const data::Task &old, const data::Task &updated);

// [UndoPoint, Create] for a new task, [UndoPoint, <update ops>...] otherwise.
OperationBatch buildSaveBatch(const std::optional<data::Task> &existing, const data::Task &task);

OperationBatch buildDeleteBatch(const QUuid &id);

} // namespace replica
} // namespace taskstore
