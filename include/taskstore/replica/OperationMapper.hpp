#pragma once

#include <QHash>
#include <QSet>
#include <QUuid>

#include <functional>
#include <optional>
#include <vector>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/replica/Operation.hpp"
#include "taskstore/replica/Replica.hpp"
#include "taskstore/replica/TaskFields.hpp"

namespace taskstore {
namespace replica {

// Translates an OperationBatch into the replica's primitive operations.
//
// Tag, dependency and annotation operations go through one of two branches:
// when a snapshot of the task can be read from the store or was created
// earlier in the same batch, the structured `tags`, `depends` and
// `annotations` fields are rewritten; when it cannot (the task is unknown
// and only implicitly created here), raw per-item keys `tag_<name>`,
// `dep_<uuid>` and `annotation_<unix_ts>` are written instead.
class OperationMapper
{
public:
    using SnapshotLookup = std::function<std::optional<TaskFields>(const QUuid &, core::StorageError *)>;

    explicit OperationMapper(SnapshotLookup lookup);

    bool map(const OperationBatch &batch, std::vector<ReplicaOperation> *result,
             core::StorageError *error = nullptr);

private:
    bool apply(const CreateOp &operation);
    bool apply(const UpdateOp &operation);
    bool apply(const SetFieldOp &operation);
    bool apply(const UnsetFieldOp &operation);
    bool apply(const AddTagOp &operation);
    bool apply(const RemoveTagOp &operation);
    bool apply(const AddAnnotationOp &operation);
    bool apply(const AddDependencyOp &operation);
    bool apply(const RemoveDependencyOp &operation);
    bool apply(const DeleteOp &operation);
    bool apply(const UndoPointOp &operation);

    bool checkFieldName(const QUuid &uuid, const QString &key);

    // Points `snapshot` at the live field map of `uuid`, or at nullptr when the
    // task only exists within this batch. Emits a native Create the first time
    // an unseen task is written.
    bool resolve(const QUuid &uuid, TaskFields **snapshot);

    void write(const QUuid &uuid, TaskFields *snapshot, const QString &key, std::optional<QString> value);
    bool fail(const QString &message);

    SnapshotLookup m_lookup;

    // Per-batch state.
    QHash<QUuid, TaskFields> m_snapshots;
    QSet<QUuid> m_pending;
    std::vector<ReplicaOperation> *m_result = nullptr;
    core::StorageError *m_error = nullptr;
};

} // namespace replica
} // namespace taskstore
