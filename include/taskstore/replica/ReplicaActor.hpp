#pragma once

#include <QString>

#include <chrono>
#include <memory>

#include "taskstore/core/StorageError.hpp"
#include "taskstore/replica/ReplicaWrapper.hpp"

namespace taskstore {
namespace replica {

struct ReplicaActorOptions
{
    // How long start() waits for the worker to open the store.
    std::chrono::milliseconds startupTimeout{5000};
    // Upper bound for a single request; zero waits indefinitely.
    std::chrono::milliseconds requestTimeout{0};
};

// ReplicaWrapper backed by a dedicated worker thread that exclusively owns
// the Replica. Calls from any thread are queued to the worker and block until
// it answers, so commits and reads are applied in one total order.
//
// Handles are cheap to clone and safe to share between threads. The worker
// stops on shutdown() or when the last handle is destroyed; every call made
// after that fails with a Disconnected error.
class ReplicaActor : public ReplicaWrapper
{
public:
    static std::unique_ptr<ReplicaActor> start(const QString &path,
                                               const ReplicaActorOptions &options = ReplicaActorOptions(),
                                               core::StorageError *error = nullptr);

    ~ReplicaActor() override;

    std::unique_ptr<ReplicaActor> clone() const;

    // Lets queued commands finish and joins the worker.
    void shutdown();

    bool open(const QString &path, core::StorageError *error = nullptr) override;
    bool commitOperations(OperationBatch operations, core::StorageError *error = nullptr) override;
    std::optional<data::Task> readTask(const QUuid &id, core::StorageError *error = nullptr) const override;
    bool undo(bool *undone = nullptr, core::StorageError *error = nullptr) override;

private:
    class Core;

    ReplicaActor(std::shared_ptr<Core> core, const ReplicaActorOptions &options);

    std::shared_ptr<Core> m_core;
    ReplicaActorOptions m_options;
};

std::unique_ptr<ReplicaWrapper> openEmbeddedReplica(const QString &path, core::StorageError *error = nullptr);
std::unique_ptr<ReplicaWrapper> openEmbeddedReplica(const QString &path, const ReplicaActorOptions &options,
                                                    core::StorageError *error = nullptr);

} // namespace replica
} // namespace taskstore
