#include "taskstore/replica/ReplicaActor.hpp"

#include "taskstore/core/Logging.hpp"
#include "taskstore/replica/CommandChannel.hpp"
#include "taskstore/replica/OperationMapper.hpp"
#include "taskstore/replica/Replica.hpp"
#include "taskstore/replica/TaskFields.hpp"

#include <QDir>
#include <QMutex>
#include <QMutexLocker>

#include <future>
#include <thread>
#include <utility>
#include <variant>

namespace taskstore {
namespace replica {

using core::StorageError;
using core::setError;

namespace {

struct CommitCommand
{
    using Reply = StorageError;
    OperationBatch operations;
    std::promise<Reply> reply;
};

struct OpenCommand
{
    using Reply = StorageError;
    QString path;
    std::promise<Reply> reply;
};

struct ReadTaskReply
{
    std::optional<data::Task> task;
    StorageError error;
};

struct ReadTaskCommand
{
    using Reply = ReadTaskReply;
    QUuid uuid;
    std::promise<Reply> reply;
};

struct UndoReply
{
    bool undone = false;
    StorageError error;
};

struct UndoCommand
{
    using Reply = UndoReply;
    std::promise<Reply> reply;
};

using Command = std::variant<CommitCommand, OpenCommand, ReadTaskCommand, UndoCommand>;
using Channel = CommandChannel<Command>;

StorageError disconnectedError()
{
    return StorageError::disconnected(QStringLiteral("replica worker is no longer running"));
}

StorageError notOpenError()
{
    return StorageError::database(QStringLiteral("replica is not open"));
}

bool samePath(const QString &lhs, const QString &rhs)
{
    return QDir::cleanPath(QDir(lhs).absolutePath()) == QDir::cleanPath(QDir(rhs).absolutePath());
}

// Owns the Replica for the lifetime of the worker thread. Constructed on that
// thread so the SQL connection never leaves it.
class Worker
{
public:
    explicit Worker(std::shared_ptr<Channel> channel)
        : m_channel(std::move(channel))
        , m_mapper([this](const QUuid &uuid, StorageError *error) {
            return m_replica.taskFields(uuid, error);
        })
    {
    }

    void run(const QString &path, std::promise<StorageError> started)
    {
        StorageError openError;
        if (!m_replica.open(path, Replica::AccessMode::ReadWrite, &openError)) {
            qCWarning(lcActor) << "Replica worker failed to start:" << openError.toString();
            m_channel->close();
            started.set_value(openError);
            return;
        }
        started.set_value(StorageError());
        qCInfo(lcActor) << "Replica worker started for" << path;

        while (std::optional<Command> command = m_channel->receive()) {
            std::visit([this](auto &cmd) { handle(cmd); }, *command);
        }

        m_replica.close();
        qCInfo(lcActor) << "Replica worker stopped";
    }

private:
    void handle(CommitCommand &command)
    {
        qCDebug(lcActor) << "Commit of" << command.operations.size() << "operations";
        StorageError error;
        if (!m_replica.isOpen()) {
            error = notOpenError();
        } else {
            std::vector<ReplicaOperation> mapped;
            if (m_mapper.map(command.operations, &mapped, &error)
                && m_replica.commitOperations(mapped, &error)) {
                qCDebug(lcActor) << "Commit applied" << mapped.size() << "replica operations";
            }
        }
        command.reply.set_value(error);
    }

    void handle(OpenCommand &command)
    {
        qCDebug(lcActor) << "Open" << command.path;
        StorageError error;
        if (m_replica.isOpen() && samePath(m_replica.directory(), command.path)) {
            command.reply.set_value(error);
            return;
        }
        m_replica.close();
        if (!m_replica.open(command.path, Replica::AccessMode::ReadWrite, &error)) {
            qCWarning(lcActor) << "Reopen failed:" << error.toString();
        }
        command.reply.set_value(error);
    }

    void handle(ReadTaskCommand &command)
    {
        qCDebug(lcActor) << "Read" << command.uuid;
        ReadTaskReply reply;
        if (!m_replica.isOpen()) {
            reply.error = notOpenError();
        } else {
            const std::optional<TaskFields> fields = m_replica.taskFields(command.uuid, &reply.error);
            if (fields) {
                reply.task = taskFromFields(command.uuid, *fields);
            }
        }
        command.reply.set_value(std::move(reply));
    }

    void handle(UndoCommand &command)
    {
        qCDebug(lcActor) << "Undo";
        UndoReply reply;
        if (!m_replica.isOpen()) {
            reply.error = notOpenError();
        } else if (!m_replica.undo(&reply.undone, &reply.error)) {
            reply.undone = false;
        }
        command.reply.set_value(std::move(reply));
    }

    std::shared_ptr<Channel> m_channel;
    Replica m_replica;
    OperationMapper m_mapper;
};

void runWorker(std::shared_ptr<Channel> channel, QString path, std::promise<StorageError> started)
{
    Worker worker(std::move(channel));
    worker.run(path, std::move(started));
}

// Sends `command` and blocks for its reply.
template <typename CommandType>
std::optional<typename CommandType::Reply> request(Channel &channel, CommandType command,
                                                   std::chrono::milliseconds timeout, StorageError *error)
{
    std::future<typename CommandType::Reply> future = command.reply.get_future();
    if (!channel.send(std::move(command))) {
        setError(error, disconnectedError());
        return std::nullopt;
    }
    if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
        setError(error, StorageError::timeout(
                            QStringLiteral("replica did not answer within %1 ms").arg(timeout.count())));
        return std::nullopt;
    }
    try {
        return future.get();
    } catch (const std::future_error &e) {
        qCWarning(lcActor) << "Reply dropped:" << e.what();
        setError(error, disconnectedError());
        return std::nullopt;
    }
}

} // namespace

class ReplicaActor::Core
{
public:
    Core()
        : m_channel(std::make_shared<Channel>())
    {
    }

    ~Core()
    {
        stop();
    }

    Channel &channel()
    {
        return *m_channel;
    }

    void launch(const QString &path, std::promise<StorageError> started)
    {
        m_worker = std::thread(runWorker, m_channel, path, std::move(started));
    }

    void stop()
    {
        QMutexLocker locker(&m_stopMutex);
        m_channel->close();
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

    // For a worker that never answered the startup handshake.
    void abandon()
    {
        QMutexLocker locker(&m_stopMutex);
        m_channel->close();
        if (m_worker.joinable()) {
            m_worker.detach();
        }
    }

private:
    std::shared_ptr<Channel> m_channel;
    std::thread m_worker;
    QMutex m_stopMutex;
};

std::unique_ptr<ReplicaActor> ReplicaActor::start(const QString &path, const ReplicaActorOptions &options,
                                                  StorageError *error)
{
    auto core = std::make_shared<Core>();
    std::promise<StorageError> started;
    std::future<StorageError> handshake = started.get_future();
    core->launch(path, std::move(started));

    if (options.startupTimeout.count() > 0
        && handshake.wait_for(options.startupTimeout) != std::future_status::ready) {
        qCWarning(lcActor) << "Replica worker for" << path << "did not start in time";
        core->abandon();
        setError(error, StorageError::timeout(QStringLiteral("replica at %1 did not start within %2 ms")
                                                  .arg(path)
                                                  .arg(options.startupTimeout.count())));
        return nullptr;
    }

    StorageError startupError;
    try {
        startupError = handshake.get();
    } catch (const std::future_error &e) {
        qCWarning(lcActor) << "Startup handshake dropped:" << e.what();
        startupError = disconnectedError();
    }
    if (startupError.isValid()) {
        setError(error, startupError.withContext(QStringLiteral("cannot open replica at %1").arg(path)));
        return nullptr;
    }

    return std::unique_ptr<ReplicaActor>(new ReplicaActor(std::move(core), options));
}

ReplicaActor::ReplicaActor(std::shared_ptr<Core> core, const ReplicaActorOptions &options)
    : m_core(std::move(core))
    , m_options(options)
{
}

ReplicaActor::~ReplicaActor() = default;

std::unique_ptr<ReplicaActor> ReplicaActor::clone() const
{
    return std::unique_ptr<ReplicaActor>(new ReplicaActor(m_core, m_options));
}

void ReplicaActor::shutdown()
{
    m_core->stop();
}

bool ReplicaActor::open(const QString &path, StorageError *error)
{
    const auto reply = request(m_core->channel(), OpenCommand{path, {}}, m_options.requestTimeout, error);
    if (!reply) {
        return false;
    }
    if (reply->isValid()) {
        setError(error, *reply);
        return false;
    }
    return true;
}

bool ReplicaActor::commitOperations(OperationBatch operations, StorageError *error)
{
    const auto reply = request(m_core->channel(), CommitCommand{std::move(operations), {}},
                               m_options.requestTimeout, error);
    if (!reply) {
        return false;
    }
    if (reply->isValid()) {
        setError(error, *reply);
        return false;
    }
    return true;
}

std::optional<data::Task> ReplicaActor::readTask(const QUuid &id, StorageError *error) const
{
    auto reply = request(m_core->channel(), ReadTaskCommand{id, {}}, m_options.requestTimeout, error);
    if (!reply) {
        return std::nullopt;
    }
    if (reply->error.isValid()) {
        setError(error, reply->error);
        return std::nullopt;
    }
    return std::move(reply->task);
}

bool ReplicaActor::undo(bool *undone, StorageError *error)
{
    if (undone) {
        *undone = false;
    }
    const auto reply = request(m_core->channel(), UndoCommand{{}}, m_options.requestTimeout, error);
    if (!reply) {
        return false;
    }
    if (reply->error.isValid()) {
        setError(error, reply->error);
        return false;
    }
    if (undone) {
        *undone = reply->undone;
    }
    return true;
}

std::unique_ptr<ReplicaWrapper> openEmbeddedReplica(const QString &path, StorageError *error)
{
    return openEmbeddedReplica(path, ReplicaActorOptions(), error);
}

std::unique_ptr<ReplicaWrapper> openEmbeddedReplica(const QString &path, const ReplicaActorOptions &options,
                                                    StorageError *error)
{
    return ReplicaActor::start(path, options, error);
}

} // namespace replica
} // namespace taskstore
