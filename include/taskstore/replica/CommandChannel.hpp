#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>

#include <deque>
#include <optional>
#include <utility>

namespace taskstore {
namespace replica {

// Unbounded multi-producer, single-consumer queue. Closing it rejects further
// sends; commands already queued are still handed out by receive().
template <typename T>
class CommandChannel
{
public:
    CommandChannel() = default;
    CommandChannel(const CommandChannel &) = delete;
    CommandChannel &operator=(const CommandChannel &) = delete;

    bool send(T command)
    {
        QMutexLocker locker(&m_mutex);
        if (m_closed) {
            return false;
        }
        m_queue.push_back(std::move(command));
        m_condition.wakeOne();
        return true;
    }

    // Blocks until a command is available. std::nullopt once the channel is
    // closed and drained.
    std::optional<T> receive()
    {
        QMutexLocker locker(&m_mutex);
        while (m_queue.empty() && !m_closed) {
            m_condition.wait(&m_mutex);
        }
        if (m_queue.empty()) {
            return std::nullopt;
        }
        std::optional<T> command(std::move(m_queue.front()));
        m_queue.pop_front();
        return command;
    }

    void close()
    {
        QMutexLocker locker(&m_mutex);
        m_closed = true;
        m_condition.wakeAll();
    }

    bool isClosed() const
    {
        QMutexLocker locker(&m_mutex);
        return m_closed;
    }

private:
    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    std::deque<T> m_queue;
    bool m_closed = false;
};

} // namespace replica
} // namespace taskstore
