#pragma once

#include <QDeadlineTimer>
#include <QMutex>
#include <QWaitCondition>
#include <deque>
#include "AppConstants.h"
#include "CapturedFrame.h"

enum class OverflowPolicy {
    Block,       // producer waits for space (export)
    DropOldest   // stale frames are discarded (live preview)
};

enum class QueueStatus {
    Ok,
    Timeout,
    Closed
};

// Bounded FIFO between the producing (render) thread and one consumer
// thread. close() wakes every waiter: pushes fail from then on, pops drain
// what is left and then report Closed.
class FrameQueue {
public:
    explicit FrameQueue(int capacity = AppConstants::DefaultQueueCapacity,
                        OverflowPolicy policy = OverflowPolicy::Block)
        : m_capacity(capacity > 0 ? capacity : 1), m_policy(policy) {}

    // timeoutMs < 0 waits until space frees up or the queue is closed.
    QueueStatus push(CapturedFrame frame, int timeoutMs = -1) {
        QMutexLocker lock(&m_mutex);
        if (m_closed) return QueueStatus::Closed;

        if (m_policy == OverflowPolicy::DropOldest) {
            while (static_cast<int>(m_queue.size()) >= m_capacity) {
                m_queue.pop_front();
                ++m_dropped;
            }
        } else {
            QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                                    : QDeadlineTimer(timeoutMs);
            while (static_cast<int>(m_queue.size()) >= m_capacity && !m_closed) {
                if (!m_notFull.wait(&m_mutex, deadline))
                    return QueueStatus::Timeout;
            }
            if (m_closed) return QueueStatus::Closed;
        }

        m_queue.push_back(std::move(frame));
        m_notEmpty.wakeOne();
        return QueueStatus::Ok;
    }

    QueueStatus pop(CapturedFrame& frame, int timeoutMs = -1) {
        QMutexLocker lock(&m_mutex);
        QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                                : QDeadlineTimer(timeoutMs);
        while (m_queue.empty()) {
            if (m_closed) return QueueStatus::Closed;
            if (!m_notEmpty.wait(&m_mutex, deadline))
                return m_closed && m_queue.empty() ? QueueStatus::Closed : QueueStatus::Timeout;
        }
        frame = std::move(m_queue.front());
        m_queue.pop_front();
        m_notFull.wakeOne();
        return QueueStatus::Ok;
    }

    bool tryPop(CapturedFrame& frame) {
        QMutexLocker lock(&m_mutex);
        if (m_queue.empty()) return false;
        frame = std::move(m_queue.front());
        m_queue.pop_front();
        m_notFull.wakeOne();
        return true;
    }

    void close() {
        QMutexLocker lock(&m_mutex);
        m_closed = true;
        m_notEmpty.wakeAll();
        m_notFull.wakeAll();
    }

    void reopen() {
        QMutexLocker lock(&m_mutex);
        m_closed = false;
        m_queue.clear();
        m_dropped = 0;
    }

    void clear() {
        QMutexLocker lock(&m_mutex);
        m_queue.clear();
        m_notFull.wakeAll();
    }

    bool isClosed() const {
        QMutexLocker lock(&m_mutex);
        return m_closed;
    }

    int size() const {
        QMutexLocker lock(&m_mutex);
        return static_cast<int>(m_queue.size());
    }

    bool isEmpty() const {
        QMutexLocker lock(&m_mutex);
        return m_queue.empty();
    }

    int capacity() const { return m_capacity; }
    OverflowPolicy policy() const { return m_policy; }

    int64_t droppedCount() const {
        QMutexLocker lock(&m_mutex);
        return m_dropped;
    }

private:
    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    QWaitCondition m_notFull;
    std::deque<CapturedFrame> m_queue;
    int m_capacity;
    OverflowPolicy m_policy;
    bool m_closed = false;
    int64_t m_dropped = 0;
};
