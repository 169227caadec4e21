#include "FrameBufferPool.h"

FrameBufferPool::FrameBufferPool(int maxFree)
    : m_state(std::make_shared<State>())
{
    m_state->maxFree = maxFree;
}

FrameBufferPool::~FrameBufferPool() {
    QMutexLocker lock(&m_state->mutex);
    m_state->alive = false;
    m_state->free.clear();
}

FrameBuffer FrameBufferPool::acquire(qsizetype size) {
    std::unique_ptr<QByteArray> bytes;
    {
        QMutexLocker lock(&m_state->mutex);
        while (!m_state->free.empty()) {
            std::unique_ptr<QByteArray> candidate = std::move(m_state->free.back());
            m_state->free.pop_back();
            if (candidate->size() == size) {
                bytes = std::move(candidate);
                break;
            }
        }
        if (!bytes) ++m_state->allocated;
    }

    if (!bytes) bytes = std::make_unique<QByteArray>(size, Qt::Uninitialized);

    std::weak_ptr<State> weak = m_state;
    return FrameBuffer(bytes.release(), [weak](QByteArray* released) {
        std::unique_ptr<QByteArray> owned(released);
        if (auto state = weak.lock()) {
            QMutexLocker lock(&state->mutex);
            if (state->alive && static_cast<int>(state->free.size()) < state->maxFree)
                state->free.push_back(std::move(owned));
        }
    });
}

int FrameBufferPool::freeCount() const {
    QMutexLocker lock(&m_state->mutex);
    return static_cast<int>(m_state->free.size());
}

int64_t FrameBufferPool::allocatedCount() const {
    QMutexLocker lock(&m_state->mutex);
    return m_state->allocated;
}

void FrameBufferPool::clear() {
    QMutexLocker lock(&m_state->mutex);
    m_state->free.clear();
}
