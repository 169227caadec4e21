#pragma once

#include <QMutex>
#include <memory>
#include <vector>
#include "CapturedFrame.h"

// Free-list of equally sized frame buffers. A buffer handed out by acquire()
// goes back to the list only when its last FrameBuffer reference is
// released, so a consumer never sees its bytes overwritten. Safe to release
// from any thread, and after the pool itself is gone.
class FrameBufferPool {
public:
    explicit FrameBufferPool(int maxFree = 32);
    ~FrameBufferPool();

    FrameBuffer acquire(qsizetype size);

    // Buffers currently waiting in the free-list.
    int freeCount() const;
    // Buffers allocated since construction (reuse does not count).
    int64_t allocatedCount() const;

    void clear();

private:
    struct State {
        QMutex mutex;
        std::vector<std::unique_ptr<QByteArray>> free;
        int maxFree = 0;
        int64_t allocated = 0;
        bool alive = true;
    };

    std::shared_ptr<State> m_state;
};
