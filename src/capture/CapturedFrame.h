#pragma once

#include <QByteArray>
#include <cstdint>
#include <memory>
#include "PixelFormat.h"

// Pooled or freshly allocated pixel storage; the pool reclaims it when the
// last reference is dropped.
using FrameBuffer = std::shared_ptr<QByteArray>;

// A rendered and converted frame. Moved from producer to exactly one consumer.
struct CapturedFrame {
    int64_t index = -1;
    double timeSeconds = 0.0;
    PixelFormat pixelFormat = PixelFormat::RGBA;
    int width = 0;
    int height = 0;
    FrameBuffer buffer;

    bool isValid() const { return index >= 0 && buffer != nullptr; }
    qsizetype byteCount() const { return buffer ? buffer->size() : 0; }
    const char* data() const { return buffer ? buffer->constData() : nullptr; }
};
