#pragma once

#include <QByteArray>
#include <cstdint>
#include "FFmpegHandles.h"
#include "PixelFormat.h"
#include "PipelineError.h"

// Converts tightly packed top-down RGBA8 into encoder input layouts with
// libswscale. YUV output is BT.601 limited range (Y 16..235, chroma
// 16..240), the range encoders assume for yuv420p/yuv444p.
//
// One converter per producing thread: the scaler context is cached and
// rebuilt only when the size or target format changes.
class PixelFormatConverter {
public:
    PixelFormatConverter() = default;

    // Writes into dst, resizing it only when its size differs from the frame
    // size, so a caller that keeps dst across frames never reallocates.
    bool convert(const uint8_t* rgba, int width, int height, PixelFormat target,
                 QByteArray& dst, PipelineError* error = nullptr);

    bool convert(const QByteArray& rgba, int width, int height, PixelFormat target,
                 QByteArray& dst, PipelineError* error = nullptr) {
        return convert(reinterpret_cast<const uint8_t*>(rgba.constData()), width, height,
                       target, dst, error);
    }

    // Reference decode back to RGBA (alpha 255), used to check conversions.
    static bool yuvToRgba(const QByteArray& yuv, int width, int height, PixelFormat format,
                          QByteArray& rgba, PipelineError* error = nullptr);

private:
    bool prepare(int width, int height, PixelFormat target, PipelineError* error);

    FFmpeg::ScalerPtr m_scaler;
    int m_width = 0;
    int m_height = 0;
    PixelFormat m_target = PixelFormat::RGBA;
};
