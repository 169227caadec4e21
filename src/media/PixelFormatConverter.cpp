#include "PixelFormatConverter.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

extern "C" {
#include <libavutil/imgutils.h>
}

namespace {

inline uint8_t clampByte(double v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

AVPixelFormat avFormat(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA:    return AV_PIX_FMT_RGBA;
        case PixelFormat::BGRA:    return AV_PIX_FMT_BGRA;
        case PixelFormat::RGB:     return AV_PIX_FMT_RGB24;
        case PixelFormat::BGR:     return AV_PIX_FMT_BGR24;
        case PixelFormat::YUV420P: return AV_PIX_FMT_YUV420P;
        case PixelFormat::YUV444P: return AV_PIX_FMT_YUV444P;
    }
    return AV_PIX_FMT_NONE;
}

bool checkDimensions(int width, int height, PixelFormat format, PipelineError* error) {
    if (width <= 0 || height <= 0) {
        if (error) *error = PipelineError::invalidParameter(
            QString("frame size %1x%2 must be positive").arg(width).arg(height));
        return false;
    }
    if (requiresEvenDimensions(format) && ((width & 1) || (height & 1))) {
        if (error) *error = PipelineError::unsupportedDimensions(width, height, pixelFormatName(format));
        return false;
    }
    return true;
}

} // namespace

bool PixelFormatConverter::prepare(int width, int height, PixelFormat target, PipelineError* error) {
    if (m_scaler && width == m_width && height == m_height && target == m_target)
        return true;

    // Same size in and out, so only the format conversion runs
    const int flags = SWS_POINT | SWS_ACCURATE_RND | SWS_FULL_CHR_H_INP;
    m_scaler.reset(sws_getCachedContext(m_scaler.release(),
                                        width, height, AV_PIX_FMT_RGBA,
                                        width, height, avFormat(target),
                                        flags, nullptr, nullptr, nullptr));
    if (!m_scaler) {
        if (error) *error = PipelineError::invalidParameter(
            QString("no RGBA to %1 conversion for %2x%3")
                .arg(pixelFormatName(target)).arg(width).arg(height));
        return false;
    }

    if (isPlanarYuv(target)) {
        const int* bt601 = sws_getCoefficients(SWS_CS_ITU601);
        // Source is full-range RGB, destination MPEG (limited) range
        sws_setColorspaceDetails(m_scaler.get(), bt601, 1, bt601, 0, 0, 1 << 16, 1 << 16);
    }

    m_width = width;
    m_height = height;
    m_target = target;
    qCDebug(lcCapture) << "Pixel converter ready: rgba ->" << pixelFormatName(target)
                       << width << "x" << height;
    return true;
}

bool PixelFormatConverter::convert(const uint8_t* rgba, int width, int height, PixelFormat target,
                                   QByteArray& dst, PipelineError* error) {
    if (!rgba) {
        if (error) *error = PipelineError::invalidParameter("source frame is null");
        return false;
    }
    if (!checkDimensions(width, height, target, error)) return false;
    if (!prepare(width, height, target, error)) return false;

    const qsizetype size = static_cast<qsizetype>(bytesPerFrame(target, width, height));
    if (dst.size() != size) dst.resize(size);

    uint8_t* planes[4] = {nullptr, nullptr, nullptr, nullptr};
    int strides[4] = {0, 0, 0, 0};
    int ret = av_image_fill_arrays(planes, strides, reinterpret_cast<uint8_t*>(dst.data()),
                                   avFormat(target), width, height, 1);
    if (ret < 0) {
        if (error) *error = PipelineError::invalidParameter(
            QString("cannot lay out %1 planes (%2)").arg(pixelFormatName(target), FFmpeg::errorText(ret)));
        return false;
    }

    const uint8_t* const src[4] = {rgba, nullptr, nullptr, nullptr};
    const int srcStride[4] = {width * 4, 0, 0, 0};
    sws_scale(m_scaler.get(), src, srcStride, 0, height, planes, strides);

    if (error) *error = PipelineError::none();
    return true;
}

bool PixelFormatConverter::yuvToRgba(const QByteArray& yuv, int width, int height, PixelFormat format,
                                     QByteArray& rgba, PipelineError* error) {
    if (!isPlanarYuv(format)) {
        if (error) *error = PipelineError::invalidParameter(
            QString("%1 is not a planar YUV format").arg(pixelFormatName(format)));
        return false;
    }
    if (!checkDimensions(width, height, format, error)) return false;
    if (static_cast<size_t>(yuv.size()) != bytesPerFrame(format, width, height)) {
        if (error) *error = PipelineError::invalidParameter(
            QString("YUV buffer holds %1 bytes, expected %2")
                .arg(yuv.size()).arg(bytesPerFrame(format, width, height)));
        return false;
    }

    const size_t pixels = static_cast<size_t>(width) * height;
    const bool sub = format == PixelFormat::YUV420P;
    const int cw = sub ? width / 2 : width;
    const size_t chromaSize = sub ? static_cast<size_t>(cw) * (height / 2) : pixels;

    const uint8_t* yPlane = reinterpret_cast<const uint8_t*>(yuv.constData());
    const uint8_t* uPlane = yPlane + pixels;
    const uint8_t* vPlane = uPlane + chromaSize;

    rgba.resize(static_cast<qsizetype>(pixels * 4));
    uint8_t* out = reinterpret_cast<uint8_t*>(rgba.data());

    // Inverse BT.601, limited range
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t ci = sub ? static_cast<size_t>(y / 2) * cw + x / 2
                            : static_cast<size_t>(y) * width + x;
            double Y = 1.164383 * (yPlane[static_cast<size_t>(y) * width + x] - 16.0);
            double Cb = uPlane[ci] - 128.0;
            double Cr = vPlane[ci] - 128.0;
            *out++ = clampByte(Y + 1.596027 * Cr);
            *out++ = clampByte(Y - 0.391762 * Cb - 0.812968 * Cr);
            *out++ = clampByte(Y + 2.017232 * Cb);
            *out++ = 255;
        }
    }

    if (error) *error = PipelineError::none();
    return true;
}
