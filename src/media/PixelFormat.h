#pragma once

#include <QString>
#include <cstddef>
#include <cstdint>

enum class PixelFormat {
    RGBA,
    RGB,
    BGR,
    BGRA,
    YUV420P,
    YUV444P
};

inline bool isPlanarYuv(PixelFormat format) {
    return format == PixelFormat::YUV420P || format == PixelFormat::YUV444P;
}

inline bool requiresEvenDimensions(PixelFormat format) {
    return format == PixelFormat::YUV420P;
}

// Exact byte size of one frame; 4:2:0 is w*h*3/2 for even dimensions.
inline size_t bytesPerFrame(PixelFormat format, int width, int height) {
    const size_t pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    switch (format) {
        case PixelFormat::RGBA:
        case PixelFormat::BGRA:    return pixels * 4;
        case PixelFormat::RGB:
        case PixelFormat::BGR:     return pixels * 3;
        case PixelFormat::YUV420P: return pixels + 2 * (static_cast<size_t>(width / 2) * (height / 2));
        case PixelFormat::YUV444P: return pixels * 3;
    }
    return 0;
}

// Name understood by the encoder's -pix_fmt option.
inline const char* pixelFormatName(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA:    return "rgba";
        case PixelFormat::RGB:     return "rgb24";
        case PixelFormat::BGR:     return "bgr24";
        case PixelFormat::BGRA:    return "bgra";
        case PixelFormat::YUV420P: return "yuv420p";
        case PixelFormat::YUV444P: return "yuv444p";
    }
    return "rgba";
}

// Accepts the CLI spellings ("rgb", "yuv420p") and the encoder names ("rgb24").
inline bool pixelFormatFromName(const QString& name, PixelFormat& format) {
    const QString n = name.trimmed().toLower();
    if (n == "rgba")                   format = PixelFormat::RGBA;
    else if (n == "rgb" || n == "rgb24") format = PixelFormat::RGB;
    else if (n == "bgr" || n == "bgr24") format = PixelFormat::BGR;
    else if (n == "bgra")              format = PixelFormat::BGRA;
    else if (n == "yuv420p")           format = PixelFormat::YUV420P;
    else if (n == "yuv444p")           format = PixelFormat::YUV444P;
    else return false;
    return true;
}
