#pragma once

#include <QString>
#include <memory>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
}

// Owning handles for the libav objects the media readers hold, plus the
// few conversions both of them need.
namespace FFmpeg {

struct InputDeleter {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct PacketDeleter {
    void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};
struct ScalerDeleter {
    void operator()(SwsContext* ctx) const { sws_freeContext(ctx); }
};

using InputPtr = std::unique_ptr<AVFormatContext, InputDeleter>;
using CodecPtr = std::unique_ptr<AVCodecContext, CodecDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using ScalerPtr = std::unique_ptr<SwsContext, ScalerDeleter>;

inline QString errorText(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

// Opens a file and reads enough packets to fill in stream parameters.
// On failure ctx stays empty and message carries the reason.
inline bool openInput(const QString& path, InputPtr& ctx, QString& message) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, path.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        message = QString("Cannot open %1 (%2)").arg(path, errorText(ret));
        return false;
    }
    InputPtr opened(raw);
    ret = avformat_find_stream_info(opened.get(), nullptr);
    if (ret < 0) {
        message = QString("Cannot read stream info from %1 (%2)").arg(path, errorText(ret));
        return false;
    }
    ctx = std::move(opened);
    return true;
}

// Nominal frame rate, 0 when the container declares none
inline double frameRate(const AVStream* stream) {
    for (AVRational r : {stream->avg_frame_rate, stream->r_frame_rate}) {
        if (r.num > 0 && r.den > 0) return av_q2d(r);
    }
    return 0.0;
}

// Stream duration in seconds, falling back to the container's
inline double duration(const AVFormatContext* ctx, const AVStream* stream) {
    if (stream && stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    if (ctx->duration > 0)
        return static_cast<double>(ctx->duration) / AV_TIME_BASE;
    return 0.0;
}

inline QString codecName(AVCodecID id) {
    return QString::fromLatin1(avcodec_get_name(id));
}

} // namespace FFmpeg
