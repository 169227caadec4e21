#include "VideoDecoder.h"
#include "FFmpegHandles.h"
#include "Logging.h"
#include <algorithm>

struct VideoDecoder::Stream {
    FFmpeg::InputPtr input;
    FFmpeg::CodecPtr codec;
    FFmpeg::FramePtr frame;
    FFmpeg::PacketPtr packet;
    FFmpeg::ScalerPtr scaler;
    int index = -1;
    AVRational timeBase{1, 1};
    int64_t startPts = 0;
    double lastPts = -1.0;
    bool draining = false;    // demuxer hit the end, decoder is being flushed
};

VideoDecoder::VideoDecoder() = default;

VideoDecoder::~VideoDecoder() = default;

bool VideoDecoder::fail(const QString& message) {
    m_error = message;
    qCWarning(lcRender).noquote() << "Background video:" << message;
    return false;
}

bool VideoDecoder::open(const QString& filePath) {
    close();

    auto s = std::make_unique<Stream>();
    QString message;
    if (!FFmpeg::openInput(filePath, s->input, message))
        return fail(message);

    const AVCodec* decoder = nullptr;
    s->index = av_find_best_stream(s->input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &decoder, 0);
    if (s->index == AVERROR_DECODER_NOT_FOUND)
        return fail(QString("No decoder for the video stream in %1").arg(filePath));
    if (s->index < 0 || !decoder)
        return fail(QString("No video stream in %1").arg(filePath));

    const AVStream* st = s->input->streams[s->index];
    s->codec.reset(avcodec_alloc_context3(decoder));
    if (!s->codec)
        return fail("Cannot allocate decoder context");
    int ret = avcodec_parameters_to_context(s->codec.get(), st->codecpar);
    if (ret < 0)
        return fail(QString("Bad codec parameters in %1 (%2)").arg(filePath, FFmpeg::errorText(ret)));
    s->codec->thread_count = 0;
    ret = avcodec_open2(s->codec.get(), decoder, nullptr);
    if (ret < 0)
        return fail(QString("Cannot start %1 decoder (%2)").arg(decoder->name, FFmpeg::errorText(ret)));

    s->frame.reset(av_frame_alloc());
    s->packet.reset(av_packet_alloc());
    if (!s->frame || !s->packet)
        return fail("Cannot allocate decoder buffers");

    s->timeBase = st->time_base;
    s->startPts = st->start_time != AV_NOPTS_VALUE ? st->start_time : 0;

    m_info.width = s->codec->width;
    m_info.height = s->codec->height;
    m_info.fps = FFmpeg::frameRate(st);
    m_info.duration = FFmpeg::duration(s->input.get(), st);
    m_info.codecName = QString::fromLatin1(decoder->name);
    if (m_info.fps > 0.0 && m_info.duration > 0.0)
        m_info.totalFrames = static_cast<int64_t>(m_info.duration * m_info.fps);

    m_stream = std::move(s);
    m_error.clear();
    qCInfo(lcRender).nospace() << "Background video " << filePath << ": " << m_info.width << "x"
                               << m_info.height << " @ " << m_info.fps << "fps " << m_info.codecName;
    return true;
}

void VideoDecoder::close() {
    m_stream.reset();
    m_info = VideoInfo{};
    dropHeldFrames();
}

void VideoDecoder::dropHeldFrames() {
    m_shown = QImage();
    m_shownPts = -1.0;
    m_ahead = QImage();
    m_aheadPts = -1.0;
}

// Sends the next packet of our stream, or the flush request once the
// demuxer is exhausted.
void VideoDecoder::feedDecoder() {
    Stream& s = *m_stream;
    while (true) {
        int ret = av_read_frame(s.input.get(), s.packet.get());
        if (ret < 0) {
            s.draining = true;
            avcodec_send_packet(s.codec.get(), nullptr);
            return;
        }
        if (s.packet->stream_index != s.index) {
            av_packet_unref(s.packet.get());
            continue;
        }
        ret = avcodec_send_packet(s.codec.get(), s.packet.get());
        av_packet_unref(s.packet.get());
        if (ret < 0 && ret != AVERROR(EAGAIN))
            qCDebug(lcRender) << "Skipping damaged packet:" << FFmpeg::errorText(ret);
        return;
    }
}

bool VideoDecoder::convert(QImage& image) {
    Stream& s = *m_stream;
    const AVFrame* f = s.frame.get();
    // Output keeps the opened size even if the stream changes resolution
    s.scaler.reset(sws_getCachedContext(s.scaler.release(),
                                        f->width, f->height, static_cast<AVPixelFormat>(f->format),
                                        m_info.width, m_info.height, AV_PIX_FMT_RGBA,
                                        SWS_BILINEAR, nullptr, nullptr, nullptr));
    if (!s.scaler) {
        m_error = "Cannot convert decoded frame to RGBA";
        return false;
    }

    image = QImage(m_info.width, m_info.height, QImage::Format_RGBA8888);
    uint8_t* dst[4] = {image.bits(), nullptr, nullptr, nullptr};
    int dstStride[4] = {static_cast<int>(image.bytesPerLine()), 0, 0, 0};
    sws_scale(s.scaler.get(), f->data, f->linesize, 0, f->height, dst, dstStride);
    return true;
}

bool VideoDecoder::nextFrame(QImage& image, double& pts) {
    Stream& s = *m_stream;
    while (true) {
        // Drain what the decoder holds before reading more input
        int ret = avcodec_receive_frame(s.codec.get(), s.frame.get());
        if (ret == 0) {
            const int64_t ts = s.frame->best_effort_timestamp;
            if (ts != AV_NOPTS_VALUE)
                pts = static_cast<double>(ts - s.startPts) * av_q2d(s.timeBase);
            else
                pts = s.lastPts + (m_info.fps > 0.0 ? 1.0 / m_info.fps : 0.0);
            s.lastPts = pts;
            const bool converted = convert(image);
            av_frame_unref(s.frame.get());
            return converted;
        }
        if (ret == AVERROR_EOF) return false;
        if (ret != AVERROR(EAGAIN)) {
            m_error = QString("Decoding failed (%1)").arg(FFmpeg::errorText(ret));
            qCWarning(lcRender) << m_error;
            return false;
        }
        if (s.draining) return false;
        feedDecoder();
    }
}

bool VideoDecoder::seek(double seconds) {
    if (!m_stream) return false;
    Stream& s = *m_stream;

    const int64_t target = s.startPts + av_rescale_q(static_cast<int64_t>(seconds * AV_TIME_BASE),
                                                     AVRational{1, AV_TIME_BASE}, s.timeBase);
    int ret = avformat_seek_file(s.input.get(), s.index, INT64_MIN, target, target, 0);
    if (ret < 0) {
        m_error = QString("Seek to %1s failed (%2)").arg(seconds).arg(FFmpeg::errorText(ret));
        return false;
    }
    avcodec_flush_buffers(s.codec.get());
    s.draining = false;
    s.lastPts = seconds;
    dropHeldFrames();
    return true;
}

QImage VideoDecoder::frameAt(double seconds) {
    if (!m_stream) return QImage();
    seconds = std::max(0.0, seconds);

    const double halfFrame = m_info.fps > 0.0 ? 0.5 / m_info.fps : 0.0;
    const double position = std::max(m_shownPts, 0.0);
    const bool rewind = m_shownPts >= 0.0 && seconds + halfFrame < m_shownPts;
    if (rewind || seconds - position > SeekThresholdSeconds) {
        qCDebug(lcRender) << "Background seek to" << seconds;
        if (!seek(seconds)) return m_shown;
    }

    // Step until the frame after the shown one starts past the requested time
    for (;;) {
        if (m_ahead.isNull() && !nextFrame(m_ahead, m_aheadPts)) {
            m_ahead = QImage();
            break;
        }
        if (!m_shown.isNull() && m_aheadPts > seconds + halfFrame) break;
        m_shown = m_ahead;
        m_shownPts = m_aheadPts;
        m_ahead = QImage();
    }
    return m_shown;
}
