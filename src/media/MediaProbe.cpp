#include "MediaProbe.h"
#include "FFmpegHandles.h"
#include "Logging.h"

bool MediaInfo::isStillImage() const {
    if (!hasVideo) return false;
    static const char* const stillCodecs[] = {"png", "bmp", "tiff", "webp", "gif"};
    for (const char* name : stillCodecs) {
        if (videoCodec == QLatin1String(name)) return true;
    }
    // An mjpeg stream without a frame rate is a jpeg picture
    return videoCodec == "mjpeg" && videoFps <= 0.0;
}

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    FFmpeg::InputPtr input;
    if (!FFmpeg::openInput(filePath, input, m_error)) {
        qCDebug(lcPipeline) << "Probe failed:" << m_error;
        return false;
    }

    const int videoIdx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    const int audioIdx = av_find_best_stream(input.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);

    if (videoIdx >= 0) {
        const AVStream* video = input->streams[videoIdx];
        // Cover art in an audio file is not a background clip
        if (!(video->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
            m_info.hasVideo = true;
            m_info.videoWidth = video->codecpar->width;
            m_info.videoHeight = video->codecpar->height;
            m_info.videoFps = FFmpeg::frameRate(video);
            m_info.videoCodec = FFmpeg::codecName(video->codecpar->codec_id);
        }
    }

    if (audioIdx >= 0) {
        const AVStream* audio = input->streams[audioIdx];
        m_info.hasAudio = true;
        m_info.audioSampleRate = audio->codecpar->sample_rate;
        m_info.audioChannels = audio->codecpar->ch_layout.nb_channels;
        m_info.audioCodec = FFmpeg::codecName(audio->codecpar->codec_id);
    }

    // The audio track sets the song length when there is one
    const AVStream* timed = nullptr;
    if (audioIdx >= 0) timed = input->streams[audioIdx];
    else if (m_info.hasVideo) timed = input->streams[videoIdx];
    m_info.duration = FFmpeg::duration(input.get(), timed);

    if (!m_info.hasVideo && !m_info.hasAudio) {
        m_error = QString("No audio or video stream in %1").arg(filePath);
        return false;
    }

    qCDebug(lcPipeline).nospace() << "Probed " << filePath << ": " << m_info.duration << "s"
                                  << (m_info.hasVideo ? " video " + m_info.videoCodec : QString())
                                  << (m_info.hasAudio ? " audio " + m_info.audioCodec : QString());
    return true;
}
