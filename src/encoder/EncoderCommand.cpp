#include "EncoderCommand.h"

namespace EncoderCommand {

QStringList buildArguments(const EncoderSettings& s, const QString& audioPath) {
    QStringList args;
    args << "-hide_banner" << "-y";

    if (s.threads > 0)
        args << "-threads" << QString::number(s.threads);

    args << "-f" << "rawvideo"
         << "-pix_fmt" << pixelFormatName(s.inputPixelFormat)
         << "-s" << QString("%1x%2").arg(s.width).arg(s.height)
         << "-r" << s.frameRate.toString()
         << "-i" << "pipe:0";

    const bool withAudio = !audioPath.isEmpty();
    if (withAudio)
        args << "-i" << audioPath;

    args << "-c:v" << s.effectiveVideoCodec();

    if (s.bitrateKbps) {
        args << "-b:v" << QString("%1k").arg(*s.bitrateKbps);
        if (s.maxBitrateKbps > 0) args << "-maxrate" << QString("%1k").arg(s.maxBitrateKbps);
        if (s.bufferSizeKbps > 0) args << "-bufsize" << QString("%1k").arg(s.bufferSizeKbps);
    } else if (s.crf) {
        args << "-crf" << QString::number(*s.crf);
    }

    args << "-preset" << s.preset;
    if (!s.tune.isEmpty()) args << "-tune" << s.tune;
    if (!s.profile.isEmpty()) args << "-profile:v" << s.profile;
    if (!s.level.isEmpty()) args << "-level" << s.level;

    args << "-pix_fmt" << s.outputPixelFormat;

    if (withAudio) {
        args << "-map" << "0:v:0" << "-map" << "1:a:0"
             << "-c:a" << s.audioCodec
             << "-b:a" << QString("%1k").arg(s.audioBitrateKbps)
             << "-ar" << QString::number(s.audioSampleRate)
             << "-ac" << QString::number(s.audioChannels)
             << "-shortest";
    } else {
        args << "-an";
    }

    if (!s.filters.isEmpty())
        args << "-vf" << s.filters.join(',');

    for (const auto& kv : s.metadata)
        args << "-metadata" << QString("%1=%2").arg(kv.first, kv.second);

    args << "-f" << s.muxerName()
         << "-progress" << "pipe:2"
         << s.outputPath;
    return args;
}

} // namespace EncoderCommand
