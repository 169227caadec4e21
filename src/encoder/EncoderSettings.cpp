#include "EncoderSettings.h"
#include "EncoderCapabilities.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QVariant>

namespace {

const QStringList KnownPresets = {
    "ultrafast", "superfast", "veryfast", "faster", "fast",
    "medium", "slow", "slower", "veryslow"
};

const QStringList KnownHwAccel = {"nvenc", "qsv", "vaapi", "videotoolbox"};

// Containers each software codec is normally muxed into
bool codecSuitsContainer(const QString& codec, const QString& container) {
    if (codec == "libx264") return QStringList{"mp4", "mkv", "avi", "mov"}.contains(container);
    if (codec == "libx265") return QStringList{"mp4", "mkv", "mov"}.contains(container);
    if (codec == "libvpx-vp9") return QStringList{"webm", "mkv"}.contains(container);
    if (codec == "libaom-av1") return QStringList{"mp4", "mkv", "webm"}.contains(container);
    return true;
}

} // namespace

QString EncoderSettings::effectiveVideoCodec() const {
    if (hardwareAcceleration.isEmpty()) return videoCodec;

    QString family;
    if (videoCodec == "libx264" || videoCodec == "h264") family = "h264";
    else if (videoCodec == "libx265" || videoCodec == "hevc") family = "hevc";
    else return videoCodec;

    return QString("%1_%2").arg(family, hardwareAcceleration);
}

QString EncoderSettings::muxerName() const {
    if (container == "mkv") return "matroska";
    return container;
}

namespace EncoderSettingsUtil {

SettingsValidation validate(const EncoderSettings& s, const EncoderCapabilities* caps) {
    SettingsValidation v;

    if (s.outputPath.isEmpty())
        v.errors << "Output path is empty";

    if (s.width <= 0 || s.height <= 0)
        v.errors << QString("Invalid resolution %1x%2: width and height must be positive")
                        .arg(s.width).arg(s.height);
    else if (s.outputPixelFormat == "yuv420p" && ((s.width & 1) || (s.height & 1)))
        v.errors << QString("Resolution %1x%2 must be even for yuv420p output")
                        .arg(s.width).arg(s.height);
    else if (requiresEvenDimensions(s.inputPixelFormat) && ((s.width & 1) || (s.height & 1)))
        v.errors << QString("Resolution %1x%2 must be even for %3 input")
                        .arg(s.width).arg(s.height).arg(pixelFormatName(s.inputPixelFormat));

    if (s.width > 7680 || s.height > 4320)
        v.warnings << "Very high resolution (>8K) may cause performance issues";
    else if (s.width > 0 && s.height > 0 && (s.width < 64 || s.height < 64))
        v.warnings << "Very low resolution may cause encoding issues";

    if (!s.frameRate.isValid()) {
        v.errors << "Invalid frame rate: must be positive";
    } else {
        double fps = s.frameRate.toDouble();
        if (fps > 120.0) v.warnings << "Very high frame rate (>120fps) may cause performance issues";
        else if (fps < 1.0) v.warnings << "Very low frame rate (<1fps) may cause playback issues";
    }

    if (s.crf && s.bitrateKbps) {
        v.errors << "Quality factor (crf) and target bitrate are mutually exclusive";
    } else if (!s.crf && !s.bitrateKbps) {
        v.errors << "Either a quality factor (crf) or a target bitrate is required";
    } else if (s.crf) {
        if (*s.crf < 0 || *s.crf > 51)
            v.errors << QString("Invalid CRF %1: must be between 0 and 51").arg(*s.crf);
        else if (*s.crf < 10)
            v.warnings << "Very low CRF (<10) results in very large files";
        else if (*s.crf > 35)
            v.warnings << "High CRF (>35) may result in poor quality";
        if (s.maxBitrateKbps > 0 || s.bufferSizeKbps > 0)
            v.warnings << "Max bitrate and buffer size only apply in bitrate mode; ignored";
    } else {
        if (*s.bitrateKbps <= 0)
            v.errors << "Invalid bitrate: must be positive";
        else if (*s.bitrateKbps < 100)
            v.warnings << "Very low bitrate (<100kbps) may result in poor quality";
        else if (*s.bitrateKbps > 50000)
            v.warnings << "Very high bitrate (>50Mbps) may be unnecessary";
        if (s.maxBitrateKbps < 0 || s.bufferSizeKbps < 0)
            v.errors << "Max bitrate and buffer size must not be negative";
        else if (s.maxBitrateKbps > 0 && s.maxBitrateKbps < *s.bitrateKbps)
            v.warnings << "Max bitrate is below the target bitrate";
    }

    if (!KnownPresets.contains(s.preset))
        v.errors << QString("Unknown preset '%1'").arg(s.preset);
    else if (s.preset == "ultrafast" && s.crf && *s.crf < 20)
        v.warnings << "Ultrafast preset with low CRF may not provide expected quality benefits";

    if (s.audioBitrateKbps <= 0)
        v.errors << "Invalid audio bitrate: must be positive";
    else if (s.audioBitrateKbps < 64)
        v.warnings << "Low audio bitrate (<64kbps) may result in poor audio quality";
    else if (s.audioBitrateKbps > 320)
        v.warnings << "High audio bitrate (>320kbps) may be unnecessary";

    if (s.audioSampleRate <= 0)
        v.errors << "Invalid audio sample rate: must be positive";
    else if (!QList<int>{22050, 44100, 48000, 96000}.contains(s.audioSampleRate))
        v.warnings << "Non-standard audio sample rate may cause compatibility issues";

    if (s.audioChannels <= 0)
        v.errors << "Invalid audio channel count: must be positive";
    else if (s.audioChannels > 2 && s.audioChannels != 6 && s.audioChannels != 8)
        v.warnings << "Non-standard channel count may cause compatibility issues";

    if (s.threads < 0)
        v.errors << "Invalid thread count: must not be negative";
    else if (s.threads > 32)
        v.warnings << "Very high thread count (>32) may not improve performance";

    if (!s.hardwareAcceleration.isEmpty()) {
        if (!KnownHwAccel.contains(s.hardwareAcceleration))
            v.errors << QString("Unknown hardware acceleration '%1'").arg(s.hardwareAcceleration);
        else if (s.preset == "veryslow" || s.preset == "slower")
            v.warnings << "Hardware acceleration with slow presets may not provide expected speed benefits";
    }

    if (!codecSuitsContainer(s.videoCodec, s.container))
        v.warnings << QString("Video codec %1 may not be optimal for %2 container")
                          .arg(s.videoCodec, s.container);

    if (caps && caps->available) {
        const QString codec = s.effectiveVideoCodec();
        if (!caps->hasVideoEncoder(codec))
            v.errors << QString("Video codec '%1' is not supported by %2").arg(codec, caps->program);
        if (!caps->hasAudioEncoder(s.audioCodec))
            v.warnings << QString("Audio codec '%1' is not supported by %2; audio may fail")
                              .arg(s.audioCodec, caps->program);
        if (!caps->hasMuxer(s.muxerName()))
            v.errors << QString("Container format '%1' is not supported by %2")
                            .arg(s.container, caps->program);
    }

    return v;
}

QStringList presetNames() {
    return {"low", "medium", "high", "4k", "crf-high", "crf-medium", "crf-low"};
}

bool applyPreset(const QString& name, EncoderSettings& s) {
    auto bitrate = [&s](int w, int h, int kbps) {
        s.width = w;
        s.height = h;
        s.crf.reset();
        s.bitrateKbps = kbps;
    };
    auto quality = [&s](int crf, const char* preset) {
        s.bitrateKbps.reset();
        s.maxBitrateKbps = 0;
        s.bufferSizeKbps = 0;
        s.crf = crf;
        s.preset = preset;
    };

    if (name == "low")             bitrate(1280, 720, 4000);
    else if (name == "medium")     bitrate(1920, 1080, 8000);
    else if (name == "high")       bitrate(1920, 1080, 15000);
    else if (name == "4k")         bitrate(3840, 2160, 25000);
    else if (name == "crf-high")   quality(18, "slow");
    else if (name == "crf-medium") quality(23, "medium");
    else if (name == "crf-low")    quality(28, "fast");
    else return false;
    return true;
}

QJsonObject toJson(const EncoderSettings& s) {
    QJsonObject obj;
    obj["output"] = s.outputPath;
    obj["container"] = s.container;
    obj["videoCodec"] = s.videoCodec;
    if (s.crf) obj["crf"] = *s.crf;
    if (s.bitrateKbps) obj["bitrate"] = *s.bitrateKbps;
    if (s.maxBitrateKbps > 0) obj["maxBitrate"] = s.maxBitrateKbps;
    if (s.bufferSizeKbps > 0) obj["bufferSize"] = s.bufferSizeKbps;
    obj["preset"] = s.preset;
    if (!s.tune.isEmpty()) obj["tune"] = s.tune;
    if (!s.profile.isEmpty()) obj["profile"] = s.profile;
    if (!s.level.isEmpty()) obj["level"] = s.level;
    obj["width"] = s.width;
    obj["height"] = s.height;
    obj["fps"] = s.frameRate.toString();
    obj["inputPixelFormat"] = pixelFormatName(s.inputPixelFormat);
    obj["pixelFormat"] = s.outputPixelFormat;
    obj["audioCodec"] = s.audioCodec;
    obj["audioBitrate"] = s.audioBitrateKbps;
    obj["audioSampleRate"] = s.audioSampleRate;
    obj["audioChannels"] = s.audioChannels;
    if (s.threads > 0) obj["threads"] = s.threads;
    if (!s.hardwareAcceleration.isEmpty()) obj["hardwareAcceleration"] = s.hardwareAcceleration;
    if (!s.filters.isEmpty()) obj["filters"] = QJsonArray::fromStringList(s.filters);
    if (!s.metadata.isEmpty()) {
        QJsonObject meta;
        for (const auto& kv : s.metadata) meta[kv.first] = kv.second;
        obj["metadata"] = meta;
    }
    return obj;
}

bool fromJson(const QJsonObject& obj, EncoderSettings& s, QString* error) {
    auto reject = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };

    EncoderSettings r = s;
    r.outputPath = obj["output"].toString(r.outputPath);
    r.container = obj["container"].toString(r.container);
    r.videoCodec = obj["videoCodec"].toString(r.videoCodec);

    // Naming one rate-control field switches the mode
    if (obj.contains("crf") && obj.contains("bitrate"))
        return reject("'crf' and 'bitrate' are mutually exclusive");
    if (obj.contains("crf")) {
        r.crf = obj["crf"].toInt();
        r.bitrateKbps.reset();
    } else if (obj.contains("bitrate")) {
        r.bitrateKbps = obj["bitrate"].toInt();
        r.crf.reset();
    }
    r.maxBitrateKbps = obj["maxBitrate"].toInt(r.maxBitrateKbps);
    r.bufferSizeKbps = obj["bufferSize"].toInt(r.bufferSizeKbps);
    r.preset = obj["preset"].toString(r.preset);
    r.tune = obj["tune"].toString(r.tune);
    r.profile = obj["profile"].toString(r.profile);
    r.level = obj["level"].toString(r.level);
    r.width = obj["width"].toInt(r.width);
    r.height = obj["height"].toInt(r.height);

    if (obj.contains("fps")) {
        QJsonValue fps = obj["fps"];
        r.frameRate = fps.isDouble() ? FrameRate::fromDouble(fps.toDouble())
                                     : FrameRate::fromString(fps.toString());
        if (!r.frameRate.isValid())
            return reject(QString("invalid fps '%1'").arg(fps.toVariant().toString()));
    }
    if (obj.contains("inputPixelFormat") &&
        !pixelFormatFromName(obj["inputPixelFormat"].toString(), r.inputPixelFormat))
        return reject(QString("unknown input pixel format '%1'").arg(obj["inputPixelFormat"].toString()));

    r.outputPixelFormat = obj["pixelFormat"].toString(r.outputPixelFormat);
    r.audioCodec = obj["audioCodec"].toString(r.audioCodec);
    r.audioBitrateKbps = obj["audioBitrate"].toInt(r.audioBitrateKbps);
    r.audioSampleRate = obj["audioSampleRate"].toInt(r.audioSampleRate);
    r.audioChannels = obj["audioChannels"].toInt(r.audioChannels);
    r.threads = obj["threads"].toInt(r.threads);
    r.hardwareAcceleration = obj["hardwareAcceleration"].toString(r.hardwareAcceleration);

    if (obj.contains("filters")) {
        r.filters.clear();
        for (const auto& f : obj["filters"].toArray()) r.filters << f.toString();
    }
    if (obj.contains("metadata")) {
        r.metadata.clear();
        QJsonObject meta = obj["metadata"].toObject();
        for (auto it = meta.begin(); it != meta.end(); ++it)
            r.metadata.append({it.key(), it.value().toString()});
    }

    s = r;
    return true;
}

bool load(const QString& filePath, EncoderSettings& settings, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read: %1").arg(filePath);
        return false;
    }
    auto doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        if (error) *error = QString("Invalid export settings file: %1").arg(filePath);
        return false;
    }
    return fromJson(doc.object(), settings, error);
}

bool save(const QString& filePath, const EncoderSettings& settings, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }
    file.write(QJsonDocument(toJson(settings)).toJson());
    return true;
}

} // namespace EncoderSettingsUtil
