#pragma once

#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <optional>
#include "FrameTimestamp.h"
#include "PixelFormat.h"

struct EncoderCapabilities;

// Everything needed to build the encoder command line. Exactly one of
// crf / bitrateKbps must be set.
struct EncoderSettings {
    QString outputPath;
    QString container = "mp4";          // mp4, mkv, webm, avi, mov
    QString videoCodec = "libx264";
    std::optional<int> crf = 23;        // quality factor, 0..51
    std::optional<int> bitrateKbps;     // target bitrate
    int maxBitrateKbps = 0;             // bitrate mode only, 0 = unset
    int bufferSizeKbps = 0;
    QString preset = "medium";
    QString tune;
    QString profile;
    QString level;

    int width = 1920;
    int height = 1080;
    FrameRate frameRate;
    PixelFormat inputPixelFormat = PixelFormat::RGBA;   // bytes written to stdin
    QString outputPixelFormat = "yuv420p";

    QString audioCodec = "aac";
    int audioBitrateKbps = 128;
    int audioSampleRate = 44100;
    int audioChannels = 2;

    int threads = 0;                    // 0 = encoder default
    QString hardwareAcceleration;       // nvenc, qsv, vaapi, videotoolbox
    QStringList filters;                // joined into -vf
    QList<QPair<QString, QString>> metadata;

    // Codec name after hardware-acceleration mapping (libx264 + nvenc = h264_nvenc).
    QString effectiveVideoCodec() const;
    // Value for -f (mkv is "matroska").
    QString muxerName() const;
};

struct SettingsValidation {
    QStringList errors;     // configuration errors, the job must not start
    QStringList warnings;   // logged, do not block

    bool isValid() const { return errors.isEmpty(); }
};

namespace EncoderSettingsUtil {

// Checks ranges and mutual exclusion; with capabilities also checks that the
// codecs and muxer exist in the probed encoder.
SettingsValidation validate(const EncoderSettings& settings,
                            const EncoderCapabilities* capabilities = nullptr);

// low, medium, high, 4k, crf-high, crf-medium, crf-low
QStringList presetNames();
bool applyPreset(const QString& name, EncoderSettings& settings);

QJsonObject toJson(const EncoderSettings& settings);
// Missing fields keep the values already in settings.
bool fromJson(const QJsonObject& obj, EncoderSettings& settings, QString* error);

bool load(const QString& filePath, EncoderSettings& settings, QString* error);
bool save(const QString& filePath, const EncoderSettings& settings, QString* error);

} // namespace EncoderSettingsUtil
