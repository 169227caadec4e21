#pragma once

#include <QString>
#include <QStringList>

// What the encoder tool on this machine can do, from one probe.
struct EncoderCapabilities {
    bool available = false;
    QString program;            // resolved absolute path
    QString version;
    QStringList videoEncoders;
    QStringList audioEncoders;
    QStringList muxers;
    QStringList hwaccelMethods;     // -hwaccels output (decode side)
    QStringList hardwareEncoders;   // nvenc, qsv, vaapi, videotoolbox with an h264 encoder present
    QString errorMessage;

    bool hasVideoEncoder(const QString& name) const { return videoEncoders.contains(name); }
    bool hasAudioEncoder(const QString& name) const { return audioEncoders.contains(name); }
    bool hasMuxer(const QString& name) const { return muxers.contains(name); }
    bool hasHardwareEncoder(const QString& backend) const { return hardwareEncoders.contains(backend); }
};

class EncoderProbe {
public:
    // Runs -version, -encoders, -muxers and -hwaccels. Never throws; an
    // unusable program yields available == false with errorMessage set.
    static EncoderCapabilities probe(const QString& program, int timeoutMs);

    // Probe result cached for the process lifetime, keyed by resolved path
    // and modification time so an upgraded binary is probed again.
    static EncoderCapabilities cached(const QString& program);
    static void clearCache();

    static QString resolveProgram(const QString& program);

    static QString parseVersion(const QString& output);
    static void parseEncoders(const QString& output, QStringList* video, QStringList* audio);
    static QStringList parseMuxers(const QString& output);
    static QStringList parseHwaccels(const QString& output);
};
