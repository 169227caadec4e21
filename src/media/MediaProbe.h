#pragma once

#include <QString>

// What the pipeline needs to know about a scene's media before a run:
// whether the background clip and the audio track are usable, and their
// timing.
struct MediaInfo {
    QString filePath;
    double duration = 0.0;     // seconds, 0 when unknown

    bool hasVideo = false;
    int videoWidth = 0;
    int videoHeight = 0;
    double videoFps = 0.0;
    QString videoCodec;

    bool hasAudio = false;
    int audioSampleRate = 0;
    int audioChannels = 0;
    QString audioCodec;

    // Single picture codecs (png, mjpeg stills) report a video stream too
    bool isStillImage() const;
};

class MediaProbe {
public:
    bool probe(const QString& filePath);

    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};
