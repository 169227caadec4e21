#pragma once

#include <QImage>
#include <QString>
#include <cstdint>
#include <memory>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration = 0.0;  // seconds
    int64_t totalFrames = 0;
    QString codecName;
};

// Reads a background clip frame by frame as RGBA8888 images, timed from the
// start of the clip.
class VideoDecoder {
public:
    VideoDecoder();
    ~VideoDecoder();

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_stream != nullptr; }

    // Frame on screen at the given time. Decodes forward from the current
    // position and only seeks on a backward jump or a jump past
    // SeekThresholdSeconds; the last frame is held past the end.
    QImage frameAt(double seconds);

    // Repositions on the keyframe at or before the given time.
    bool seek(double seconds);

    const VideoInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

    static constexpr double SeekThresholdSeconds = 2.0;

private:
    struct Stream;

    bool fail(const QString& message);
    bool nextFrame(QImage& image, double& pts);
    void feedDecoder();
    bool convert(QImage& image);
    void dropHeldFrames();

    std::unique_ptr<Stream> m_stream;
    VideoInfo m_info;
    QString m_error;

    QImage m_shown;               // latest frame not after the requested time
    double m_shownPts = -1.0;
    QImage m_ahead;               // decoded past the requested time
    double m_aheadPts = -1.0;
};
