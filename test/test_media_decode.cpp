#include <cassert>
#include <cstdio>
#include <cmath>
#include <QImage>
#include <QProcess>
#include <QStandardPaths>
#include <QTemporaryDir>
#include "media/MediaProbe.h"
#include "media/VideoDecoder.h"
#include "render/BackgroundProvider.h"

// Clips are generated with the ffmpeg binary when it is installed.
static bool makeClip(const QString& ffmpeg, const QStringList& args) {
    QProcess proc;
    proc.start(ffmpeg, QStringList{"-v", "error", "-y"} + args);
    if (!proc.waitForFinished(30000)) return false;
    return proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0;
}

void test_probe_missing_file() {
    MediaProbe probe;
    assert(!probe.probe("/nonexistent/clip.mp4"));
    assert(!probe.errorString().isEmpty());
    assert(!probe.info().hasVideo);

    VideoDecoder decoder;
    assert(!decoder.open("/nonexistent/clip.mp4"));
    assert(!decoder.isOpen());
    assert(decoder.errorString().contains("Cannot open"));
    printf("PASS: test_probe_missing_file\n");
}

void test_background_fallbacks() {
    BackgroundProvider provider;
    provider.setCanvasSize(QSize(64, 36));

    SceneState state;
    state.canvasSize = QSize(64, 36);
    state.background.type = BackgroundType::SolidColor;
    assert(provider.imageFor(state).isNull());
    assert(!provider.isDegraded());

    state.background.type = BackgroundType::Video;
    state.background.path = "/nonexistent/bg.mp4";
    assert(provider.imageFor(state).isNull());
    assert(provider.isDegraded());
    // Still degraded on the next frame without reopening
    assert(provider.imageFor(state).isNull());
    assert(provider.isDegraded());

    state.background.type = BackgroundType::Image;
    state.background.path = "/nonexistent/bg.png";
    assert(provider.imageFor(state).isNull());
    assert(provider.isDegraded());
    printf("PASS: test_background_fallbacks\n");
}

void test_background_image_fill() {
    QTemporaryDir dir;
    assert(dir.isValid());
    QImage wide(200, 50, QImage::Format_RGB32);
    wide.fill(QColor(10, 200, 30));
    const QString path = dir.filePath("bg.png");
    assert(wide.save(path));

    BackgroundProvider provider;
    provider.setCanvasSize(QSize(64, 36));
    SceneState state;
    state.background.type = BackgroundType::Image;
    state.background.path = path;

    QImage img = provider.imageFor(state);
    assert(!img.isNull());
    assert(!provider.isDegraded());
    assert(img.size() == QSize(64, 36));
    assert(img.format() == QImage::Format_RGBA8888);
    QColor c = img.pixelColor(32, 18);
    assert(std::abs(c.green() - 200) <= 2 && std::abs(c.red() - 10) <= 2);

    MediaProbe probe;
    assert(probe.probe(path));
    assert(probe.info().hasVideo && !probe.info().hasAudio);
    assert(probe.info().isStillImage());
    printf("PASS: test_background_image_fill\n");
}

// Left half red, right half blue
static QString writeSplitImage(const QTemporaryDir& dir, int width, int height) {
    QImage img(width, height, QImage::Format_RGB32);
    img.fill(Qt::red);
    for (int y = 0; y < height; ++y)
        for (int x = width / 2; x < width; ++x)
            img.setPixelColor(x, y, Qt::blue);
    const QString path = dir.filePath("split.png");
    return img.save(path) ? path : QString();
}

void test_background_refits_on_resize() {
    QTemporaryDir dir;
    const QString path = writeSplitImage(dir, 200, 100);
    assert(!path.isEmpty());

    BackgroundProvider provider;
    SceneState state;
    state.background.type = BackgroundType::Image;
    state.background.path = path;

    provider.setCanvasSize(QSize(200, 100));
    QImage big = provider.imageFor(state);
    assert(big.size() == QSize(200, 100));
    assert(big.pixelColor(75, 50).red() > 200);

    // Same path, smaller canvas: x=75 now lies in the right half
    provider.setCanvasSize(QSize(100, 50));
    QImage small = provider.imageFor(state);
    assert(small.size() == QSize(100, 50));
    QColor c = small.pixelColor(75, 25);
    assert(c.blue() > 200 && c.red() < 50);

    // Setting the same size again keeps the fitted image
    provider.setCanvasSize(QSize(100, 50));
    assert(provider.imageFor(state).size() == QSize(100, 50));
    printf("PASS: test_background_refits_on_resize\n");
}

void test_generated_video(const QString& ffmpeg, const QTemporaryDir& dir) {
    const QString path = dir.filePath("clip.mp4");
    if (!makeClip(ffmpeg, {"-f", "lavfi", "-i", "testsrc=size=160x120:rate=25", "-t", "2",
                           "-c:v", "mpeg4", "-pix_fmt", "yuv420p", path})) {
        printf("SKIP: test_generated_video (ffmpeg could not encode mpeg4)\n");
        return;
    }

    MediaProbe probe;
    bool ok = probe.probe(path);
    if (!ok) printf("  probe error: %s\n", probe.errorString().toUtf8().constData());
    assert(ok);
    const MediaInfo& info = probe.info();
    assert(info.hasVideo);
    assert(!info.hasAudio);
    assert(info.videoWidth == 160 && info.videoHeight == 120);
    assert(std::abs(info.videoFps - 25.0) < 0.01);
    assert(std::abs(info.duration - 2.0) < 0.2);

    VideoDecoder decoder;
    assert(decoder.open(path));
    assert(decoder.info().width == 160);
    assert(std::abs(decoder.info().fps - 25.0) < 0.01);

    QImage first = decoder.frameAt(0.0);
    assert(!first.isNull());
    assert(first.size() == QSize(160, 120));
    assert(first.format() == QImage::Format_RGBA8888);

    QImage later = decoder.frameAt(1.0);
    assert(!later.isNull());
    assert(later != first);   // testsrc animates

    // Backward jump seeks
    QImage again = decoder.frameAt(0.0);
    assert(!again.isNull());

    // Past the end the last frame is held
    QImage held = decoder.frameAt(30.0);
    assert(!held.isNull());
    assert(held.size() == QSize(160, 120));

    BackgroundProvider provider;
    provider.setCanvasSize(QSize(320, 180));
    SceneState state;
    state.background.type = BackgroundType::Video;
    state.background.path = path;
    state.backgroundFrameIndex = 10;
    QImage bg = provider.imageFor(state);
    assert(!provider.isDegraded());
    assert(bg.size() == QSize(320, 180));
    printf("PASS: test_generated_video\n");
}

void test_generated_audio(const QString& ffmpeg, const QTemporaryDir& dir) {
    const QString path = dir.filePath("tone.wav");
    if (!makeClip(ffmpeg, {"-f", "lavfi", "-i", "sine=frequency=440:sample_rate=44100:duration=1", path})) {
        printf("SKIP: test_generated_audio (ffmpeg could not write wav)\n");
        return;
    }

    MediaProbe probe;
    assert(probe.probe(path));
    assert(probe.info().hasAudio);
    assert(!probe.info().hasVideo);
    assert(probe.info().audioSampleRate == 44100);
    assert(probe.info().audioChannels == 1);
    assert(std::abs(probe.info().duration - 1.0) < 0.1);

    VideoDecoder decoder;
    assert(!decoder.open(path));
    assert(decoder.errorString().contains("No video stream"));
    printf("PASS: test_generated_audio\n");
}

int main() {
    test_probe_missing_file();
    test_background_fallbacks();
    test_background_image_fill();
    test_background_refits_on_resize();

    QString ffmpeg = QStandardPaths::findExecutable("ffmpeg");
    if (ffmpeg.isEmpty()) {
        printf("SKIP: generated media tests (no ffmpeg binary)\n");
    } else {
        QTemporaryDir dir;
        assert(dir.isValid());
        test_generated_video(ffmpeg, dir);
        test_generated_audio(ffmpeg, dir);
    }

    printf("All media tests passed.\n");
    return 0;
}
