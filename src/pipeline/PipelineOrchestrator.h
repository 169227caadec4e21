#pragma once

#include <QObject>
#include <memory>
#include "EncoderProcessManager.h"
#include "FrameCaptureSystem.h"
#include "RenderExecutor.h"

class SceneSource;
struct SceneDescription;

enum class PipelineMode {
    Preview,
    Export
};

// What a run produces. Export uses settings (size, rate, pixel format and
// output file); preview uses rate/previewFormat and hands frames to previewSink.
struct OutputTarget {
    EncoderSettings settings;
    QString audioPath;
    double audioOffsetSeconds = 0.0;
    double durationSeconds = 0.0;       // 0 = scene duration

    FrameRate rate;
    PixelFormat previewFormat = PixelFormat::RGBA;
    FrameCallback previewSink;          // runs on the delivery thread; may be empty
    bool paced = true;
    OverflowPolicy previewOverflow = OverflowPolicy::Block;
};

struct PipelineProgress {
    int64_t framesDone = 0;
    int64_t totalFrames = 0;
    double fraction = 0.0;
    double etaSeconds = -1.0;
};

// Owns the render context (through RenderExecutor) and runs either a paced
// preview or a one-pass export through the same renderer and scene source.
// Decides every state transition; background threads only report here.
class PipelineOrchestrator : public QObject {
    Q_OBJECT
public:
    explicit PipelineOrchestrator(QObject* parent = nullptr);
    ~PipelineOrchestrator();

    // rendererName is "gl", "raster" or "mock".
    bool initialize(const SceneSource* scene, const QString& rendererName = "gl",
                    PipelineError* error = nullptr);
    bool initialize(const SceneSource* scene, std::unique_ptr<FrameRenderer> renderer,
                    PipelineError* error = nullptr);
    bool isInitialized() const { return m_executor && m_executor->isInitialized(); }

    bool start(PipelineMode mode, const OutputTarget& target, PipelineError* error = nullptr);

    // Preview only; an export is a forward-only stream.
    bool pause(PipelineError* error = nullptr);
    bool resume(PipelineError* error = nullptr);
    bool seek(double seconds, PipelineError* error = nullptr);

    void cancel();

    // Spins a local event loop until the run ends or the timeout expires.
    bool waitForFinished(int timeoutMs);

    bool isRunning() const { return m_running; }
    PipelineMode mode() const { return m_mode; }
    PipelineProgress lastProgress() const { return m_progress; }
    CaptureStats captureStats() const;
    const ExportJob& exportJob() const { return m_encoder.job(); }
    const char* rendererName() const { return m_executor ? m_executor->rendererName() : ""; }

    EncoderProcessManager& encoder() { return m_encoder; }

    // Fills in the native rate of a video background and checks the audio
    // track. A background that cannot be probed only degrades rendering.
    static bool probeSceneMedia(SceneDescription& description, PipelineError* error);

signals:
    void progress(const PipelineProgress& progress);
    void completed(const QString& outputPath);
    void failed(const PipelineError& error, const QString& summary);
    void cancelled();

private:
    bool startPreview(const OutputTarget& target, PipelineError* error);
    bool startExport(const OutputTarget& target, PipelineError* error);
    bool ensureRenderSize(const QSize& size, PipelineError* error);
    bool checkAudio(const QString& path, PipelineError* error);

    void onFrameCaptured(qint64 index, double timeSeconds);
    void onCaptureFinished();
    void onCaptureFailed(const PipelineError& error);
    void onEncoderProgress(qint64 written, qint64 total, double eta);
    void onEncoderFailed(const PipelineError& error, const QStringList& tail);
    void onEncoderCancelled();

    void finishCompleted(const QString& outputPath);
    void finishFailed(const PipelineError& error, const QStringList& tail);
    void finishCancelled();

    const SceneSource* m_scene = nullptr;
    std::unique_ptr<RenderExecutor> m_executor;
    std::unique_ptr<FrameCaptureSystem> m_capture;
    EncoderProcessManager m_encoder;

    PipelineMode m_mode = PipelineMode::Preview;
    bool m_running = false;
    PipelineProgress m_progress;
};

Q_DECLARE_METATYPE(PipelineProgress)
