#include "PipelineOrchestrator.h"
#include "Logging.h"
#include "MediaProbe.h"
#include "SceneSource.h"
#include "StaticSceneSource.h"
#include <QEventLoop>
#include <QTimer>
#include <algorithm>

PipelineOrchestrator::PipelineOrchestrator(QObject* parent)
    : QObject(parent)
{
    connect(&m_encoder, &EncoderProcessManager::progress, this, &PipelineOrchestrator::onEncoderProgress);
    connect(&m_encoder, &EncoderProcessManager::completed, this, [this](const QString& path) {
        if (m_running && m_mode == PipelineMode::Export) finishCompleted(path);
    });
    connect(&m_encoder, &EncoderProcessManager::failed, this, &PipelineOrchestrator::onEncoderFailed);
    connect(&m_encoder, &EncoderProcessManager::cancelled, this, &PipelineOrchestrator::onEncoderCancelled);
}

PipelineOrchestrator::~PipelineOrchestrator() {
    // Capture first: it may still be pushing into the encoder's queue
    m_capture.reset();
    if (m_executor) m_executor->shutdown();
}

bool PipelineOrchestrator::initialize(const SceneSource* scene, const QString& rendererName,
                                      PipelineError* error) {
    std::unique_ptr<FrameRenderer> renderer = RenderExecutor::createRenderer(rendererName);
    if (!renderer) {
        if (error) *error = PipelineError::invalidParameter(
                       QString("Unknown renderer '%1' (expected gl, raster or mock)").arg(rendererName));
        return false;
    }
    return initialize(scene, std::move(renderer), error);
}

bool PipelineOrchestrator::initialize(const SceneSource* scene, std::unique_ptr<FrameRenderer> renderer,
                                      PipelineError* error) {
    if (m_running) {
        if (error) *error = PipelineError::invalidState("cannot re-initialize while running");
        return false;
    }
    if (!scene) {
        if (error) *error = PipelineError::invalidParameter("no scene source");
        return false;
    }

    m_capture.reset();
    if (m_executor) m_executor->shutdown();
    m_executor = std::make_unique<RenderExecutor>(std::move(renderer));

    if (!m_executor->initialize(scene->canvasSize())) {
        PipelineError e = m_executor->lastError();
        qCCritical(lcPipeline).noquote() << formatErrorSummary(e);
        if (error) *error = e;
        m_executor.reset();
        return false;
    }

    m_scene = scene;
    m_capture = std::make_unique<FrameCaptureSystem>(m_executor.get());
    connect(m_capture.get(), &FrameCaptureSystem::frameCaptured, this, &PipelineOrchestrator::onFrameCaptured);
    connect(m_capture.get(), &FrameCaptureSystem::finished, this, &PipelineOrchestrator::onCaptureFinished);
    connect(m_capture.get(), &FrameCaptureSystem::failed, this, &PipelineOrchestrator::onCaptureFailed);
    connect(m_capture.get(), &FrameCaptureSystem::cancelled, this, [this]() {
        if (m_running && m_mode == PipelineMode::Preview) finishCancelled();
    });

    qCInfo(lcPipeline) << "Pipeline initialized with" << m_executor->rendererName() << "renderer at"
                       << scene->canvasSize();
    if (error) *error = PipelineError::none();
    return true;
}

bool PipelineOrchestrator::start(PipelineMode mode, const OutputTarget& target, PipelineError* error) {
    if (!isInitialized()) {
        if (error) *error = PipelineError::invalidState("pipeline is not initialized");
        return false;
    }
    if (m_running) {
        if (error) *error = PipelineError::invalidState("a run is already in progress");
        return false;
    }

    m_mode = mode;
    m_progress = PipelineProgress{};
    return mode == PipelineMode::Export ? startExport(target, error) : startPreview(target, error);
}

bool PipelineOrchestrator::startPreview(const OutputTarget& target, PipelineError* error) {
    if (!ensureRenderSize(m_scene->canvasSize(), error)) return false;

    CaptureOptions options;
    options.durationSeconds = target.durationSeconds > 0.0 ? target.durationSeconds : m_scene->duration();
    options.rate = target.rate;
    options.audioOffsetSeconds = target.audioOffsetSeconds;
    options.pixelFormat = target.previewFormat;
    options.overflow = target.previewOverflow;
    options.paced = target.paced;

    FrameCallback sink = target.previewSink ? target.previewSink : [](CapturedFrame) {};
    if (!m_capture->start(options, m_scene, std::move(sink), error)) return false;

    m_progress.totalFrames = m_capture->totalFrames();
    m_running = true;
    qCInfo(lcPipeline) << "Preview started," << m_progress.totalFrames << "frames";
    return true;
}

bool PipelineOrchestrator::startExport(const OutputTarget& target, PipelineError* error) {
    const EncoderSettings& settings = target.settings;
    if (!checkAudio(target.audioPath, error)) return false;
    if (!ensureRenderSize(QSize(settings.width, settings.height), error)) return false;

    CaptureOptions options;
    options.durationSeconds = target.durationSeconds > 0.0 ? target.durationSeconds : m_scene->duration();
    options.rate = settings.frameRate;
    options.audioOffsetSeconds = target.audioOffsetSeconds;
    options.pixelFormat = settings.inputPixelFormat;
    options.overflow = OverflowPolicy::Block;
    options.paced = false;

    PipelineError seqError;
    TimestampSequence seq = TimestampSequence::create(options.durationSeconds, options.rate,
                                                      options.audioOffsetSeconds, &seqError);
    if (!seq.isValid()) {
        if (error) *error = seqError;
        return false;
    }
    if (seq.isEmpty()) {
        if (error) *error = PipelineError::invalidParameter("nothing to export: duration is zero");
        return false;
    }

    if (!m_encoder.start(settings, seq.size(), target.audioPath, error)) return false;

    PipelineError captureError;
    if (!m_capture->start(options, m_scene, m_encoder.inputQueue(), &captureError)) {
        m_encoder.abort(captureError);
        m_encoder.waitForFinished(-1);
        if (error) *error = captureError;
        return false;
    }

    m_progress.totalFrames = seq.size();
    m_running = true;
    qCInfo(lcPipeline) << "Export started:" << settings.outputPath << seq.size() << "frames";
    return true;
}

bool PipelineOrchestrator::ensureRenderSize(const QSize& size, PipelineError* error) {
    if (m_executor->size() == size) return true;

    qCDebug(lcPipeline) << "Resizing render target" << m_executor->size() << "->" << size;
    m_executor->shutdown();
    if (!m_executor->initialize(size)) {
        if (error) *error = m_executor->lastError();
        return false;
    }
    return true;
}

bool PipelineOrchestrator::checkAudio(const QString& path, PipelineError* error) {
    if (path.isEmpty()) return true;

    MediaProbe probe;
    if (!probe.probe(path) || !probe.info().hasAudio) {
        const QString reason = probe.errorString().isEmpty() ? QString("no audio stream") : probe.errorString();
        PipelineError e = PipelineError::mediaUnavailable(QString("Audio track %1: %2").arg(path, reason));
        qCWarning(lcPipeline).noquote() << formatErrorSummary(e);
        if (error) *error = e;
        return false;
    }
    qCDebug(lcPipeline) << "Audio:" << probe.info().audioCodec << probe.info().audioSampleRate << "Hz,"
                        << probe.info().duration << "s";
    return true;
}

bool PipelineOrchestrator::probeSceneMedia(SceneDescription& description, PipelineError* error) {
    if (description.background.type == BackgroundType::Video && description.backgroundFps <= 0.0) {
        MediaProbe probe;
        const bool probed = probe.probe(description.background.path);
        if (probed && probe.info().isStillImage()) {
            qCDebug(lcPipeline) << "Background" << description.background.path << "is a still picture";
        } else if (probed && probe.info().hasVideo) {
            description.backgroundFps = probe.info().videoFps;
            qCDebug(lcPipeline) << "Background video at" << description.backgroundFps << "fps";
        } else {
            qCWarning(lcPipeline) << "Cannot probe background video" << description.background.path
                                  << probe.errorString();
        }
    }

    if (!description.audioPath.isEmpty()) {
        MediaProbe probe;
        if (!probe.probe(description.audioPath) || !probe.info().hasAudio) {
            if (error) *error = PipelineError::mediaUnavailable(
                           QString("Audio track %1: %2").arg(description.audioPath, probe.errorString()));
            return false;
        }
        if (description.durationSeconds <= 0.0 && description.cues.empty())
            description.durationSeconds = probe.info().duration;
    }
    return true;
}

bool PipelineOrchestrator::pause(PipelineError* error) {
    if (!m_running || m_mode != PipelineMode::Preview) {
        if (error) *error = PipelineError::invalidState("pause is only available during preview");
        return false;
    }
    m_capture->pause();
    return true;
}

bool PipelineOrchestrator::resume(PipelineError* error) {
    if (!m_running || m_mode != PipelineMode::Preview) {
        if (error) *error = PipelineError::invalidState("resume is only available during preview");
        return false;
    }
    m_capture->resume();
    return true;
}

bool PipelineOrchestrator::seek(double seconds, PipelineError* error) {
    if (!m_running || m_mode != PipelineMode::Preview) {
        if (error) *error = PipelineError::invalidState("seek is only available during preview");
        return false;
    }
    if (!m_capture->seek(seconds)) {
        if (error) *error = m_executor->lastError();
        return false;
    }
    return true;
}

void PipelineOrchestrator::cancel() {
    if (!m_running) return;
    qCInfo(lcPipeline) << "Cancel requested";
    m_capture->cancel();
    if (m_mode == PipelineMode::Export) m_encoder.cancel();
}

bool PipelineOrchestrator::waitForFinished(int timeoutMs) {
    if (!m_running) return true;

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    connect(this, &PipelineOrchestrator::completed, &loop, &QEventLoop::quit);
    connect(this, &PipelineOrchestrator::failed, &loop, &QEventLoop::quit);
    connect(this, &PipelineOrchestrator::cancelled, &loop, &QEventLoop::quit);
    if (timeoutMs >= 0) timeout.start(timeoutMs);
    loop.exec();
    return !m_running;
}

CaptureStats PipelineOrchestrator::captureStats() const {
    return m_capture ? m_capture->stats() : CaptureStats{};
}

void PipelineOrchestrator::onFrameCaptured(qint64 index, double timeSeconds) {
    Q_UNUSED(timeSeconds);
    if (!m_running || m_mode != PipelineMode::Preview) return;

    m_progress.framesDone = std::max<int64_t>(m_progress.framesDone, index + 1);
    m_progress.fraction = m_progress.totalFrames > 0
        ? double(m_progress.framesDone) / double(m_progress.totalFrames) : 0.0;
    const double fps = m_capture->stats().effectiveFps;
    m_progress.etaSeconds = fps > 0.0 ? (m_progress.totalFrames - m_progress.framesDone) / fps : -1.0;
    emit progress(m_progress);
}

void PipelineOrchestrator::onCaptureFinished() {
    if (!m_running) return;
    if (m_mode == PipelineMode::Export) {
        m_encoder.finishInput();
        return;
    }
    finishCompleted(QString());
}

void PipelineOrchestrator::onCaptureFailed(const PipelineError& error) {
    if (!m_running) return;
    if (m_mode == PipelineMode::Export) {
        // The job fails with the render error once the encoder is down
        m_encoder.abort(error);
        return;
    }
    finishFailed(error, {});
}

void PipelineOrchestrator::onEncoderProgress(qint64 written, qint64 total, double eta) {
    if (!m_running || m_mode != PipelineMode::Export) return;
    m_progress.framesDone = std::max<int64_t>(m_progress.framesDone, written);
    m_progress.totalFrames = total;
    m_progress.fraction = total > 0 ? std::min(1.0, double(m_progress.framesDone) / double(total)) : 0.0;
    m_progress.etaSeconds = eta;
    emit progress(m_progress);
}

void PipelineOrchestrator::onEncoderFailed(const PipelineError& error, const QStringList& tail) {
    if (!m_running || m_mode != PipelineMode::Export) return;
    m_capture->cancel();
    finishFailed(error, tail);
}

void PipelineOrchestrator::onEncoderCancelled() {
    if (!m_running || m_mode != PipelineMode::Export) return;
    finishCancelled();
}

void PipelineOrchestrator::finishCompleted(const QString& outputPath) {
    m_running = false;
    m_progress.framesDone = m_mode == PipelineMode::Export ? m_encoder.job().framesWritten
                                                           : m_progress.totalFrames;
    m_progress.fraction = 1.0;
    m_progress.etaSeconds = 0.0;
    emit progress(m_progress);
    qCInfo(lcPipeline) << "Run completed" << outputPath;
    emit completed(outputPath);
}

void PipelineOrchestrator::finishFailed(const PipelineError& error, const QStringList& tail) {
    m_running = false;
    const QString summary = formatErrorSummary(error, tail);
    qCCritical(lcPipeline).noquote() << summary;
    emit failed(error, summary);
}

void PipelineOrchestrator::finishCancelled() {
    m_running = false;
    qCInfo(lcPipeline) << "Run cancelled after" << m_progress.framesDone << "frames";
    emit cancelled();
}
