#include "FrameCaptureSystem.h"
#include "Logging.h"
#include "RenderExecutor.h"
#include "SceneSource.h"
#include <algorithm>
#include <cmath>

namespace {
// Producer wakes this often while blocked on a full queue to poll for cancel
constexpr int PushPollMs = 50;
}

// --- DeliveryThread ---

DeliveryThread::DeliveryThread(FrameQueue* queue, FrameCallback callback, QObject* parent)
    : QThread(parent), m_queue(queue), m_callback(std::move(callback)) {}

void DeliveryThread::requestStop() {
    m_stopRequested = true;
    m_queue->close();
}

void DeliveryThread::run() {
    while (!m_stopRequested) {
        CapturedFrame frame;
        QueueStatus status = m_queue->pop(frame, 100);
        if (status == QueueStatus::Closed) break;
        if (status == QueueStatus::Timeout) continue;

        if (m_callback) m_callback(std::move(frame));
        ++m_delivered;
    }
}

// --- FrameCaptureSystem ---

FrameCaptureSystem::FrameCaptureSystem(RenderExecutor* executor, QObject* parent)
    : QObject(parent), m_executor(executor)
{
    connect(&m_timer, &QTimer::timeout, this, &FrameCaptureSystem::onTick);
}

FrameCaptureSystem::~FrameCaptureSystem() {
    m_timer.stop();
    if (m_delivery) {
        m_delivery->requestStop();
        m_delivery->wait();
    }
}

bool FrameCaptureSystem::prepare(const CaptureOptions& options, const SceneSource* scene,
                                 PipelineError* error) {
    auto reject = [error](const PipelineError& e) {
        if (error) *error = e;
        qCWarning(lcCapture) << "Capture not started:" << e.message;
        return false;
    };

    if (m_running)
        return reject(PipelineError::invalidState("capture is already running"));
    if (!scene)
        return reject(PipelineError::invalidParameter("no scene source"));
    if (!m_executor || !m_executor->isInitialized())
        return reject(PipelineError::renderTargetUnavailable("renderer is not initialized"));

    PipelineError seqError;
    TimestampSequence seq = TimestampSequence::create(options.durationSeconds, options.rate,
                                                      options.audioOffsetSeconds, &seqError);
    if (!seq.isValid()) return reject(seqError);

    m_frameSize = m_executor->size();
    if (requiresEvenDimensions(options.pixelFormat) &&
        ((m_frameSize.width() & 1) || (m_frameSize.height() & 1)))
        return reject(PipelineError::unsupportedDimensions(m_frameSize.width(), m_frameSize.height(),
                                                           pixelFormatName(options.pixelFormat)));

    m_options = options;
    m_scene = scene;
    m_sequence = seq;
    m_nextIndex = 0;
    m_pending.reset();
    m_cancelRequested = false;
    m_paused = false;
    m_productionDone = false;
    m_renderMsTotal = 0.0;
    {
        QMutexLocker lock(&m_statsMutex);
        m_stats = CaptureStats{};
        m_stats.framesTotal = seq.size();
    }
    return true;
}

bool FrameCaptureSystem::start(const CaptureOptions& options, const SceneSource* scene,
                               FrameCallback onFrame, PipelineError* error) {
    if (!prepare(options, scene, error)) return false;

    m_ownQueue = std::make_unique<FrameQueue>(options.queueCapacity, options.overflow);
    m_queue = m_ownQueue.get();
    m_delivery = std::make_unique<DeliveryThread>(m_queue, std::move(onFrame));
    connect(m_delivery.get(), &QThread::finished, this, &FrameCaptureSystem::onDeliveryFinished);
    m_delivery->start();

    m_running = true;
    m_clock.start();
    m_timer.start(options.paced ? std::max(1, qRound(1000.0 * options.rate.frameDuration())) : 0);
    qCInfo(lcCapture) << "Capture started:" << m_sequence.size() << "frames at"
                      << options.rate.toString() << "fps," << pixelFormatName(options.pixelFormat)
                      << (options.paced ? "(paced)" : "");
    if (error) *error = PipelineError::none();
    return true;
}

bool FrameCaptureSystem::start(const CaptureOptions& options, const SceneSource* scene,
                               FrameQueue* sink, PipelineError* error) {
    if (!sink) {
        if (error) *error = PipelineError::invalidParameter("no frame sink");
        return false;
    }
    if (!prepare(options, scene, error)) return false;

    m_ownQueue.reset();
    m_delivery.reset();
    m_queue = sink;

    m_running = true;
    m_clock.start();
    m_timer.start(options.paced ? std::max(1, qRound(1000.0 * options.rate.frameDuration())) : 0);
    qCInfo(lcCapture) << "Capture started:" << m_sequence.size() << "frames at"
                      << options.rate.toString() << "fps into external queue,"
                      << pixelFormatName(options.pixelFormat);
    if (error) *error = PipelineError::none();
    return true;
}

void FrameCaptureSystem::cancel() {
    m_cancelRequested = true;
    // A paused capture has no timer running, so handle the request explicitly
    if (QThread::currentThread() == thread())
        onTick();
    else
        QMetaObject::invokeMethod(this, [this]() { onTick(); }, Qt::QueuedConnection);
}

void FrameCaptureSystem::pause() {
    if (!m_running || m_paused) return;
    m_paused = true;
    m_timer.stop();
    qCDebug(lcCapture) << "Capture paused at frame" << m_nextIndex;
}

void FrameCaptureSystem::resume() {
    if (!m_running || !m_paused) return;
    m_paused = false;
    m_timer.start();
    qCDebug(lcCapture) << "Capture resumed at frame" << m_nextIndex;
}

bool FrameCaptureSystem::seek(double seconds) {
    if (!m_running || m_sequence.isEmpty()) return false;

    int64_t index = m_sequence.indexForTime(seconds);
    if (m_ownQueue) m_ownQueue->clear();
    m_pending.reset();
    m_productionDone = false;
    qCDebug(lcCapture) << "Seek to" << seconds << "s -> frame" << index;

    m_nextIndex = index;
    if (captureFrame(index)) {
        m_nextIndex = index + 1;
        return true;
    }
    return m_pending.has_value();   // rendered, queued on a later tick
}

CaptureStats FrameCaptureSystem::stats() const {
    QMutexLocker lock(&m_statsMutex);
    CaptureStats s = m_stats;
    if (m_delivery) s.framesDelivered = m_delivery->delivered();
    if (m_queue) s.framesDropped = m_queue->droppedCount();
    return s;
}

bool FrameCaptureSystem::captureFrame(int64_t index) {
    const FrameTimestamp ts = m_sequence.at(index);
    const SceneState scene = m_scene->sceneAt(ts.timeSeconds);

    QElapsedTimer renderClock;
    renderClock.start();
    if (!m_executor->render(ts, scene, m_rgba)) {
        fail(m_executor->lastError());
        return false;
    }
    const double renderMs = renderClock.nsecsElapsed() / 1.0e6;

    CapturedFrame frame;
    frame.index = ts.index;
    frame.timeSeconds = ts.timeSeconds;
    frame.pixelFormat = m_options.pixelFormat;
    frame.width = m_frameSize.width();
    frame.height = m_frameSize.height();
    frame.buffer = m_pool.acquire(static_cast<qsizetype>(
        bytesPerFrame(m_options.pixelFormat, frame.width, frame.height)));

    PipelineError convError;
    if (!m_converter.convert(m_rgba, frame.width, frame.height, m_options.pixelFormat,
                             *frame.buffer, &convError)) {
        fail(convError);
        return false;
    }

    {
        QMutexLocker lock(&m_statsMutex);
        ++m_stats.framesRendered;
        m_renderMsTotal += renderMs;
        m_stats.avgRenderMs = m_renderMsTotal / m_stats.framesRendered;
        m_stats.minRenderMs = m_stats.framesRendered == 1 ? renderMs : std::min(m_stats.minRenderMs, renderMs);
        m_stats.maxRenderMs = std::max(m_stats.maxRenderMs, renderMs);
        const double elapsed = m_clock.elapsed() / 1000.0;
        m_stats.effectiveFps = elapsed > 0.0 ? m_stats.framesRendered / elapsed : 0.0;
    }

    m_pending = std::move(frame);
    return deliverPending();
}

bool FrameCaptureSystem::deliverPending() {
    // Backpressure: wait a bounded time for space, then give the event loop
    // a turn (cancel, timers) and retry on the next tick
    QueueStatus status = m_queue->push(*m_pending, PushPollMs);
    if (status == QueueStatus::Timeout) return false;

    const CapturedFrame frame = std::move(*m_pending);
    m_pending.reset();
    if (status == QueueStatus::Closed) {
        // Consumer went away (encoder died); the owner of the sink reports why
        qCWarning(lcCapture) << "Frame queue closed at frame" << frame.index << "- stopping capture";
        stopTicking();
        m_running = false;
        return false;
    }

    emit frameCaptured(frame.index, frame.timeSeconds);
    return true;
}

void FrameCaptureSystem::onTick() {
    if (!m_running) return;

    if (m_cancelRequested) {
        stopTicking();
        m_running = false;
        m_pending.reset();
        if (m_delivery) {
            m_delivery->requestStop();
            m_delivery->wait();
        }
        qCInfo(lcCapture) << "Capture cancelled before frame" << m_nextIndex;
        emit cancelled();
        return;
    }

    if (m_paused || m_productionDone) return;

    if (m_pending) {
        if (deliverPending()) ++m_nextIndex;
        return;
    }

    if (m_nextIndex >= m_sequence.size()) {
        finishProduction();
        return;
    }

    if (captureFrame(m_nextIndex)) ++m_nextIndex;
}

void FrameCaptureSystem::finishProduction() {
    m_productionDone = true;
    qCInfo(lcCapture) << "All" << m_sequence.size() << "frames produced";

    if (m_delivery) {
        m_timer.stop();
        m_ownQueue->close();
        return;   // finished() once the delivery thread drains
    }

    stopTicking();
    m_running = false;
    emit finished();
}

void FrameCaptureSystem::onDeliveryFinished() {
    // Cancel or failure already reported, or a stale signal from a previous run
    if (!m_running || !m_delivery || !m_delivery->isFinished()) return;
    stopTicking();
    m_running = false;
    qCInfo(lcCapture) << "Delivered" << (m_delivery ? m_delivery->delivered() : 0) << "frames";
    emit finished();
}

void FrameCaptureSystem::stopTicking() {
    m_timer.stop();
}

void FrameCaptureSystem::fail(const PipelineError& error) {
    stopTicking();
    m_running = false;
    m_pending.reset();
    if (m_delivery) {
        m_delivery->requestStop();
        m_delivery->wait();
    }
    qCCritical(lcCapture) << "Capture failed:" << error.message;
    emit failed(error);
}
