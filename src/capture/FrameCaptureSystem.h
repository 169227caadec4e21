#pragma once

#include <QElapsedTimer>
#include <QMutex>
#include <QObject>
#include <QSize>
#include <QThread>
#include <QTimer>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include "FrameBufferPool.h"
#include "FrameQueue.h"
#include "PixelFormatConverter.h"
#include "TimestampGenerator.h"

class RenderExecutor;
class SceneSource;

using FrameCallback = std::function<void(CapturedFrame)>;

struct CaptureOptions {
    double durationSeconds = 0.0;
    FrameRate rate;
    double audioOffsetSeconds = 0.0;
    PixelFormat pixelFormat = PixelFormat::RGBA;
    int queueCapacity = AppConstants::DefaultQueueCapacity;
    OverflowPolicy overflow = OverflowPolicy::Block;
    bool paced = false;     // tick at the frame rate (preview) instead of as fast as possible
};

struct CaptureStats {
    int64_t framesTotal = 0;
    int64_t framesRendered = 0;
    int64_t framesDelivered = 0;
    int64_t framesDropped = 0;
    double avgRenderMs = 0.0;
    double minRenderMs = 0.0;
    double maxRenderMs = 0.0;
    double effectiveFps = 0.0;
};

// Pops frames off the capture queue and hands each to the callback, in order.
class DeliveryThread : public QThread {
    Q_OBJECT
public:
    DeliveryThread(FrameQueue* queue, FrameCallback callback, QObject* parent = nullptr);

    void requestStop();
    int64_t delivered() const { return m_delivered; }

protected:
    void run() override;

private:
    FrameQueue* m_queue;
    FrameCallback m_callback;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<int64_t> m_delivered{0};
};

// Drives timestamp generation and rendering on the thread that owns the
// render context (a QTimer tick, one frame per tick) and feeds the bounded
// queue. Consumers are either a callback run on a delivery thread or an
// external queue drained by someone else (the encoder writer).
class FrameCaptureSystem : public QObject {
    Q_OBJECT
public:
    explicit FrameCaptureSystem(RenderExecutor* executor, QObject* parent = nullptr);
    ~FrameCaptureSystem();

    bool start(const CaptureOptions& options, const SceneSource* scene,
               FrameCallback onFrame, PipelineError* error = nullptr);
    bool start(const CaptureOptions& options, const SceneSource* scene,
               FrameQueue* sink, PipelineError* error = nullptr);

    // Cooperative: checked between frames, callable from any thread.
    void cancel();

    void pause();
    void resume();
    // Renders the frame at `seconds` right away (also while paused) and
    // continues from there. Stale queued frames are discarded.
    bool seek(double seconds);

    bool isRunning() const { return m_running; }
    bool isPaused() const { return m_paused; }
    int64_t totalFrames() const { return m_sequence.size(); }
    int64_t nextIndex() const { return m_nextIndex; }
    const TimestampSequence& sequence() const { return m_sequence; }

    CaptureStats stats() const;

signals:
    void frameCaptured(qint64 index, double timeSeconds);
    // Every frame was produced and, in callback mode, delivered.
    void finished();
    void cancelled();
    void failed(const PipelineError& error);

private slots:
    void onTick();
    void onDeliveryFinished();

private:
    bool prepare(const CaptureOptions& options, const SceneSource* scene, PipelineError* error);
    bool captureFrame(int64_t index);
    bool deliverPending();
    void stopTicking();
    void finishProduction();
    void fail(const PipelineError& error);

    RenderExecutor* m_executor;
    const SceneSource* m_scene = nullptr;
    CaptureOptions m_options;
    TimestampSequence m_sequence;
    QSize m_frameSize;

    QTimer m_timer;
    FrameQueue* m_queue = nullptr;          // m_ownQueue or the external sink
    std::unique_ptr<FrameQueue> m_ownQueue;
    std::unique_ptr<DeliveryThread> m_delivery;
    FrameBufferPool m_pool;
    QByteArray m_rgba;                      // renderer output, reused
    PixelFormatConverter m_converter;
    std::optional<CapturedFrame> m_pending; // rendered, waiting for queue space

    std::atomic<bool> m_cancelRequested{false};
    bool m_running = false;
    bool m_paused = false;
    bool m_productionDone = false;
    int64_t m_nextIndex = 0;

    mutable QMutex m_statsMutex;
    CaptureStats m_stats;
    double m_renderMsTotal = 0.0;
    QElapsedTimer m_clock;
};
