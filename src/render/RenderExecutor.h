#pragma once

#include <QObject>
#include <memory>
#include "FrameRenderer.h"

// Single owner of a FrameRenderer and its context. Calls made from the
// owning thread run inline; calls from any other thread are marshalled to
// the owner with a blocking queued invocation and awaited, so the context
// is only ever touched by one thread.
class RenderExecutor : public QObject {
    Q_OBJECT
public:
    explicit RenderExecutor(std::unique_ptr<FrameRenderer> renderer, QObject* parent = nullptr);
    ~RenderExecutor();

    bool initialize(const QSize& size);
    bool render(const FrameTimestamp& timestamp, const SceneState& scene, QByteArray& rgba);
    void shutdown();

    bool isInitialized() const;
    QSize size() const;
    const char* rendererName() const { return m_renderer->name(); }
    PipelineError lastError() const;

    // Factory for the CLI names "gl", "raster" and "mock".
    static std::unique_ptr<FrameRenderer> createRenderer(const QString& name);

private:
    bool initializeOnOwner(const QSize& size);
    bool renderOnOwner(const FrameTimestamp& timestamp, const SceneState& scene, QByteArray& rgba);
    void shutdownOnOwner();

    bool onOwnerThread() const;

    std::unique_ptr<FrameRenderer> m_renderer;
};
