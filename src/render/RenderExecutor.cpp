#include "RenderExecutor.h"
#include "GlFrameRenderer.h"
#include "MockFrameRenderer.h"
#include "RasterFrameRenderer.h"
#include "Logging.h"
#include <QThread>

RenderExecutor::RenderExecutor(std::unique_ptr<FrameRenderer> renderer, QObject* parent)
    : QObject(parent), m_renderer(std::move(renderer))
{
}

RenderExecutor::~RenderExecutor() {
    if (m_renderer && onOwnerThread())
        m_renderer->shutdown();
}

std::unique_ptr<FrameRenderer> RenderExecutor::createRenderer(const QString& name) {
    if (name == "gl") return std::make_unique<GlFrameRenderer>();
    if (name == "raster") return std::make_unique<RasterFrameRenderer>();
    if (name == "mock") return std::make_unique<MockFrameRenderer>();
    return nullptr;
}

bool RenderExecutor::onOwnerThread() const {
    return QThread::currentThread() == thread();
}

bool RenderExecutor::initialize(const QSize& size) {
    if (onOwnerThread()) return initializeOnOwner(size);

    bool ok = false;
    QMetaObject::invokeMethod(this, [&]() { ok = initializeOnOwner(size); },
                              Qt::BlockingQueuedConnection);
    return ok;
}

bool RenderExecutor::render(const FrameTimestamp& timestamp, const SceneState& scene, QByteArray& rgba) {
    if (onOwnerThread()) return renderOnOwner(timestamp, scene, rgba);

    // References stay valid: the caller is blocked until the owner returns
    bool ok = false;
    QMetaObject::invokeMethod(this, [&]() { ok = renderOnOwner(timestamp, scene, rgba); },
                              Qt::BlockingQueuedConnection);
    return ok;
}

void RenderExecutor::shutdown() {
    if (onOwnerThread()) {
        shutdownOnOwner();
        return;
    }
    QMetaObject::invokeMethod(this, [this]() { shutdownOnOwner(); }, Qt::BlockingQueuedConnection);
}

bool RenderExecutor::isInitialized() const {
    return m_renderer->isInitialized();
}

QSize RenderExecutor::size() const {
    return m_renderer->size();
}

PipelineError RenderExecutor::lastError() const {
    return m_renderer->lastError();
}

bool RenderExecutor::initializeOnOwner(const QSize& size) {
    if (!m_renderer->initialize(size)) {
        qCCritical(lcRender) << "Renderer" << m_renderer->name() << "failed to initialize:"
                             << m_renderer->lastError().message;
        return false;
    }
    return true;
}

bool RenderExecutor::renderOnOwner(const FrameTimestamp& timestamp, const SceneState& scene,
                                   QByteArray& rgba) {
    if (!m_renderer->render(timestamp, scene, rgba)) {
        qCWarning(lcRender) << "Render of frame" << timestamp.index << "failed:"
                            << m_renderer->lastError().message;
        return false;
    }
    return true;
}

void RenderExecutor::shutdownOnOwner() {
    m_renderer->shutdown();
}
