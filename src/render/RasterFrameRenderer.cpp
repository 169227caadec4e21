#include "RasterFrameRenderer.h"
#include "Logging.h"
#include <QPainter>
#include <cstring>

bool RasterFrameRenderer::initialize(const QSize& size) {
    if (size.width() <= 0 || size.height() <= 0)
        return setError(PipelineError::invalidParameter(
            QString("render size %1x%2 must be positive").arg(size.width()).arg(size.height())));

    m_canvas = QImage(size, QImage::Format_RGBA8888);
    if (m_canvas.isNull())
        return setError(PipelineError::renderTargetUnavailable(
            QString("cannot allocate %1x%2 raster canvas").arg(size.width()).arg(size.height())));

    m_background.setCanvasSize(size);
    m_error = PipelineError::none();
    qCInfo(lcRender) << "Raster renderer ready at" << size;
    return true;
}

void RasterFrameRenderer::shutdown() {
    m_canvas = QImage();
}

bool RasterFrameRenderer::render(const FrameTimestamp& timestamp, const SceneState& scene,
                                 QByteArray& rgba) {
    Q_UNUSED(timestamp)
    if (m_canvas.isNull())
        return setError(PipelineError::renderTargetUnavailable("raster renderer is not initialized"));

    m_canvas.fill(scene.background.color);

    QPainter painter(&m_canvas);
    QImage bg = m_background.imageFor(scene);
    if (!bg.isNull())
        painter.drawImage(0, 0, bg);

    SceneState sized = scene;
    sized.canvasSize = m_canvas.size();
    m_subtitles.paint(painter, sized);
    painter.end();

    const qsizetype rowBytes = static_cast<qsizetype>(m_canvas.width()) * 4;
    const qsizetype total = rowBytes * m_canvas.height();
    if (rgba.size() != total) rgba.resize(total);

    char* out = rgba.data();
    for (int y = 0; y < m_canvas.height(); ++y)
        std::memcpy(out + y * rowBytes, m_canvas.constScanLine(y), static_cast<size_t>(rowBytes));
    return true;
}
