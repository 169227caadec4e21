#include "BackgroundProvider.h"
#include "VideoDecoder.h"
#include "Logging.h"

BackgroundProvider::BackgroundProvider() = default;
BackgroundProvider::~BackgroundProvider() = default;

void BackgroundProvider::setCanvasSize(const QSize& size) {
    if (size == m_canvasSize) return;
    m_canvasSize = size;
    m_bound = false;
    m_staticImage = QImage();
}

bool BackgroundProvider::bind(const BackgroundRef& ref) {
    if (m_bound && ref.type == m_boundType && ref.path == m_boundPath)
        return !m_degraded;

    m_bound = true;
    m_boundType = ref.type;
    m_boundPath = ref.path;
    m_degraded = false;
    m_staticImage = QImage();
    m_video.reset();

    switch (ref.type) {
        case BackgroundType::SolidColor:
            qCInfo(lcRender) << "No background media bound, drawing solid colour" << ref.color.name();
            return true;

        case BackgroundType::Image: {
            QImage img(ref.path);
            if (img.isNull()) {
                m_degraded = true;
                qCWarning(lcRender) << "Cannot load background image" << ref.path
                                    << "- falling back to solid colour" << ref.color.name();
                return false;
            }
            m_staticImage = fitToCanvas(img);
            return true;
        }

        case BackgroundType::Video: {
            m_video = std::make_unique<VideoDecoder>();
            if (!m_video->open(ref.path)) {
                m_degraded = true;
                qCWarning(lcRender) << "Cannot open background video" << ref.path << ":"
                                    << m_video->errorString()
                                    << "- falling back to solid colour" << ref.color.name();
                m_video.reset();
                return false;
            }
            m_videoFps = m_video->info().fps;
            return true;
        }
    }
    return false;
}

QImage BackgroundProvider::fitToCanvas(const QImage& source) const {
    if (source.isNull() || m_canvasSize.isEmpty()) return QImage();

    // Scale to fill, centre-crop the overflow
    QImage scaled = source.scaled(m_canvasSize, Qt::KeepAspectRatioByExpanding, Qt::SmoothTransformation);
    int x = (scaled.width() - m_canvasSize.width()) / 2;
    int y = (scaled.height() - m_canvasSize.height()) / 2;
    return scaled.copy(x, y, m_canvasSize.width(), m_canvasSize.height())
        .convertToFormat(QImage::Format_RGBA8888);
}

QImage BackgroundProvider::imageFor(const SceneState& scene) {
    if (!bind(scene.background)) return QImage();

    switch (m_boundType) {
        case BackgroundType::SolidColor:
            return QImage();
        case BackgroundType::Image:
            return m_staticImage;
        case BackgroundType::Video: {
            double t = scene.timeSeconds;
            if (scene.backgroundFrameIndex >= 0 && m_videoFps > 0.0)
                t = static_cast<double>(scene.backgroundFrameIndex) / m_videoFps;
            return fitToCanvas(m_video->frameAt(t));
        }
    }
    return QImage();
}
