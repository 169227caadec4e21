#pragma once

#include <QImage>
#include <QSize>
#include <memory>
#include "SceneTypes.h"

class VideoDecoder;

// Resolves a scene's background reference to an image sized to the canvas.
// Media that cannot be loaded falls back to the solid colour; that degraded
// mode is logged once per source, never silently.
class BackgroundProvider {
public:
    BackgroundProvider();
    ~BackgroundProvider();

    // A new size drops the fitted media; it is reloaded on the next frame.
    void setCanvasSize(const QSize& size);

    // Null image means "fill with scene.background.color".
    QImage imageFor(const SceneState& scene);

    bool isDegraded() const { return m_degraded; }

private:
    bool bind(const BackgroundRef& ref);
    QImage fitToCanvas(const QImage& source) const;

    QSize m_canvasSize;
    BackgroundType m_boundType = BackgroundType::SolidColor;
    QString m_boundPath;
    bool m_bound = false;
    bool m_degraded = false;
    QImage m_staticImage;
    std::unique_ptr<VideoDecoder> m_video;
    double m_videoFps = 0.0;
};
