#pragma once

#include <QImage>
#include "FrameRenderer.h"
#include "BackgroundProvider.h"
#include "SubtitlePainter.h"

// Software renderer: QPainter into a QImage::Format_RGBA8888 canvas.
class RasterFrameRenderer : public FrameRenderer {
public:
    const char* name() const override { return "raster"; }

    bool initialize(const QSize& size) override;
    void shutdown() override;
    bool isInitialized() const override { return !m_canvas.isNull(); }
    QSize size() const override { return m_canvas.size(); }

    bool render(const FrameTimestamp& timestamp, const SceneState& scene,
                QByteArray& rgba) override;

private:
    QImage m_canvas;
    BackgroundProvider m_background;
    SubtitlePainter m_subtitles;
};
