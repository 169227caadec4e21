#pragma once

#include <QImage>
#include <memory>
#include "FrameRenderer.h"
#include "BackgroundProvider.h"
#include "SubtitlePainter.h"

class QOffscreenSurface;
class QOpenGLContext;
class QOpenGLFramebufferObject;
class QOpenGLShaderProgram;
class QOpenGLTexture;
class QOpenGLBuffer;

// Off-screen OpenGL renderer. The context is current only on the thread that
// called initialize(); every later call must come from that thread.
class GlFrameRenderer : public FrameRenderer {
public:
    GlFrameRenderer();
    ~GlFrameRenderer() override;

    const char* name() const override { return "gl"; }

    bool initialize(const QSize& size) override;
    void shutdown() override;
    bool isInitialized() const override { return m_fbo != nullptr; }
    QSize size() const override { return m_size; }

    bool render(const FrameTimestamp& timestamp, const SceneState& scene,
                QByteArray& rgba) override;

private:
    bool makeCurrent();
    bool buildShader();
    void drawBackground(const SceneState& scene);

    QSize m_size;
    std::unique_ptr<QOffscreenSurface> m_surface;
    std::unique_ptr<QOpenGLContext> m_context;
    std::unique_ptr<QOpenGLFramebufferObject> m_fbo;
    std::unique_ptr<QOpenGLShaderProgram> m_program;
    std::unique_ptr<QOpenGLTexture> m_texture;
    std::unique_ptr<QOpenGLBuffer> m_quad;
    QImage m_uploadedImage;     // what m_texture currently holds
    BackgroundProvider m_background;
    SubtitlePainter m_subtitles;
    QByteArray m_readback;
};
