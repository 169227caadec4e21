#include "GlFrameRenderer.h"
#include "Logging.h"
#include <QOffscreenSurface>
#include <QOpenGLBuffer>
#include <QOpenGLContext>
#include <QOpenGLFramebufferObject>
#include <QOpenGLFunctions>
#include <QOpenGLPaintDevice>
#include <QOpenGLShaderProgram>
#include <QOpenGLTexture>
#include <QPainter>
#include <cstring>

namespace {

// Full-screen quad; texture v runs top-down so uploaded QImages need no flip.
const char* VertexShader = R"(
attribute highp vec2 a_position;
attribute highp vec2 a_texcoord;
varying highp vec2 v_texcoord;
void main() {
    v_texcoord = a_texcoord;
    gl_Position = vec4(a_position, 0.0, 1.0);
}
)";

const char* FragmentShader = R"(
varying highp vec2 v_texcoord;
uniform sampler2D u_background;
uniform lowp vec4 u_color;
uniform bool u_useTexture;
void main() {
    gl_FragColor = u_useTexture ? texture2D(u_background, v_texcoord) : u_color;
}
)";

const GLfloat QuadVertices[] = {
    // x,    y,    u,   v
    -1.0f, -1.0f, 0.0f, 1.0f,
     1.0f, -1.0f, 1.0f, 1.0f,
    -1.0f,  1.0f, 0.0f, 0.0f,
     1.0f,  1.0f, 1.0f, 0.0f,
};

} // namespace

GlFrameRenderer::GlFrameRenderer() = default;

GlFrameRenderer::~GlFrameRenderer() {
    shutdown();
}

bool GlFrameRenderer::makeCurrent() {
    if (!m_context || !m_surface)
        return setError(PipelineError::renderTargetUnavailable("OpenGL context is not initialized"));
    if (!m_context->isValid())
        return setError(PipelineError::renderTargetUnavailable("OpenGL context was lost"));
    if (!m_context->makeCurrent(m_surface.get()))
        return setError(PipelineError::renderTargetUnavailable(
            "cannot make the OpenGL context current on this thread"));
    return true;
}

bool GlFrameRenderer::buildShader() {
    m_program = std::make_unique<QOpenGLShaderProgram>();
    if (!m_program->addShaderFromSourceCode(QOpenGLShader::Vertex, VertexShader))
        return setError(PipelineError::shaderCompilationFailed(
            QString("background vertex shader: %1").arg(m_program->log())));
    if (!m_program->addShaderFromSourceCode(QOpenGLShader::Fragment, FragmentShader))
        return setError(PipelineError::shaderCompilationFailed(
            QString("background fragment shader: %1").arg(m_program->log())));

    m_program->bindAttributeLocation("a_position", 0);
    m_program->bindAttributeLocation("a_texcoord", 1);
    if (!m_program->link())
        return setError(PipelineError::shaderCompilationFailed(
            QString("background program link: %1").arg(m_program->log())));

    m_quad = std::make_unique<QOpenGLBuffer>(QOpenGLBuffer::VertexBuffer);
    if (!m_quad->create())
        return setError(PipelineError::renderTargetUnavailable("cannot create vertex buffer"));
    m_quad->bind();
    m_quad->allocate(QuadVertices, sizeof(QuadVertices));
    m_quad->release();
    return true;
}

bool GlFrameRenderer::initialize(const QSize& size) {
    shutdown();

    if (size.width() <= 0 || size.height() <= 0)
        return setError(PipelineError::invalidParameter(
            QString("render size %1x%2 must be positive").arg(size.width()).arg(size.height())));

    QSurfaceFormat format;
    format.setRenderableType(QSurfaceFormat::OpenGL);
    format.setDepthBufferSize(0);
    format.setStencilBufferSize(8);

    m_context = std::make_unique<QOpenGLContext>();
    m_context->setFormat(format);
    if (!m_context->create()) {
        m_context.reset();
        return setError(PipelineError::renderTargetUnavailable(
            "cannot create an OpenGL context (expected OpenGL 2.0 or GLES 2.0)"));
    }

    m_surface = std::make_unique<QOffscreenSurface>();
    m_surface->setFormat(m_context->format());
    m_surface->create();
    if (!m_surface->isValid()) {
        shutdown();
        return setError(PipelineError::renderTargetUnavailable("cannot create an offscreen surface"));
    }

    if (!makeCurrent()) {
        PipelineError err = m_error;
        shutdown();
        return setError(err);
    }

    QOpenGLFramebufferObjectFormat fboFormat;
    fboFormat.setAttachment(QOpenGLFramebufferObject::CombinedDepthStencil);
    fboFormat.setInternalTextureFormat(GL_RGBA8);
    auto fbo = std::make_unique<QOpenGLFramebufferObject>(size, fboFormat);
    if (!fbo->isValid()) {
        shutdown();
        return setError(PipelineError::renderTargetUnavailable(
            QString("cannot allocate a %1x%2 framebuffer object").arg(size.width()).arg(size.height())));
    }

    if (!buildShader()) {
        PipelineError err = m_error;
        shutdown();
        return setError(err);
    }

    m_fbo = std::move(fbo);
    m_size = size;
    m_background.setCanvasSize(size);
    m_error = PipelineError::none();

    auto* f = m_context->functions();
    qCInfo(lcRender) << "OpenGL renderer ready at" << size << "-"
                     << reinterpret_cast<const char*>(f->glGetString(GL_RENDERER))
                     << reinterpret_cast<const char*>(f->glGetString(GL_VERSION));
    return true;
}

void GlFrameRenderer::shutdown() {
    if (m_context && m_surface && m_context->makeCurrent(m_surface.get())) {
        m_texture.reset();
        m_quad.reset();
        m_program.reset();
        m_fbo.reset();
        m_context->doneCurrent();
    } else {
        // No current context: the wrappers skip the GL calls but free themselves
        m_texture.reset();
        m_quad.reset();
        m_program.reset();
        m_fbo.reset();
    }
    m_uploadedImage = QImage();
    m_context.reset();
    m_surface.reset();
    m_size = QSize();
}

void GlFrameRenderer::drawBackground(const SceneState& scene) {
    auto* f = m_context->functions();
    f->glViewport(0, 0, m_size.width(), m_size.height());
    f->glDisable(GL_BLEND);
    f->glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    f->glClear(GL_COLOR_BUFFER_BIT | GL_STENCIL_BUFFER_BIT);

    QImage bg = m_background.imageFor(scene);
    const bool useTexture = !bg.isNull();
    if (useTexture && bg.cacheKey() != m_uploadedImage.cacheKey()) {
        if (!m_texture || m_texture->width() != bg.width() || m_texture->height() != bg.height()) {
            m_texture = std::make_unique<QOpenGLTexture>(QOpenGLTexture::Target2D);
            m_texture->setFormat(QOpenGLTexture::RGBA8_UNorm);
            m_texture->setSize(bg.width(), bg.height());
            m_texture->setMinMagFilters(QOpenGLTexture::Linear, QOpenGLTexture::Linear);
            m_texture->setWrapMode(QOpenGLTexture::ClampToEdge);
            m_texture->allocateStorage(QOpenGLTexture::RGBA, QOpenGLTexture::UInt8);
        }
        m_texture->setData(QOpenGLTexture::RGBA, QOpenGLTexture::UInt8, bg.constBits());
        m_uploadedImage = bg;
    }

    m_program->bind();
    m_program->setUniformValue("u_useTexture", static_cast<GLint>(useTexture));
    m_program->setUniformValue("u_color", scene.background.color);
    m_program->setUniformValue("u_background", 0);
    if (useTexture) m_texture->bind(0);

    m_quad->bind();
    m_program->enableAttributeArray(0);
    m_program->enableAttributeArray(1);
    m_program->setAttributeBuffer(0, GL_FLOAT, 0, 2, 4 * sizeof(GLfloat));
    m_program->setAttributeBuffer(1, GL_FLOAT, 2 * sizeof(GLfloat), 2, 4 * sizeof(GLfloat));
    f->glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    m_program->disableAttributeArray(0);
    m_program->disableAttributeArray(1);
    m_quad->release();

    if (useTexture) m_texture->release(0);
    m_program->release();
}

bool GlFrameRenderer::render(const FrameTimestamp& timestamp, const SceneState& scene,
                             QByteArray& rgba) {
    Q_UNUSED(timestamp)
    if (!m_fbo)
        return setError(PipelineError::renderTargetUnavailable("OpenGL renderer is not initialized"));
    if (!makeCurrent()) return false;

    if (!m_fbo->bind())
        return setError(PipelineError::renderTargetUnavailable("cannot bind the framebuffer object"));

    drawBackground(scene);

    {
        QOpenGLPaintDevice device(m_size);
        QPainter painter(&device);
        SceneState sized = scene;
        sized.canvasSize = m_size;
        m_subtitles.paint(painter, sized);
    }

    auto* f = m_context->functions();
    const qsizetype rowBytes = static_cast<qsizetype>(m_size.width()) * 4;
    const qsizetype total = rowBytes * m_size.height();
    if (m_readback.size() != total) m_readback.resize(total);

    f->glBindFramebuffer(GL_FRAMEBUFFER, m_fbo->handle());
    f->glPixelStorei(GL_PACK_ALIGNMENT, 1);
    f->glReadPixels(0, 0, m_size.width(), m_size.height(), GL_RGBA, GL_UNSIGNED_BYTE,
                    m_readback.data());
    GLenum glErr = f->glGetError();
    m_fbo->release();

    if (glErr != GL_NO_ERROR)
        return setError(PipelineError::renderTargetUnavailable(
            QString("glReadPixels failed with 0x%1").arg(glErr, 0, 16)));

    // GL rows are bottom-up
    if (rgba.size() != total) rgba.resize(total);
    const char* src = m_readback.constData();
    char* dst = rgba.data();
    for (int y = 0; y < m_size.height(); ++y)
        std::memcpy(dst + y * rowBytes, src + (m_size.height() - 1 - y) * rowBytes,
                    static_cast<size_t>(rowBytes));
    return true;
}
