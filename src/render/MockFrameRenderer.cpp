#include "MockFrameRenderer.h"
#include "Logging.h"
#include <QThread>
#include <algorithm>
#include <cmath>

MockFrameRenderer::MockFrameRenderer(const Options& options)
    : m_options(options), m_rng(options.seed)
{
}

bool MockFrameRenderer::initialize(const QSize& size) {
    if (size.width() <= 0 || size.height() <= 0)
        return setError(PipelineError::invalidParameter(
            QString("render size %1x%2 must be positive").arg(size.width()).arg(size.height())));
    m_size = size;
    m_lost = false;
    m_framesRendered = 0;
    m_rng.seed(m_options.seed);
    m_error = PipelineError::none();
    qCInfo(lcRender) << "Mock renderer ready at" << size;
    return true;
}

void MockFrameRenderer::expectedPixel(int64_t index, double t, int x, int y, uint8_t out[4]) {
    const int ms = static_cast<int>(std::llround(t * 1000.0));
    out[0] = static_cast<uint8_t>(index & 0xFF);
    out[1] = static_cast<uint8_t>((index >> 8) + x);
    out[2] = static_cast<uint8_t>(ms + y);
    out[3] = 255;
}

bool MockFrameRenderer::render(const FrameTimestamp& timestamp, const SceneState& scene,
                               QByteArray& rgba) {
    Q_UNUSED(scene)
    if (!isInitialized() || m_lost)
        return setError(PipelineError::renderTargetUnavailable("mock render context is not available"));

    if (m_options.failAtFrame >= 0 && timestamp.index == m_options.failAtFrame) {
        m_lost = true;
        return setError(PipelineError::renderTargetUnavailable(
            QString("mock render context lost at frame %1").arg(timestamp.index)));
    }

    if (m_options.maxDelayMs > 0) {
        std::uniform_int_distribution<int> dist(m_options.minDelayMs,
                                                std::max(m_options.minDelayMs, m_options.maxDelayMs));
        QThread::msleep(static_cast<unsigned long>(dist(m_rng)));
    }

    const qsizetype total = static_cast<qsizetype>(m_size.width()) * m_size.height() * 4;
    if (rgba.size() != total) rgba.resize(total);

    uint8_t* out = reinterpret_cast<uint8_t*>(rgba.data());
    for (int y = 0; y < m_size.height(); ++y) {
        for (int x = 0; x < m_size.width(); ++x, out += 4)
            expectedPixel(timestamp.index, timestamp.timeSeconds, x, y, out);
    }

    ++m_framesRendered;
    return true;
}
