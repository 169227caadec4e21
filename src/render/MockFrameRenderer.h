#pragma once

#include <random>
#include "FrameRenderer.h"

// Headless renderer producing deterministic pixels from the frame index and
// time, for tests and machines without a GPU.
class MockFrameRenderer : public FrameRenderer {
public:
    struct Options {
        int minDelayMs = 0;         // random per-frame delay in [min, max]
        int maxDelayMs = 0;
        int64_t failAtFrame = -1;   // simulate context loss at this index
        unsigned seed = 1;
    };

    MockFrameRenderer() = default;
    explicit MockFrameRenderer(const Options& options);

    const char* name() const override { return "mock"; }

    bool initialize(const QSize& size) override;
    void shutdown() override { m_size = QSize(); }
    bool isInitialized() const override { return m_size.isValid() && !m_size.isEmpty(); }
    QSize size() const override { return m_size; }

    bool render(const FrameTimestamp& timestamp, const SceneState& scene,
                QByteArray& rgba) override;

    int64_t framesRendered() const { return m_framesRendered; }

    // Pixel (x, y) of frame `index` at time `t`; what render() writes.
    static void expectedPixel(int64_t index, double t, int x, int y, uint8_t out[4]);

private:
    Options m_options;
    QSize m_size;
    std::mt19937 m_rng;
    int64_t m_framesRendered = 0;
    bool m_lost = false;
};
