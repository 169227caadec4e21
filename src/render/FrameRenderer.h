#pragma once

#include <QByteArray>
#include <QSize>
#include "FrameTimestamp.h"
#include "PipelineError.h"
#include "SceneTypes.h"

// Renders one scene snapshot to tightly packed, top-down RGBA8
// (width * height * 4 bytes). Implementations may hold a context with
// single-thread affinity; they are only driven through RenderExecutor.
class FrameRenderer {
public:
    virtual ~FrameRenderer() = default;

    virtual const char* name() const = 0;

    // Creates the render target. Shader and context failures are reported
    // here, never per frame.
    virtual bool initialize(const QSize& size) = 0;
    virtual void shutdown() {}
    virtual bool isInitialized() const = 0;
    virtual QSize size() const = 0;

    // Resizes rgba when needed; returns false with lastError() set on failure.
    virtual bool render(const FrameTimestamp& timestamp, const SceneState& scene,
                        QByteArray& rgba) = 0;

    const PipelineError& lastError() const { return m_error; }

protected:
    bool setError(const PipelineError& error) {
        m_error = error;
        return false;
    }

    PipelineError m_error;
};
