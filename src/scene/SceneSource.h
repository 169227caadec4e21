#pragma once

#include "SceneTypes.h"

// Pull-based provider of per-frame scene state. Must be idempotent and cheap
// for repeated calls with the same time (preview scrubbing re-requests frames).
class SceneSource {
public:
    virtual ~SceneSource() = default;

    virtual SceneState sceneAt(double timeSeconds) const = 0;
    virtual QSize canvasSize() const = 0;
    virtual double duration() const = 0;
};
