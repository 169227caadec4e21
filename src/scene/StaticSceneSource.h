#pragma once

#include <QString>
#include <vector>
#include "SceneSource.h"
#include "PipelineError.h"

// Immutable description of a karaoke composition as handed over by the editor.
struct SceneDescription {
    QSize canvasSize{1920, 1080};
    BackgroundRef background;
    double backgroundFps = 0.0;     // native rate of a video background (probed); 0 = unknown
    SubtitleStyle style;
    std::vector<SubtitleCue> cues;
    std::vector<EffectDescriptor> effects;
    QString audioPath;
    double audioOffsetSeconds = 0.0;
    double durationSeconds = 0.0;   // 0 = end of the last cue
};

class StaticSceneSource : public SceneSource {
public:
    StaticSceneSource() = default;
    explicit StaticSceneSource(SceneDescription description);

    // Checks cue/word ordering, canvas size and effect parameters.
    static bool validate(const SceneDescription& description, PipelineError* error);

    SceneState sceneAt(double timeSeconds) const override;
    QSize canvasSize() const override { return m_desc.canvasSize; }
    double duration() const override;

    const SceneDescription& description() const { return m_desc; }

private:
    SceneDescription m_desc;
};
