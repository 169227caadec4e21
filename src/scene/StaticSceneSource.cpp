#include "StaticSceneSource.h"
#include "KaraokeTiming.h"
#include <algorithm>
#include <cmath>

StaticSceneSource::StaticSceneSource(SceneDescription description)
    : m_desc(std::move(description))
{
    std::stable_sort(m_desc.cues.begin(), m_desc.cues.end(),
                     [](const SubtitleCue& a, const SubtitleCue& b) {
                         return a.startSeconds < b.startSeconds;
                     });
}

bool StaticSceneSource::validate(const SceneDescription& d, PipelineError* error) {
    auto reject = [error](const QString& message) {
        if (error) *error = PipelineError::invalidParameter(message);
        return false;
    };

    if (d.canvasSize.width() <= 0 || d.canvasSize.height() <= 0)
        return reject("canvas size must be positive");
    if (d.durationSeconds < 0.0)
        return reject("scene duration must be >= 0");
    if (d.background.type != BackgroundType::SolidColor && d.background.path.isEmpty())
        return reject("background media path is empty");

    for (size_t i = 0; i < d.cues.size(); ++i) {
        const SubtitleCue& cue = d.cues[i];
        if (cue.startSeconds < 0.0 || cue.endSeconds < cue.startSeconds)
            return reject(QString("cue %1 has invalid timing %2-%3")
                              .arg(i).arg(cue.startSeconds).arg(cue.endSeconds));
        for (const WordTiming& w : cue.words) {
            if (w.endSeconds < w.startSeconds)
                return reject(QString("word '%1' in cue %2 ends before it starts").arg(w.text).arg(i));
        }
    }

    for (size_t i = 0; i < d.effects.size(); ++i) {
        QString why;
        if (!validateEffect(d.effects[i], &why))
            return reject(QString("effect %1 (%2): %3")
                              .arg(i).arg(effectKindName(d.effects[i].kind()), why));
    }

    if (error) *error = PipelineError::none();
    return true;
}

double StaticSceneSource::duration() const {
    if (m_desc.durationSeconds > 0.0) return m_desc.durationSeconds;
    double end = 0.0;
    for (const SubtitleCue& cue : m_desc.cues)
        end = std::max(end, cue.endSeconds);
    return end;
}

SceneState StaticSceneSource::sceneAt(double timeSeconds) const {
    SceneState state;
    state.timeSeconds = timeSeconds;
    state.canvasSize = m_desc.canvasSize;
    state.background = m_desc.background;
    state.style = m_desc.style;
    state.activeCues = KaraokeTiming::activeCuesAt(m_desc.cues, timeSeconds);

    for (const EffectDescriptor& effect : m_desc.effects) {
        if (effect.enabled) state.effects.push_back(effect);
    }

    if (m_desc.background.type == BackgroundType::Video && m_desc.backgroundFps > 0.0)
        state.backgroundFrameIndex = static_cast<int64_t>(
            std::floor(std::max(0.0, timeSeconds) * m_desc.backgroundFps + 1e-9));

    return state;
}
