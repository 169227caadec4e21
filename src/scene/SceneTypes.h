#pragma once

#include <QColor>
#include <QImage>
#include <QSize>
#include <QString>
#include <cstdint>
#include <variant>
#include <vector>

struct WordTiming {
    QString text;
    double startSeconds = 0.0;
    double endSeconds = 0.0;   // start <= end
};

struct SubtitleCue {
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    QString text;
    std::vector<WordTiming> words;

    // cue.start <= t < cue.end
    bool isActiveAt(double t) const { return startSeconds <= t && t < endSeconds; }
};

struct SubtitleStyle {
    QString fontFamily = "Arial";
    int fontSize = 48;              // pixels at 1080 lines, scaled with canvas height
    QColor unsungColor = QColor(200, 200, 200);
    QColor sungColor = QColor(255, 255, 100);
    QColor outlineColor = QColor(0, 0, 0);
    int marginBottom = 60;          // pixels at 1080 lines
    double lineSpacing = 1.2;
};

enum class BackgroundType {
    SolidColor,
    Image,
    Video
};

struct BackgroundRef {
    BackgroundType type = BackgroundType::SolidColor;
    QColor color = QColor(26, 26, 51);
    QString path;                   // image or video file
};

// --- Effects ---------------------------------------------------------------

struct GlowParams {
    double radius = 5.0;
    double intensity = 0.8;         // 0..1
    QColor color = QColor(255, 255, 0);
};

struct OutlineParams {
    double width = 2.0;
    QColor color = QColor(0, 0, 0);
};

struct ShadowParams {
    double offsetX = 3.0;
    double offsetY = 3.0;
    double opacity = 0.7;           // 0..1
    QColor color = QColor(0, 0, 0);
};

struct FadeParams {
    double fadeInSeconds = 0.5;
    double fadeOutSeconds = 0.5;
};

struct BounceParams {
    double amplitude = 10.0;        // pixels
    double frequency = 2.0;         // Hz
};

struct WaveParams {
    double amplitude = 5.0;         // pixels
    double frequency = 1.0;         // cycles across the line
    double speed = 2.0;             // cycles per second
};

struct ColorTransitionParams {
    QColor startColor = QColor(255, 255, 255);
    QColor endColor = QColor(255, 0, 0);
    double durationSeconds = 2.0;
};

using EffectParams = std::variant<GlowParams, OutlineParams, ShadowParams, FadeParams,
                                  BounceParams, WaveParams, ColorTransitionParams>;

enum class EffectKind {
    Glow,
    Outline,
    Shadow,
    Fade,
    Bounce,
    Wave,
    ColorTransition
};

struct EffectDescriptor {
    EffectParams params;
    bool enabled = true;

    EffectKind kind() const { return static_cast<EffectKind>(params.index()); }
};

const char* effectKindName(EffectKind kind);
bool effectKindFromName(const QString& name, EffectKind& kind);
EffectDescriptor defaultEffect(EffectKind kind);

// Returns false and fills error when a parameter is out of range.
bool validateEffect(const EffectDescriptor& effect, QString* error);

// --- Per-frame state -------------------------------------------------------

struct WordState {
    QString text;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    double progress = 0.0;          // 0 = not yet sung, 1 = sung
};

struct CueState {
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    double lineProgress = 0.0;
    std::vector<WordState> words;
};

// Everything the renderer needs for one timestamp. Built per frame.
struct SceneState {
    double timeSeconds = 0.0;
    QSize canvasSize;
    BackgroundRef background;
    int64_t backgroundFrameIndex = -1;  // video backgrounds only
    SubtitleStyle style;
    std::vector<CueState> activeCues;
    std::vector<EffectDescriptor> effects;
};
