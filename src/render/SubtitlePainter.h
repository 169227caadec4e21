#pragma once

#include <QColor>
#include <QFont>
#include <QPainter>
#include <QPainterPath>
#include <QSize>
#include <vector>
#include "SceneTypes.h"

// Draws the active karaoke lines and their effect passes with QPainter.
// Shared by every renderer so preview and export are pixel-identical.
class SubtitlePainter {
public:
    struct WordLayout {
        QString text;
        QPointF baseline;
        double advance = 0.0;
        double progress = 0.0;
        QColor fill;
    };

    // Decoration passes drawn beneath the fill, in configured order.
    struct Decoration {
        EffectKind kind;
        EffectParams params;
    };

    struct LineLayout {
        std::vector<WordLayout> words;
        double opacity = 1.0;
        std::vector<Decoration> decorations;
    };

    void paint(QPainter& painter, const SceneState& scene) const;

    // Layout and effect application without drawing; exposed for tests.
    std::vector<LineLayout> layout(const SceneState& scene) const;

    static QColor wordColor(const SubtitleStyle& style, double progress);
    static QColor mix(const QColor& a, const QColor& b, double t);
    static QFont fontFor(const SubtitleStyle& style, const QSize& canvas);

private:
    void applyEffect(const EffectDescriptor& effect, const CueState& cue, double t,
                     const SubtitleStyle& style, LineLayout& line) const;
    void drawLine(QPainter& painter, const LineLayout& line, const QFont& font,
                  const SubtitleStyle& style) const;
};
