#include "SubtitlePainter.h"
#include <QFontMetricsF>
#include <algorithm>
#include <cmath>

namespace {

constexpr double Pi = 3.14159265358979323846;
constexpr double ReferenceHeight = 1080.0;

QPainterPath textPath(const std::vector<SubtitlePainter::WordLayout>& words, const QFont& font,
                      const QPointF& offset = QPointF()) {
    QPainterPath path;
    for (const auto& w : words)
        path.addText(w.baseline + offset, font, w.text);
    return path;
}

} // namespace

QColor SubtitlePainter::mix(const QColor& a, const QColor& b, double t) {
    t = std::clamp(t, 0.0, 1.0);
    return QColor::fromRgbF(
        static_cast<float>(a.redF() + (b.redF() - a.redF()) * t),
        static_cast<float>(a.greenF() + (b.greenF() - a.greenF()) * t),
        static_cast<float>(a.blueF() + (b.blueF() - a.blueF()) * t),
        static_cast<float>(a.alphaF() + (b.alphaF() - a.alphaF()) * t));
}

QColor SubtitlePainter::wordColor(const SubtitleStyle& style, double progress) {
    if (progress <= 0.0) return style.unsungColor;
    if (progress >= 1.0) return style.sungColor;
    return mix(style.unsungColor, style.sungColor, progress);
}

QFont SubtitlePainter::fontFor(const SubtitleStyle& style, const QSize& canvas) {
    QFont font(style.fontFamily);
    int px = qMax(1, qRound(style.fontSize * canvas.height() / ReferenceHeight));
    font.setPixelSize(px);
    font.setWeight(QFont::Bold);
    return font;
}

std::vector<SubtitlePainter::LineLayout> SubtitlePainter::layout(const SceneState& scene) const {
    std::vector<LineLayout> lines;
    if (scene.activeCues.empty() || scene.canvasSize.isEmpty()) return lines;

    const QFont font = fontFor(scene.style, scene.canvasSize);
    const QFontMetricsF fm(font);
    const double scale = scene.canvasSize.height() / ReferenceHeight;
    const double lineHeight = fm.height() * scene.style.lineSpacing;
    const double space = fm.horizontalAdvance(QLatin1Char(' '));

    // Latest cue sits on the bottom line, earlier ones stack upward
    double baselineY = scene.canvasSize.height() - scene.style.marginBottom * scale - fm.descent();
    for (auto it = scene.activeCues.rbegin(); it != scene.activeCues.rend(); ++it) {
        const CueState& cue = *it;
        LineLayout line;

        double total = 0.0;
        for (size_t i = 0; i < cue.words.size(); ++i) {
            total += fm.horizontalAdvance(cue.words[i].text);
            if (i + 1 < cue.words.size()) total += space;
        }

        double x = (scene.canvasSize.width() - total) / 2.0;
        for (const WordState& ws : cue.words) {
            WordLayout w;
            w.text = ws.text;
            w.advance = fm.horizontalAdvance(ws.text);
            w.baseline = QPointF(x, baselineY);
            w.progress = ws.progress;
            w.fill = wordColor(scene.style, ws.progress);
            line.words.push_back(w);
            x += w.advance + space;
        }

        for (const EffectDescriptor& effect : scene.effects) {
            if (effect.enabled)
                applyEffect(effect, cue, scene.timeSeconds, scene.style, line);
        }

        lines.push_back(std::move(line));
        baselineY -= lineHeight;
    }

    std::reverse(lines.begin(), lines.end());
    return lines;
}

void SubtitlePainter::applyEffect(const EffectDescriptor& effect, const CueState& cue, double t,
                                  const SubtitleStyle& style, LineLayout& line) const {
    switch (effect.kind()) {
        case EffectKind::Glow:
        case EffectKind::Outline:
        case EffectKind::Shadow:
            line.decorations.push_back({effect.kind(), effect.params});
            break;

        case EffectKind::Fade: {
            const auto& p = std::get<FadeParams>(effect.params);
            double factor = 1.0;
            if (p.fadeInSeconds > 0.0)
                factor = std::min(factor, (t - cue.startSeconds) / p.fadeInSeconds);
            if (p.fadeOutSeconds > 0.0)
                factor = std::min(factor, (cue.endSeconds - t) / p.fadeOutSeconds);
            line.opacity *= std::clamp(factor, 0.0, 1.0);
            break;
        }

        case EffectKind::Bounce: {
            // Only the word being sung bounces
            const auto& p = std::get<BounceParams>(effect.params);
            for (size_t i = 0; i < line.words.size() && i < cue.words.size(); ++i) {
                const WordState& ws = cue.words[i];
                if (ws.progress <= 0.0 || ws.progress >= 1.0) continue;
                double phase = 2.0 * Pi * p.frequency * (t - ws.startSeconds);
                line.words[i].baseline.ry() -= p.amplitude * std::abs(std::sin(phase));
            }
            break;
        }

        case EffectKind::Wave: {
            const auto& p = std::get<WaveParams>(effect.params);
            const double n = std::max<double>(1.0, static_cast<double>(line.words.size()));
            for (size_t i = 0; i < line.words.size(); ++i) {
                double phase = 2.0 * Pi * (p.frequency * i / n + p.speed * t);
                line.words[i].baseline.ry() += p.amplitude * std::sin(phase);
            }
            break;
        }

        case EffectKind::ColorTransition: {
            // Replaces the sung colour with one blended over time since the cue start
            const auto& p = std::get<ColorTransitionParams>(effect.params);
            double k = p.durationSeconds > 0.0 ? (t - cue.startSeconds) / p.durationSeconds : 1.0;
            QColor sung = mix(p.startColor, p.endColor, k);
            for (auto& w : line.words)
                w.fill = mix(style.unsungColor, sung, w.progress);
            break;
        }
    }
}

void SubtitlePainter::drawLine(QPainter& painter, const LineLayout& line, const QFont& font,
                               const SubtitleStyle& style) const {
    if (line.opacity <= 0.0 || line.words.empty()) return;

    painter.save();
    painter.setOpacity(line.opacity);

    const QPainterPath path = textPath(line.words, font);

    for (const Decoration& d : line.decorations) {
        switch (d.kind) {
            case EffectKind::Glow: {
                const auto& p = std::get<GlowParams>(d.params);
                const int steps = std::max(1, static_cast<int>(std::ceil(p.radius)));
                for (int i = steps; i >= 1; --i) {
                    QColor c = p.color;
                    c.setAlphaF(static_cast<float>(p.intensity * (1.0 - double(i - 1) / steps) / steps));
                    painter.strokePath(path, QPen(c, 2.0 * i, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
                }
                break;
            }
            case EffectKind::Outline: {
                const auto& p = std::get<OutlineParams>(d.params);
                if (p.width > 0.0)
                    painter.strokePath(path, QPen(p.color, 2.0 * p.width, Qt::SolidLine,
                                                  Qt::RoundCap, Qt::RoundJoin));
                break;
            }
            case EffectKind::Shadow: {
                const auto& p = std::get<ShadowParams>(d.params);
                QColor c = p.color;
                c.setAlphaF(static_cast<float>(p.opacity));
                painter.fillPath(textPath(line.words, font, QPointF(p.offsetX, p.offsetY)), c);
                break;
            }
            default:
                break;
        }
    }

    // Thin base outline keeps text legible on any background
    const double base = std::max(1.0, font.pixelSize() / 24.0);
    painter.strokePath(path, QPen(style.outlineColor, base, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));

    for (const WordLayout& w : line.words) {
        QPainterPath wordPath;
        wordPath.addText(w.baseline, font, w.text);
        painter.fillPath(wordPath, w.fill);
    }

    painter.restore();
}

void SubtitlePainter::paint(QPainter& painter, const SceneState& scene) const {
    const std::vector<LineLayout> lines = layout(scene);
    if (lines.empty()) return;

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    const QFont font = fontFor(scene.style, scene.canvasSize);
    for (const LineLayout& line : lines)
        drawLine(painter, line, font, scene.style);
}
