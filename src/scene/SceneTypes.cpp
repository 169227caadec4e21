#include "SceneTypes.h"

const char* effectKindName(EffectKind kind) {
    switch (kind) {
        case EffectKind::Glow:            return "glow";
        case EffectKind::Outline:         return "outline";
        case EffectKind::Shadow:          return "shadow";
        case EffectKind::Fade:            return "fade";
        case EffectKind::Bounce:          return "bounce";
        case EffectKind::Wave:            return "wave";
        case EffectKind::ColorTransition: return "color_transition";
    }
    return "unknown";
}

bool effectKindFromName(const QString& name, EffectKind& kind) {
    static const EffectKind all[] = {
        EffectKind::Glow, EffectKind::Outline, EffectKind::Shadow, EffectKind::Fade,
        EffectKind::Bounce, EffectKind::Wave, EffectKind::ColorTransition
    };
    for (EffectKind k : all) {
        if (name == QLatin1String(effectKindName(k))) {
            kind = k;
            return true;
        }
    }
    return false;
}

EffectDescriptor defaultEffect(EffectKind kind) {
    EffectDescriptor effect;
    switch (kind) {
        case EffectKind::Glow:            effect.params = GlowParams{}; break;
        case EffectKind::Outline:         effect.params = OutlineParams{}; break;
        case EffectKind::Shadow:          effect.params = ShadowParams{}; break;
        case EffectKind::Fade:            effect.params = FadeParams{}; break;
        case EffectKind::Bounce:          effect.params = BounceParams{}; break;
        case EffectKind::Wave:            effect.params = WaveParams{}; break;
        case EffectKind::ColorTransition: effect.params = ColorTransitionParams{}; break;
    }
    return effect;
}

namespace {

bool inUnitRange(double v) { return v >= 0.0 && v <= 1.0; }

bool fail(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

struct EffectValidator {
    QString* error;

    bool operator()(const GlowParams& p) const {
        if (p.radius < 0.0) return fail(error, "glow radius must be >= 0");
        if (!inUnitRange(p.intensity)) return fail(error, "glow intensity must be in [0, 1]");
        if (!p.color.isValid()) return fail(error, "glow color is invalid");
        return true;
    }
    bool operator()(const OutlineParams& p) const {
        if (p.width < 0.0) return fail(error, "outline width must be >= 0");
        if (!p.color.isValid()) return fail(error, "outline color is invalid");
        return true;
    }
    bool operator()(const ShadowParams& p) const {
        if (!inUnitRange(p.opacity)) return fail(error, "shadow opacity must be in [0, 1]");
        if (!p.color.isValid()) return fail(error, "shadow color is invalid");
        return true;
    }
    bool operator()(const FadeParams& p) const {
        if (p.fadeInSeconds < 0.0 || p.fadeOutSeconds < 0.0)
            return fail(error, "fade durations must be >= 0");
        return true;
    }
    bool operator()(const BounceParams& p) const {
        if (p.frequency < 0.0) return fail(error, "bounce frequency must be >= 0");
        return true;
    }
    bool operator()(const WaveParams& p) const {
        if (p.frequency < 0.0) return fail(error, "wave frequency must be >= 0");
        return true;
    }
    bool operator()(const ColorTransitionParams& p) const {
        if (p.durationSeconds < 0.0) return fail(error, "color transition duration must be >= 0");
        if (!p.startColor.isValid() || !p.endColor.isValid())
            return fail(error, "color transition colors are invalid");
        return true;
    }
};

} // namespace

bool validateEffect(const EffectDescriptor& effect, QString* error) {
    return std::visit(EffectValidator{error}, effect.params);
}
