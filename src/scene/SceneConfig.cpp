#include "SceneConfig.h"
#include "Logging.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace {

constexpr int SceneFormatVersion = 1;

QString colorToJson(const QColor& c) {
    return c.alpha() == 255 ? c.name(QColor::HexRgb) : c.name(QColor::HexArgb);
}

QColor colorFromJson(const QJsonValue& v, const QColor& fallback) {
    if (!v.isString()) return fallback;
    QColor c(v.toString());
    return c.isValid() ? c : fallback;
}

struct EffectWriter {
    QJsonObject& obj;

    void operator()(const GlowParams& p) const {
        obj["radius"] = p.radius;
        obj["intensity"] = p.intensity;
        obj["color"] = colorToJson(p.color);
    }
    void operator()(const OutlineParams& p) const {
        obj["width"] = p.width;
        obj["color"] = colorToJson(p.color);
    }
    void operator()(const ShadowParams& p) const {
        obj["offsetX"] = p.offsetX;
        obj["offsetY"] = p.offsetY;
        obj["opacity"] = p.opacity;
        obj["color"] = colorToJson(p.color);
    }
    void operator()(const FadeParams& p) const {
        obj["fadeIn"] = p.fadeInSeconds;
        obj["fadeOut"] = p.fadeOutSeconds;
    }
    void operator()(const BounceParams& p) const {
        obj["amplitude"] = p.amplitude;
        obj["frequency"] = p.frequency;
    }
    void operator()(const WaveParams& p) const {
        obj["amplitude"] = p.amplitude;
        obj["frequency"] = p.frequency;
        obj["speed"] = p.speed;
    }
    void operator()(const ColorTransitionParams& p) const {
        obj["startColor"] = colorToJson(p.startColor);
        obj["endColor"] = colorToJson(p.endColor);
        obj["duration"] = p.durationSeconds;
    }
};

// Missing keys keep the defaults already held by the params.
struct EffectReader {
    const QJsonObject& obj;

    void operator()(GlowParams& p) const {
        p.radius = obj["radius"].toDouble(p.radius);
        p.intensity = obj["intensity"].toDouble(p.intensity);
        p.color = colorFromJson(obj["color"], p.color);
    }
    void operator()(OutlineParams& p) const {
        p.width = obj["width"].toDouble(p.width);
        p.color = colorFromJson(obj["color"], p.color);
    }
    void operator()(ShadowParams& p) const {
        p.offsetX = obj["offsetX"].toDouble(p.offsetX);
        p.offsetY = obj["offsetY"].toDouble(p.offsetY);
        p.opacity = obj["opacity"].toDouble(p.opacity);
        p.color = colorFromJson(obj["color"], p.color);
    }
    void operator()(FadeParams& p) const {
        p.fadeInSeconds = obj["fadeIn"].toDouble(p.fadeInSeconds);
        p.fadeOutSeconds = obj["fadeOut"].toDouble(p.fadeOutSeconds);
    }
    void operator()(BounceParams& p) const {
        p.amplitude = obj["amplitude"].toDouble(p.amplitude);
        p.frequency = obj["frequency"].toDouble(p.frequency);
    }
    void operator()(WaveParams& p) const {
        p.amplitude = obj["amplitude"].toDouble(p.amplitude);
        p.frequency = obj["frequency"].toDouble(p.frequency);
        p.speed = obj["speed"].toDouble(p.speed);
    }
    void operator()(ColorTransitionParams& p) const {
        p.startColor = colorFromJson(obj["startColor"], p.startColor);
        p.endColor = colorFromJson(obj["endColor"], p.endColor);
        p.durationSeconds = obj["duration"].toDouble(p.durationSeconds);
    }
};

QJsonObject wordToJson(const WordTiming& w) {
    QJsonObject obj;
    obj["text"] = w.text;
    obj["start"] = w.startSeconds;
    obj["end"] = w.endSeconds;
    return obj;
}

QJsonObject cueToJson(const SubtitleCue& cue) {
    QJsonObject obj;
    obj["start"] = cue.startSeconds;
    obj["end"] = cue.endSeconds;
    obj["text"] = cue.text;
    if (!cue.words.empty()) {
        QJsonArray words;
        for (const auto& w : cue.words)
            words.append(wordToJson(w));
        obj["words"] = words;
    }
    return obj;
}

SubtitleCue cueFromJson(const QJsonObject& obj) {
    SubtitleCue cue;
    cue.startSeconds = obj["start"].toDouble();
    cue.endSeconds = obj["end"].toDouble();
    cue.text = obj["text"].toString();
    for (const auto& val : obj["words"].toArray()) {
        QJsonObject wo = val.toObject();
        WordTiming w;
        w.text = wo["text"].toString();
        w.startSeconds = wo["start"].toDouble();
        w.endSeconds = wo["end"].toDouble();
        cue.words.push_back(w);
    }
    if (cue.text.isEmpty() && !cue.words.empty()) {
        QStringList parts;
        for (const auto& w : cue.words) parts << w.text;
        cue.text = parts.join(' ');
    }
    return cue;
}

} // namespace

bool SceneConfig::save(const QString& filePath, const SceneDescription& scene) {
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(sceneToJson(scene)).toJson());
    return true;
}

bool SceneConfig::load(const QString& filePath, SceneDescription& scene) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid scene file %1: %2").arg(filePath, parseError.errorString());
        return false;
    }

    QString why;
    if (!sceneFromJson(doc.object(), scene, &why)) {
        m_error = QString("Invalid scene file %1: %2").arg(filePath, why);
        return false;
    }

    qCDebug(lcPipeline) << "Loaded scene" << filePath << "cues:" << scene.cues.size()
                        << "effects:" << scene.effects.size();
    return true;
}

QJsonObject SceneConfig::effectToJson(const EffectDescriptor& effect) {
    QJsonObject obj;
    obj["type"] = effectKindName(effect.kind());
    obj["enabled"] = effect.enabled;
    std::visit(EffectWriter{obj}, effect.params);
    return obj;
}

bool SceneConfig::effectFromJson(const QJsonObject& obj, EffectDescriptor& effect, QString* error) {
    EffectKind kind;
    QString type = obj["type"].toString();
    if (!effectKindFromName(type, kind)) {
        if (error) *error = QString("unknown effect type '%1'").arg(type);
        return false;
    }

    effect = defaultEffect(kind);
    effect.enabled = obj["enabled"].toBool(true);
    std::visit(EffectReader{obj}, effect.params);
    return true;
}

QJsonObject SceneConfig::sceneToJson(const SceneDescription& scene) {
    QJsonObject root;
    root["version"] = SceneFormatVersion;

    QJsonObject canvas;
    canvas["width"] = scene.canvasSize.width();
    canvas["height"] = scene.canvasSize.height();
    root["canvas"] = canvas;

    QJsonObject bg;
    switch (scene.background.type) {
        case BackgroundType::SolidColor:
            bg["type"] = "color";
            bg["color"] = colorToJson(scene.background.color);
            break;
        case BackgroundType::Image:
            bg["type"] = "image";
            bg["path"] = scene.background.path;
            break;
        case BackgroundType::Video:
            bg["type"] = "video";
            bg["path"] = scene.background.path;
            if (scene.backgroundFps > 0.0) bg["fps"] = scene.backgroundFps;
            break;
    }
    root["background"] = bg;

    QJsonObject style;
    style["fontFamily"] = scene.style.fontFamily;
    style["fontSize"] = scene.style.fontSize;
    style["unsungColor"] = colorToJson(scene.style.unsungColor);
    style["sungColor"] = colorToJson(scene.style.sungColor);
    style["outlineColor"] = colorToJson(scene.style.outlineColor);
    style["marginBottom"] = scene.style.marginBottom;
    style["lineSpacing"] = scene.style.lineSpacing;
    root["style"] = style;

    QJsonArray cues;
    for (const auto& cue : scene.cues)
        cues.append(cueToJson(cue));
    root["cues"] = cues;

    QJsonArray effects;
    for (const auto& effect : scene.effects)
        effects.append(effectToJson(effect));
    root["effects"] = effects;

    if (!scene.audioPath.isEmpty()) {
        QJsonObject audio;
        audio["path"] = scene.audioPath;
        audio["offset"] = scene.audioOffsetSeconds;
        root["audio"] = audio;
    }
    if (scene.durationSeconds > 0.0)
        root["duration"] = scene.durationSeconds;

    return root;
}

bool SceneConfig::sceneFromJson(const QJsonObject& root, SceneDescription& scene, QString* error) {
    auto reject = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };

    int version = root["version"].toInt(SceneFormatVersion);
    if (version != SceneFormatVersion)
        return reject(QString("unsupported scene version %1").arg(version));

    SceneDescription result;

    QJsonObject canvas = root["canvas"].toObject();
    result.canvasSize = QSize(canvas["width"].toInt(result.canvasSize.width()),
                              canvas["height"].toInt(result.canvasSize.height()));

    QJsonObject bg = root["background"].toObject();
    QString bgType = bg["type"].toString("color");
    if (bgType == "color") {
        result.background.type = BackgroundType::SolidColor;
        result.background.color = colorFromJson(bg["color"], result.background.color);
    } else if (bgType == "image") {
        result.background.type = BackgroundType::Image;
        result.background.path = bg["path"].toString();
    } else if (bgType == "video") {
        result.background.type = BackgroundType::Video;
        result.background.path = bg["path"].toString();
        result.backgroundFps = bg["fps"].toDouble(0.0);
    } else {
        return reject(QString("unknown background type '%1'").arg(bgType));
    }

    QJsonObject style = root["style"].toObject();
    SubtitleStyle& s = result.style;
    s.fontFamily = style["fontFamily"].toString(s.fontFamily);
    s.fontSize = style["fontSize"].toInt(s.fontSize);
    s.unsungColor = colorFromJson(style["unsungColor"], s.unsungColor);
    s.sungColor = colorFromJson(style["sungColor"], s.sungColor);
    s.outlineColor = colorFromJson(style["outlineColor"], s.outlineColor);
    s.marginBottom = style["marginBottom"].toInt(s.marginBottom);
    s.lineSpacing = style["lineSpacing"].toDouble(s.lineSpacing);

    if (root.contains("cues") && !root["cues"].isArray())
        return reject("'cues' must be an array");
    for (const auto& val : root["cues"].toArray()) {
        if (!val.isObject()) return reject("cue entries must be objects");
        result.cues.push_back(cueFromJson(val.toObject()));
    }

    for (const auto& val : root["effects"].toArray()) {
        EffectDescriptor effect;
        if (!effectFromJson(val.toObject(), effect, error)) return false;
        result.effects.push_back(effect);
    }

    QJsonObject audio = root["audio"].toObject();
    result.audioPath = audio["path"].toString();
    result.audioOffsetSeconds = audio["offset"].toDouble(0.0);
    result.durationSeconds = root["duration"].toDouble(0.0);

    scene = std::move(result);
    return true;
}
