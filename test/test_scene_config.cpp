#include <cassert>
#include <cstdio>
#include <cmath>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "scene/SceneConfig.h"

static const char* SceneJson = R"({
    "version": 1,
    "canvas": {"width": 1280, "height": 720},
    "background": {"type": "color", "color": "#102030"},
    "style": {"fontFamily": "DejaVu Sans", "fontSize": 64, "sungColor": "#ff8000"},
    "cues": [
        {"start": 0.0, "end": 1.0, "text": "Hello",
         "words": [{"text": "Hello", "start": 0.0, "end": 1.0}]},
        {"start": 1.0, "end": 2.0, "text": "big world"}
    ],
    "effects": [
        {"type": "glow", "radius": 8, "intensity": 0.5, "color": "#00ff00"},
        {"type": "fade", "fadeIn": 0.2, "fadeOut": 0.3, "enabled": false},
        {"type": "color_transition", "startColor": "#ffffff", "endColor": "#0000ff", "duration": 1.5}
    ],
    "audio": {"path": "/music/song.mp3", "offset": -0.25},
    "duration": 3.0
})";

void test_parse_scene_json() {
    QJsonObject root = QJsonDocument::fromJson(SceneJson).object();
    SceneDescription scene;
    QString error;
    bool ok = SceneConfig::sceneFromJson(root, scene, &error);
    assert(ok);

    assert(scene.canvasSize == QSize(1280, 720));
    assert(scene.background.type == BackgroundType::SolidColor);
    assert(scene.background.color == QColor("#102030"));
    assert(scene.style.fontFamily == "DejaVu Sans");
    assert(scene.style.fontSize == 64);
    assert(scene.style.sungColor == QColor(255, 128, 0));
    assert(scene.style.unsungColor == QColor(200, 200, 200));   // default kept

    assert(scene.cues.size() == 2);
    assert(scene.cues[0].words.size() == 1);
    assert(scene.cues[1].words.empty());
    assert(scene.cues[1].text == "big world");

    assert(scene.effects.size() == 3);
    assert(scene.effects[0].kind() == EffectKind::Glow);
    const auto& glow = std::get<GlowParams>(scene.effects[0].params);
    assert(glow.radius == 8.0 && glow.intensity == 0.5 && glow.color == QColor(0, 255, 0));
    assert(!scene.effects[1].enabled);
    assert(std::get<FadeParams>(scene.effects[1].params).fadeOutSeconds == 0.3);
    const auto& ct = std::get<ColorTransitionParams>(scene.effects[2].params);
    assert(ct.endColor == QColor(0, 0, 255) && ct.durationSeconds == 1.5);

    assert(scene.audioPath == "/music/song.mp3");
    assert(scene.audioOffsetSeconds == -0.25);
    assert(scene.durationSeconds == 3.0);

    PipelineError perr;
    assert(StaticSceneSource::validate(scene, &perr));
    printf("PASS: test_parse_scene_json\n");
}

void test_effect_json_defaults() {
    QJsonObject obj;
    obj["type"] = "wave";
    obj["amplitude"] = 12.0;
    EffectDescriptor effect;
    QString error;
    assert(SceneConfig::effectFromJson(obj, effect, &error));
    assert(effect.kind() == EffectKind::Wave);
    assert(effect.enabled);
    const auto& wave = std::get<WaveParams>(effect.params);
    assert(wave.amplitude == 12.0);
    assert(wave.frequency == WaveParams{}.frequency);

    QJsonObject out = SceneConfig::effectToJson(effect);
    assert(out["type"].toString() == "wave");
    assert(out["speed"].toDouble() == wave.speed);

    obj["type"] = "sparkle";
    assert(!SceneConfig::effectFromJson(obj, effect, &error));
    assert(error.contains("sparkle"));
    printf("PASS: test_effect_json_defaults\n");
}

void test_save_and_load_file() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = dir.filePath("scene.json");

    SceneDescription scene;
    scene.canvasSize = QSize(640, 360);
    scene.background.type = BackgroundType::Video;
    scene.background.path = "/videos/bg.mp4";
    scene.backgroundFps = 25.0;
    SubtitleCue cue;
    cue.startSeconds = 0.5;
    cue.endSeconds = 2.5;
    cue.text = "la la";
    cue.words = {{"la", 0.5, 1.5}, {"la", 1.5, 2.5}};
    scene.cues.push_back(cue);
    BounceParams bounce;
    bounce.amplitude = 4.0;
    scene.effects.push_back(EffectDescriptor{bounce});

    SceneConfig config;
    assert(config.save(path, scene));

    SceneDescription loaded;
    assert(config.load(path, loaded));
    assert(loaded.canvasSize == QSize(640, 360));
    assert(loaded.background.type == BackgroundType::Video);
    assert(loaded.background.path == "/videos/bg.mp4");
    assert(loaded.backgroundFps == 25.0);
    assert(loaded.cues.size() == 1);
    assert(loaded.cues[0].words.size() == 2);
    assert(loaded.cues[0].words[1].startSeconds == 1.5);
    assert(loaded.effects.size() == 1);
    assert(std::get<BounceParams>(loaded.effects[0].params).amplitude == 4.0);
    assert(loaded.audioPath.isEmpty());
    printf("PASS: test_save_and_load_file\n");
}

void test_rejects_bad_files() {
    QTemporaryDir dir;
    SceneConfig config;
    SceneDescription scene;

    assert(!config.load(dir.filePath("missing.json"), scene));
    assert(config.errorString().contains("Cannot read"));

    QFile broken(dir.filePath("broken.json"));
    assert(broken.open(QIODevice::WriteOnly));
    broken.write("{ \"canvas\": ");
    broken.close();
    assert(!config.load(broken.fileName(), scene));
    assert(config.errorString().contains("Invalid scene file"));

    QJsonObject root;
    root["version"] = 2;
    QString error;
    assert(!SceneConfig::sceneFromJson(root, scene, &error));
    assert(error.contains("version"));

    root["version"] = 1;
    QJsonObject bg;
    bg["type"] = "hologram";
    root["background"] = bg;
    assert(!SceneConfig::sceneFromJson(root, scene, &error));
    printf("PASS: test_rejects_bad_files\n");
}

int main() {
    test_parse_scene_json();
    test_effect_json_defaults();
    test_save_and_load_file();
    test_rejects_bad_files();
    printf("All scene config tests passed.\n");
    return 0;
}
