#include <cassert>
#include <cstdio>
#include <cmath>
#include <QGuiApplication>
#include "scene/KaraokeTiming.h"
#include "scene/StaticSceneSource.h"
#include "render/SubtitlePainter.h"

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

static SceneDescription helloWorldScene() {
    SceneDescription desc;
    desc.canvasSize = QSize(1920, 1080);
    desc.durationSeconds = 3.0;
    SubtitleCue hello;
    hello.startSeconds = 0.0;
    hello.endSeconds = 1.0;
    hello.text = "Hello";
    hello.words.push_back({"Hello", 0.0, 1.0});
    SubtitleCue world;
    world.startSeconds = 1.0;
    world.endSeconds = 2.0;
    world.text = "world";
    world.words.push_back({"world", 1.0, 2.0});
    desc.cues = {world, hello};   // out of order on purpose
    return desc;
}

void test_word_progress() {
    WordTiming w{"word", 1.0, 2.0};
    assert(near(KaraokeTiming::wordProgress(w, 1.25), 0.25));
    assert(near(KaraokeTiming::wordProgress(w, 0.5), 0.0));
    assert(near(KaraokeTiming::wordProgress(w, 3.0), 1.0));
    assert(near(KaraokeTiming::wordProgress(w, 1.0), 0.0));
    assert(near(KaraokeTiming::wordProgress(w, 2.0), 1.0));

    WordTiming instant{"pop", 1.0, 1.0};
    assert(KaraokeTiming::wordProgress(instant, 0.99) == 0.0);
    assert(KaraokeTiming::wordProgress(instant, 1.0) == 1.0);
    printf("PASS: test_word_progress\n");
}

void test_line_progress() {
    SubtitleCue cue;
    cue.startSeconds = 0.0;
    cue.endSeconds = 3.0;
    cue.text = "one two three";
    cue.words = {{"one", 0.0, 1.0}, {"two", 1.0, 2.0}, {"three", 2.0, 3.0}};
    // one finished, two half way
    assert(near(KaraokeTiming::lineProgress(cue, 1.5), 1.5 / 3.0));
    assert(KaraokeTiming::lineProgress(cue, -1.0) == 0.0);
    assert(KaraokeTiming::lineProgress(cue, 5.0) == 1.0);

    SubtitleCue plain;
    plain.startSeconds = 2.0;
    plain.endSeconds = 4.0;
    plain.text = "no timings here";
    assert(near(KaraokeTiming::lineProgress(plain, 3.0), 0.5));
    printf("PASS: test_line_progress\n");
}

void test_distribute_words() {
    SubtitleCue cue;
    cue.startSeconds = 1.0;
    cue.endSeconds = 4.0;
    cue.text = "  Hello   big\tworld ";
    std::vector<WordTiming> words = KaraokeTiming::distributeWords(cue);
    assert(words.size() == 3);
    assert(words[0].text == "Hello" && words[1].text == "big" && words[2].text == "world");
    assert(near(words[0].startSeconds, 1.0) && near(words[0].endSeconds, 2.0));
    assert(near(words[1].startSeconds, 2.0) && near(words[1].endSeconds, 3.0));
    assert(near(words[2].startSeconds, 3.0) && words[2].endSeconds == 4.0);

    SubtitleCue empty;
    empty.startSeconds = 0.0;
    empty.endSeconds = 1.0;
    assert(KaraokeTiming::distributeWords(empty).empty());

    CueState state = KaraokeTiming::cueStateAt(cue, 2.5);
    assert(state.words.size() == 3);
    assert(state.words[0].progress == 1.0);
    assert(near(state.words[1].progress, 0.5));
    assert(state.words[2].progress == 0.0);
    printf("PASS: test_distribute_words\n");
}

void test_active_cues_boundaries() {
    SceneDescription desc = helloWorldScene();
    StaticSceneSource scene(desc);
    assert(scene.duration() == 3.0);

    // Half-open: the cue ending at 1.0 is gone at exactly 1.0
    SceneState at1 = scene.sceneAt(1.0);
    assert(at1.activeCues.size() == 1);
    assert(at1.activeCues[0].words[0].text == "world");
    assert(at1.activeCues[0].words[0].progress == 0.0);

    assert(scene.sceneAt(2.5).activeCues.empty());
    assert(scene.sceneAt(-0.1).activeCues.empty());

    // Repeated requests for the same time are identical
    SceneState a = scene.sceneAt(0.75);
    SceneState b = scene.sceneAt(0.75);
    assert(a.activeCues.size() == b.activeCues.size());
    assert(a.activeCues[0].lineProgress == b.activeCues[0].lineProgress);
    printf("PASS: test_active_cues_boundaries\n");
}

void test_hello_world_at_half_second() {
    StaticSceneSource scene(helloWorldScene());
    SceneState state = scene.sceneAt(0.5);
    assert(state.activeCues.size() == 1);
    const CueState& hello = state.activeCues[0];
    assert(hello.words.size() == 1);
    assert(hello.words[0].text == "Hello");
    assert(near(hello.words[0].progress, 0.5));
    assert(near(hello.lineProgress, 0.5));

    // "world" is not on screen yet and its cue has not started
    SubtitleCue world = scene.description().cues[1];
    assert(world.text == "world");
    CueState worldState = KaraokeTiming::cueStateAt(world, 0.5);
    assert(worldState.lineProgress == 0.0);
    assert(worldState.words[0].progress == 0.0);

    // Colour is half way between unsung and sung
    SubtitlePainter painter;
    std::vector<SubtitlePainter::LineLayout> lines = painter.layout(state);
    assert(lines.size() == 1);
    assert(lines[0].words.size() == 1);
    const QColor fill = lines[0].words[0].fill;
    const SubtitleStyle style;
    assert(std::abs(fill.red() - (style.unsungColor.red() + style.sungColor.red()) / 2) <= 1);
    assert(std::abs(fill.blue() - (style.unsungColor.blue() + style.sungColor.blue()) / 2) <= 1);
    assert(SubtitlePainter::wordColor(style, 0.0) == style.unsungColor);
    assert(SubtitlePainter::wordColor(style, 1.0) == style.sungColor);
    printf("PASS: test_hello_world_at_half_second\n");
}

void test_effects_in_layout() {
    SceneDescription desc = helloWorldScene();
    FadeParams fade;
    fade.fadeInSeconds = 0.5;
    fade.fadeOutSeconds = 0.25;
    GlowParams glow;
    ShadowParams shadow;
    EffectDescriptor disabled{OutlineParams{}, false};
    desc.effects = {EffectDescriptor{glow}, EffectDescriptor{fade}, disabled, EffectDescriptor{shadow}};
    PipelineError error;
    assert(StaticSceneSource::validate(desc, &error));
    StaticSceneSource scene(desc);
    SubtitlePainter painter;

    auto lines = painter.layout(scene.sceneAt(0.25));
    assert(lines.size() == 1);
    assert(near(lines[0].opacity, 0.5));
    // Decorations keep their configured order; the disabled outline is skipped
    assert(lines[0].decorations.size() == 2);
    assert(lines[0].decorations[0].kind == EffectKind::Glow);
    assert(lines[0].decorations[1].kind == EffectKind::Shadow);

    lines = painter.layout(scene.sceneAt(0.6));
    assert(near(lines[0].opacity, 1.0));
    lines = painter.layout(scene.sceneAt(0.875));
    assert(near(lines[0].opacity, 0.5));
    printf("PASS: test_effects_in_layout\n");
}

void test_invalid_scene() {
    SceneDescription desc = helloWorldScene();
    desc.cues[0].endSeconds = 0.5;   // world: ends before it starts
    PipelineError error;
    assert(!StaticSceneSource::validate(desc, &error));
    assert(error.code == ErrorCode::InvalidParameter);

    desc = helloWorldScene();
    GlowParams glow;
    glow.intensity = 1.5;
    desc.effects.push_back(EffectDescriptor{glow});
    assert(!StaticSceneSource::validate(desc, &error));
    assert(error.message.contains("glow"));
    printf("PASS: test_invalid_scene\n");
}

int main(int argc, char* argv[]) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);

    test_word_progress();
    test_line_progress();
    test_distribute_words();
    test_active_cues_boundaries();
    test_hello_world_at_half_second();
    test_effects_in_layout();
    test_invalid_scene();
    printf("All karaoke timing tests passed.\n");
    return 0;
}
