#include <QCommandLineParser>
#include <QFileInfo>
#include <QGuiApplication>
#include <QTimer>
#include <cstdio>
#include "AppConstants.h"
#include "EncoderCapabilities.h"
#include "Logging.h"
#include "PipelineOrchestrator.h"
#include "SceneConfig.h"
#include "TimeUtil.h"

namespace {

int printCapabilities(const QString& program) {
    EncoderCapabilities caps = EncoderProbe::probe(program, AppConstants::ProbeTimeoutMs);
    if (!caps.available) {
        std::fprintf(stderr, "Encoder unavailable: %s\n", qPrintable(caps.errorMessage));
        return 1;
    }
    std::printf("Encoder:   %s\n", qPrintable(caps.program));
    std::printf("Version:   %s\n", qPrintable(caps.version));
    std::printf("Video:     %lld encoders\n", static_cast<long long>(caps.videoEncoders.size()));
    std::printf("Audio:     %lld encoders\n", static_cast<long long>(caps.audioEncoders.size()));
    std::printf("Muxers:    %lld\n", static_cast<long long>(caps.muxers.size()));
    std::printf("Hardware:  %s\n", caps.hardwareEncoders.isEmpty()
                                       ? "none" : qPrintable(caps.hardwareEncoders.join(", ")));
    std::printf("Hwaccels:  %s\n", qPrintable(caps.hwaccelMethods.join(", ")));
    return 0;
}

void printStats(const PipelineOrchestrator& pipeline) {
    const CaptureStats s = pipeline.captureStats();
    std::printf("Frames:    %lld rendered, %lld delivered, %lld dropped of %lld\n",
                static_cast<long long>(s.framesRendered), static_cast<long long>(s.framesDelivered),
                static_cast<long long>(s.framesDropped), static_cast<long long>(s.framesTotal));
    std::printf("Render:    avg %.2f ms, min %.2f ms, max %.2f ms\n", s.avgRenderMs, s.minRenderMs, s.maxRenderMs);
    std::printf("Rate:      %.1f fps\n", s.effectiveFps);
}

} // namespace

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Renders karaoke subtitle scenes to video");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption sceneOpt("scene", "Scene file (JSON).", "file");
    QCommandLineOption outputOpt("output", "Output video file.", "file");
    QCommandLineOption settingsOpt("settings", "Export settings file (JSON).", "file");
    QCommandLineOption presetOpt("preset", "Quality preset: " + EncoderSettingsUtil::presetNames().join(", ") + ".", "name");
    QCommandLineOption durationOpt("duration", "Duration in seconds (default: scene duration).", "seconds");
    QCommandLineOption fpsOpt("fps", "Frame rate, e.g. 30, 29.97 or 30000/1001.", "rate");
    QCommandLineOption formatOpt("pixel-format", "Raw frame format: rgba, rgb, bgr, bgra, yuv420p, yuv444p.", "format");
    QCommandLineOption rendererOpt("renderer", "Renderer: gl, raster or mock.", "name", "gl");
    QCommandLineOption previewOpt("preview", "Render without encoding and print statistics.");
    QCommandLineOption ffmpegOpt("ffmpeg", "Encoder program.", "path", AppConstants::DefaultEncoderProgram);
    QCommandLineOption probeOpt("probe", "Print encoder capabilities and exit.");
    QCommandLineOption verboseOpt("verbose", "Enable debug logging.");
    parser.addOptions({sceneOpt, outputOpt, settingsOpt, presetOpt, durationOpt, fpsOpt, formatOpt,
                       rendererOpt, previewOpt, ffmpegOpt, probeOpt, verboseOpt});
    parser.process(app);

    Logging::setVerbose(parser.isSet(verboseOpt));

    const QString program = parser.value(ffmpegOpt);
    if (parser.isSet(probeOpt)) return printCapabilities(program);

    if (!parser.isSet(sceneOpt)) {
        std::fprintf(stderr, "--scene is required\n");
        return 2;
    }

    SceneConfig config;
    SceneDescription desc;
    if (!config.load(parser.value(sceneOpt), desc)) {
        std::fprintf(stderr, "%s\n", qPrintable(config.errorString()));
        return 1;
    }
    PipelineError error;
    if (!PipelineOrchestrator::probeSceneMedia(desc, &error) ||
        !StaticSceneSource::validate(desc, &error)) {
        std::fprintf(stderr, "%s\n", qPrintable(formatErrorSummary(error)));
        return 1;
    }
    StaticSceneSource scene(desc);

    const bool preview = parser.isSet(previewOpt);
    OutputTarget target;
    target.audioPath = desc.audioPath;
    target.audioOffsetSeconds = desc.audioOffsetSeconds;
    if (parser.isSet(durationOpt)) target.durationSeconds = parser.value(durationOpt).toDouble();

    EncoderSettings& settings = target.settings;
    settings.width = desc.canvasSize.width();
    settings.height = desc.canvasSize.height();
    if (parser.isSet(settingsOpt)) {
        QString loadError;
        if (!EncoderSettingsUtil::load(parser.value(settingsOpt), settings, &loadError)) {
            std::fprintf(stderr, "%s\n", qPrintable(loadError));
            return 1;
        }
    }
    if (parser.isSet(presetOpt) && !EncoderSettingsUtil::applyPreset(parser.value(presetOpt), settings)) {
        std::fprintf(stderr, "Unknown preset '%s'\n", qPrintable(parser.value(presetOpt)));
        return 2;
    }
    if (parser.isSet(fpsOpt)) {
        FrameRate rate = FrameRate::fromString(parser.value(fpsOpt));
        if (!rate.isValid()) {
            std::fprintf(stderr, "Invalid frame rate '%s'\n", qPrintable(parser.value(fpsOpt)));
            return 2;
        }
        settings.frameRate = rate;
    }
    target.rate = settings.frameRate;
    if (parser.isSet(formatOpt)) {
        PixelFormat format;
        if (!pixelFormatFromName(parser.value(formatOpt), format)) {
            std::fprintf(stderr, "Unknown pixel format '%s'\n", qPrintable(parser.value(formatOpt)));
            return 2;
        }
        settings.inputPixelFormat = format;
        target.previewFormat = format;
    }
    if (parser.isSet(outputOpt)) settings.outputPath = parser.value(outputOpt);
    if (!preview && settings.outputPath.isEmpty()) {
        std::fprintf(stderr, "--output is required unless --preview is given\n");
        return 2;
    }

    PipelineOrchestrator pipeline;
    pipeline.encoder().setEncoderProgram(program);
    if (!pipeline.initialize(&scene, parser.value(rendererOpt), &error)) {
        std::fprintf(stderr, "%s\n", qPrintable(formatErrorSummary(error)));
        return 1;
    }

    if (!preview) {
        EncoderCapabilities caps = EncoderProbe::cached(program);
        if (caps.available) pipeline.encoder().setCapabilities(caps);
    }

    // Preview from the command line runs as fast as possible; pacing only
    // matters when a viewer is attached
    target.paced = false;

    int exitCode = 0;
    QObject::connect(&pipeline, &PipelineOrchestrator::progress, [](const PipelineProgress& p) {
        std::fprintf(stderr, "\r%lld/%lld frames (%.0f%%) ETA %s   ",
                     static_cast<long long>(p.framesDone), static_cast<long long>(p.totalFrames),
                     p.fraction * 100.0, qPrintable(TimeUtil::etaText(p.etaSeconds)));
    });
    QObject::connect(&pipeline, &PipelineOrchestrator::completed, &app, [&](const QString& path) {
        std::fprintf(stderr, "\n");
        if (!path.isEmpty()) std::printf("Wrote %s\n", qPrintable(QFileInfo(path).absoluteFilePath()));
        for (const QString& w : pipeline.exportJob().warnings)
            std::printf("Warning:   %s\n", qPrintable(w));
        app.quit();
    });
    QObject::connect(&pipeline, &PipelineOrchestrator::failed, &app,
                     [&](const PipelineError&, const QString& summary) {
        std::fprintf(stderr, "\n%s\n", qPrintable(summary));
        exitCode = 1;
        app.quit();
    });
    QObject::connect(&pipeline, &PipelineOrchestrator::cancelled, &app, [&]() {
        std::fprintf(stderr, "\nCancelled\n");
        exitCode = 3;
        app.quit();
    });

    if (!pipeline.start(preview ? PipelineMode::Preview : PipelineMode::Export, target, &error)) {
        std::fprintf(stderr, "%s\n", qPrintable(formatErrorSummary(error)));
        return 1;
    }

    app.exec();
    printStats(pipeline);
    return exitCode;
}
