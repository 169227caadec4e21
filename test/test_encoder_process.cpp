#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>
#include <QTimer>
#include <thread>
#include "encoder/EncoderProcessManager.h"

#ifndef KF_FAKE_ENCODER
#error "KF_FAKE_ENCODER must point at the fake_encoder test binary"
#endif

static const int FrameW = 64;
static const int FrameH = 64;

static void resetFakeEnv() {
    for (const char* name : {"FAKE_ENCODER_STOP_AFTER", "FAKE_ENCODER_EXIT_CODE", "FAKE_ENCODER_DELAY_MS",
                             "FAKE_ENCODER_IGNORE_TERM", "FAKE_ENCODER_HANG", "FAKE_ENCODER_WARN"})
        qunsetenv(name);
}

static EncoderSettings makeSettings(const QTemporaryDir& dir, const QString& name) {
    EncoderSettings s;
    s.outputPath = dir.filePath(name);
    s.width = FrameW;
    s.height = FrameH;
    s.frameRate = FrameRate{30, 1};
    s.inputPixelFormat = PixelFormat::RGBA;
    return s;
}

// Pushes `count` frames and signals end of input; stops early when the queue closes.
static std::thread startProducer(EncoderProcessManager& manager, int count, std::atomic<int>* pushed) {
    FrameQueue* queue = manager.inputQueue();
    return std::thread([&manager, queue, count, pushed]() {
        for (int i = 0; i < count; ++i) {
            CapturedFrame frame;
            frame.index = i;
            frame.timeSeconds = i / 30.0;
            frame.width = FrameW;
            frame.height = FrameH;
            frame.buffer = std::make_shared<QByteArray>(FrameW * FrameH * 4, char(i & 0x7F));
            if (queue->push(std::move(frame)) != QueueStatus::Ok) break;
            ++*pushed;
        }
        manager.finishInput();
    });
}

static QByteArray readFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll().trimmed();
}

void test_successful_export() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_DELAY_MS", "2");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    std::vector<JobState> states;
    QObject::connect(&manager, &EncoderProcessManager::stateChanged, [&](JobState s) { states.push_back(s); });
    int64_t lastWritten = 0;
    bool monotonic = true;
    bool sawEta = false;
    int progressEvents = 0;
    QObject::connect(&manager, &EncoderProcessManager::progress, [&](qint64 written, qint64 total, double eta) {
        if (written < lastWritten) monotonic = false;
        lastWritten = written;
        assert(total == 100);
        if (eta >= 0.0) sawEta = true;
        ++progressEvents;
    });
    QString completedPath;
    QObject::connect(&manager, &EncoderProcessManager::completed, [&](const QString& p) { completedPath = p; });

    EncoderSettings settings = makeSettings(dir, "ok.mp4");
    PipelineError err;
    bool ok = manager.start(settings, 100, QString(), &err);
    if (!ok) printf("  start error: %s\n", err.message.toUtf8().constData());
    assert(ok);
    assert(manager.isRunning());
    assert(manager.job().startTime.isValid());

    // A second job cannot start while this one runs
    assert(!manager.start(settings, 100, QString(), &err));
    assert(err.code == ErrorCode::InvalidState);

    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 100, &pushed);
    assert(manager.waitForFinished(30000));
    producer.join();

    const ExportJob& job = manager.job();
    assert(job.state == JobState::Completed);
    assert(pushed == 100);
    assert(job.framesSubmitted == 100);
    assert(job.framesWritten == 100);
    assert(job.fraction() == 1.0);
    assert(job.exitCode == 0);
    assert(!job.error.isError());
    assert(completedPath == settings.outputPath);
    assert(readFile(settings.outputPath) == "frames=100");
    assert(monotonic && sawEta && progressEvents > 0);
    assert(lastWritten == 100);
    assert(states.size() == 2 && states[0] == JobState::Running && states[1] == JobState::Completed);
    printf("PASS: test_successful_export\n");
}

void test_encoder_stops_reading() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_STOP_AFTER", "10");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    manager.setShutdownTimeouts(500, 500);
    PipelineError reported;
    QStringList reportedTail;
    QObject::connect(&manager, &EncoderProcessManager::failed,
                     [&](const PipelineError& e, const QStringList& tail) { reported = e; reportedTail = tail; });

    assert(manager.start(makeSettings(dir, "short.mp4"), 100));
    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 100, &pushed);
    assert(manager.waitForFinished(30000));
    producer.join();   // unblocked by the closed queue

    const ExportJob& job = manager.job();
    assert(job.state == JobState::Failed);
    assert(job.error.code == ErrorCode::BrokenPipe);
    assert(reported.code == ErrorCode::BrokenPipe);
    assert(job.framesWritten == 10);
    assert(job.framesSubmitted < 100);
    assert(pushed < 100 || manager.inputQueue()->isClosed());
    assert(!reportedTail.isEmpty());
    assert(formatErrorSummary(reported, reportedTail).startsWith("[Streaming] BrokenPipe"));
    printf("PASS: test_encoder_stops_reading\n");
}

void test_encoder_exit_code_failure() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_EXIT_CODE", "1");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    assert(manager.start(makeSettings(dir, "fail.mp4"), 20));
    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 20, &pushed);
    assert(manager.waitForFinished(30000));
    producer.join();

    const ExportJob& job = manager.job();
    assert(job.state == JobState::Failed);
    assert(job.error.code == ErrorCode::EncoderFailed);
    assert(job.error.message.contains("conversion failed", Qt::CaseInsensitive));
    assert(job.exitCode == 1);
    assert(job.framesWritten == 20);
    assert(!job.errors.isEmpty());
    bool tailHasError = false;
    for (const QString& line : manager.diagnosticTail())
        if (line.contains("Conversion failed!")) tailHasError = true;
    assert(tailHasError);
    printf("PASS: test_encoder_exit_code_failure\n");
}

void test_cancel_escalates_to_kill() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_IGNORE_TERM", "1");
    qputenv("FAKE_ENCODER_HANG", "1");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    manager.setShutdownTimeouts(300, 300);
    bool cancelledSignal = false;
    QObject::connect(&manager, &EncoderProcessManager::cancelled, [&]() { cancelledSignal = true; });

    assert(manager.start(makeSettings(dir, "hang.mp4"), 50));
    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 5, &pushed);
    producer.join();

    QElapsedTimer clock;
    clock.start();
    QTimer::singleShot(200, &manager, [&]() { manager.cancel(); });
    assert(manager.waitForFinished(10000));

    assert(manager.job().state == JobState::Cancelled);
    assert(cancelledSignal);
    assert(clock.elapsed() < 5000);
    assert(!manager.job().error.isError());
    printf("PASS: test_cancel_escalates_to_kill\n");
}

void test_cancel_while_streaming() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_DELAY_MS", "20");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    assert(manager.start(makeSettings(dir, "cancel.mp4"), 200));
    QObject::connect(&manager, &EncoderProcessManager::progress, [&](qint64 written, qint64, double) {
        if (written >= 5) manager.cancel();
    });

    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 200, &pushed);
    assert(manager.waitForFinished(30000));
    producer.join();   // the closed queue releases it

    assert(manager.job().state == JobState::Cancelled);
    assert(manager.job().framesWritten < 200);
    assert(manager.inputQueue()->isClosed());
    printf("PASS: test_cancel_while_streaming\n");
}

void test_abort_ends_failed() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_DELAY_MS", "20");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    manager.setShutdownTimeouts(300, 300);
    PipelineError reported;
    bool cancelledSignal = false;
    QObject::connect(&manager, &EncoderProcessManager::failed,
                     [&](const PipelineError& e, const QStringList&) { reported = e; });
    QObject::connect(&manager, &EncoderProcessManager::cancelled, [&]() { cancelledSignal = true; });

    assert(manager.start(makeSettings(dir, "abort.mp4"), 200));
    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 200, &pushed);
    QTimer::singleShot(100, &manager, [&]() {
        manager.abort(PipelineError::renderTargetUnavailable("context lost"));
    });
    assert(manager.waitForFinished(30000));
    producer.join();

    const ExportJob& job = manager.job();
    assert(job.state == JobState::Failed);
    assert(!cancelledSignal);
    assert(reported.code == ErrorCode::RenderTargetUnavailable);
    assert(job.error.code == ErrorCode::RenderTargetUnavailable);
    assert(job.errors.contains("context lost"));
    assert(manager.inputQueue()->isClosed());

    // A second abort or cancel after the job is terminal changes nothing
    manager.abort(PipelineError::invalidState("late"));
    manager.cancel();
    assert(manager.job().state == JobState::Failed);
    assert(manager.job().error.code == ErrorCode::RenderTargetUnavailable);
    printf("PASS: test_abort_ends_failed\n");
}

void test_warnings_are_collected() {
    resetFakeEnv();
    qputenv("FAKE_ENCODER_WARN", "1");
    QTemporaryDir dir;

    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    QStringList signalled;
    QObject::connect(&manager, &EncoderProcessManager::warningReported,
                     [&](const QString& w) { signalled << w; });

    assert(manager.start(makeSettings(dir, "warn.mp4"), 10));
    std::atomic<int> pushed{0};
    std::thread producer = startProducer(manager, 10, &pushed);
    assert(manager.waitForFinished(30000));
    producer.join();

    const ExportJob& job = manager.job();
    assert(job.state == JobState::Completed);
    bool found = false;
    for (const QString& w : job.warnings)
        if (w.contains("deprecated pixel format")) found = true;
    assert(found);
    assert(!signalled.isEmpty());
    printf("PASS: test_warnings_are_collected\n");
}

void test_start_rejections() {
    resetFakeEnv();
    QTemporaryDir dir;
    EncoderProcessManager manager;
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    PipelineError err;

    assert(!manager.start(makeSettings(dir, "a.mp4"), 0, QString(), &err));
    assert(err.code == ErrorCode::InvalidParameter);
    assert(manager.job().state == JobState::Pending);

    EncoderSettings bad = makeSettings(dir, "b.mp4");
    bad.crf = 70;
    assert(!manager.start(bad, 10, QString(), &err));
    assert(err.code == ErrorCode::InvalidParameter);
    assert(err.message.contains("CRF"));
    assert(manager.job().state == JobState::Pending);
    assert(!manager.job().errors.isEmpty());

    assert(!manager.start(makeSettings(dir, "c.mp4"), 10, dir.filePath("missing.wav"), &err));
    assert(err.code == ErrorCode::MediaUnavailable);

    manager.setEncoderProgram("/nonexistent/bin/ffmpeg");
    assert(!manager.start(makeSettings(dir, "d.mp4"), 10, QString(), &err));
    assert(err.code == ErrorCode::EncoderUnavailable);
    assert(manager.inputQueue() == nullptr);

    // Capabilities reject a codec the probed build lacks
    manager.setEncoderProgram(KF_FAKE_ENCODER);
    EncoderCapabilities caps = EncoderProbe::probe(KF_FAKE_ENCODER, 10000);
    assert(caps.available);
    manager.setCapabilities(caps);
    EncoderSettings vp9 = makeSettings(dir, "e.webm");
    vp9.container = "webm";
    vp9.videoCodec = "libvpx-vp9";
    assert(!manager.start(vp9, 10, QString(), &err));
    assert(err.code == ErrorCode::InvalidParameter);
    assert(manager.job().state == JobState::Pending);
    printf("PASS: test_start_rejections\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    qRegisterMetaType<PipelineError>("PipelineError");
    qRegisterMetaType<JobState>("JobState");

    test_successful_export();
    test_encoder_stops_reading();
    test_encoder_exit_code_failure();
    test_cancel_escalates_to_kill();
    test_cancel_while_streaming();
    test_abort_ends_failed();
    test_warnings_are_collected();
    test_start_rejections();

    printf("All encoder process tests passed.\n");
    return 0;
}
