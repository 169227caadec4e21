#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QThread>
#include <QTimer>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include "ChildProcess.h"
#include "EncoderCapabilities.h"
#include "ExportJob.h"
#include "FrameQueue.h"

// Drains the input queue into the encoder's stdin in fixed-size chunks.
class FrameWriterThread : public QThread {
    Q_OBJECT
public:
    enum class Result {
        Running,
        Drained,        // queue closed and fully written, stdin closed
        Stopped,        // stop requested, pending frames discarded
        BrokenPipe,
        WriteFailed     // consecutive failures past the threshold
    };

    using FinishedFn = std::function<void(Result, const QString&)>;

    FrameWriterThread(ChildProcess* process, FrameQueue* queue, size_t chunkSize,
                      int maxConsecutiveFailures, FinishedFn onFinished,
                      QObject* parent = nullptr);

    void requestStop();

    int64_t framesSubmitted() const { return m_framesSubmitted; }
    Result result() const { return m_result; }
    QString errorMessage() const { return m_error; }

protected:
    void run() override;

private:
    bool append(const char* data, size_t size);
    bool flush();

    ChildProcess* m_process;
    FrameQueue* m_queue;
    size_t m_chunkSize;
    int m_maxFailures;
    FinishedFn m_onFinished;
    QByteArray m_chunk;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<int64_t> m_framesSubmitted{0};
    std::atomic<Result> m_result{Result::Running};
    QString m_error;
};

// Reads the encoder's stderr, parses it and reports back until the process exits.
class ProgressMonitorThread : public QThread {
    Q_OBJECT
public:
    struct Update {
        EncoderProgress progress;
        QStringList warnings;   // new since the previous update
        QStringList errors;
    };
    struct Exit {
        int exitCode = -1;
        bool normal = false;
        int signal = 0;
        QStringList tail;
        QStringList errors;     // every error line of the run
    };

    using UpdateFn = std::function<void(const Update&)>;
    using ExitFn = std::function<void(const Exit&)>;

    ProgressMonitorThread(ChildProcess* process, UpdateFn onUpdate, ExitFn onExit,
                          QObject* parent = nullptr);

    void requestStop() { m_stopRequested = true; }
    DiagnosticParser& parser() { return m_parser; }

protected:
    void run() override;

private:
    ChildProcess* m_process;
    UpdateFn m_onUpdate;
    ExitFn m_onExit;
    DiagnosticParser m_parser;
    std::atomic<bool> m_stopRequested{false};
};

// Owns one encoder subprocess per job: spawns it from EncoderSettings, feeds
// raw frames from inputQueue() on a writer thread, scrapes progress on a
// monitor thread and decides job state on the thread it lives on.
class EncoderProcessManager : public QObject {
    Q_OBJECT
public:
    explicit EncoderProcessManager(QObject* parent = nullptr);
    ~EncoderProcessManager();

    void setEncoderProgram(const QString& program) { m_program = program; }
    QString encoderProgram() const { return m_program; }
    void setCapabilities(const EncoderCapabilities& caps) { m_capabilities = caps; }
    void setQueueCapacity(int capacity) { m_queueCapacity = capacity; }
    void setChunkSize(size_t bytes) { m_chunkSize = bytes; }
    void setShutdownTimeouts(int terminateMs, int killMs);

    // Configuration problems are reported here and the job stays Pending.
    bool start(const EncoderSettings& settings, int64_t totalFrames,
               const QString& audioPath = QString(), PipelineError* error = nullptr);

    // Frames pushed here are written in order. Closed when the job stops
    // accepting input.
    FrameQueue* inputQueue() const { return m_queue.get(); }

    // No more frames will be pushed; the writer drains and closes stdin.
    // Callable from any thread.
    void finishInput();

    // Closes input, asks the encoder to terminate, kills it after the
    // terminate timeout. The job ends Cancelled once the exit is observed.
    void cancel();

    // Tears the job down like cancel() but ends it Failed with the given
    // error, for failures upstream of the encoder (a lost render context).
    void abort(const PipelineError& error);

    // Spins a local event loop until the job is terminal or the timeout expires.
    bool waitForFinished(int timeoutMs);

    const ExportJob& job() const { return m_job; }
    bool isRunning() const { return m_job.state == JobState::Running; }
    QStringList diagnosticTail() const { return m_tail; }

signals:
    void stateChanged(JobState state);
    void progress(qint64 framesWritten, qint64 totalFrames, double etaSeconds);
    void warningReported(const QString& line);
    void completed(const QString& outputPath);
    void failed(const PipelineError& error, const QStringList& diagnosticTail);
    void cancelled();

private:
    void onUpdate(const ProgressMonitorThread::Update& update);
    void onWriterFinished(FrameWriterThread::Result result, const QString& message);
    void onExited(const ProgressMonitorThread::Exit& exit);
    void scheduleTermination(int graceMs);
    void setState(JobState state);
    void stopThreads();
    bool reject(PipelineError* out, const PipelineError& error);

    QString m_program;
    std::optional<EncoderCapabilities> m_capabilities;
    int m_queueCapacity;
    size_t m_chunkSize;
    int m_terminateTimeoutMs;
    int m_killTimeoutMs;

    ExportJob m_job;
    QStringList m_tail;
    std::unique_ptr<ChildProcess> m_process;
    std::unique_ptr<FrameQueue> m_queue;
    std::unique_ptr<FrameWriterThread> m_writer;
    std::unique_ptr<ProgressMonitorThread> m_monitor;
    std::optional<PipelineError> m_streamError;
    std::optional<PipelineError> m_abortError;
    std::atomic<bool> m_inputFinished{false};
    bool m_cancelRequested = false;
    bool m_progressSeen = false;
    quint64 m_generation = 0;   // drops events posted by a previous job
    QTimer m_terminateTimer;
    QTimer m_killTimer;
    QElapsedTimer m_clock;
};

Q_DECLARE_METATYPE(JobState)
