#include "EncoderProcessManager.h"
#include "AppConstants.h"
#include "EncoderCommand.h"
#include "Logging.h"
#include <QEventLoop>
#include <QFileInfo>
#include <algorithm>

// --- FrameWriterThread ---

FrameWriterThread::FrameWriterThread(ChildProcess* process, FrameQueue* queue, size_t chunkSize,
                                     int maxConsecutiveFailures, FinishedFn onFinished,
                                     QObject* parent)
    : QThread(parent)
    , m_process(process)
    , m_queue(queue)
    , m_chunkSize(std::max<size_t>(chunkSize, 1))
    , m_maxFailures(std::max(maxConsecutiveFailures, 1))
    , m_onFinished(std::move(onFinished))
{
}

void FrameWriterThread::requestStop() {
    m_stopRequested = true;
    m_queue->close();
}

void FrameWriterThread::run() {
    m_chunk.reserve(int(m_chunkSize));
    int64_t pendingFrames = 0;
    Result result = Result::Drained;

    CapturedFrame frame;
    while (true) {
        if (m_stopRequested) {
            result = Result::Stopped;
            break;
        }
        QueueStatus status = m_queue->pop(frame, 100);
        if (status == QueueStatus::Timeout) {
            // Producer is slower than the encoder; hand over what we have
            if (!flush()) {
                result = m_result;
                break;
            }
            m_framesSubmitted += pendingFrames;
            pendingFrames = 0;
            continue;
        }
        if (status == QueueStatus::Closed) {
            if (m_stopRequested) {
                result = Result::Stopped;
            } else if (!flush()) {
                result = m_result;
            } else {
                m_framesSubmitted += pendingFrames;
                pendingFrames = 0;
            }
            break;
        }

        if (!append(frame.data(), size_t(frame.byteCount()))) {
            result = m_result;
            break;
        }
        frame = CapturedFrame();    // return the buffer to its pool
        ++pendingFrames;
        if (m_chunk.isEmpty()) {
            m_framesSubmitted += pendingFrames;
            pendingFrames = 0;
        }
    }

    m_chunk.clear();
    if (result == Result::BrokenPipe || result == Result::WriteFailed)
        m_queue->close();   // unblock the producer right away
    m_process->closeStdin();
    m_result = result;
    qCDebug(lcEncoder) << "Writer finished after" << m_framesSubmitted << "frames";
    if (m_onFinished) m_onFinished(result, m_error);
}

bool FrameWriterThread::append(const char* data, size_t size) {
    while (size > 0) {
        size_t room = m_chunkSize - size_t(m_chunk.size());
        size_t take = std::min(room, size);
        m_chunk.append(data, qsizetype(take));
        data += take;
        size -= take;
        if (size_t(m_chunk.size()) >= m_chunkSize && !flush())
            return false;
    }
    return true;
}

bool FrameWriterThread::flush() {
    const char* data = m_chunk.constData();
    size_t remaining = size_t(m_chunk.size());
    int failures = 0;

    while (remaining > 0) {
        if (m_stopRequested) {
            m_result = Result::Stopped;
            return false;
        }
        size_t written = 0;
        QString error;
        auto res = m_process->write(data, remaining, &written, &error);
        data += written;
        remaining -= written;

        switch (res) {
            case ChildProcess::WriteResult::Ok:
                failures = 0;
                break;
            case ChildProcess::WriteResult::BrokenPipe:
                m_error = QString("Encoder closed its input: %1").arg(error);
                m_result = Result::BrokenPipe;
                return false;
            case ChildProcess::WriteResult::Retry:
            case ChildProcess::WriteResult::Failed:
                if (written > 0) failures = 0;
                if (++failures >= m_maxFailures) {
                    m_error = QString("Giving up after %1 consecutive write failures: %2")
                                  .arg(failures).arg(error);
                    m_result = Result::WriteFailed;
                    return false;
                }
                qCDebug(lcEncoder) << "Write to encoder failed, retrying:" << error;
                break;
        }
    }
    m_chunk.clear();
    return true;
}

// --- ProgressMonitorThread ---

ProgressMonitorThread::ProgressMonitorThread(ChildProcess* process, UpdateFn onUpdate,
                                             ExitFn onExit, QObject* parent)
    : QThread(parent)
    , m_process(process)
    , m_onUpdate(std::move(onUpdate))
    , m_onExit(std::move(onExit))
{
}

void ProgressMonitorThread::run() {
    auto report = [this](const std::vector<ParsedLine>& lines) {
        if (lines.empty()) return;
        Update update;
        for (const ParsedLine& line : lines) {
            if (line.kind == LineKind::Warning) {
                update.warnings.append(line.text);
                qCWarning(lcEncoder).noquote() << "encoder:" << line.text;
            } else if (line.kind == LineKind::Error) {
                update.errors.append(line.text);
                qCWarning(lcEncoder).noquote() << "encoder error:" << line.text;
            } else if (line.kind == LineKind::Info) {
                qCDebug(lcEncoder).noquote() << "encoder:" << line.text;
            }
        }
        update.progress = m_parser.progress();
        if (m_onUpdate) m_onUpdate(update);
    };

    char buffer[16384];
    int idleAfterExit = 0;
    while (!m_stopRequested) {
        qint64 n = m_process->readStderr(buffer, sizeof(buffer), 100);
        if (n == 0) break;
        if (n < 0) {
            // A grandchild may still hold the pipe open after the encoder exits
            if (m_process->hasExited() && ++idleAfterExit >= 5) break;
            continue;
        }
        idleAfterExit = 0;
        report(m_parser.feed(QByteArray(buffer, int(n))));
    }
    report(m_parser.flush());
    m_process->closeStderr();

    while (!m_process->waitForExit(100)) {
        if (m_stopRequested) return;
    }

    Exit exit;
    exit.exitCode = m_process->exitCode();
    exit.normal = m_process->exitedNormally();
    exit.signal = m_process->exitSignal();
    exit.tail = m_parser.tail(AppConstants::DiagnosticTailLines);
    exit.errors = m_parser.errors();
    qCDebug(lcEncoder) << "Encoder exited, code" << exit.exitCode << "signal" << exit.signal;
    if (m_onExit) m_onExit(exit);
}

// --- EncoderProcessManager ---

EncoderProcessManager::EncoderProcessManager(QObject* parent)
    : QObject(parent)
    , m_program(AppConstants::DefaultEncoderProgram)
    , m_queueCapacity(AppConstants::DefaultQueueCapacity)
    , m_chunkSize(AppConstants::StreamingChunkSize)
    , m_terminateTimeoutMs(AppConstants::EncoderTerminateTimeoutMs)
    , m_killTimeoutMs(AppConstants::EncoderKillTimeoutMs)
{
    m_terminateTimer.setSingleShot(true);
    m_killTimer.setSingleShot(true);

    connect(&m_terminateTimer, &QTimer::timeout, this, [this]() {
        if (!m_process || m_process->hasExited()) return;
        qCWarning(lcEncoder) << "Encoder did not exit, sending SIGTERM";
        m_process->terminate();
        m_killTimer.start(m_killTimeoutMs);
    });
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (!m_process || m_process->hasExited()) return;
        qCWarning(lcEncoder) << "Encoder unresponsive, sending SIGKILL";
        m_process->kill();
    });
}

EncoderProcessManager::~EncoderProcessManager() {
    if (m_process && !m_process->hasExited()) {
        m_process->terminate();
        if (!m_process->waitForExit(m_terminateTimeoutMs)) {
            m_process->kill();
            m_process->waitForExit(m_killTimeoutMs);
        }
    }
    stopThreads();
}

void EncoderProcessManager::setShutdownTimeouts(int terminateMs, int killMs) {
    m_terminateTimeoutMs = std::max(terminateMs, 0);
    m_killTimeoutMs = std::max(killMs, 0);
}

bool EncoderProcessManager::reject(PipelineError* out, const PipelineError& error) {
    qCWarning(lcEncoder).noquote() << formatErrorSummary(error);
    m_job.errors.append(error.message);
    m_job.error = error;
    if (out) *out = error;
    return false;
}

bool EncoderProcessManager::start(const EncoderSettings& settings, int64_t totalFrames,
                                  const QString& audioPath, PipelineError* error) {
    if (m_job.state == JobState::Running) {
        // Leave the running job's record alone
        PipelineError err = PipelineError::invalidState("An export job is already running");
        qCWarning(lcEncoder).noquote() << formatErrorSummary(err);
        if (error) *error = err;
        return false;
    }

    stopThreads();
    m_writer.reset();
    m_monitor.reset();
    m_process.reset();
    m_queue.reset();
    m_streamError.reset();
    m_abortError.reset();
    m_inputFinished = false;
    m_cancelRequested = false;
    m_progressSeen = false;
    m_tail.clear();
    ++m_generation;

    m_job = ExportJob();
    m_job.settings = settings;
    m_job.audioPath = audioPath;
    m_job.totalFrames = totalFrames;

    if (totalFrames <= 0)
        return reject(error, PipelineError::invalidParameter(
                                 QString("Total frame count must be positive, got %1").arg(totalFrames)));

    SettingsValidation validation = EncoderSettingsUtil::validate(
        settings, m_capabilities ? &*m_capabilities : nullptr);
    for (const QString& w : validation.warnings) {
        qCWarning(lcEncoder).noquote() << "Settings:" << w;
        m_job.warnings.append(w);
    }
    if (!validation.isValid()) {
        m_job.errors = validation.errors;
        PipelineError err = PipelineError::invalidParameter(validation.errors.join("; "));
        qCWarning(lcEncoder).noquote() << formatErrorSummary(err);
        m_job.error = err;
        if (error) *error = err;
        return false;
    }

    if (!audioPath.isEmpty() && !QFileInfo(audioPath).isReadable())
        return reject(error, PipelineError::mediaUnavailable(
                                 QString("Audio file not readable: %1").arg(audioPath)));

    const QString program = EncoderProbe::resolveProgram(m_program);
    if (program.isEmpty())
        return reject(error, {ErrorCode::EncoderUnavailable,
                              QString("Encoder program '%1' not found").arg(m_program)});

    const QStringList args = EncoderCommand::buildArguments(settings, audioPath);
    qCDebug(lcEncoder).noquote() << "Starting:" << program << args.join(' ');

    m_process = std::make_unique<ChildProcess>();
    QString startError;
    if (!m_process->start(program, args, &startError)) {
        m_process.reset();
        return reject(error, {ErrorCode::EncoderStartFailed, startError});
    }

    m_queue = std::make_unique<FrameQueue>(m_queueCapacity, OverflowPolicy::Block);

    const quint64 generation = m_generation;
    m_writer = std::make_unique<FrameWriterThread>(
        m_process.get(), m_queue.get(), m_chunkSize, AppConstants::MaxConsecutiveWriteFailures,
        [this, generation](FrameWriterThread::Result result, const QString& message) {
            QMetaObject::invokeMethod(this, [this, generation, result, message]() {
                if (generation == m_generation) onWriterFinished(result, message);
            }, Qt::QueuedConnection);
        });
    m_monitor = std::make_unique<ProgressMonitorThread>(
        m_process.get(),
        [this, generation](const ProgressMonitorThread::Update& update) {
            QMetaObject::invokeMethod(this, [this, generation, update]() {
                if (generation == m_generation) onUpdate(update);
            }, Qt::QueuedConnection);
        },
        [this, generation](const ProgressMonitorThread::Exit& exit) {
            QMetaObject::invokeMethod(this, [this, generation, exit]() {
                if (generation == m_generation) onExited(exit);
            }, Qt::QueuedConnection);
        });

    m_job.startTime = QDateTime::currentDateTime();
    m_clock.start();
    setState(JobState::Running);
    m_writer->start();
    m_monitor->start();
    m_job.processId = m_process->pid();
    qCInfo(lcEncoder) << "Encoder started, pid" << m_process->pid() << "expecting" << totalFrames << "frames";
    return true;
}

void EncoderProcessManager::finishInput() {
    if (!m_queue) return;
    m_inputFinished = true;
    m_queue->close();
}

void EncoderProcessManager::cancel() {
    if (m_job.state != JobState::Running || m_cancelRequested) return;
    m_cancelRequested = true;
    qCInfo(lcEncoder) << "Cancelling export";

    m_writer->requestStop();
    m_terminateTimer.stop();
    if (!m_process->hasExited()) {
        m_process->terminate();
        m_killTimer.start(m_terminateTimeoutMs);
    }
}

void EncoderProcessManager::abort(const PipelineError& error) {
    if (m_job.state != JobState::Running || m_cancelRequested) return;
    qCWarning(lcEncoder).noquote() << "Aborting export:" << formatErrorSummary(error);
    m_abortError = error;
    cancel();
}

bool EncoderProcessManager::waitForFinished(int timeoutMs) {
    if (m_job.isTerminal()) return true;
    if (m_job.state != JobState::Running) return false;

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    connect(this, &EncoderProcessManager::stateChanged, &loop, [&loop](JobState state) {
        if (state != JobState::Running) loop.quit();
    });
    if (timeoutMs >= 0) timeout.start(timeoutMs);
    loop.exec();
    return m_job.isTerminal();
}

void EncoderProcessManager::onUpdate(const ProgressMonitorThread::Update& update) {
    if (m_job.isTerminal()) return;

    for (const QString& w : update.warnings) {
        m_job.warnings.append(w);
        emit warningReported(w);
    }
    for (const QString& e : update.errors) m_job.errors.append(e);

    m_job.lastProgress = update.progress;
    if (update.progress.frame >= 0) {
        m_progressSeen = true;
        m_job.framesWritten = std::max(m_job.framesWritten, update.progress.frame);
    } else {
        return;
    }

    double fps = update.progress.fps;
    if (fps <= 0.0 && m_clock.isValid() && m_clock.elapsed() > 0)
        fps = m_job.framesWritten * 1000.0 / double(m_clock.elapsed());
    const int64_t remaining = std::max<int64_t>(0, m_job.totalFrames - m_job.framesWritten);
    m_job.etaSeconds = fps > 0.0 ? remaining / fps : -1.0;

    emit progress(m_job.framesWritten, m_job.totalFrames, m_job.etaSeconds);
}

void EncoderProcessManager::onWriterFinished(FrameWriterThread::Result result, const QString& message) {
    if (m_job.isTerminal()) return;
    m_job.framesSubmitted = m_writer->framesSubmitted();

    if (result != FrameWriterThread::Result::BrokenPipe &&
        result != FrameWriterThread::Result::WriteFailed)
        return;
    if (m_cancelRequested || m_streamError) return;

    m_streamError = PipelineError{ErrorCode::BrokenPipe, message};
    m_job.errors.append(message);
    qCWarning(lcEncoder).noquote() << message;

    // Stop accepting frames; give the encoder the graceful window to exit
    // on its own before it is signalled
    m_queue->close();
    scheduleTermination(m_terminateTimeoutMs);
}

void EncoderProcessManager::scheduleTermination(int graceMs) {
    if (!m_process || m_process->hasExited() || m_terminateTimer.isActive() || m_killTimer.isActive())
        return;
    m_terminateTimer.start(graceMs);
}

void EncoderProcessManager::onExited(const ProgressMonitorThread::Exit& exit) {
    if (m_job.isTerminal()) return;
    m_terminateTimer.stop();
    m_killTimer.stop();

    // With input finished the writer only drains; let it run into the closed
    // pipe so a short read by the encoder is reported as such
    if (m_inputFinished) m_writer->wait();
    const FrameWriterThread::Result writerResult = m_writer->result();
    stopThreads();

    m_job.framesSubmitted = m_writer->framesSubmitted();
    m_job.exitCode = exit.exitCode;
    m_tail = exit.tail;

    const bool success = exit.normal && exit.exitCode == 0;

    if (m_abortError) {
        m_job.error = *m_abortError;
        m_job.errors.append(m_abortError->message);
        qCWarning(lcEncoder) << "Export aborted after" << m_job.framesSubmitted << "frames submitted";
        setState(JobState::Failed);
        emit failed(*m_abortError, m_tail);
        return;
    }

    if (m_cancelRequested) {
        qCInfo(lcEncoder) << "Export cancelled after" << m_job.framesWritten << "frames";
        setState(JobState::Cancelled);
        emit cancelled();
        return;
    }

    if (!m_streamError) {
        if (writerResult == FrameWriterThread::Result::BrokenPipe ||
            writerResult == FrameWriterThread::Result::WriteFailed) {
            m_streamError = PipelineError{ErrorCode::BrokenPipe, m_writer->errorMessage()};
            m_job.errors.append(m_writer->errorMessage());
        } else if (success && !m_inputFinished) {
            QString message = QString("Encoder exited after %1 of %2 frames were sent")
                                  .arg(m_job.framesSubmitted).arg(m_job.totalFrames);
            m_streamError = PipelineError{ErrorCode::BrokenPipe, message};
            m_job.errors.append(message);
        }
    }

    PipelineError error;
    if (m_streamError) {
        error = *m_streamError;
        if (!success)
            error.message += "; " + DiagnosticParser::explainFailure(exit.errors, exit.exitCode);
    } else if (!success) {
        error = {ErrorCode::EncoderFailed, DiagnosticParser::explainFailure(exit.errors, exit.exitCode)};
        m_job.errors.append(error.message);
    }

    if (error.isError()) {
        m_job.error = error;
        qCWarning(lcEncoder).noquote() << formatErrorSummary(error, m_tail);
        setState(JobState::Failed);
        emit failed(error, m_tail);
        return;
    }

    if (!m_progressSeen)
        m_job.framesWritten = std::max(m_job.framesWritten, m_job.framesSubmitted);
    if (m_job.framesWritten != m_job.totalFrames) {
        QString message = QString("Frame count mismatch: encoder reported %1 of %2 frames")
                              .arg(m_job.framesWritten).arg(m_job.totalFrames);
        qCWarning(lcEncoder).noquote() << message;
        m_job.warnings.append(message);
        emit warningReported(message);
    }
    m_job.etaSeconds = 0.0;
    qCInfo(lcEncoder) << "Export completed:" << m_job.settings.outputPath;
    setState(JobState::Completed);
    emit completed(m_job.settings.outputPath);
}

void EncoderProcessManager::setState(JobState state) {
    if (m_job.state == state) return;
    m_job.state = state;
    qCDebug(lcEncoder) << "Job state" << jobStateToString(state);
    emit stateChanged(state);
}

void EncoderProcessManager::stopThreads() {
    if (m_writer && m_writer->isRunning()) {
        m_writer->requestStop();
        m_writer->wait();
    }
    if (m_monitor && m_monitor->isRunning()) {
        m_monitor->requestStop();
        m_monitor->wait();
    }
}
