#pragma once

#include <QMutex>
#include <QString>
#include <QStringList>
#include <atomic>
#include <sys/types.h>

// POSIX subprocess with piped stdin and stderr (stdout goes to /dev/null).
// Unlike QProcess it has no thread affinity: one thread may write stdin while
// another reads stderr and a third waits or signals. The destructor closes
// both pipes and kills and reaps a child that is still running.
class ChildProcess {
public:
    enum class WriteResult {
        Ok,
        BrokenPipe,     // reader closed stdin or exited
        Retry,          // interrupted, try again
        Failed
    };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Fails when fork or exec fails; an exec failure is detected
    // synchronously through a close-on-exec status pipe.
    bool start(const QString& program, const QStringList& arguments, QString* error);

    pid_t pid() const { return m_pid; }
    bool isStarted() const { return m_pid > 0; }

    // Writes all of data unless the pipe breaks; *written receives the bytes
    // accepted before a failure.
    WriteResult write(const char* data, size_t size, size_t* written, QString* error);
    void closeStdin();

    // Bytes read, 0 at end of stream, -1 on timeout or error.
    qint64 readStderr(char* buffer, size_t size, int timeoutMs);
    void closeStderr();

    // Reaps the child if it has exited; safe from any thread.
    bool hasExited();
    // Polls until exit or timeout; timeoutMs < 0 waits forever.
    bool waitForExit(int timeoutMs);

    void terminate();   // SIGTERM
    void kill();        // SIGKILL

    bool exitedNormally() const { return m_exitedNormally; }
    int exitCode() const { return m_exitCode; }
    int exitSignal() const { return m_exitSignal; }

private:
    pid_t m_pid = -1;
    int m_stdinFd = -1;
    int m_stderrFd = -1;
    QMutex m_stdinMutex;
    QMutex m_stderrMutex;
    QMutex m_reapMutex;
    std::atomic<bool> m_exited{false};
    std::atomic<bool> m_exitedNormally{false};
    std::atomic<int> m_exitCode{-1};
    std::atomic<int> m_exitSignal{0};
};
