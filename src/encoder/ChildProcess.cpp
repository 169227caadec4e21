#include "ChildProcess.h"
#include "Logging.h"
#include <QElapsedTimer>
#include <QThread>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {

void ignoreSigpipeOnce() {
    // A write to a dead reader must fail with EPIPE instead of killing us
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

QString errnoText(int err) {
    return QString::fromLocal8Bit(std::strerror(err));
}

} // namespace

ChildProcess::~ChildProcess() {
    closeStdin();
    closeStderr();
    if (m_pid > 0 && !hasExited()) {
        qCWarning(lcEncoder) << "Killing encoder process" << m_pid << "on teardown";
        kill();
        waitForExit(-1);
    }
}

bool ChildProcess::start(const QString& program, const QStringList& arguments, QString* error) {
    ignoreSigpipeOnce();

    int inPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    auto fail = [&](const QString& message) {
        for (int* fds : {inPipe, errPipe, statusPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        if (error) *error = message;
        return false;
    };

    // Close-on-exec everywhere; dup2 clears the flag on the child's stdio
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(statusPipe, O_CLOEXEC) != 0)
        return fail(QString("pipe2() failed: %1").arg(errnoText(errno)));

    std::vector<QByteArray> storage;
    storage.reserve(arguments.size() + 1);
    storage.push_back(program.toLocal8Bit());
    for (const QString& arg : arguments) storage.push_back(arg.toLocal8Bit());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (QByteArray& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        return fail(QString("fork() failed: %1").arg(errnoText(errno)));

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) ::dup2(devnull, STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == sizeof(childErrno)) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return fail(QString("Cannot execute %1: %2").arg(program, errnoText(childErrno)));
    }

    m_pid = pid;
    m_stdinFd = inPipe[1];
    m_stderrFd = errPipe[0];
    m_exited = false;
    m_exitedNormally = false;
    m_exitCode = -1;
    m_exitSignal = 0;
    return true;
}

ChildProcess::WriteResult ChildProcess::write(const char* data, size_t size, size_t* written,
                                              QString* error) {
    QMutexLocker lock(&m_stdinMutex);
    size_t done = 0;
    WriteResult result = WriteResult::Ok;

    if (m_stdinFd < 0) {
        result = WriteResult::BrokenPipe;
        if (error) *error = "encoder input is closed";
    }

    while (result == WriteResult::Ok && done < size) {
        ssize_t n = ::write(m_stdinFd, data + done, size - done);
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        const int err = errno;
        if (n < 0 && (err == EINTR || err == EAGAIN)) {
            result = WriteResult::Retry;
        } else if (n < 0 && err == EPIPE) {
            result = WriteResult::BrokenPipe;
            if (error) *error = "Broken pipe: encoder closed its input";
        } else {
            result = WriteResult::Failed;
            if (error) *error = QString("write to encoder failed: %1").arg(errnoText(err));
        }
    }

    if (written) *written = done;
    return result;
}

void ChildProcess::closeStdin() {
    QMutexLocker lock(&m_stdinMutex);
    closeFd(m_stdinFd);
}

qint64 ChildProcess::readStderr(char* buffer, size_t size, int timeoutMs) {
    QMutexLocker lock(&m_stderrMutex);
    if (m_stderrFd < 0) return 0;

    pollfd pfd{m_stderrFd, POLLIN, 0};
    int ready;
    do {
        ready = ::poll(&pfd, 1, timeoutMs);
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) return -1;

    ssize_t n;
    do {
        n = ::read(m_stderrFd, buffer, size);
    } while (n < 0 && errno == EINTR);
    return n < 0 ? -1 : static_cast<qint64>(n);
}

void ChildProcess::closeStderr() {
    QMutexLocker lock(&m_stderrMutex);
    closeFd(m_stderrFd);
}

bool ChildProcess::hasExited() {
    if (m_pid <= 0) return true;
    if (m_exited) return true;

    QMutexLocker lock(&m_reapMutex);
    if (m_exited) return true;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(m_pid, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return false;
    if (r < 0) {
        // ECHILD: already reaped elsewhere; nothing left to wait for
        m_exited = true;
        return true;
    }

    if (WIFEXITED(status)) {
        m_exitedNormally = true;
        m_exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        m_exitSignal = WTERMSIG(status);
        m_exitCode = 128 + WTERMSIG(status);
    }
    m_exited = true;
    return true;
}

bool ChildProcess::waitForExit(int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!hasExited()) {
        if (timeoutMs >= 0 && timer.elapsed() >= timeoutMs) return false;
        QThread::msleep(5);
    }
    return true;
}

void ChildProcess::terminate() {
    if (m_pid > 0 && !m_exited) ::kill(m_pid, SIGTERM);
}

void ChildProcess::kill() {
    if (m_pid > 0 && !m_exited) ::kill(m_pid, SIGKILL);
}
