// ═══════════════════════════════════════════════════════════════════
//  src/child_process.cpp — fork/exec with a readiness descriptor
// ═══════════════════════════════════════════════════════════════════

#include "sidecar/child_process.h"
#include "sidecar/errors.h"
#include "sidecar/lifecycle.h"
#include "sidecar/options.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sidecar {

void FileDescriptor::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

namespace {

struct Pipe {
    FileDescriptor readEnd;
    FileDescriptor writeEnd;

    static Pipe create() {
        std::array<int, 2> fds{};
        if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
            throw SpawnError("pipe2() failed", errno);
        }
        return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    }
};

// Only async-signal-safe calls from here on: we are between fork and exec.
[[noreturn]] void execChild(const char* file,
                            char* const* argv,
                            char* const* envp,
                            int stdoutFd,
                            int stderrFd,
                            int reporterFd) {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    // Park every source above the targets so no dup2() clobbers another source.
    const int sources[3] = {stdoutFd, stderrFd, reporterFd};
    const int targets[3] = {STDOUT_FILENO, STDERR_FILENO, kListeningReporterFd};
    int parked[3] = {-1, -1, -1};
    for (int i = 0; i < 3; ++i) {
        if (sources[i] >= 0) {
            parked[i] = ::fcntl(sources[i], F_DUPFD_CLOEXEC, 10);
            if (parked[i] == -1) ::_exit(127);
        }
    }

    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devNull == -1) ::_exit(127);
    if (devNull == STDIN_FILENO) {
        ::fcntl(devNull, F_SETFD, 0);
    } else if (::dup2(devNull, STDIN_FILENO) == -1) {
        ::_exit(127);
    }

    for (int i = 0; i < 3; ++i) {
        if (parked[i] >= 0 && ::dup2(parked[i], targets[i]) == -1) ::_exit(127);
    }

    ::execve(file, argv, envp);

    static const char message[] = "sidecar: execve() failed\n";
    [[maybe_unused]] auto ignored = ::write(STDERR_FILENO, message, sizeof(message) - 1);
    ::_exit(127);
}

} // namespace

std::shared_ptr<ChildProcess> ChildProcess::spawn(const SpawnParams& params) {
    auto reporter = Pipe::create();
    std::optional<Pipe> out;
    std::optional<Pipe> err;
    if (params.pipeStdout) out = Pipe::create();
    if (params.pipeStderr) err = Pipe::create();

    // Build argv/envp before fork(): the child may not allocate.
    std::vector<std::string> argStorage;
    argStorage.reserve(params.args.size() + 1);
    argStorage.push_back(params.file);
    argStorage.insert(argStorage.end(), params.args.begin(), params.args.end());

    std::vector<char*> argv;
    for (auto& arg : argStorage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStorage = params.env;
    std::vector<char*> envp;
    for (auto& entry : envStorage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        throw SpawnError("fork() failed", errno);
    }
    if (pid == 0) {
        execChild(params.file.c_str(), argv.data(), envp.data(),
                  out ? out->writeEnd.get() : -1,
                  err ? err->writeEnd.get() : -1,
                  reporter.writeEnd.get());
    }

    std::shared_ptr<ChildProcess> child(new ChildProcess());
    child->pid_      = pid;
    child->reporter_ = std::move(reporter.readEnd);
    if (out) child->stdout_ = std::move(out->readEnd);
    if (err) child->stderr_ = std::move(err->readEnd);
    // Write ends close here, so EOF reaches us once the child is done.
    return child;
}

bool ChildProcess::kill(int signal) {
    if (status_ || pid_ <= 0) return false;
    return ::kill(pid_, signal) == 0;
}

bool ChildProcess::reap() {
    if (status_) return true;

    int rawStatus = 0;
    pid_t result = ::waitpid(pid_, &rawStatus, WNOHANG);
    if (result == 0) return false;
    if (result == -1) {
        if (errno == EINTR) return false;
        // Somebody else reaped it; all we know is that it is gone.
        settle(ExitStatus{ExitStatus::Reason::Exit, -1});
        return true;
    }
    finish(rawStatus);
    return true;
}

void ChildProcess::reapBlocking() {
    while (!status_) {
        int rawStatus = 0;
        pid_t result = ::waitpid(pid_, &rawStatus, 0);
        if (result == pid_) {
            finish(rawStatus);
        } else if (result == -1 && errno != EINTR) {
            settle(ExitStatus{ExitStatus::Reason::Exit, -1});
        }
    }
}

void ChildProcess::onExit(ExitCallback callback) {
    if (status_) {
        callback(*status_);
        return;
    }
    exitCallbacks_.push_back(std::move(callback));
}

void ChildProcess::finish(int rawStatus) {
    if (WIFSIGNALED(rawStatus)) {
        settle(ExitStatus{ExitStatus::Reason::Signal, WTERMSIG(rawStatus)});
    } else {
        settle(ExitStatus{ExitStatus::Reason::Exit, WEXITSTATUS(rawStatus)});
    }
}

void ChildProcess::settle(const ExitStatus& status) {
    status_ = status;
    auto callbacks = std::move(exitCallbacks_);
    for (auto& callback : callbacks) callback(status);
}

std::string describeExit(const ExitStatus& status) {
    if (status.reason == ExitStatus::Reason::Signal) {
        return "Engine was killed unexpectedly by signal: " + signalName(status.code);
    }
    return "Engine crashed unexpectedly with code: " + std::to_string(status.code);
}

} // namespace sidecar
