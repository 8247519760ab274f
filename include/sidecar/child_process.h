#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/child_process.h — fork/exec of one supervised child
// ═══════════════════════════════════════════════════════════════════
//
//  The child gets /dev/null on stdin, the parent's stdout/stderr (or
//  a pipe per stream when requested) and a write-only readiness pipe
//  on descriptor 3. Exits are observed by reap(), which the owner
//  calls whenever SIGCHLD arrives.
//
// ═══════════════════════════════════════════════════════════════════

#include <sys/types.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sidecar {

// ── Owning file descriptor ──
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int fd_ = -1;
};

struct ExitStatus {
    enum class Reason : int {
        Exit,
        Signal,
    };

    Reason reason = Reason::Exit;
    int    code   = 0;   // exit code, or signal number
};

struct SpawnParams {
    std::string              file;
    std::vector<std::string> args;     // argv[1..]; argv[0] is `file`
    std::vector<std::string> env;      // complete "KEY=value" list
    bool pipeStdout = false;
    bool pipeStderr = false;
};

class ChildProcess {
public:
    using ExitCallback = std::function<void(const ExitStatus&)>;

    // Throws SpawnError when pipes cannot be created or fork() fails.
    static std::shared_ptr<ChildProcess> spawn(const SpawnParams& params);

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool exited() const { return status_.has_value(); }
    const std::optional<ExitStatus>& exitStatus() const { return status_; }

    // Parent ends of the pipes; empty when the stream was not piped.
    FileDescriptor takeReporter() { return std::move(reporter_); }
    FileDescriptor takeStdout()   { return std::move(stdout_); }
    FileDescriptor takeStderr()   { return std::move(stderr_); }

    // Returns false when the process is already gone.
    bool kill(int signal);

    // Non-blocking waitpid(); true once the exit has been observed.
    bool reap();

    // Blocking; only for teardown paths.
    void reapBlocking();

    // Runs once the exit is observed (immediately if it already was).
    void onExit(ExitCallback callback);

private:
    ChildProcess() = default;

    void finish(int rawStatus);
    void settle(const ExitStatus& status);

    pid_t pid_ = -1;
    std::optional<ExitStatus> status_;
    std::vector<ExitCallback> exitCallbacks_;
    FileDescriptor reporter_;
    FileDescriptor stdout_;
    FileDescriptor stderr_;
};

// "Engine crashed unexpectedly with code: 3" style description.
std::string describeExit(const ExitStatus& status);

} // namespace sidecar
