#pragma once
#include "environment.hpp"
#include <atomic>
#include <string>
#include <sys/types.h>
#include <vector>

namespace mcpguard {

/// A spawned server process with its three standard streams piped.
///
/// Owns the pipe ends and the pid. Destroying a still-running child sends
/// SIGTERM and reaps it.
class ChildProcess {
public:
    /// fork + execvpe. Throws SpawnError when the pipes cannot be created,
    /// fork fails, or exec fails in the child.
    static ChildProcess spawn(const std::string& command,
                              const std::vector<std::string>& args,
                              const EnvMap& env);

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] int stdin_fd() const { return stdin_fd_; }
    [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const { return stderr_fd_; }

    /// Close our end of the child's stdin so it sees EOF.
    void close_stdin();

    /// Block until the child exits. Returns the exit code, or 128 + signal
    /// for a signalled child. Safe to call more than once.
    int wait();

    /// Send a signal if the child has not been reaped yet.
    void kill(int sig);

    [[nodiscard]] bool running() const { return pid_ > 0 && !reaped_; }

private:
    void release();

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    std::atomic<bool> reaped_{false};
    int exit_code_{0};
};

} // namespace mcpguard
