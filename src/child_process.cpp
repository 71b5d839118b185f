#include "mcpguard/child_process.hpp"
#include "mcpguard/error.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpguard {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

} // anonymous namespace

ChildProcess ChildProcess::spawn(const std::string& command,
                                 const std::vector<std::string>& args,
                                 const EnvMap& env) {
    if (command.empty()) {
        throw SpawnError("No command to start");
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe(in_pipe) < 0 || ::pipe(out_pipe) < 0 || ::pipe(err_pipe) < 0 ||
        ::pipe(status_pipe) < 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("Failed to create pipes: ") + std::strerror(err));
    }
    set_cloexec(status_pipe[1]);

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_store;
    argv_store.push_back(command);
    argv_store.insert(argv_store.end(), args.begin(), args.end());
    std::vector<char*> argv_vec;
    for (auto& a : argv_store) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);

    std::vector<std::string> envp_store = to_envp(env);
    std::vector<char*> envp_vec;
    for (auto& e : envp_store) envp_vec.push_back(e.data());
    envp_vec.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw SpawnError(std::string("Failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                       err_pipe[0], err_pipe[1], status_pipe[0]}) {
            ::close(fd);
        }

        ::execvpe(command.c_str(), argv_vec.data(), envp_vec.data());

        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_all();
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw SpawnError("Failed to start '" + command + "': " + std::strerror(child_errno));
    }

    ChildProcess child;
    child.pid_ = pid;
    child.stdin_fd_ = in_pipe[1];
    child.stdout_fd_ = out_pipe[0];
    child.stderr_fd_ = err_pipe[0];
    set_cloexec(child.stdin_fd_);
    set_cloexec(child.stdout_fd_);
    set_cloexec(child.stderr_fd_);
    return child;
}

ChildProcess::~ChildProcess() {
    release();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept {
    *this = std::move(other);
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        reaped_ = other.reaped_.load();
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

void ChildProcess::release() {
    close_fd(stdin_fd_);
    if (running()) {
        ::kill(pid_, SIGTERM);
        wait();
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    pid_ = -1;
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

int ChildProcess::wait() {
    if (pid_ <= 0) return exit_code_;
    if (reaped_) return exit_code_;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        exit_code_ = 1;
    } else if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    reaped_ = true;
    return exit_code_;
}

void ChildProcess::kill(int sig) {
    if (running()) ::kill(pid_, sig);
}

} // namespace mcpguard
