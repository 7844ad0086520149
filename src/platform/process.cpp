#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
    if (pid_ > 0) {
        // Never leave a zombie behind
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    out_fd_ = other.out_fd_;
    err_fd_ = other.err_fd_;
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        if (pid_ > 0) terminate();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_fds() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::communicate(std::string& out, std::string& err, int timeout_ms) {
    if (pid_ <= 0) return -1;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[4096];

    while (out_fd_ >= 0 || err_fd_ >= 0) {
        struct pollfd fds[2];
        int nfds = 0;
        if (out_fd_ >= 0) fds[nfds++] = {out_fd_, POLLIN, 0};
        if (err_fd_ >= 0) fds[nfds++] = {err_fd_, POLLIN, 0};

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                terminate();
                close_fds();
                return -1;
            }
            wait_ms = static_cast<int>(left);
        }

        int rc = poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < nfds; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            std::string& sink = (fds[i].fd == out_fd_) ? out : err;
            if (n > 0) {
                sink.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                if (fds[i].fd == out_fd_) { close(out_fd_); out_fd_ = -1; }
                else { close(err_fd_); err_fd_ = -1; }
            }
        }
    }
    close_fds();

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void ProcessHandle::terminate() {
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            pid_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    // O_CLOEXEC keeps concurrent spawns from inheriting each other's pipes
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) return handle;
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    // Built before fork: the child may only call async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];
    return handle;
}

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_secs) {
    CommandResult result{127, "", ""};

    ProcessHandle proc = spawn(program, args);
    if (!proc.valid()) {
        result.stderr_data = "failed to spawn " + program + ": " + std::strerror(errno);
        return result;
    }

    int timeout_ms = timeout_secs < 0 ? -1 : timeout_secs * 1000;
    result.exit_code = proc.communicate(result.stdout_data, result.stderr_data, timeout_ms);
    return result;
}

} // namespace platform
