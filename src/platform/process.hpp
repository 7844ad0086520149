#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process with captured stdout/stderr.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Drain stdout/stderr until the child closes them or timeout_ms passes,
    // then reap it. Returns the exit code, or -1 on timeout/abnormal exit.
    // timeout_ms = -1 means indefinite wait.
    int communicate(std::string& out, std::string& err, int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

private:
    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;

    void close_fds();

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process (execvp, stdin closed, stdout/stderr piped).
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Spawn, capture and wait. Spawn failure yields exit_code 127 with an
// explanatory stderr_data; a timeout yields exit_code -1.
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_secs = -1);

} // namespace platform
