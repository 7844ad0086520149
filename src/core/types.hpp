#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Error taxonomy carried alongside a failed Result.
enum class ErrorKind {
    None,
    Format,              // malformed size token or quantity
    UnsupportedRuntime,  // unknown container runtime name
    Collaborator,        // mount/env/image/script/submit/record failure
    Compensation,        // cleanup after a failure itself failed
    Config,              // configuration could not be loaded
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Collaborator) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Collaborator) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local command execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Sidecar configuration (SlurmConfig.yaml)
struct SingularityConfig {
    std::string path = "singularity";
    std::string prefix;
    std::vector<std::string> default_options = {"--nv", "--no-eval", "--containall"};
};

struct EnrootConfig {
    std::string path = "enroot";
    std::string prefix;
    std::vector<std::string> default_options = {"--rw"};
};

struct SidecarConfig {
    std::string sbatch_path = "/usr/bin/sbatch";
    std::string scancel_path = "/usr/bin/scancel";
    std::string data_root_folder = ".local/interlink/jobs/";
    std::string ns;
    std::string bash_path = "/bin/bash";
    std::string command_prefix;
    std::string image_prefix;
    bool export_pod_data = false;
    bool verbose_logging = false;
    bool errors_only_logging = false;
    std::string log_file;                        // empty = stderr
    std::string container_runtime = "singularity";
    SingularityConfig singularity;
    EnrootConfig enroot;
};
