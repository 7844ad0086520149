#pragma once

#include <cstdint>

// ── Default resource values ─────────────────────────────────
// Floors applied when no container in a pod declares a limit.
constexpr int64_t DEFAULT_CPU_UNITS      = 1;
constexpr int64_t DEFAULT_MEMORY_BYTES   = 1024 * 1024;  // 1 MiB

// ── Configuration ───────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/slurm-sidecar/SlurmConfig.yaml";
constexpr const char* CONFIG_PATH_ENV     = "SLURMCONFIGPATH";

// ── Runtime names ───────────────────────────────────────────
constexpr const char* RUNTIME_SINGULARITY = "singularity";
constexpr const char* RUNTIME_ENROOT      = "enroot";

// ── Pod annotations ─────────────────────────────────────────
constexpr const char* ANNOTATION_SINGULARITY_COMMANDS = "slurm-job.vk.io/singularity-commands";
constexpr const char* ANNOTATION_SINGULARITY_MOUNTS   = "slurm-job.vk.io/singularity-mounts";
constexpr const char* ANNOTATION_SINGULARITY_OPTIONS  = "slurm-job.vk.io/singularity-options";
constexpr const char* ANNOTATION_ENROOT_OPTIONS       = "slurm-job.vk.io/enroot-options";
constexpr const char* ANNOTATION_IMAGE_ROOT           = "slurm-job.vk.io/image-root";
constexpr const char* ANNOTATION_SBATCH_FLAGS         = "slurm-job.vk.io/flags";
constexpr const char* ANNOTATION_PRE_EXEC             = "slurm-job.vk.io/pre-exec";

// ── Working directory layout ────────────────────────────────
// Paths are relative to <DataRootFolder><namespace>-<uid>
constexpr const char* JOB_SCRIPT_NAME   = "job.sh";
constexpr const char* JOB_OUTPUT_NAME   = "job.out";
constexpr const char* JOB_RECORD_NAME   = "job.yaml";
constexpr const char* POD_EXPORT_NAME   = "pod.json";
constexpr const char* ENV_FILE_SUFFIX   = "_envfile.properties";

// ── Caller-facing messages ──────────────────────────────────
constexpr const char* GENERIC_FAILURE_MESSAGE =
    "Some errors occurred while creating containers. Check Slurm Sidecar's logs";

constexpr int STATUS_OK             = 200;
constexpr int STATUS_INTERNAL_ERROR = 500;

// ── Scheduler client ────────────────────────────────────────
constexpr int SCHEDULER_TIMEOUT_SECS = 60;   // sbatch / scancel
constexpr int SERVE_MAX_WORKERS = 16;        // concurrent requests in serve mode
