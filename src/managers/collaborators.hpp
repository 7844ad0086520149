#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/pod.hpp>
#include <core/resource_limits.hpp>
#include <runtimes/container_command.hpp>
#include "job_store.hpp"

namespace fs = std::filesystem;

// Everything the submission path needs from the outside world: the working
// directory, the scheduler and the job store. SlurmCollaborators is the real
// implementation; tests substitute a fake.
class SubmitCollaborators {
public:
    virtual ~SubmitCollaborators() = default;

    // Materialize the container's volumes under files_path and return the
    // mount fragment ("--bind src:dst[:ro],..." or "").
    virtual Result<std::string> prepare_mounts(const PodDescription& pod,
                                               const ContainerSpec& container,
                                               const fs::path& files_path) = 0;

    // Environment tokens for the container. Best effort: never fails.
    virtual std::vector<std::string> prepare_envs(const PodDescription& pod,
                                                  const ContainerSpec& container,
                                                  const fs::path& files_path) = 0;

    // Resolve an image reference to what the runtime should launch.
    virtual std::string prepare_image(const ObjectMeta& metadata,
                                      const std::string& image) = 0;

    // Write the batch script and return its path.
    virtual Result<fs::path> produce_script(const PodDescription& pod,
                                            const fs::path& files_path,
                                            const std::vector<ContainerCommand>& commands,
                                            const ResourceLimits& limits) = 0;

    // Submit the script and return the scheduler's raw output.
    virtual Result<std::string> submit_batch(const fs::path& script) = 0;

    // Extract the job id from the submit output and record pod uid → job id.
    virtual Result<std::string> record_job_id(const std::string& submit_output,
                                              const PodDescription& pod,
                                              JobStore& store,
                                              const fs::path& files_path) = 0;

    // Best-effort scheduler-side cancellation of a just-submitted job and
    // removal of its store entry. Failures are ErrorKind::Compensation.
    virtual Result<void> cancel_job(const std::string& pod_uid,
                                    const std::string& submit_output,
                                    JobStore& store,
                                    const fs::path& files_path) = 0;

    virtual Result<void> remove_working_dir(const fs::path& files_path) = 0;
};
