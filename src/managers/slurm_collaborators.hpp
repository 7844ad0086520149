#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "collaborators.hpp"

namespace fs = std::filesystem;

// Collaborators backed by the local filesystem and the SLURM client binaries.
// Implementation is split by concern:
//   slurm_volumes.cpp: mounts, environment files, image resolution
//   slurm_script.cpp:  batch script rendering
//   slurm_submit.cpp:  sbatch, job id recording, scancel, cleanup
class SlurmCollaborators : public SubmitCollaborators {
public:
    explicit SlurmCollaborators(const SidecarConfig& config);

    Result<std::string> prepare_mounts(const PodDescription& pod,
                                       const ContainerSpec& container,
                                       const fs::path& files_path) override;

    std::vector<std::string> prepare_envs(const PodDescription& pod,
                                          const ContainerSpec& container,
                                          const fs::path& files_path) override;

    std::string prepare_image(const ObjectMeta& metadata,
                              const std::string& image) override;

    Result<fs::path> produce_script(const PodDescription& pod,
                                    const fs::path& files_path,
                                    const std::vector<ContainerCommand>& commands,
                                    const ResourceLimits& limits) override;

    Result<std::string> submit_batch(const fs::path& script) override;

    Result<std::string> record_job_id(const std::string& submit_output,
                                      const PodDescription& pod,
                                      JobStore& store,
                                      const fs::path& files_path) override;

    Result<void> cancel_job(const std::string& pod_uid,
                            const std::string& submit_output,
                            JobStore& store,
                            const fs::path& files_path) override;

    Result<void> remove_working_dir(const fs::path& files_path) override;

private:
    const SidecarConfig& config_;
};

// Resolve an image reference: image-root annotation, then absolute paths and
// scheme URIs as is, then ImagePrefix + image.
std::string resolve_image(const SidecarConfig& config, const ObjectMeta& metadata,
                          const std::string& image);

// Render the complete batch script text.
std::string render_job_script(const SidecarConfig& config,
                              const PodDescription& pod,
                              const fs::path& files_path,
                              const std::vector<ContainerCommand>& commands,
                              const ResourceLimits& limits);

// Extract a job id from sbatch output: "Submitted batch job 123" or the
// --parsable form "123" / "123;cluster".
Result<std::string> extract_job_id(const std::string& submit_output);
