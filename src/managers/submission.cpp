#include "submission.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/resource_spec.hpp>
#include <core/utils.hpp>
#include <runtimes/container_runtime.hpp>
#include <runtimes/container_command.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

// Gives the pod back when the submission returns, whatever the outcome.
struct PodClaim {
    JobStore& store;
    std::string pod_uid;
    ~PodClaim() { store.release(pod_uid); }
};

} // namespace

const char* stage_name(SubmissionStage stage) {
    switch (stage) {
        case SubmissionStage::Received:               return "Received";
        case SubmissionStage::RuntimeSelected:        return "RuntimeSelected";
        case SubmissionStage::PerContainerProcessing: return "PerContainerProcessing";
        case SubmissionStage::ScriptGenerated:        return "ScriptGenerated";
        case SubmissionStage::Submitted:              return "Submitted";
        case SubmissionStage::JobRecorded:            return "JobRecorded";
        case SubmissionStage::Responded:              return "Responded";
        case SubmissionStage::Failed:                 return "Failed";
    }
    return "?";
}

SubmissionOrchestrator::SubmissionOrchestrator(const SidecarConfig& config,
                                               SubmitCollaborators& collaborators,
                                               JobStore& store)
    : config_(config), collab_(collaborators), store_(store) {}

fs::path SubmissionOrchestrator::working_dir(const SidecarConfig& config,
                                             const ObjectMeta& metadata) {
    return fs::path(config.data_root_folder + metadata.ns + "-" + metadata.uid);
}

void SubmissionOrchestrator::advance(SubmissionOutcome& out, SubmissionStage next) const {
    log_debug(fmt::format("pod {}: {} -> {}", out.pod_uid, stage_name(out.stage), stage_name(next)));
    out.stage = next;
}

SubmissionOutcome& SubmissionOrchestrator::fail(SubmissionOutcome& out, SubmissionStage attempted,
                                                const std::string& error, ErrorKind kind) const {
    out.success = false;
    out.failed_stage = attempted;
    out.error = error;
    out.kind = kind;
    out.job_id.clear();
    log_error(fmt::format("pod {}: submission failed at {} ({}): {}",
                          out.pod_uid, stage_name(out.failed_stage), error_kind_name(kind), error));
    out.stage = SubmissionStage::Failed;
    return out;
}

void SubmissionOrchestrator::remove_working_dir(const fs::path& files_path) const {
    auto removed = collab_.remove_working_dir(files_path);
    if (removed.is_err()) {
        log_error(fmt::format("Cleanup of {} failed: {}", files_path.string(), removed.error));
    }
}

SubmissionOutcome SubmissionOrchestrator::submit(const PodDescription& pod) {
    SubmissionOutcome out;
    out.pod_uid = pod.metadata.uid;
    log_info(fmt::format("Slurm Sidecar: received Submit call for pod {}/{} ({})",
                         pod.metadata.ns, pod.metadata.name, pod.metadata.uid));

    // ── Runtime selection (once, before any container work) ──
    auto runtime = select_runtime(config_.container_runtime);
    if (runtime.is_err()) {
        return fail(out, SubmissionStage::RuntimeSelected, runtime.error, runtime.kind);
    }
    advance(out, SubmissionStage::RuntimeSelected);

    fs::path files_path = working_dir(config_, pod.metadata);

    // One submission per pod at a time; the working directory is shared
    if (!store_.try_reserve(pod.metadata.uid)) {
        return fail(out, SubmissionStage::PerContainerProcessing,
                    fmt::format("pod {} is already submitted or being submitted", pod.metadata.uid),
                    ErrorKind::Collaborator);
    }
    PodClaim claim{store_, pod.metadata.uid};

    // Init containers first, then regular containers, pod order within each
    std::vector<const ContainerSpec*> containers;
    for (const auto& c : pod.init_containers) containers.push_back(&c);
    for (const auto& c : pod.containers) containers.push_back(&c);

    // ── Per-container processing ──
    advance(out, SubmissionStage::PerContainerProcessing);
    ResourceAggregator aggregator;
    std::vector<ContainerCommand> commands;

    for (size_t i = 0; i < containers.size(); i++) {
        const ContainerSpec& container = *containers[i];
        bool is_init = i < pod.init_containers.size();
        log_info("- Beginning script generation for container " + container.name);

        auto step = aggregator.observe(container.cpu_limit, container.memory_limit);
        if (step.cpu_defaulted) {
            log_warn(fmt::format("Max CPU resource not set for {}. Only {} CPU will be used",
                                 container.name, DEFAULT_CPU_UNITS));
        } else if (step.cpu_raised) {
            log_info(fmt::format("Setting CPU limit to {}", step.cpu_rounded));
        }
        if (step.memory_defaulted) {
            log_warn(fmt::format("Max Memory resource not set for {}. Only {} will be used",
                                 container.name, format_memory_bytes(DEFAULT_MEMORY_BYTES)));
        } else if (step.memory_raised) {
            log_info(fmt::format("Setting Memory limit to {}", container.memory_limit));
        }

        auto mounts = collab_.prepare_mounts(pod, container, files_path);
        if (mounts.is_err()) {
            fail(out, SubmissionStage::PerContainerProcessing,
                 fmt::format("container {}: {}", container.name, mounts.error), ErrorKind::Collaborator);
            remove_working_dir(files_path);
            return out;
        }
        log_debug(mounts.value);

        auto envs = collab_.prepare_envs(pod, container, files_path);
        std::string image = collab_.prepare_image(pod.metadata, container.image);

        log_debug("-- Appending all commands together...");
        ContainerCommand cmd = assemble_container_command(runtime.value, config_, pod.metadata,
                                                          container, is_init, envs,
                                                          mounts.value, image);

        std::string key = fmt::format("job.container{}", i);
        out.attributes.emplace_back(key + ".name", container.name);
        out.attributes.emplace_back(key + ".isinit", is_init ? "true" : "false");
        out.attributes.emplace_back(key + ".envs", fmt::format("{}", fmt::join(envs, " ")));
        out.attributes.emplace_back(key + ".image", image);
        out.attributes.emplace_back(key + ".command", fmt::format("{}", fmt::join(container.command, " ")));
        out.attributes.emplace_back(key + ".args", fmt::format("{}", fmt::join(container.args, " ")));

        commands.push_back(std::move(cmd));
    }

    out.limits = aggregator.limits();
    out.attributes.emplace_back("job.limits.cpu", std::to_string(out.limits.cpu));
    out.attributes.emplace_back("job.limits.memory", std::to_string(out.limits.memory));

    // ── Script generation ──
    auto script = collab_.produce_script(pod, files_path, commands, out.limits);
    if (script.is_err()) {
        fail(out, SubmissionStage::ScriptGenerated, script.error, ErrorKind::Collaborator);
        remove_working_dir(files_path);
        return out;
    }
    advance(out, SubmissionStage::ScriptGenerated);

    // ── Submission ──
    auto submitted = collab_.submit_batch(script.value);
    if (submitted.is_err()) {
        log_error("Failed to submit the SLURM Job");
        fail(out, SubmissionStage::Submitted, submitted.error, ErrorKind::Collaborator);
        remove_working_dir(files_path);
        return out;
    }
    advance(out, SubmissionStage::Submitted);
    log_info(submitted.value);

    // ── Job recording ──
    auto jid = collab_.record_job_id(submitted.value, pod, store_, files_path);
    if (jid.is_err()) {
        fail(out, SubmissionStage::JobRecorded, jid.error, ErrorKind::Collaborator);
        // The job may already be live: cancel it before dropping its files
        auto cancelled = collab_.cancel_job(pod.metadata.uid, submitted.value, store_, files_path);
        if (cancelled.is_err()) {
            log_error(fmt::format("pod {}: {} error: {}", pod.metadata.uid,
                                  error_kind_name(ErrorKind::Compensation), cancelled.error));
        }
        if (auto owner = store_.lookup(pod.metadata.uid)) {
            log_warn(fmt::format("Keeping {}: it belongs to job {}", files_path.string(), owner->job_id));
        } else {
            remove_working_dir(files_path);
        }
        return out;
    }
    advance(out, SubmissionStage::JobRecorded);

    out.job_id = jid.value;
    out.success = true;
    for (const auto& [k, v] : out.attributes) {
        log_debug(fmt::format("pod {} {}={}", out.pod_uid, k, v));
    }
    log_info("SLURM Job successfully submitted with ID " + out.job_id);
    advance(out, SubmissionStage::Responded);
    return out;
}
