#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>
#include <core/types.hpp>
#include <core/pod.hpp>
#include <core/resource_limits.hpp>
#include "collaborators.hpp"
#include "job_store.hpp"

namespace fs = std::filesystem;

// Stages of one submission, in order. Failed is reachable from any stage
// before Responded; there are no backward transitions.
enum class SubmissionStage {
    Received,
    RuntimeSelected,
    PerContainerProcessing,
    ScriptGenerated,
    Submitted,
    JobRecorded,
    Responded,
    Failed,
};

const char* stage_name(SubmissionStage stage);

using TraceAttributes = std::vector<std::pair<std::string, std::string>>;

struct SubmissionOutcome {
    bool success = false;
    std::string pod_uid;
    std::string job_id;                 // set only on success
    SubmissionStage stage = SubmissionStage::Received;  // last stage reached
    SubmissionStage failed_stage = SubmissionStage::Received;  // stage being attempted
    std::string error;
    ErrorKind kind = ErrorKind::None;
    ResourceLimits limits;
    TraceAttributes attributes;
};

// Runs one pod submission start to finish: select the runtime, build every
// container's command while aggregating the job-wide limits, generate the
// script, submit it and record the job id. Any failure aborts the whole pod;
// scheduler-visible side effects only happen after every container succeeded.
class SubmissionOrchestrator {
public:
    SubmissionOrchestrator(const SidecarConfig& config, SubmitCollaborators& collaborators,
                           JobStore& store);

    SubmissionOutcome submit(const PodDescription& pod);

    // <DataRootFolder><namespace>-<uid>
    static fs::path working_dir(const SidecarConfig& config, const ObjectMeta& metadata);

private:
    const SidecarConfig& config_;
    SubmitCollaborators& collab_;
    JobStore& store_;

    void advance(SubmissionOutcome& out, SubmissionStage next) const;
    SubmissionOutcome& fail(SubmissionOutcome& out, SubmissionStage attempted,
                            const std::string& error, ErrorKind kind) const;
    void remove_working_dir(const fs::path& files_path) const;
};
