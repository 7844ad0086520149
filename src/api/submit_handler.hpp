#pragma once

#include <string>
#include <managers/submission.hpp>
#include <managers/job_store.hpp>

// Status code plus body, as handed back to the caller.
struct Reply {
    int status;
    std::string body;
};

// Entry point for one create request. Decodes the body, runs the
// orchestrator and maps the outcome to a reply. Internal error details only
// reach the log; failed replies always carry the generic message.
class SubmitHandler {
public:
    SubmitHandler(SubmissionOrchestrator& orchestrator, const JobStore& store);

    Reply handle(const std::string& body);

private:
    SubmissionOrchestrator& orchestrator_;
    const JobStore& store_;
};
