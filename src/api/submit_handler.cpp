#include "submit_handler.hpp"
#include "pod_codec.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

SubmitHandler::SubmitHandler(SubmissionOrchestrator& orchestrator, const JobStore& store)
    : orchestrator_(orchestrator), store_(store) {}

Reply SubmitHandler::handle(const std::string& body) {
    auto pod = decode_pod_request(body);
    if (pod.is_err()) {
        log_error(fmt::format("Rejected submit request ({}): {}", error_kind_name(pod.kind), pod.error));
        return {STATUS_INTERNAL_ERROR, GENERIC_FAILURE_MESSAGE};
    }

    // A retried create for a pod that already has a job gets the same answer
    if (auto existing = store_.lookup(pod.value.metadata.uid)) {
        log_warn(fmt::format("pod {} already submitted as job {}", existing->pod_uid, existing->job_id));
        return {STATUS_OK, encode_create_response(existing->pod_uid, existing->job_id)};
    }

    auto outcome = orchestrator_.submit(pod.value);
    if (!outcome.success) {
        return {STATUS_INTERNAL_ERROR, GENERIC_FAILURE_MESSAGE};
    }
    return {STATUS_OK, encode_create_response(outcome.pod_uid, outcome.job_id)};
}
