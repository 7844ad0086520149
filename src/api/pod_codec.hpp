#pragma once

#include <string>
#include <core/types.hpp>
#include <core/pod.hpp>

// Decode a submission request body:
//   {"pod": {"metadata": {...}, "spec": {...}}, "configmaps": [...], "secrets": [...]}
// Resource limits are converted with parse_quantity(); a pod without a uid
// or a container without a name is rejected.
Result<PodDescription> decode_pod_request(const std::string& body);

// Encode the success reply: {"PodJID":"<jid>","PodUID":"<uid>"}
std::string encode_create_response(const std::string& pod_uid, const std::string& job_id);

// Parse a Kubernetes quantity ("500m", "2", "1.5", "128Mi", "1G", "1e3").
// Fails with ErrorKind::Format on anything else.
Result<double> parse_quantity(const std::string& quantity);
