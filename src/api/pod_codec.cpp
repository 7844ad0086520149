#include "pod_codec.hpp"
#include <json/json.h>
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <memory>
#include <sstream>

// ── Quantities ──────────────────────────────────────────────

static bool quantity_multiplier(const std::string& suffix, double& out) {
    static const struct { const char* suffix; double mult; } table[] = {
        {"",   1.0},
        {"m",  1e-3},
        {"k",  1e3},  {"M",  1e6},  {"G",  1e9},
        {"T",  1e12}, {"P",  1e15}, {"E",  1e18},
        {"Ki", 1024.0},
        {"Mi", 1024.0 * 1024},
        {"Gi", 1024.0 * 1024 * 1024},
        {"Ti", 1024.0 * 1024 * 1024 * 1024},
        {"Pi", 1024.0 * 1024 * 1024 * 1024 * 1024},
        {"Ei", 1024.0 * 1024 * 1024 * 1024 * 1024 * 1024},
    };
    for (const auto& row : table) {
        if (suffix == row.suffix) {
            out = row.mult;
            return true;
        }
    }
    return false;
}

Result<double> parse_quantity(const std::string& quantity) {
    auto invalid = [&]() {
        return Result<double>::Err("invalid quantity: " + quantity, ErrorKind::Format);
    };

    const std::string& q = quantity;
    size_t i = 0;
    if (i < q.size() && (q[i] == '+' || q[i] == '-')) i++;

    size_t digits = 0;
    while (i < q.size() && std::isdigit(static_cast<unsigned char>(q[i]))) { i++; digits++; }
    if (i < q.size() && q[i] == '.') {
        i++;
        while (i < q.size() && std::isdigit(static_cast<unsigned char>(q[i]))) { i++; digits++; }
    }
    if (digits == 0) return invalid();

    // "1e3" is an exponent, "1E" alone is the exa suffix
    if (i < q.size() && (q[i] == 'e' || q[i] == 'E')) {
        size_t j = i + 1;
        if (j < q.size() && (q[j] == '+' || q[j] == '-')) j++;
        if (j < q.size() && std::isdigit(static_cast<unsigned char>(q[j]))) {
            while (j < q.size() && std::isdigit(static_cast<unsigned char>(q[j]))) j++;
            i = j;
        }
    }

    double mult = 1.0;
    if (!quantity_multiplier(q.substr(i), mult)) return invalid();

    double value = 0.0;
    try {
        value = std::stod(q.substr(0, i));
    } catch (const std::exception&) {
        return invalid();
    }
    if (value < 0) return invalid();
    return Result<double>::Ok(value * mult);
}

// ── Request decoding ────────────────────────────────────────

namespace {

const Json::Value& member(const Json::Value& obj, const char* key) {
    static const Json::Value null_value;
    if (!obj.isObject() || !obj.isMember(key)) return null_value;
    return obj[key];
}

std::string string_member(const Json::Value& obj, const char* key) {
    const auto& v = member(obj, key);
    return v.isString() ? v.asString() : "";
}

std::vector<std::string> string_list(const Json::Value& arr) {
    std::vector<std::string> out;
    if (!arr.isArray()) return out;
    for (const auto& v : arr) {
        if (v.isString()) out.push_back(v.asString());
    }
    return out;
}

std::map<std::string, std::string> string_map(const Json::Value& obj) {
    std::map<std::string, std::string> out;
    if (!obj.isObject()) return out;
    for (const auto& key : obj.getMemberNames()) {
        if (obj[key].isString()) out[key] = obj[key].asString();
    }
    return out;
}

// Limits may arrive as strings ("500m") or bare JSON numbers. The rounded
// value must fit in int64.
Result<double> quantity_member(const Json::Value& limits, const char* key) {
    const auto& v = member(limits, key);
    if (v.isNull()) return Result<double>::Ok(0.0);

    Result<double> q = Result<double>::Err(fmt::format("invalid {} limit", key), ErrorKind::Format);
    if (v.isNumeric()) {
        q = Result<double>::Ok(v.asDouble());
    } else if (v.isString()) {
        q = parse_quantity(v.asString());
    }
    if (q.is_err()) return q;

    if (!std::isfinite(q.value) || q.value < 0) {
        return Result<double>::Err(fmt::format("invalid {} limit", key), ErrorKind::Format);
    }
    if (std::ceil(q.value) >= std::ldexp(1.0, 63)) {
        return Result<double>::Err(fmt::format("{} limit out of range", key), ErrorKind::Format);
    }
    return q;
}

Result<ContainerSpec> decode_container(const Json::Value& node) {
    ContainerSpec c;
    c.name = string_member(node, "name");
    if (c.name.empty()) {
        return Result<ContainerSpec>::Err("container without a name", ErrorKind::Format);
    }
    c.image = string_member(node, "image");
    c.command = string_list(member(node, "command"));
    c.args = string_list(member(node, "args"));

    for (const auto& e : member(node, "env")) {
        std::string name = string_member(e, "name");
        if (!name.empty()) c.env.push_back({name, string_member(e, "value")});
    }

    for (const auto& m : member(node, "volumeMounts")) {
        VolumeMount vm;
        vm.name = string_member(m, "name");
        vm.mount_path = string_member(m, "mountPath");
        vm.sub_path = string_member(m, "subPath");
        const auto& ro = member(m, "readOnly");
        vm.read_only = ro.isBool() && ro.asBool();
        c.volume_mounts.push_back(vm);
    }

    const auto& limits = member(member(node, "resources"), "limits");
    auto cpu = quantity_member(limits, "cpu");
    if (cpu.is_err()) {
        return Result<ContainerSpec>::Err(fmt::format("container {}: {}", c.name, cpu.error),
                                          ErrorKind::Format);
    }
    auto mem = quantity_member(limits, "memory");
    if (mem.is_err()) {
        return Result<ContainerSpec>::Err(fmt::format("container {}: {}", c.name, mem.error),
                                          ErrorKind::Format);
    }
    c.cpu_limit = cpu.value;
    c.memory_limit = static_cast<int64_t>(std::ceil(mem.value));

    return Result<ContainerSpec>::Ok(c);
}

VolumeSpec decode_volume(const Json::Value& node) {
    VolumeSpec v;
    v.name = string_member(node, "name");
    if (node.isMember("emptyDir")) {
        v.type = VolumeType::EmptyDir;
    } else if (node.isMember("configMap")) {
        v.type = VolumeType::ConfigMap;
        v.source = string_member(node["configMap"], "name");
    } else if (node.isMember("secret")) {
        v.type = VolumeType::Secret;
        v.source = string_member(node["secret"], "secretName");
    } else if (node.isMember("hostPath")) {
        v.type = VolumeType::HostPath;
        v.source = string_member(node["hostPath"], "path");
    }
    return v;
}

std::vector<DataObject> decode_data_objects(const Json::Value& arr) {
    std::vector<DataObject> out;
    if (!arr.isArray()) return out;
    for (const auto& node : arr) {
        DataObject d;
        d.name = string_member(member(node, "metadata"), "name");
        d.data = string_map(member(node, "data"));
        out.push_back(d);
    }
    return out;
}

Result<void> decode_container_list(const Json::Value& arr, std::vector<ContainerSpec>& out) {
    if (arr.isNull()) return Result<void>::Ok();
    if (!arr.isArray()) return Result<void>::Err("container list is not an array", ErrorKind::Format);
    for (const auto& node : arr) {
        auto c = decode_container(node);
        if (c.is_err()) return Result<void>::Err(c.error, c.kind);
        out.push_back(c.value);
    }
    return Result<void>::Ok();
}

} // namespace

Result<PodDescription> decode_pod_request(const std::string& body) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream in(body);
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Result<PodDescription>::Err("malformed request: " + errs, ErrorKind::Format);
    }

    try {
        const auto& pod = member(root, "pod");
        if (!pod.isObject()) {
            return Result<PodDescription>::Err("request has no pod", ErrorKind::Format);
        }

        PodDescription desc;
        desc.raw = body;

        const auto& meta = member(pod, "metadata");
        desc.metadata.name = string_member(meta, "name");
        desc.metadata.ns = string_member(meta, "namespace");
        desc.metadata.uid = string_member(meta, "uid");
        desc.metadata.labels = string_map(member(meta, "labels"));
        desc.metadata.annotations = string_map(member(meta, "annotations"));
        if (desc.metadata.uid.empty()) {
            return Result<PodDescription>::Err("pod has no uid", ErrorKind::Format);
        }

        const auto& spec = member(pod, "spec");
        auto init = decode_container_list(member(spec, "initContainers"), desc.init_containers);
        if (init.is_err()) return Result<PodDescription>::Err(init.error, init.kind);
        auto regular = decode_container_list(member(spec, "containers"), desc.containers);
        if (regular.is_err()) return Result<PodDescription>::Err(regular.error, regular.kind);

        for (const auto& v : member(spec, "volumes")) {
            desc.volumes.push_back(decode_volume(v));
        }

        desc.config_maps = decode_data_objects(member(root, "configmaps"));
        desc.secrets = decode_data_objects(member(root, "secrets"));

        return Result<PodDescription>::Ok(desc);
    } catch (const Json::Exception& e) {
        return Result<PodDescription>::Err(std::string("malformed request: ") + e.what(),
                                           ErrorKind::Format);
    }
}

std::string encode_create_response(const std::string& pod_uid, const std::string& job_id) {
    Json::Value out(Json::objectValue);
    out["PodUID"] = pod_uid;
    out["PodJID"] = job_id;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, out);
}
