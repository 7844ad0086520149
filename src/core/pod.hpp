#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

struct EnvVar {
    std::string name;
    std::string value;
};

struct VolumeMount {
    std::string name;         // volume name in the pod spec
    std::string mount_path;   // path inside the container
    std::string sub_path;
    bool read_only = false;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::vector<std::string> args;
    std::vector<EnvVar> env;
    std::vector<VolumeMount> volume_mounts;
    double cpu_limit = 0.0;      // cores; 0 = undeclared
    int64_t memory_limit = 0;    // bytes; 0 = undeclared
};

enum class VolumeType { EmptyDir, ConfigMap, Secret, HostPath, Unsupported };

struct VolumeSpec {
    std::string name;
    VolumeType type = VolumeType::Unsupported;
    std::string source;       // configMap name, secret name or host path
};

struct ObjectMeta {
    std::string name;
    std::string ns;
    std::string uid;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;

    std::optional<std::string> annotation(const std::string& key) const {
        auto it = annotations.find(key);
        if (it == annotations.end()) return std::nullopt;
        return it->second;
    }
};

// ConfigMap or Secret content shipped alongside the pod.
// Secret values are kept base64-encoded as received.
struct DataObject {
    std::string name;
    std::map<std::string, std::string> data;
};

// One submission request: the pod plus the objects its volumes reference.
struct PodDescription {
    ObjectMeta metadata;
    std::vector<ContainerSpec> init_containers;
    std::vector<ContainerSpec> containers;
    std::vector<VolumeSpec> volumes;
    std::vector<DataObject> config_maps;
    std::vector<DataObject> secrets;
    std::string raw;          // request body as received

    const VolumeSpec* find_volume(const std::string& name) const {
        for (const auto& v : volumes) {
            if (v.name == name) return &v;
        }
        return nullptr;
    }

    const DataObject* find_config_map(const std::string& name) const {
        for (const auto& c : config_maps) {
            if (c.name == name) return &c;
        }
        return nullptr;
    }

    const DataObject* find_secret(const std::string& name) const {
        for (const auto& s : secrets) {
            if (s.name == name) return &s;
        }
        return nullptr;
    }
};
