#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/pod.hpp>

enum class RuntimeKind {
    Singularity,   // image-file based: command ends with the resolved image path
    Enroot,        // named-container based: command ends with a generated container name
};

// Builds the runtime-specific parts of one container's command line.
// The set of runtimes is closed; dispatch is a switch over RuntimeKind.
// Never looks at resource limits.
class ContainerRuntime {
public:
    explicit ContainerRuntime(RuntimeKind kind) : kind_(kind) {}

    RuntimeKind kind() const { return kind_; }
    const char* name() const;

    // Tokens that launch a container under this runtime, before env/mount/image.
    std::vector<std::string> build_prefix(const SidecarConfig& config,
                                          const ContainerSpec& container,
                                          const ObjectMeta& metadata) const;

    // Tokens that follow the environment fragment: the mount fragment and the
    // image (Singularity) or container name (Enroot). Enroot cannot mount
    // read-only, so ":ro" markers are stripped from the mount fragment.
    std::vector<std::string> build_trailer(const std::string& mounts,
                                           const std::string& image,
                                           const ContainerSpec& container,
                                           const ObjectMeta& metadata) const;

private:
    RuntimeKind kind_;
};

// Resolve a configured runtime name. Unknown names fail with
// ErrorKind::UnsupportedRuntime.
Result<ContainerRuntime> select_runtime(const std::string& name);

// Names accepted by select_runtime().
std::vector<std::string> supported_runtimes();

// Remove ":ro" markers that end a bind entry ("/a:/b:ro,/c:/d" → "/a:/b,/c:/d").
std::string strip_read_only(const std::string& text);

// Enroot container name for a pod's container: <container name><pod uid>.
std::string enroot_container_name(const ContainerSpec& container, const ObjectMeta& metadata);
