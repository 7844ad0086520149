#include "container_runtime.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

static void push_nonempty(std::vector<std::string>& out, const std::string& token) {
    if (!token.empty()) out.push_back(token);
}

// Drop ":ro" mount markers. Only a marker at the end of a bind entry counts,
// so a target such as "/root" is left alone.
std::string strip_read_only(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 3, ":ro") == 0) {
            size_t next = i + 3;
            if (next == text.size() || text[next] == ',' || text[next] == ' ') {
                i = next;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

const char* ContainerRuntime::name() const {
    switch (kind_) {
        case RuntimeKind::Singularity: return RUNTIME_SINGULARITY;
        case RuntimeKind::Enroot:      return RUNTIME_ENROOT;
    }
    return "";
}

std::vector<std::string> ContainerRuntime::build_prefix(const SidecarConfig& config,
                                                        const ContainerSpec& container,
                                                        const ObjectMeta& metadata) const {
    std::vector<std::string> cmd;

    switch (kind_) {
        case RuntimeKind::Singularity: {
            std::string prefix = config.singularity.prefix;
            if (auto extra = metadata.annotation(ANNOTATION_SINGULARITY_COMMANDS)) {
                prefix = join_nonempty({prefix, *extra});
            }
            push_nonempty(cmd, prefix);
            cmd.push_back(config.singularity.path);
            // Without an explicit command the image's runscript is the entrypoint
            cmd.push_back(container.command.empty() ? "run" : "exec");
            for (const auto& opt : config.singularity.default_options) push_nonempty(cmd, opt);
            if (auto mounts = metadata.annotation(ANNOTATION_SINGULARITY_MOUNTS)) {
                push_nonempty(cmd, *mounts);
            }
            if (auto opts = metadata.annotation(ANNOTATION_SINGULARITY_OPTIONS)) {
                push_nonempty(cmd, *opts);
            }
            break;
        }
        case RuntimeKind::Enroot: {
            push_nonempty(cmd, config.enroot.prefix);
            cmd.push_back(config.enroot.path);
            cmd.push_back("start");
            // Enroot has no read-only binds
            for (const auto& opt : config.enroot.default_options) {
                push_nonempty(cmd, strip_read_only(opt));
            }
            if (auto opts = metadata.annotation(ANNOTATION_ENROOT_OPTIONS)) {
                push_nonempty(cmd, strip_read_only(*opts));
            }
            break;
        }
    }

    return cmd;
}

std::vector<std::string> ContainerRuntime::build_trailer(const std::string& mounts,
                                                         const std::string& image,
                                                         const ContainerSpec& container,
                                                         const ObjectMeta& metadata) const {
    std::vector<std::string> cmd;

    switch (kind_) {
        case RuntimeKind::Singularity:
            push_nonempty(cmd, mounts);
            cmd.push_back(image);
            break;
        case RuntimeKind::Enroot:
            push_nonempty(cmd, strip_read_only(mounts));
            cmd.push_back(enroot_container_name(container, metadata));
            break;
    }

    return cmd;
}

Result<ContainerRuntime> select_runtime(const std::string& name) {
    if (name == RUNTIME_SINGULARITY) {
        return Result<ContainerRuntime>::Ok(ContainerRuntime(RuntimeKind::Singularity));
    }
    if (name == RUNTIME_ENROOT) {
        return Result<ContainerRuntime>::Ok(ContainerRuntime(RuntimeKind::Enroot));
    }
    // No default-constructible ContainerRuntime, so Err() cannot be used here
    return Result<ContainerRuntime>{false, ContainerRuntime(RuntimeKind::Singularity),
                                    "invalid runtime: " + name, ErrorKind::UnsupportedRuntime};
}

std::vector<std::string> supported_runtimes() {
    return {RUNTIME_SINGULARITY, RUNTIME_ENROOT};
}

std::string enroot_container_name(const ContainerSpec& container, const ObjectMeta& metadata) {
    return container.name + metadata.uid;
}
