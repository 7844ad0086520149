#pragma once

#include <string>
#include <vector>
#include "container_runtime.hpp"

// One fully formed per-container invocation, handed to script generation.
struct ContainerCommand {
    std::string container_name;
    std::string runtime;                       // "singularity" / "enroot"
    bool is_init_container = false;
    std::vector<std::string> runtime_command;  // prefix + env + mounts + image/name
    std::vector<std::string> container_command;
    std::vector<std::string> container_args;
    std::string container_image;               // resolved image
};

// Concatenate, in order: runtime prefix, environment tokens, runtime trailer
// (mounts + image, or mounts without ":ro" + container name). Pure; no I/O.
ContainerCommand assemble_container_command(const ContainerRuntime& runtime,
                                            const SidecarConfig& config,
                                            const ObjectMeta& metadata,
                                            const ContainerSpec& container,
                                            bool is_init_container,
                                            const std::vector<std::string>& envs,
                                            const std::string& mounts,
                                            const std::string& image);

// Full shell line: runtime command followed by the container's command and args,
// each argument single-quoted.
std::string render_command_line(const ContainerCommand& cmd);
