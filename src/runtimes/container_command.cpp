#include "container_command.hpp"
#include <core/utils.hpp>

ContainerCommand assemble_container_command(const ContainerRuntime& runtime,
                                            const SidecarConfig& config,
                                            const ObjectMeta& metadata,
                                            const ContainerSpec& container,
                                            bool is_init_container,
                                            const std::vector<std::string>& envs,
                                            const std::string& mounts,
                                            const std::string& image) {
    ContainerCommand cmd;
    cmd.container_name = container.name;
    cmd.runtime = runtime.name();
    cmd.is_init_container = is_init_container;
    cmd.container_command = container.command;
    cmd.container_args = container.args;
    cmd.container_image = image;

    cmd.runtime_command = runtime.build_prefix(config, container, metadata);
    cmd.runtime_command.insert(cmd.runtime_command.end(), envs.begin(), envs.end());
    auto trailer = runtime.build_trailer(mounts, image, container, metadata);
    cmd.runtime_command.insert(cmd.runtime_command.end(), trailer.begin(), trailer.end());

    return cmd;
}

std::string render_command_line(const ContainerCommand& cmd) {
    std::string line = join_nonempty(cmd.runtime_command);
    for (const auto& part : cmd.container_command) {
        line += " " + shell_quote(part);
    }
    for (const auto& arg : cmd.container_args) {
        line += " " + shell_quote(arg);
    }
    return line;
}
