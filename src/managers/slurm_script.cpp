#include "slurm_collaborators.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/resource_spec.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

static std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

static std::string enroot_create_line(const SidecarConfig& config, const ContainerCommand& cmd,
                                      const std::string& container_name) {
    return fmt::format("{} create --force --name {} {}", config.enroot.path,
                       shell_quote(container_name), shell_quote(cmd.container_image));
}

std::string render_job_script(const SidecarConfig& config,
                              const PodDescription& pod,
                              const fs::path& files_path,
                              const std::vector<ContainerCommand>& commands,
                              const ResourceLimits& limits) {
    const auto& meta = pod.metadata;
    std::string wd = files_path.string();

    std::string s;
    s += fmt::format("#!{}\n", config.bash_path);
    s += fmt::format("#SBATCH --job-name={}\n", meta.uid);
    s += fmt::format("#SBATCH --output={}\n", (files_path / JOB_OUTPUT_NAME).string());
    s += generate_sbatch_resources(limits);
    if (auto flags = meta.annotation(ANNOTATION_SBATCH_FLAGS)) {
        for (const auto& flag : split_whitespace(*flags)) {
            s += fmt::format("#SBATCH {}\n", flag);
        }
    }
    s += "\n";

    if (limits.cpu_default || limits.memory_default) {
        s += "# No container declared a limit above the default for:";
        if (limits.cpu_default) s += " cpu";
        if (limits.memory_default) s += " memory";
        s += "\n";
    }

    if (!config.command_prefix.empty()) s += config.command_prefix + "\n";
    if (auto pre = meta.annotation(ANNOTATION_PRE_EXEC)) s += *pre + "\n";

    // Enroot starts named containers, which have to exist first
    bool created = false;
    for (const auto& cmd : commands) {
        if (cmd.runtime != RUNTIME_ENROOT) continue;
        std::string name = cmd.container_name + meta.uid;
        s += enroot_create_line(config, cmd, name) + "\n";
        created = true;
    }
    if (created) s += "\n";

    // Init containers run to completion in pod order; the first failure ends the job
    for (const auto& cmd : commands) {
        if (!cmd.is_init_container) continue;
        std::string out = shell_quote(wd + "/" + cmd.container_name + ".out");
        std::string status = shell_quote(wd + "/" + cmd.container_name + ".status");
        s += fmt::format("{} &> {}\n", render_command_line(cmd), out);
        s += "rc=$?\n";
        s += fmt::format("echo $rc > {}\n", status);
        s += "if [ $rc -ne 0 ]; then exit $rc; fi\n";
    }

    for (const auto& cmd : commands) {
        if (cmd.is_init_container) continue;
        std::string out = shell_quote(wd + "/" + cmd.container_name + ".out");
        std::string status = shell_quote(wd + "/" + cmd.container_name + ".status");
        s += fmt::format("( {} &> {}; echo $? > {} ) &\n", render_command_line(cmd), out, status);
    }
    s += "wait\n";

    return s;
}

Result<fs::path> SlurmCollaborators::produce_script(const PodDescription& pod,
                                                    const fs::path& files_path,
                                                    const std::vector<ContainerCommand>& commands,
                                                    const ResourceLimits& limits) {
    const auto& meta = pod.metadata;
    if (limits.cpu_default) {
        log_warn(fmt::format("pod {}: no CPU limit above the default, job runs with {} CPU",
                             meta.uid, limits.cpu));
    }
    if (limits.memory_default) {
        log_warn(fmt::format("pod {}: no memory limit above the default, job runs with {}",
                             meta.uid, format_memory_bytes(limits.memory)));
    }

    std::error_code ec;
    fs::create_directories(files_path, ec);
    if (ec) {
        return Result<fs::path>::Err(fmt::format("cannot create {}: {}", files_path.string(),
                                                 ec.message()));
    }

    fs::path script = files_path / JOB_SCRIPT_NAME;
    {
        std::ofstream f(script, std::ios::trunc);
        if (!f) return Result<fs::path>::Err("cannot write " + script.string());
        f << render_job_script(config_, pod, files_path, commands, limits);
        if (!f) return Result<fs::path>::Err("cannot write " + script.string());
    }

    fs::permissions(script, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                            fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        return Result<fs::path>::Err(fmt::format("cannot chmod {}: {}", script.string(),
                                                 ec.message()));
    }

    if (config_.export_pod_data) {
        std::ofstream f(files_path / POD_EXPORT_NAME, std::ios::trunc);
        if (!f || !(f << pod.raw)) {
            return Result<fs::path>::Err("cannot write " + (files_path / POD_EXPORT_NAME).string());
        }
    }

    log_debug(fmt::format("pod {}: wrote {}", meta.uid, script.string()));
    return Result<fs::path>::Ok(script);
}
