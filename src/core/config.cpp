#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace fs = std::filesystem;

// Accepts a YAML sequence or a single scalar; absent keys keep the default.
static void read_string_list(const YAML::Node& node, std::vector<std::string>& out) {
    if (!node) return;
    if (node.IsSequence()) {
        out = node.as<std::vector<std::string>>(std::vector<std::string>());
    } else if (node.IsScalar()) {
        out = {node.as<std::string>()};
    }
}

static SidecarConfig parse_sidecar_config(const YAML::Node& root) {
    SidecarConfig c;
    c.sbatch_path = root["SbatchPath"].as<std::string>(c.sbatch_path);
    c.scancel_path = root["ScancelPath"].as<std::string>(c.scancel_path);
    c.data_root_folder = root["DataRootFolder"].as<std::string>(c.data_root_folder);
    c.ns = root["Namespace"].as<std::string>("");
    c.bash_path = root["BashPath"].as<std::string>(c.bash_path);
    c.command_prefix = root["CommandPrefix"].as<std::string>("");
    c.image_prefix = root["ImagePrefix"].as<std::string>("");
    c.export_pod_data = root["ExportPodData"].as<bool>(false);
    c.verbose_logging = root["VerboseLogging"].as<bool>(false);
    c.errors_only_logging = root["ErrorsOnlyLogging"].as<bool>(false);
    c.log_file = root["LogFile"].as<std::string>("");
    c.container_runtime = root["ContainerRuntime"].as<std::string>(c.container_runtime);

    c.singularity.path = root["SingularityPath"].as<std::string>(c.singularity.path);
    c.singularity.prefix = root["SingularityPrefix"].as<std::string>("");
    read_string_list(root["SingularityDefaultOptions"], c.singularity.default_options);

    c.enroot.path = root["EnrootPath"].as<std::string>(c.enroot.path);
    c.enroot.prefix = root["EnrootPrefix"].as<std::string>("");
    read_string_list(root["EnrootDefaultOptions"], c.enroot.default_options);

    if (!c.data_root_folder.empty() && c.data_root_folder.back() != '/') {
        c.data_root_folder += '/';
    }
    return c;
}

fs::path resolve_config_path(const std::optional<fs::path>& path) {
    if (path.has_value() && !path->empty()) return *path;
    const char* env = std::getenv(CONFIG_PATH_ENV);
    if (env && *env) return fs::path(env);
    return fs::path(DEFAULT_CONFIG_PATH);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        config.sidecar_ = parse_sidecar_config(root);
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::Config);
    }
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    fs::path config_path = resolve_config_path(path);
    if (!fs::exists(config_path)) {
        return Result<Config>::Err("Config not found at " + config_path.string(),
                                   ErrorKind::Config);
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path.string());

        Config config;
        config.sidecar_ = parse_sidecar_config(root);
        config.source_path_ = config_path;
        config.apply_env_overrides();

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::Config);
    }
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("SBATCHPATH"); v && *v) sidecar_.sbatch_path = v;
    if (const char* v = std::getenv("SCANCELPATH"); v && *v) sidecar_.scancel_path = v;
    if (const char* v = std::getenv("CONTAINERRUNTIME"); v && *v) sidecar_.container_runtime = v;
    if (const char* v = std::getenv("DATAROOTFOLDER"); v && *v) {
        sidecar_.data_root_folder = v;
        if (sidecar_.data_root_folder.back() != '/') sidecar_.data_root_folder += '/';
    }
}
