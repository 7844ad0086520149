#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    Config() = default;

    // Load from an explicit path, or $SLURMCONFIGPATH, or the default path.
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // Parse YAML text directly (no environment overrides applied).
    static Result<Config> parse(const std::string& yaml_text);

    const SidecarConfig& sidecar() const { return sidecar_; }
    const fs::path& source_path() const { return source_path_; }

private:
    SidecarConfig sidecar_;
    fs::path source_path_;

    void apply_env_overrides();
};

// Resolve which config file would be read for the given explicit path.
fs::path resolve_config_path(const std::optional<fs::path>& path = std::nullopt);
