#include "slurm_collaborators.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>

SlurmCollaborators::SlurmCollaborators(const SidecarConfig& config) : config_(config) {}

// ── Mounts ─────────────────────────────────────────────────

static Result<void> write_file(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return Result<void>::Err("cannot write " + path.string());
    f << content;
    if (!f) return Result<void>::Err("cannot write " + path.string());
    return Result<void>::Ok();
}

// Write every key of a configMap/secret as a file under dir.
static Result<void> materialize(const fs::path& dir, const DataObject& obj, bool base64) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Result<void>::Err(fmt::format("cannot create {}: {}", dir.string(), ec.message()));

    for (const auto& [key, value] : obj.data) {
        std::string content = value;
        if (base64) {
            auto decoded = base64_decode(value);
            if (!decoded) {
                return Result<void>::Err(fmt::format("secret {} key {} is not valid base64", obj.name, key));
            }
            content = *decoded;
        }
        fs::path file = dir / key;
        auto written = write_file(file, content);
        if (written.is_err()) return written;
        if (base64) {
            fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, ec);
            if (ec) {
                return Result<void>::Err(fmt::format("cannot restrict {}: {}", file.string(),
                                                     ec.message()));
            }
        }
    }
    return Result<void>::Ok();
}

Result<std::string> SlurmCollaborators::prepare_mounts(const PodDescription& pod,
                                                       const ContainerSpec& container,
                                                       const fs::path& files_path) {
    std::error_code ec;
    fs::create_directories(files_path, ec);
    if (ec) {
        return Result<std::string>::Err(fmt::format("cannot create working directory {}: {}",
                                                    files_path.string(), ec.message()));
    }

    std::vector<std::string> binds;
    for (const auto& vm : container.volume_mounts) {
        const VolumeSpec* vol = pod.find_volume(vm.name);
        if (!vol) {
            return Result<std::string>::Err("volume " + vm.name + " not found in pod spec");
        }

        fs::path source;
        bool read_only = vm.read_only;

        switch (vol->type) {
            case VolumeType::EmptyDir: {
                source = files_path / "emptyDirs" / vol->name;
                fs::create_directories(source, ec);
                if (ec) {
                    return Result<std::string>::Err(fmt::format("cannot create {}: {}",
                                                                source.string(), ec.message()));
                }
                break;
            }
            case VolumeType::ConfigMap: {
                const DataObject* cm = pod.find_config_map(vol->source);
                if (!cm) return Result<std::string>::Err("configMap " + vol->source + " not provided");
                source = files_path / "configMaps" / vol->name;
                auto r = materialize(source, *cm, false);
                if (r.is_err()) return Result<std::string>::Err(r.error);
                read_only = true;
                break;
            }
            case VolumeType::Secret: {
                const DataObject* secret = pod.find_secret(vol->source);
                if (!secret) return Result<std::string>::Err("secret " + vol->source + " not provided");
                source = files_path / "secrets" / vol->name;
                auto r = materialize(source, *secret, true);
                if (r.is_err()) return Result<std::string>::Err(r.error);
                read_only = true;
                break;
            }
            case VolumeType::HostPath:
                source = vol->source;
                break;
            case VolumeType::Unsupported:
                return Result<std::string>::Err("volume " + vol->name + " has an unsupported type");
        }

        if (!vm.sub_path.empty()) source /= vm.sub_path;
        std::string bind = source.string() + ":" + vm.mount_path;
        if (read_only) bind += ":ro";
        binds.push_back(bind);
    }

    if (binds.empty()) return Result<std::string>::Ok("");
    return Result<std::string>::Ok("--bind " + join_nonempty(binds, ","));
}

// ── Environment ────────────────────────────────────────────

std::vector<std::string> SlurmCollaborators::prepare_envs(const PodDescription& pod,
                                                          const ContainerSpec& container,
                                                          const fs::path& files_path) {
    std::vector<std::string> tokens;
    if (container.env.empty()) return tokens;

    if (config_.container_runtime == RUNTIME_ENROOT) {
        for (const auto& e : container.env) {
            tokens.push_back("--env");
            tokens.push_back(e.name + "=" + shell_quote(e.value));
        }
        return tokens;
    }

    fs::path env_file = files_path / (container.name + ENV_FILE_SUFFIX);
    std::string content;
    for (const auto& e : container.env) {
        content += e.name + "=" + e.value + "\n";
    }
    auto written = write_file(env_file, content);
    if (written.is_err()) {
        log_warn(fmt::format("pod {}: {}; container {} starts without its environment",
                             pod.metadata.uid, written.error, container.name));
        return tokens;
    }

    tokens.push_back("--env-file");
    tokens.push_back(env_file.string());
    return tokens;
}

// ── Image ──────────────────────────────────────────────────

std::string resolve_image(const SidecarConfig& config, const ObjectMeta& metadata,
                          const std::string& image) {
    if (auto root = metadata.annotation(ANNOTATION_IMAGE_ROOT)) {
        return *root + image;
    }
    if (!image.empty() && (image[0] == '/' || image.find("://") != std::string::npos)) {
        return image;
    }
    return config.image_prefix + image;
}

std::string SlurmCollaborators::prepare_image(const ObjectMeta& metadata,
                                              const std::string& image) {
    std::string resolved = resolve_image(config_, metadata, image);
    log_debug(fmt::format("image {} resolved to {}", image, resolved));
    return resolved;
}
