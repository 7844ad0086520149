#include <iostream>
#include <sstream>
#include <optional>
#include <vector>
#include <string>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "runtimes/container_runtime.hpp"
#include "managers/sidecar_service.hpp"

static const char* VERSION = "0.1.0";

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("slurm-sidecar submit <file|->", "Submit one pod request, print the reply");
    std::cout << theme::usage("slurm-sidecar serve", "Handle one request per stdin line");
    std::cout << theme::usage("slurm-sidecar config", "Show the effective configuration");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>                   Config file (default $" << CONFIG_PATH_ENV
              << " or " << DEFAULT_CONFIG_PATH << ")\n"
              << "    --version                         Show version\n"
              << "    --help                            Show this help"
              << theme::color::RESET << "\n\n";
}

static void print_config(const Config& config) {
    const auto& c = config.sidecar();
    std::cout << theme::section("Configuration");
    std::cout << theme::kv("Source", config.source_path().string());
    std::cout << theme::kv("SbatchPath", c.sbatch_path);
    std::cout << theme::kv("ScancelPath", c.scancel_path);
    std::cout << theme::kv("DataRootFolder", c.data_root_folder);
    std::cout << theme::kv("BashPath", c.bash_path);
    std::cout << theme::kv("ContainerRuntime", c.container_runtime);
    std::cout << theme::kv("ImagePrefix", c.image_prefix.empty() ? "-" : c.image_prefix);
    std::cout << theme::kv("ExportPodData", c.export_pod_data ? "true" : "false");
    std::cout << theme::kv("LogFile", c.log_file.empty() ? "stderr" : c.log_file);

    auto runtime = select_runtime(c.container_runtime);
    if (runtime.is_err()) {
        std::cout << "\n" << theme::fail(fmt::format("{} (supported: {})", runtime.error,
                                                     fmt::join(supported_runtimes(), ", ")));
    }
    std::cout << "\n";
}

int main(int argc, char** argv) {
    try {
        std::optional<fs::path> config_path;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "slurm-sidecar"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << theme::fail("--config needs a path");
                    return 1;
                }
                config_path = fs::path(argv[++i]);
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            print_usage();
            return 1;
        }

        auto config = Config::load(config_path);
        if (config.is_err()) {
            std::cerr << theme::fail(config.error);
            return 1;
        }

        const std::string& cmd = positional[0];
        if (cmd == "config") {
            print_config(config.value);
            return 0;
        }

        if (cmd == "submit") {
            if (positional.size() < 2) {
                std::cerr << theme::fail("Missing request file.");
                std::cerr << theme::step("Usage: slurm-sidecar submit <file|->");
                return 1;
            }
            SidecarService service(config.value);
            Reply reply{STATUS_INTERNAL_ERROR, GENERIC_FAILURE_MESSAGE};
            if (positional[1] == "-") {
                std::stringstream ss;
                ss << std::cin.rdbuf();
                reply = service.submit(ss.str());
            } else {
                reply = service.submit_file(positional[1]);
            }
            std::cout << reply.body << "\n";
            return reply.status == STATUS_OK ? 0 : 1;
        }

        if (cmd == "serve") {
            SidecarService service(config.value);
            service.serve(std::cin, std::cout);
            return 0;
        }

        std::cerr << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
