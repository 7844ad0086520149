#pragma once

#include <string>
#include <memory>
#include <iosfwd>
#include <filesystem>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <api/submit_handler.hpp>
#include "job_store.hpp"
#include "slurm_collaborators.hpp"
#include "submission.hpp"

namespace fs = std::filesystem;

// Headless service facade: owns the config, the job store and the submission
// pipeline. Usable by any frontend; main.cpp drives it from the command line.
class SidecarService {
public:
    explicit SidecarService(Config config);
    ~SidecarService();

    SidecarService(const SidecarService&) = delete;
    SidecarService& operator=(const SidecarService&) = delete;

    // ── Requests ──────────────────────────────────────────────

    // Handle one create request body.
    Reply submit(const std::string& body);

    // Handle the request stored in a file.
    Reply submit_file(const fs::path& path);

    // Read one JSON request per line from `in` and write one
    // "<status> <body>" line per request to `out`. At most max_workers
    // requests run at once, so replies may come back in a different order;
    // reading pauses while every worker is busy. Returns the number of
    // requests handled once input ends and every reply is written.
    int serve(std::istream& in, std::ostream& out, int max_workers = SERVE_MAX_WORKERS);

    // ── State queries ─────────────────────────────────────────

    const Config& config() const { return config_; }
    JobStore& store() { return store_; }

private:
    Config config_;
    JobStore store_;
    std::unique_ptr<SlurmCollaborators> collaborators_;
    std::unique_ptr<SubmissionOrchestrator> orchestrator_;
    std::unique_ptr<SubmitHandler> handler_;
};
