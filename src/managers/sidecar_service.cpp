#include "sidecar_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <list>
#include <mutex>
#include <sstream>
#include <thread>

SidecarService::SidecarService(Config config) : config_(std::move(config)) {
    const auto& sc = config_.sidecar();
    configure_logging(sc);

    int loaded = store_.load_from(sc.data_root_folder);
    if (loaded > 0) {
        log_info(fmt::format("Restored {} job record(s) from {}", loaded, sc.data_root_folder));
    }

    collaborators_ = std::make_unique<SlurmCollaborators>(sc);
    orchestrator_ = std::make_unique<SubmissionOrchestrator>(sc, *collaborators_, store_);
    handler_ = std::make_unique<SubmitHandler>(*orchestrator_, store_);
}

SidecarService::~SidecarService() = default;

Reply SidecarService::submit(const std::string& body) {
    return handler_->handle(body);
}

Reply SidecarService::submit_file(const fs::path& path) {
    std::ifstream f(path);
    if (!f) {
        log_error("Cannot read request file " + path.string());
        return {STATUS_INTERNAL_ERROR, GENERIC_FAILURE_MESSAGE};
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return submit(ss.str());
}

int SidecarService::serve(std::istream& in, std::ostream& out, int max_workers) {
    struct Worker {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    if (max_workers < 1) max_workers = 1;
    std::mutex out_mutex;
    std::mutex slot_mutex;
    std::condition_variable slot_freed;
    int active = 0;
    std::list<std::unique_ptr<Worker>> workers;
    int handled = 0;

    auto reap = [&workers]() {
        for (auto it = workers.begin(); it != workers.end();) {
            if ((*it)->finished.load()) {
                (*it)->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    };

    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        {
            std::unique_lock<std::mutex> lock(slot_mutex);
            slot_freed.wait(lock, [&] { return active < max_workers; });
            active++;
        }
        reap();

        auto worker = std::make_unique<Worker>();
        auto* raw = worker.get();
        worker->thread = std::thread([this, &out, &out_mutex, &slot_mutex, &slot_freed, &active,
                                      raw, body = line]() {
            Reply reply{STATUS_INTERNAL_ERROR, GENERIC_FAILURE_MESSAGE};
            try {
                reply = submit(body);
            } catch (const std::exception& e) {
                log_error(std::string("Request handler failed: ") + e.what());
            }
            {
                std::lock_guard<std::mutex> lock(out_mutex);
                out << reply.status << " " << reply.body << "\n";
                out.flush();
            }
            {
                std::lock_guard<std::mutex> lock(slot_mutex);
                active--;
                raw->finished.store(true);
            }
            slot_freed.notify_one();
        });
        workers.push_back(std::move(worker));
        handled++;
    }

    for (auto& w : workers) w->thread.join();
    return handled;
}
