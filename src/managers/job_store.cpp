#include "job_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

bool JobStore::insert_if_absent(const JobRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.emplace(record.pod_uid, record).second;
}

std::optional<JobRecord> JobStore::lookup(const std::string& pod_uid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(pod_uid);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

bool JobStore::remove(const std::string& pod_uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.erase(pod_uid) > 0;
}

size_t JobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool JobStore::try_reserve(const std::string& pod_uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.count(pod_uid)) return false;
    return in_flight_.insert(pod_uid).second;
}

void JobStore::release(const std::string& pod_uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(pod_uid);
}

bool JobStore::reserved(const std::string& pod_uid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(pod_uid) > 0;
}

int JobStore::load_from(const fs::path& data_root) {
    std::error_code ec;
    if (!fs::is_directory(data_root, ec)) return 0;

    int loaded = 0;
    for (const auto& entry : fs::directory_iterator(data_root, ec)) {
        if (!entry.is_directory(ec)) continue;
        fs::path record_path = entry.path() / JOB_RECORD_NAME;
        if (!fs::exists(record_path, ec)) continue;

        auto record = load_record(record_path);
        if (record.is_err()) {
            log_warn(fmt::format("Skipping job record {}: {}", record_path.string(), record.error));
            continue;
        }
        if (insert_if_absent(record.value)) loaded++;
    }
    return loaded;
}

Result<void> JobStore::save_record(const fs::path& path, const JobRecord& record) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "pod_uid" << YAML::Value << record.pod_uid;
    out << YAML::Key << "pod_namespace" << YAML::Value << record.pod_namespace;
    out << YAML::Key << "job_id" << YAML::Value << record.job_id;
    out << YAML::Key << "submit_time" << YAML::Value << record.submit_time;
    out << YAML::EndMap;

    std::ofstream f(path);
    if (!f) {
        return Result<void>::Err("Failed to write job record at " + path.string());
    }
    f << out.c_str() << "\n";
    if (!f) {
        return Result<void>::Err("Failed to write job record at " + path.string());
    }
    return Result<void>::Ok();
}

Result<JobRecord> JobStore::load_record(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());

        JobRecord r;
        r.pod_uid = root["pod_uid"].as<std::string>("");
        r.pod_namespace = root["pod_namespace"].as<std::string>("");
        r.job_id = root["job_id"].as<std::string>("");
        r.submit_time = root["submit_time"].as<std::string>("");
        if (r.pod_uid.empty() || r.job_id.empty()) {
            return Result<JobRecord>::Err("record is missing pod_uid or job_id");
        }
        return Result<JobRecord>::Ok(r);
    } catch (const std::exception& e) {
        return Result<JobRecord>::Err(std::string("corrupted job record: ") + e.what());
    }
}
