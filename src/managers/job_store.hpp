#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct JobRecord {
    std::string pod_uid;
    std::string pod_namespace;
    std::string job_id;        // SLURM job id
    std::string submit_time;   // ISO timestamp
};

// Pod uid → SLURM job mapping shared by all submissions.
// Every operation takes the store mutex; no call blocks on a submission.
class JobStore {
public:
    JobStore() = default;
    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // Insert unless the pod already has an entry. Returns false on conflict.
    bool insert_if_absent(const JobRecord& record);

    std::optional<JobRecord> lookup(const std::string& pod_uid) const;

    // Returns true if an entry was removed.
    bool remove(const std::string& pod_uid);

    size_t size() const;

    // Claim a pod for one submission. Fails if the pod already has a job or
    // another submission holds the claim; never waits.
    bool try_reserve(const std::string& pod_uid);
    void release(const std::string& pod_uid);
    bool reserved(const std::string& pod_uid) const;

    // Rebuild entries from <data_root>/*/job.yaml. Returns the number loaded.
    int load_from(const fs::path& data_root);

    // Persist / read a single record file.
    static Result<void> save_record(const fs::path& path, const JobRecord& record);
    static Result<JobRecord> load_record(const fs::path& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> jobs_;
    std::set<std::string> in_flight_;
};
