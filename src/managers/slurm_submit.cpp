#include "slurm_collaborators.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <regex>

Result<std::string> extract_job_id(const std::string& submit_output) {
    static const std::regex submitted_re(R"(Submitted batch job (\d+))");
    static const std::regex parsable_re(R"(^(\d+)(;\S*)?$)");

    std::smatch m;
    if (std::regex_search(submit_output, m, submitted_re)) {
        return Result<std::string>::Ok(m[1].str());
    }

    std::string trimmed = submit_output;
    trim(trimmed);
    if (std::regex_match(trimmed, m, parsable_re)) {
        return Result<std::string>::Ok(m[1].str());
    }
    return Result<std::string>::Err("no job id in sbatch output: " + trimmed);
}

// ── Submit ─────────────────────────────────────────────────

Result<std::string> SlurmCollaborators::submit_batch(const fs::path& script) {
    auto r = platform::run_command(config_.sbatch_path, {script.string()}, SCHEDULER_TIMEOUT_SECS);
    log_command("sbatch", config_.sbatch_path + " " + script.string(), r);

    if (r.failed()) {
        std::string detail = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
        trim(detail);
        return Result<std::string>::Err(fmt::format("sbatch exited with {}: {}", r.exit_code, detail));
    }
    return Result<std::string>::Ok(r.stdout_data);
}

// ── Record ─────────────────────────────────────────────────

Result<std::string> SlurmCollaborators::record_job_id(const std::string& submit_output,
                                                      const PodDescription& pod,
                                                      JobStore& store,
                                                      const fs::path& files_path) {
    auto jid = extract_job_id(submit_output);
    if (jid.is_err()) return jid;

    JobRecord record;
    record.pod_uid = pod.metadata.uid;
    record.pod_namespace = pod.metadata.ns;
    record.job_id = jid.value;
    record.submit_time = now_iso();

    auto saved = JobStore::save_record(files_path / JOB_RECORD_NAME, record);
    if (saved.is_err()) return Result<std::string>::Err(saved.error);

    if (!store.insert_if_absent(record)) {
        auto existing = store.lookup(record.pod_uid);
        return Result<std::string>::Err(fmt::format("pod {} is already mapped to job {}",
                                                    record.pod_uid,
                                                    existing ? existing->job_id : "?"));
    }

    log_info(fmt::format("pod {} submitted as job {}", record.pod_uid, record.job_id));
    return Result<std::string>::Ok(record.job_id);
}

// ── Cancel ─────────────────────────────────────────────────

Result<void> SlurmCollaborators::cancel_job(const std::string& pod_uid,
                                            const std::string& submit_output,
                                            JobStore& store,
                                            const fs::path& files_path) {
    (void)files_path;

    // Without a parsable id the job name (the pod uid) still identifies it
    std::vector<std::string> args;
    auto jid = extract_job_id(submit_output);
    if (jid.is_ok()) {
        args.push_back(jid.value);
    } else {
        args.push_back("--name=" + pod_uid);
    }

    auto r = platform::run_command(config_.scancel_path, args, SCHEDULER_TIMEOUT_SECS);
    log_command("scancel", config_.scancel_path + " " + join_nonempty(args), r);

    // Only drop the entry this submission could have written
    auto existing = store.lookup(pod_uid);
    if (existing && jid.is_ok() && existing->job_id == jid.value) {
        store.remove(pod_uid);
    }

    if (r.failed()) {
        std::string detail = r.get_output();
        trim(detail);
        return Result<void>::Err(fmt::format("scancel exited with {}: {}", r.exit_code, detail),
                                 ErrorKind::Compensation);
    }
    return Result<void>::Ok();
}

// ── Cleanup ────────────────────────────────────────────────

Result<void> SlurmCollaborators::remove_working_dir(const fs::path& files_path) {
    std::error_code ec;
    fs::remove_all(files_path, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot remove {}: {}", files_path.string(),
                                             ec.message()),
                                 ErrorKind::Compensation);
    }
    return Result<void>::Ok();
}
