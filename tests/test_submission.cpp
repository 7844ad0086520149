#include <gtest/gtest.h>
#include <managers/submission.hpp>
#include "fake_collaborators.hpp"

static ContainerSpec make_container(const std::string& name, double cpu, int64_t memory) {
    ContainerSpec c;
    c.name = name;
    c.image = name + "-img";
    c.command = {"run-" + name};
    c.cpu_limit = cpu;
    c.memory_limit = memory;
    return c;
}

class SubmissionTest : public ::testing::Test {
protected:
    SidecarConfig config;
    FakeCollaborators collab;
    JobStore store;
    PodDescription pod;

    void SetUp() override {
        config.data_root_folder = "/data/jobs/";
        pod.metadata.name = "test-pod";
        pod.metadata.ns = "default";
        pod.metadata.uid = "uid-42";
    }

    std::string wd() const { return "/data/jobs/default-uid-42"; }

    SubmissionOutcome run() {
        SubmissionOrchestrator orchestrator(config, collab, store);
        return orchestrator.submit(pod);
    }
};

TEST_F(SubmissionTest, WorkingDirLayout) {
    EXPECT_EQ(SubmissionOrchestrator::working_dir(config, pod.metadata), fs::path(wd()));
}

TEST_F(SubmissionTest, SingleFractionalCpuContainer) {
    pod.containers = {make_container("main", 0.4, 0)};

    auto out = run();
    ASSERT_TRUE(out.success) << out.error;
    EXPECT_EQ(out.job_id, "4242");
    EXPECT_EQ(out.stage, SubmissionStage::Responded);
    EXPECT_EQ(out.limits.cpu, 1);
    EXPECT_EQ(out.limits.memory, 1048576);
    EXPECT_FALSE(out.limits.cpu_default);
    EXPECT_TRUE(out.limits.memory_default);
    EXPECT_EQ(collab.seen_limits.cpu, 1);
    EXPECT_TRUE(collab.seen_limits.memory_default);
}

TEST_F(SubmissionTest, CeilingAcrossContainers) {
    pod.containers = {make_container("a", 0, 2097152), make_container("b", 3, 1048576)};

    auto out = run();
    ASSERT_TRUE(out.success) << out.error;
    EXPECT_EQ(out.limits.cpu, 3);
    EXPECT_EQ(out.limits.memory, 2097152);
    EXPECT_FALSE(out.limits.cpu_default);
    EXPECT_FALSE(out.limits.memory_default);
}

TEST_F(SubmissionTest, SuccessPathCallOrder) {
    pod.init_containers = {make_container("init", 0, 0)};
    pod.containers = {make_container("main", 2, 0)};

    auto out = run();
    ASSERT_TRUE(out.success) << out.error;

    std::vector<std::string> expected = {
        "mounts:init", "envs:init", "image:init-img",
        "mounts:main", "envs:main", "image:main-img",
        "script", "submit", "record",
    };
    EXPECT_EQ(collab.calls, expected);
    EXPECT_EQ(collab.seen_files_path, fs::path(wd()));

    ASSERT_EQ(collab.seen_commands.size(), 2u);
    EXPECT_EQ(collab.seen_commands[0].container_name, "init");
    EXPECT_TRUE(collab.seen_commands[0].is_init_container);
    EXPECT_FALSE(collab.seen_commands[1].is_init_container);
    EXPECT_EQ(collab.seen_commands[1].container_image, "/images/main-img.sif");
    EXPECT_EQ(collab.seen_commands[1].runtime_command.back(), "/images/main-img.sif");

    ASSERT_TRUE(store.lookup("uid-42").has_value());
    EXPECT_EQ(store.lookup("uid-42")->job_id, "4242");
}

TEST_F(SubmissionTest, TraceAttributes) {
    pod.init_containers = {make_container("init", 0, 0)};
    pod.containers = {make_container("main", 2, 0)};
    pod.containers[0].args = {"--port", "80"};

    auto out = run();
    ASSERT_TRUE(out.success);

    auto attr = [&](const std::string& key) {
        for (const auto& [k, v] : out.attributes) {
            if (k == key) return v;
        }
        return std::string("<missing>");
    };
    EXPECT_EQ(attr("job.container0.name"), "init");
    EXPECT_EQ(attr("job.container0.isinit"), "true");
    EXPECT_EQ(attr("job.container1.name"), "main");
    EXPECT_EQ(attr("job.container1.isinit"), "false");
    EXPECT_EQ(attr("job.container1.image"), "/images/main-img.sif");
    EXPECT_EQ(attr("job.container1.command"), "run-main");
    EXPECT_EQ(attr("job.container1.args"), "--port 80");
    EXPECT_EQ(attr("job.container1.envs"), "--env-file /wd/main_envfile.properties");
}

TEST_F(SubmissionTest, UnsupportedRuntimeTouchesNothing) {
    config.container_runtime = "docker";
    pod.containers = {make_container("main", 1, 0)};

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.kind, ErrorKind::UnsupportedRuntime);
    EXPECT_EQ(out.stage, SubmissionStage::Failed);
    EXPECT_EQ(out.failed_stage, SubmissionStage::RuntimeSelected);
    EXPECT_TRUE(collab.calls.empty());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SubmissionTest, MountFailureAbortsBeforeScript) {
    pod.containers = {make_container("a", 1, 0), make_container("b", 1, 0),
                      make_container("c", 1, 0)};
    collab.fail_mounts_for = "c";

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.kind, ErrorKind::Collaborator);
    EXPECT_EQ(out.failed_stage, SubmissionStage::PerContainerProcessing);
    EXPECT_NE(out.error.find("container c"), std::string::npos);
    EXPECT_FALSE(collab.called("script"));
    EXPECT_FALSE(collab.called("submit"));
    EXPECT_EQ(collab.count("remove:" + wd()), 1);
    EXPECT_TRUE(out.job_id.empty());
}

TEST_F(SubmissionTest, ScriptFailureRemovesWorkingDir) {
    pod.containers = {make_container("a", 1, 0), make_container("b", 2, 0),
                      make_container("c", 1, 0)};
    collab.fail_script = true;

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failed_stage, SubmissionStage::ScriptGenerated);
    EXPECT_EQ(out.stage, SubmissionStage::Failed);
    EXPECT_FALSE(collab.called("submit"));
    EXPECT_FALSE(collab.called("cancel"));
    EXPECT_EQ(collab.count("remove:" + wd()), 1);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SubmissionTest, SubmitFailureRemovesWorkingDir) {
    pod.containers = {make_container("main", 1, 0)};
    collab.fail_submit = true;

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failed_stage, SubmissionStage::Submitted);
    EXPECT_NE(out.error.find("invalid partition"), std::string::npos);
    EXPECT_FALSE(collab.called("record"));
    EXPECT_FALSE(collab.called("cancel"));
    EXPECT_EQ(collab.count("remove:" + wd()), 1);
}

TEST_F(SubmissionTest, RecordFailureCancelsBeforeCleanup) {
    pod.containers = {make_container("main", 1, 0)};
    collab.fail_record = true;
    collab.submit_output = "sbatch: garbled";

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failed_stage, SubmissionStage::JobRecorded);
    EXPECT_EQ(collab.count("cancel:uid-42"), 1);
    int cancel_at = collab.index_of("cancel:uid-42");
    int remove_at = collab.index_of("remove:" + wd());
    ASSERT_GE(remove_at, 0);
    EXPECT_LT(cancel_at, remove_at);
    EXPECT_FALSE(store.lookup("uid-42").has_value());
}

TEST_F(SubmissionTest, CompensationFailureKeepsOriginalError) {
    pod.containers = {make_container("main", 1, 0)};
    collab.fail_record = true;
    collab.fail_cancel = true;
    collab.fail_remove = true;

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.kind, ErrorKind::Collaborator);
    EXPECT_EQ(out.failed_stage, SubmissionStage::JobRecorded);
    EXPECT_NE(out.error.find("no job id"), std::string::npos);
    EXPECT_EQ(collab.count("remove:" + wd()), 1);
}

TEST_F(SubmissionTest, PodInFlightIsRejectedWithoutTouchingFiles) {
    pod.containers = {make_container("main", 1, 0)};
    ASSERT_TRUE(store.try_reserve("uid-42"));

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failed_stage, SubmissionStage::PerContainerProcessing);
    EXPECT_TRUE(collab.calls.empty());
    EXPECT_TRUE(store.reserved("uid-42"));
}

TEST_F(SubmissionTest, ClaimReleasedAfterEveryOutcome) {
    pod.containers = {make_container("main", 1, 0)};
    collab.fail_submit = true;
    EXPECT_FALSE(run().success);
    EXPECT_FALSE(store.reserved("uid-42"));

    collab.fail_submit = false;
    EXPECT_TRUE(run().success);
    EXPECT_FALSE(store.reserved("uid-42"));

    // Already mapped: a new claim is refused
    EXPECT_FALSE(store.try_reserve("uid-42"));
}

TEST_F(SubmissionTest, RecordConflictKeepsOwnersDirectory) {
    pod.containers = {make_container("main", 1, 0)};
    collab.record_owner = "1001";

    auto out = run();
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.failed_stage, SubmissionStage::JobRecorded);
    EXPECT_EQ(collab.count("cancel:uid-42"), 1);
    EXPECT_FALSE(collab.called("remove:"));
    EXPECT_EQ(store.lookup("uid-42")->job_id, "1001");
}

TEST_F(SubmissionTest, EnrootRuntimeUsesContainerName) {
    config.container_runtime = "enroot";
    pod.containers = {make_container("main", 1, 0)};

    auto out = run();
    ASSERT_TRUE(out.success) << out.error;
    ASSERT_EQ(collab.seen_commands.size(), 1u);
    EXPECT_EQ(collab.seen_commands[0].runtime, "enroot");
    EXPECT_EQ(collab.seen_commands[0].runtime_command.back(), "mainuid-42");
}

TEST_F(SubmissionTest, StageNames) {
    EXPECT_STREQ(stage_name(SubmissionStage::Received), "Received");
    EXPECT_STREQ(stage_name(SubmissionStage::JobRecorded), "JobRecorded");
    EXPECT_STREQ(stage_name(SubmissionStage::Failed), "Failed");
}
