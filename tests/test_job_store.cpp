#include <gtest/gtest.h>
#include <managers/job_store.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

static JobRecord make_record(const std::string& uid, const std::string& jid) {
    return JobRecord{uid, "default", jid, "2025-01-15T10:00:00"};
}

TEST(JobStore, InsertLookupRemove) {
    JobStore store;
    EXPECT_TRUE(store.insert_if_absent(make_record("a", "100")));
    EXPECT_EQ(store.size(), 1u);

    auto found = store.lookup("a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->job_id, "100");
    EXPECT_FALSE(store.lookup("b").has_value());

    EXPECT_TRUE(store.remove("a"));
    EXPECT_FALSE(store.remove("a"));
    EXPECT_EQ(store.size(), 0u);
}

TEST(JobStore, InsertDoesNotOverwrite) {
    JobStore store;
    EXPECT_TRUE(store.insert_if_absent(make_record("a", "100")));
    EXPECT_FALSE(store.insert_if_absent(make_record("a", "200")));
    EXPECT_EQ(store.lookup("a")->job_id, "100");
}

TEST(JobStore, ConcurrentInsertsDoNotLoseEntries) {
    JobStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kPerThread; i++) {
                std::string uid = "pod-" + std::to_string(t) + "-" + std::to_string(i);
                store.insert_if_absent(make_record(uid, std::to_string(i)));
                store.lookup(uid);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(JobStore, ConcurrentSameUidHasOneWinner) {
    JobStore store;
    std::vector<std::thread> threads;
    std::vector<int> won(16, 0);
    for (int t = 0; t < 16; t++) {
        threads.emplace_back([&store, &won, t]() {
            won[t] = store.insert_if_absent(make_record("shared", std::to_string(t))) ? 1 : 0;
        });
    }
    for (auto& th : threads) th.join();

    int winners = 0;
    for (int w : won) winners += w;
    EXPECT_EQ(winners, 1);
    EXPECT_EQ(store.size(), 1u);
}

TEST(JobStore, ReserveIsExclusive) {
    JobStore store;
    EXPECT_TRUE(store.try_reserve("a"));
    EXPECT_FALSE(store.try_reserve("a"));
    EXPECT_TRUE(store.reserved("a"));

    store.release("a");
    EXPECT_FALSE(store.reserved("a"));
    EXPECT_TRUE(store.try_reserve("a"));
}

TEST(JobStore, ReserveRefusesRecordedPod) {
    JobStore store;
    store.insert_if_absent(make_record("a", "100"));
    EXPECT_FALSE(store.try_reserve("a"));
    EXPECT_FALSE(store.reserved("a"));
}

TEST(JobStore, ConcurrentReserveHasOneWinner) {
    JobStore store;
    std::vector<std::thread> threads;
    std::vector<int> won(16, 0);
    for (int t = 0; t < 16; t++) {
        threads.emplace_back([&store, &won, t]() {
            won[t] = store.try_reserve("shared") ? 1 : 0;
        });
    }
    for (auto& th : threads) th.join();

    int winners = 0;
    for (int w : won) winners += w;
    EXPECT_EQ(winners, 1);
}

// ── Persistence ─────────────────────────────────────────────

class JobStoreFileTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = platform::temp_file("sidecar_store");
        fs::create_directories(root);
    }

    void TearDown() override {
        fs::remove_all(root);
    }
};

TEST_F(JobStoreFileTest, SaveAndLoadRecord) {
    auto path = root / JOB_RECORD_NAME;
    ASSERT_TRUE(JobStore::save_record(path, make_record("uid-1", "4711")).is_ok());

    auto loaded = JobStore::load_record(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.pod_uid, "uid-1");
    EXPECT_EQ(loaded.value.pod_namespace, "default");
    EXPECT_EQ(loaded.value.job_id, "4711");
    EXPECT_EQ(loaded.value.submit_time, "2025-01-15T10:00:00");
}

TEST_F(JobStoreFileTest, LoadFromSkipsBrokenRecords) {
    fs::create_directories(root / "default-a");
    fs::create_directories(root / "default-b");
    fs::create_directories(root / "default-c");
    fs::create_directories(root / "default-d");
    ASSERT_TRUE(JobStore::save_record(root / "default-a" / JOB_RECORD_NAME, make_record("a", "1")).is_ok());
    ASSERT_TRUE(JobStore::save_record(root / "default-b" / JOB_RECORD_NAME, make_record("b", "2")).is_ok());
    std::ofstream(root / "default-c" / JOB_RECORD_NAME) << "pod_uid: [broken\n";
    std::ofstream(root / "default-d" / JOB_RECORD_NAME) << "pod_uid: d\n";  // no job id
    std::ofstream(root / "stray.yaml") << "job_id: 9\n";

    JobStore store;
    EXPECT_EQ(store.load_from(root), 2);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.lookup("b")->job_id, "2");
}

TEST_F(JobStoreFileTest, LoadFromMissingRoot) {
    JobStore store;
    EXPECT_EQ(store.load_from(root / "nope"), 0);
}

TEST_F(JobStoreFileTest, SaveIntoMissingDirectoryFails) {
    auto r = JobStore::save_record(root / "missing" / JOB_RECORD_NAME, make_record("a", "1"));
    EXPECT_TRUE(r.is_err());
}
