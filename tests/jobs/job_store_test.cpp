#include "cloudsync/jobs/job_store.hpp"
#include "cloudsync/jobs/json.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace cloudsync;
using namespace cloudsync::jobs;

class JobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = test::create_temp_dir();
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    fs::path root_;
};

TEST_F(JobStoreTest, MissingFileIsEmpty) {
    JobStore store(root_ / "jobs.json");
    EXPECT_TRUE(store.load().empty());
}

TEST_F(JobStoreTest, SaveThenLoadKeepsFields) {
    Job job;
    job.id = "1700000000000";
    job.name = "Photos";
    job.source = "/home/me/photos";
    job.destination = "remote1:backup/photos";
    job.interval_minutes = 15;
    job.status = JobStatus::Error;
    job.last_error = "Sync failed";
    job.last_run = from_epoch_millis(1700000000123);
    job.pending_changes = 1;
    job.diff_status = DiffStatus::Different;

    JobStore store(root_ / "nested" / "jobs.json");
    ASSERT_TRUE(store.save({job}).is_ok());

    auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    const auto& back = loaded[0];
    EXPECT_EQ(back.id, job.id);
    EXPECT_EQ(back.destination, job.destination);
    EXPECT_EQ(back.interval_minutes, 15);
    EXPECT_EQ(back.status, JobStatus::Error);
    EXPECT_EQ(back.last_error, "Sync failed");
    ASSERT_TRUE(back.last_run.has_value());
    EXPECT_EQ(to_epoch_millis(*back.last_run), 1700000000123);
    EXPECT_EQ(back.pending_changes, 1);
    EXPECT_EQ(back.diff_status, DiffStatus::Different);
}

TEST_F(JobStoreTest, UsesCamelCaseKeys) {
    Job job;
    job.id = "1";
    job.timeout_seconds = 45;

    JobStore store(root_ / "jobs.json");
    ASSERT_TRUE(store.save({job}).is_ok());

    auto doc = nlohmann::json::parse(test::read_text(root_ / "jobs.json"));
    ASSERT_TRUE(doc.is_array());
    EXPECT_EQ(doc[0]["intervalMinutes"], 60);
    EXPECT_EQ(doc[0]["timeout"], 45);
    EXPECT_TRUE(doc[0]["lastError"].is_null());
    EXPECT_FALSE(doc[0].contains("analytics"));
}

TEST_F(JobStoreTest, RunningJobsComeBackIdle) {
    Job job;
    job.id = "1";
    job.status = JobStatus::Running;
    job.speed = 1234.0;
    job.diff_status = DiffStatus::Checking;

    JobStore store(root_ / "jobs.json");
    ASSERT_TRUE(store.save({job}).is_ok());

    auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].status, JobStatus::Idle);
    EXPECT_DOUBLE_EQ(loaded[0].speed, 0.0);
    EXPECT_EQ(loaded[0].diff_status, DiffStatus::Unknown);
}

TEST_F(JobStoreTest, CorruptFileIsEmptyAndRecordsWithoutIdAreSkipped) {
    test::write_file(root_ / "jobs.json", "{ definitely not");
    JobStore store(root_ / "jobs.json");
    EXPECT_TRUE(store.load().empty());

    test::write_file(root_ / "jobs.json", R"([{"name": "no id"}, {"id": "2", "bytesTransferred": 12.0}])");
    auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "2");
    EXPECT_EQ(loaded[0].bytes_transferred, 12u);
}
