#include "cloudsync/process/rclone.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace cloudsync;
using namespace cloudsync::process;

namespace {

std::string value_after(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

} // namespace

TEST(RcloneArgsTest, SyncArgsCarryJobSettings) {
    jobs::Job job;
    job.source = "/data/photos";
    job.destination = "remote1:backup/photos";
    job.concurrency = 4;
    job.retries = 3;
    job.timeout_seconds = 45;

    RcloneSettings settings;
    auto args = sync_args(job, settings);

    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[0], "sync");
    EXPECT_EQ(args[1], "/data/photos");
    EXPECT_EQ(args[2], "remote1:backup/photos");
    EXPECT_EQ(value_after(args, "--transfers"), "4");
    EXPECT_EQ(value_after(args, "--checkers"), "16");
    EXPECT_EQ(value_after(args, "--retries"), "3");
    EXPECT_EQ(value_after(args, "--timeout"), "45s");
    EXPECT_EQ(value_after(args, "--stats"), "1s");
    EXPECT_NE(std::find(args.begin(), args.end(), "--use-json-log"), args.end());
    EXPECT_EQ(std::count(args.begin(), args.end(), "--exclude"), 4);
}

TEST(RcloneArgsTest, CheckersScaleWithConcurrency) {
    jobs::Job job;
    job.concurrency = 12;
    EXPECT_EQ(value_after(sync_args(job, RcloneSettings{}), "--checkers"), "24");
}

TEST(RcloneArgsTest, AuxiliaryCommands) {
    jobs::Job job;
    job.source = "/a";
    job.destination = "r:b";
    EXPECT_EQ(check_args(job), (std::vector<std::string>{"check", "/a", "r:b", "--one-way", "--quiet"}));
    EXPECT_EQ(probe_args("remote1"), (std::vector<std::string>{"lsd", "remote1:", "--max-depth", "0"}));
    EXPECT_EQ(about_args("backup:"), (std::vector<std::string>{"about", "backup:", "--json", "--timeout", "30s"}));
    EXPECT_EQ(mkdir_args("r:b"), (std::vector<std::string>{"mkdir", "r:b"}));
}

TEST(RcloneLocatorTest, RemoteNames) {
    EXPECT_EQ(remote_name("remote1:backup"), "remote1");
    EXPECT_EQ(remote_name("gdrive:"), "gdrive");
    EXPECT_FALSE(remote_name("/home/me/photos").has_value());
    EXPECT_TRUE(is_local_path("/home/me/photos"));
    EXPECT_FALSE(is_local_path("remote1:backup"));
}

TEST(RcloneParseTest, ListRemotes) {
    auto remotes = parse_remotes("backup:      s3\ngdrive:      drive\n\nbare:\n");
    ASSERT_EQ(remotes.size(), 3u);
    EXPECT_EQ(remotes[0].name, "backup");
    EXPECT_EQ(remotes[0].type, "s3");
    EXPECT_EQ(remotes[1].type, "drive");
    EXPECT_EQ(remotes[2].name, "bare");
    EXPECT_EQ(remotes[2].type, "unknown");
}

TEST(RcloneParseTest, AboutQuota) {
    auto quota = parse_about(R"({"total": 1000, "used": 333, "free": 667})");
    ASSERT_TRUE(quota.is_ok());
    EXPECT_EQ(quota.value().total, 1000u);
    EXPECT_EQ(quota.value().used, 333u);
    EXPECT_EQ(quota.value().free, 667u);
    EXPECT_EQ(quota.value().percent, 33);

    EXPECT_TRUE(parse_about(R"({"used": 5})").is_error());
    EXPECT_TRUE(parse_about("Total: 1 GiB").is_error());
}
