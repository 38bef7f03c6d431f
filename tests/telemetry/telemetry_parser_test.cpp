#include "cloudsync/telemetry/telemetry_parser.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace cloudsync;
using namespace cloudsync::telemetry;
using namespace std::chrono_literals;

namespace {

std::string stats_line(std::uint64_t bytes, std::uint64_t total_bytes,
                       std::uint64_t transfers = 0, std::uint64_t total_transfers = 0,
                       nlohmann::json extra = nlohmann::json::object()) {
    nlohmann::json stats = {
        {"bytes", bytes},
        {"totalBytes", total_bytes},
        {"transfers", transfers},
        {"totalTransfers", total_transfers}
    };
    stats.update(extra);
    return nlohmann::json{{"level", "info"}, {"msg", "stats"}, {"stats", stats}}.dump();
}

jobs::Job running_job() {
    jobs::Job job;
    job.id = "job-1";
    job.status = jobs::JobStatus::Running;
    return job;
}

} // namespace

TEST(TelemetryParserTest, CopiesCountersAndComputesProgress) {
    TelemetryParser parser;
    auto job = running_job();

    ASSERT_TRUE(parser.apply_line(job, stats_line(250, 1000, 1, 4)));
    EXPECT_EQ(job.bytes_transferred, 250u);
    EXPECT_EQ(job.total_bytes, 1000u);
    EXPECT_EQ(job.files_transferred, 1u);
    EXPECT_EQ(job.total_files, 4u);
    EXPECT_DOUBLE_EQ(job.progress, 25.0);
}

TEST(TelemetryParserTest, ProgressFallsBackToFileRatio) {
    TelemetryParser parser;
    auto job = running_job();

    parser.apply_line(job, stats_line(0, 0, 2, 3));
    EXPECT_DOUBLE_EQ(job.progress, 67.0);

    parser.apply_line(job, stats_line(0, 0, 0, 0));
    EXPECT_DOUBLE_EQ(job.progress, 0.0);
}

TEST(TelemetryParserTest, IgnoresNonStatsAndMalformedLines) {
    TelemetryParser parser;
    auto job = running_job();
    job.progress = 12.0;

    EXPECT_FALSE(parser.apply_line(job, "2024/01/01 INFO  : a.txt: Copied (new)"));
    EXPECT_FALSE(parser.apply_line(job, R"({"level":"info","msg":"no stats here"})"));
    EXPECT_FALSE(parser.apply_line(job, R"({"stats": 12})"));
    EXPECT_FALSE(parser.apply_line(job, R"({"stats":{"bytes":)"));
    EXPECT_DOUBLE_EQ(job.progress, 12.0);
    EXPECT_EQ(job.status, jobs::JobStatus::Running);
}

TEST(TelemetryParserTest, EtaUsesCompactUnits) {
    TelemetryParser parser;
    auto job = running_job();

    parser.apply_line(job, stats_line(1, 10, 0, 0, {{"eta", 125}}));
    EXPECT_EQ(job.eta, "2m 5s");

    parser.apply_line(job, stats_line(2, 10, 0, 0, {{"eta", nullptr}}));
    EXPECT_EQ(job.eta, "2m 5s");
}

TEST(TelemetryParserTest, TransferListDrivesCurrentFile) {
    TelemetryParser parser;
    auto job = running_job();

    nlohmann::json transferring = nlohmann::json::array({
        {{"name", "photos/a.jpg"}, {"size", 2048}, {"bytes", 1024}, {"percentage", 50}, {"speed", 10.5}, {"speedAvg", 9.0}, {"eta", 3}},
        {{"name", "photos/b.jpg"}, {"size", 100}, {"bytes", 0}}
    });
    parser.apply_line(job, stats_line(1024, 4096, 0, 2, {{"transferring", transferring}}));

    ASSERT_EQ(job.transferring.size(), 2u);
    EXPECT_EQ(job.transferring[0].percentage, 50.0);
    EXPECT_DOUBLE_EQ(job.transferring[0].speed_avg, 9.0);
    ASSERT_TRUE(job.current_file.has_value());
    EXPECT_EQ(*job.current_file, "photos/a.jpg");
    EXPECT_EQ(job.current_file_size, 2048u);
    EXPECT_EQ(job.current_file_bytes, 1024u);

    parser.apply_line(job, stats_line(4096, 4096, 2, 2, {{"transferring", nlohmann::json::array()}}));
    EXPECT_TRUE(job.transferring.empty());
    EXPECT_FALSE(job.current_file.has_value());
}

TEST(SpeedSmootherTest, FirstSamplePrimesAndReportsZero) {
    TelemetryParser parser;
    auto job = running_job();
    job.speed = 5000.0;

    parser.apply_line(job, stats_line(1'000'000, 0), SteadyClock::time_point{} + 10s);
    EXPECT_DOUBLE_EQ(job.speed, 0.0);
}

TEST(SpeedSmootherTest, BlendsSamplesAtLeastTwoSecondsApart) {
    SpeedSmoother smoother;
    auto t0 = SteadyClock::time_point{} + 100s;

    EXPECT_DOUBLE_EQ(smoother.sample("j", 0, 0.0, t0), 0.0);

    // 3 MiB over 3 s = 1 MiB/s raw
    double first = smoother.sample("j", 3 * 1024 * 1024, 0.0, t0 + 3s);
    EXPECT_DOUBLE_EQ(first, 0.4 * 1024 * 1024);

    // Under 2 s later: no recompute, previous value carried
    EXPECT_DOUBLE_EQ(smoother.sample("j", 10 * 1024 * 1024, first, t0 + 4s), first);

    // Measured from the t0+3s sample: 3 MiB over 3 s
    double second = smoother.sample("j", 6 * 1024 * 1024, first, t0 + 6s);
    EXPECT_DOUBLE_EQ(second, 0.6 * first + 0.4 * 1024 * 1024);
}

TEST(SpeedSmootherTest, ClampsImplausibleRates) {
    SpeedSmoother smoother;
    auto t0 = SteadyClock::time_point{} + 100s;
    smoother.sample("j", 0, 0.0, t0);

    double speed = smoother.sample("j", 10ULL * 1024 * 1024 * 1024, 0.0, t0 + 2s);
    EXPECT_DOUBLE_EQ(speed, 0.4 * SpeedSmoother::kMaxPlausibleSpeed);
}

TEST(SpeedSmootherTest, FloorsIdleSpeedToZero) {
    SpeedSmoother smoother;
    auto t0 = SteadyClock::time_point{} + 100s;
    smoother.sample("j", 0, 0.0, t0);

    EXPECT_DOUBLE_EQ(smoother.sample("j", 1000, 0.0, t0 + 2s), 0.0);
}

TEST(SpeedSmootherTest, ResetStartsOver) {
    SpeedSmoother smoother;
    auto t0 = SteadyClock::time_point{} + 100s;
    smoother.sample("j", 0, 0.0, t0);
    smoother.reset("j");
    EXPECT_DOUBLE_EQ(smoother.sample("j", 50'000'000, 123456.0, t0 + 5s), 0.0);
}

TEST(TelemetryParserTest, LastSpeedTracksSmoothedSpeed) {
    TelemetryParser parser;
    auto job = running_job();
    auto t0 = SteadyClock::time_point{} + 100s;

    parser.apply_line(job, stats_line(0, 100'000'000), t0);
    parser.apply_line(job, stats_line(20'000'000, 100'000'000), t0 + 2s);
    EXPECT_DOUBLE_EQ(job.speed, 0.4 * 10'000'000);
    EXPECT_DOUBLE_EQ(job.last_speed, job.speed);
}

TEST(ProgressThrottleTest, LimitsEmissionsPerJob) {
    ProgressThrottle throttle(200ms);
    auto t0 = SteadyClock::time_point{} + 1s;

    EXPECT_TRUE(throttle.should_emit("a", t0));
    EXPECT_FALSE(throttle.should_emit("a", t0 + 150ms));
    EXPECT_TRUE(throttle.should_emit("b", t0 + 150ms));
    EXPECT_TRUE(throttle.should_emit("a", t0 + 200ms));

    throttle.reset("a");
    EXPECT_TRUE(throttle.should_emit("a", t0 + 250ms));
}
