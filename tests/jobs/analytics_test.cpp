#include "cloudsync/jobs/analytics.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using cloudsync::jobs::AnalyticsAggregator;
using cloudsync::jobs::RunOutcome;

TEST(AnalyticsTest, FirstSuccessTakesSpeedThenBlends) {
    AnalyticsAggregator analytics("");

    auto first = analytics.record("1", RunOutcome::Success, 1000, 100.0);
    EXPECT_EQ(first.success_count, 1u);
    EXPECT_EQ(first.total_bytes, 1000u);
    EXPECT_DOUBLE_EQ(first.avg_speed, 100.0);

    auto second = analytics.record("1", RunOutcome::Success, 500, 200.0);
    EXPECT_EQ(second.success_count, 2u);
    EXPECT_EQ(second.total_bytes, 1500u);
    EXPECT_DOUBLE_EQ(second.avg_speed, 0.7 * 100.0 + 0.3 * 200.0);
}

TEST(AnalyticsTest, ErrorOnlyCountsTheFailure) {
    AnalyticsAggregator analytics("");
    analytics.record("1", RunOutcome::Success, 1000, 50.0);

    auto after = analytics.record("1", RunOutcome::Error, 999, 999.0);
    EXPECT_EQ(after.error_count, 1u);
    EXPECT_EQ(after.success_count, 1u);
    EXPECT_EQ(after.total_bytes, 1000u);
    EXPECT_DOUBLE_EQ(after.avg_speed, 50.0);
}

TEST(AnalyticsTest, PersistsKeyedByJobAndRemoves) {
    auto root = cloudsync::test::create_temp_dir();
    {
        AnalyticsAggregator analytics(root / "analytics.json");
        analytics.record("a", RunOutcome::Success, 10, 1.0);
        analytics.record("b", RunOutcome::Error, 0, 0.0);
    }

    AnalyticsAggregator reloaded(root / "analytics.json");
    reloaded.load();
    ASSERT_TRUE(reloaded.get("a").has_value());
    EXPECT_EQ(reloaded.get("a")->total_bytes, 10u);
    EXPECT_EQ(reloaded.get("b")->error_count, 1u);
    EXPECT_EQ(reloaded.all().size(), 2u);

    EXPECT_TRUE(reloaded.remove("a"));
    EXPECT_FALSE(reloaded.remove("a"));
    EXPECT_FALSE(reloaded.get("a").has_value());

    fs::remove_all(root);
}
