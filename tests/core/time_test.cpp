#include "cloudsync/core/time.hpp"

#include <gtest/gtest.h>

using namespace cloudsync;

TEST(TimeTest, FormatsUtcWithMilliseconds) {
    auto tp = from_epoch_millis(1700000000123);
    EXPECT_EQ(to_iso8601(tp), "2023-11-14T22:13:20.123Z");
}

TEST(TimeTest, ParsesWhatItFormats) {
    auto tp = from_epoch_millis(1700000000123);
    auto parsed = parse_iso8601(to_iso8601(tp));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(to_epoch_millis(parsed.value()), 1700000000123);
}

TEST(TimeTest, AcceptsMissingFractionAndSuffix) {
    auto parsed = parse_iso8601("2023-11-14T22:13:20");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(to_epoch_millis(parsed.value()), 1700000000000);

    auto short_fraction = parse_iso8601("2023-11-14T22:13:20.5Z");
    ASSERT_TRUE(short_fraction.is_ok());
    EXPECT_EQ(to_epoch_millis(short_fraction.value()), 1700000000500);
}

TEST(TimeTest, RejectsGarbage) {
    auto parsed = parse_iso8601("yesterday");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Parse);

    EXPECT_TRUE(parse_iso8601("2023-11-14T22:13:20+02:00").is_error());
}
