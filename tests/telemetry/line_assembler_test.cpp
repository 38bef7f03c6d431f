#include "cloudsync/telemetry/line_assembler.hpp"

#include <gtest/gtest.h>

using cloudsync::telemetry::LineAssembler;

TEST(LineAssemblerTest, SplitsCompleteLines) {
    LineAssembler assembler;
    auto lines = assembler.feed("one\ntwo\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_TRUE(assembler.pending().empty());
}

TEST(LineAssemblerTest, HoldsFragmentAcrossChunks) {
    LineAssembler assembler;
    EXPECT_TRUE(assembler.feed(R"({"stats":{"by)").empty());
    EXPECT_EQ(assembler.pending(), R"({"stats":{"by)");

    auto lines = assembler.feed("tes\":1}}\n{\"level\"");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], R"({"stats":{"bytes":1}})");
    EXPECT_EQ(assembler.pending(), R"({"level")");
}

TEST(LineAssemblerTest, DropsBlankLinesAndCarriageReturns) {
    LineAssembler assembler;
    auto lines = assembler.feed("a\r\n\n   \nb\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
}

TEST(LineAssemblerTest, FlushReturnsTrailingText) {
    LineAssembler assembler;
    assembler.feed("done\npartial");
    EXPECT_EQ(assembler.flush(), "partial");
    EXPECT_TRUE(assembler.pending().empty());
    EXPECT_EQ(assembler.flush(), "");
}
