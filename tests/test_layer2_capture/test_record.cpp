/**
 * @file test_record.cpp
 * @brief Layer 2 tests for the captured Record type.
 */
#include "utils/record.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace logtest::utils;
using namespace ::testing;

TEST(RecordTest, AccessorsReturnWhatWasCaptured)
{
    const Record rec("hello", Level::L_WARN, "net::conn", {{"peer", "\"10.0.0.1\""}});

    EXPECT_EQ(rec.args(), "hello");
    EXPECT_EQ(rec.level(), Level::L_WARN);
    EXPECT_EQ(rec.target(), "net::conn");
    EXPECT_THAT(rec.key_values(), ElementsAre(Pair("peer", "\"10.0.0.1\"")));
}

TEST(RecordTest, EqualityComparesAllParts)
{
    const Record base("msg", Level::L_INFO, "t", {{"a", "1"}, {"b", "2"}});

    EXPECT_EQ(base, Record("msg", Level::L_INFO, "t", {{"b", "2"}, {"a", "1"}}));
    EXPECT_NE(base, Record("other", Level::L_INFO, "t", {{"a", "1"}, {"b", "2"}}));
    EXPECT_NE(base, Record("msg", Level::L_DEBUG, "t", {{"a", "1"}, {"b", "2"}}));
    EXPECT_NE(base, Record("msg", Level::L_INFO, "u", {{"a", "1"}, {"b", "2"}}));
    EXPECT_NE(base, Record("msg", Level::L_INFO, "t", {{"a", "1"}}));
    EXPECT_NE(base, Record("msg", Level::L_INFO, "t", {{"a", "1"}, {"b", "3"}}));
}

TEST(RecordTest, FormatsWithoutKeyValues)
{
    const Record rec("hello", Level::L_INFO, "app", {});
    EXPECT_EQ(fmt::format("{}", rec), R"(Record { level: INFO, target: "app", args: "hello" })");
}

TEST(RecordTest, FormatsWithKeyValues)
{
    const Record rec("hi", Level::L_ERROR, "app", {{"color", "\"blue\""}});
    EXPECT_EQ(fmt::format("{}", rec),
              R"(Record { level: ERROR, target: "app", args: "hi", key_values: { color: "blue" } })");
}

TEST(RecordTest, PrintsReadablyInAssertions)
{
    const Record rec("x", Level::L_TRACE, "t", {});
    EXPECT_EQ(::testing::PrintToString(rec), fmt::format("{}", rec));
}
