#include <gtest/gtest.h>
#include "util/interval.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"
#include "util/u8.hpp"

using namespace mfsync::util;
using namespace std::chrono_literals;

TEST(DurationTest, SingleUnits) {
    EXPECT_EQ(parseDuration("250ms"), 250ms);
    EXPECT_EQ(parseDuration("90s"), 90s);
    EXPECT_EQ(parseDuration("5m"), 5min);
    EXPECT_EQ(parseDuration("2h"), 2h);
    EXPECT_EQ(parseDuration("1d"), 24h);
    EXPECT_EQ(parseDuration("0s"), 0ms);
}

TEST(DurationTest, CompoundForms) {
    EXPECT_EQ(parseDuration("1h 30m"), 90min);
    EXPECT_EQ(parseDuration("2m30s"), 150s);
    EXPECT_EQ(parseDuration(" 1 hour 2 minutes "), 62min);
    EXPECT_EQ(parseDuration("1.5s"), 1500ms);
}

TEST(DurationTest, ClockForm) {
    EXPECT_EQ(parseDuration("00:01:30"), 90s);
    EXPECT_EQ(parseDuration("1 day 02:00:00"), 26h);
}

TEST(DurationTest, Rejects) {
    EXPECT_THROW(parseDuration(""), std::invalid_argument);
    EXPECT_THROW(parseDuration("10"), std::invalid_argument);
    EXPECT_THROW(parseDuration("10 parsecs"), std::invalid_argument);
    EXPECT_THROW(parseDuration("fast"), std::invalid_argument);
}

TEST(DurationTest, ToString) {
    EXPECT_EQ(intervalToString(500ms), "500ms");
    EXPECT_EQ(intervalToString(90s), "1m30s");
    EXPECT_EQ(intervalToString(26h), "1d2h");
}

TEST(TimestampTest, UnixForm) {
    EXPECT_EQ(parseSyncFrom("@0"), 0);
    EXPECT_EQ(parseSyncFrom("@1700000000"), 1'700'000'000);
    EXPECT_THROW(parseSyncFrom("@"), std::invalid_argument);
    EXPECT_THROW(parseSyncFrom("@12abc"), std::invalid_argument);
}

TEST(TimestampTest, CalendarForms) {
    EXPECT_EQ(parseSyncFrom("2023-11-14T22:13:20Z"), 1'700'000'000);
    EXPECT_EQ(parseSyncFrom("2023-11-14T22:13:20"), 1'700'000'000);
    EXPECT_EQ(parseSyncFrom("2023-11-14 22:13:20"), 1'700'000'000);
    EXPECT_EQ(parseSyncFrom("2023-11-14"), 1'699'920'000);
}

TEST(TimestampTest, Rejects) {
    EXPECT_THROW(parseSyncFrom(""), std::invalid_argument);
    EXPECT_THROW(parseSyncFrom("last tuesday"), std::invalid_argument);
    EXPECT_THROW(parseSyncFrom("2023-11-14T22:13:20Z junk"), std::invalid_argument);
}

TEST(TimestampTest, Formatting) {
    EXPECT_EQ(timestampToString(1'700'000'000), "2023-11-14T22:13:20Z");
    EXPECT_EQ(toSyncFromString(1'700'000'000), "@1700000000");
}

TEST(PortTest, Range) {
    EXPECT_EQ(parsePort("5001"), 5001);
    EXPECT_EQ(parsePort("65535"), 65535);
    EXPECT_THROW(parsePort("0"), std::invalid_argument);
    EXPECT_THROW(parsePort("65536"), std::invalid_argument);
    EXPECT_THROW(parsePort("-1"), std::invalid_argument);
    EXPECT_THROW(parsePort(""), std::invalid_argument);
}

TEST(Utf8Test, Validation) {
    EXPECT_TRUE(isValidUtf8("plain.txt"));
    EXPECT_TRUE(isValidUtf8("r\xc3\xa9sum\xc3\xa9.pdf"));
    EXPECT_FALSE(isValidUtf8("bad\xff.txt"));
    EXPECT_FALSE(isValidUtf8("\xc3"));
}
