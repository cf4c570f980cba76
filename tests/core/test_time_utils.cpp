#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <thread>
#include "rebalancer/core/time_utils.hpp"

using namespace rebalancer;
using namespace rebalancer::core;

class TimeUtilsTest : public ::testing::Test {
protected:
    static Timestamp utc(int year, int month, int day, int hour, int minute, int second = 0) {
        std::tm t{};
        t.tm_year = year - 1900;
        t.tm_mon = month - 1;
        t.tm_mday = day;
        t.tm_hour = hour;
        t.tm_min = minute;
        t.tm_sec = second;
        return std::chrono::system_clock::from_time_t(safe_timegm(&t));
    }

    static std::tm eastern(int year, int month, int day, int hour, int minute) {
        std::tm t{};
        t.tm_year = year - 1900;
        t.tm_mon = month - 1;
        t.tm_mday = day;
        t.tm_hour = hour;
        t.tm_min = minute;
        return t;
    }
};

TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeReturnsSamePointer) {
    std::time_t now = std::time(nullptr);
    std::tm result;
    EXPECT_EQ(safe_localtime(&now, &result), &result);
}

TEST_F(TimeUtilsTest, TimegmInvertsGmtime) {
    std::time_t original = 1709294400;  // 2024-03-01T12:00:00Z
    std::tm fields;
    safe_gmtime(&original, &fields);
    EXPECT_EQ(safe_timegm(&fields), original);
}

TEST_F(TimeUtilsTest, TimegmNormalizesOverflow) {
    std::tm fields = eastern(2024, 1, 31, 23, 90);
    std::time_t secs = safe_timegm(&fields);
    EXPECT_EQ(fields.tm_mon, 1);
    EXPECT_EQ(fields.tm_mday, 1);
    EXPECT_EQ(fields.tm_hour, 0);
    EXPECT_EQ(fields.tm_min, 30);
    EXPECT_EQ(std::chrono::system_clock::from_time_t(secs), utc(2024, 2, 1, 0, 30));
}

TEST_F(TimeUtilsTest, FormatIso8601) {
    EXPECT_EQ(format_iso8601(std::chrono::system_clock::from_time_t(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_iso8601(utc(2024, 3, 1, 12, 0)), "2024-03-01T12:00:00Z");

    Timestamp fractional = utc(2024, 3, 1, 12, 0) + std::chrono::milliseconds(250);
    EXPECT_EQ(format_iso8601(fractional), "2024-03-01T12:00:00.250000Z");
}

TEST_F(TimeUtilsTest, ParseIso8601Variants) {
    const Timestamp expected = utc(2024, 3, 1, 12, 0);

    auto zulu = parse_iso8601("2024-03-01T12:00:00Z");
    ASSERT_TRUE(zulu.is_ok());
    EXPECT_EQ(zulu.value(), expected);

    auto bare = parse_iso8601("2024-03-01T12:00:00");
    ASSERT_TRUE(bare.is_ok());
    EXPECT_EQ(bare.value(), expected);

    auto offset = parse_iso8601("2024-03-01T07:00:00-05:00");
    ASSERT_TRUE(offset.is_ok());
    EXPECT_EQ(offset.value(), expected);

    auto fraction = parse_iso8601("2024-03-01T12:00:00.5+00:00");
    ASSERT_TRUE(fraction.is_ok());
    EXPECT_EQ(fraction.value(), expected + std::chrono::milliseconds(500));
}

TEST_F(TimeUtilsTest, ParseIso8601RejectsGarbage) {
    for (const char* text : {"", "yesterday", "2024-03-01", "2024-03-01T12:00:00.Z",
                             "2024-03-01T12:00:00+0500", "2024-03-01T12:00:00 UTC"}) {
        auto parsed = parse_iso8601(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::CONVERSION_ERROR) << text;
    }
}

TEST_F(TimeUtilsTest, FormatThenParse) {
    Timestamp original = utc(2025, 12, 31, 23, 59, 59) + std::chrono::microseconds(123456);
    auto parsed = parse_iso8601(format_iso8601(original));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), original);
}

TEST_F(TimeUtilsTest, ParseAndFormatDate) {
    auto parsed = parse_date("2024-01-02");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().tm_year, 124);
    EXPECT_EQ(parsed.value().tm_mon, 0);
    EXPECT_EQ(parsed.value().tm_mday, 2);
    EXPECT_EQ(format_date(parsed.value()), "2024-01-02");

    EXPECT_TRUE(parse_date("02/01/2024").is_error());
}

TEST_F(TimeUtilsTest, WholeDaysTruncateTowardZero) {
    Timestamp start = utc(2024, 1, 1, 12, 0);
    EXPECT_EQ(whole_days_between(start, start), 0);
    EXPECT_EQ(whole_days_between(start, start + std::chrono::hours(23)), 0);
    EXPECT_EQ(whole_days_between(start, start + std::chrono::hours(36)), 1);
    EXPECT_EQ(whole_days_between(start, start + std::chrono::hours(72)), 3);
    EXPECT_EQ(whole_days_between(start, start - std::chrono::hours(36)), -1);
}

TEST_F(TimeUtilsTest, EasternDaylightSavingRule) {
    // 2024: starts Sunday March 10, ends Sunday November 3
    EXPECT_FALSE(is_us_eastern_dst(2024, 1, 15, 12));
    EXPECT_FALSE(is_us_eastern_dst(2024, 3, 9, 12));
    EXPECT_FALSE(is_us_eastern_dst(2024, 3, 10, 1));
    EXPECT_TRUE(is_us_eastern_dst(2024, 3, 10, 2));
    EXPECT_TRUE(is_us_eastern_dst(2024, 7, 4, 0));
    EXPECT_TRUE(is_us_eastern_dst(2024, 11, 3, 1));
    EXPECT_FALSE(is_us_eastern_dst(2024, 11, 3, 2));
    EXPECT_FALSE(is_us_eastern_dst(2024, 12, 25, 12));

    // 2025: March 9 and November 2
    EXPECT_TRUE(is_us_eastern_dst(2025, 3, 9, 3));
    EXPECT_FALSE(is_us_eastern_dst(2025, 3, 8, 23));
    EXPECT_FALSE(is_us_eastern_dst(2025, 11, 2, 3));
}

TEST_F(TimeUtilsTest, EasternToUtc) {
    EXPECT_EQ(eastern_to_utc(eastern(2024, 1, 2, 10, 30)), utc(2024, 1, 2, 15, 30));
    EXPECT_EQ(eastern_to_utc(eastern(2024, 7, 1, 10, 30)), utc(2024, 7, 1, 14, 30));
    // Out-of-range minutes are normalized before the offset is chosen
    EXPECT_EQ(eastern_to_utc(eastern(2024, 1, 2, 9, 90)), utc(2024, 1, 2, 15, 30));
}

TEST_F(TimeUtilsTest, UtcToEastern) {
    std::tm winter = utc_to_eastern(utc(2024, 1, 2, 15, 30));
    EXPECT_EQ(winter.tm_mday, 2);
    EXPECT_EQ(winter.tm_hour, 10);
    EXPECT_EQ(winter.tm_min, 30);

    std::tm summer = utc_to_eastern(utc(2024, 7, 1, 14, 30));
    EXPECT_EQ(summer.tm_hour, 10);

    // Late evening in New York is already the next day in UTC
    std::tm evening = utc_to_eastern(utc(2024, 1, 3, 2, 0));
    EXPECT_EQ(evening.tm_mday, 2);
    EXPECT_EQ(evening.tm_hour, 21);
}

TEST_F(TimeUtilsTest, UtcToEasternAcrossTransitions) {
    EXPECT_EQ(utc_to_eastern(utc(2024, 3, 10, 6, 59)).tm_hour, 1);
    EXPECT_EQ(utc_to_eastern(utc(2024, 3, 10, 7, 0)).tm_hour, 3);
    EXPECT_EQ(utc_to_eastern(utc(2024, 11, 3, 5, 30)).tm_hour, 1);
    EXPECT_EQ(utc_to_eastern(utc(2024, 11, 3, 6, 30)).tm_hour, 1);
    EXPECT_EQ(utc_to_eastern(utc(2024, 11, 3, 7, 30)).tm_hour, 2);
}

TEST_F(TimeUtilsTest, EasternDaysCountDateChanges) {
    // Same wall-clock time, a few hundred milliseconds earlier on the next day
    Timestamp monday = utc(2024, 1, 8, 15, 30) + std::chrono::milliseconds(800);
    Timestamp tuesday = utc(2024, 1, 9, 15, 30) + std::chrono::milliseconds(200);
    EXPECT_EQ(whole_days_between(monday, tuesday), 0);
    EXPECT_EQ(eastern_days_between(monday, tuesday), 1);

    EXPECT_EQ(eastern_days_between(monday, monday + std::chrono::hours(8)), 0);
    // 02:00 UTC on Wednesday is Tuesday evening in New York
    EXPECT_EQ(eastern_days_between(monday, utc(2024, 1, 10, 2, 0)), 1);
    EXPECT_EQ(eastern_days_between(tuesday, monday), -1);
}

TEST_F(TimeUtilsTest, EasternDaysAcrossDaylightSavingChanges) {
    EXPECT_EQ(eastern_days_between(utc(2024, 3, 8, 15, 30), utc(2024, 3, 11, 14, 30)), 3);
    EXPECT_EQ(eastern_days_between(utc(2024, 11, 1, 14, 30), utc(2024, 11, 4, 15, 30)), 3);
}

TEST_F(TimeUtilsTest, NextEasternMidnight) {
    EXPECT_EQ(next_eastern_midnight(utc(2024, 1, 8, 15, 30)), utc(2024, 1, 9, 5, 0));
    EXPECT_EQ(next_eastern_midnight(utc(2024, 7, 1, 14, 30)), utc(2024, 7, 2, 4, 0));
    // Saturday before the spring change: Sunday starts in standard time
    EXPECT_EQ(next_eastern_midnight(utc(2024, 3, 9, 15, 0)), utc(2024, 3, 10, 5, 0));
    EXPECT_EQ(next_eastern_midnight(utc(2024, 12, 31, 23, 0)), utc(2025, 1, 1, 5, 0));
}

TEST_F(TimeUtilsTest, WaitUntilPastDeadlineReturnsImmediately) {
    std::atomic<bool> stop{false};
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(wait_until(std::chrono::system_clock::now() - std::chrono::seconds(1),
                           std::chrono::milliseconds(1000), stop));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));
}

TEST_F(TimeUtilsTest, WaitUntilReachesNearDeadline) {
    std::atomic<bool> stop{false};
    Timestamp deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(30);
    EXPECT_TRUE(wait_until(deadline, std::chrono::milliseconds(5), stop));
    EXPECT_GE(std::chrono::system_clock::now(), deadline);
}

TEST_F(TimeUtilsTest, WaitUntilStopsWhenRaised) {
    std::atomic<bool> stop{false};
    std::thread stopper([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.store(true);
    });

    auto start = std::chrono::steady_clock::now();
    bool reached = wait_until(std::chrono::system_clock::now() + std::chrono::hours(1),
                              std::chrono::milliseconds(5), stop);
    stopper.join();

    EXPECT_FALSE(reached);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
