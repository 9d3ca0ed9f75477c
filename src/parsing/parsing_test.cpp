#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "parsing.hpp"

using namespace wallclock;

TEST(ParseTimeTest, AcceptsAllLayouts) {
    Time time;
    ASSERT_EQ(parseTime("9:05", time), ParseStatus::Ok);
    EXPECT_EQ(time, Time::fromHms(9, 5, 0));
    ASSERT_EQ(parseTime("23:59:59", time), ParseStatus::Ok);
    EXPECT_EQ(time, Time::fromHms(23, 59, 59));
    ASSERT_EQ(parseTime("00:00:00.5", time), ParseStatus::Ok);
    EXPECT_EQ(time, Time::fromHmsMilli(0, 0, 0, 500));
    ASSERT_EQ(parseTime("1:02:03.000000004", time), ParseStatus::Ok);
    EXPECT_EQ(time, Time::fromHmsNano(1, 2, 3, 4));
}

TEST(ParseTimeTest, RoundTripsDisplay) {
    const Time times[] = {Time::MIDNIGHT, Time::MAX, Time::fromHmsMicro(12, 0, 0, 120), Time::fromHmsMilli(7, 8, 9, 10)};
    for (const auto &expected : times) {
        Time parsed;
        ASSERT_EQ(parseTime(expected.toString(), parsed), ParseStatus::Ok) << expected;
        EXPECT_EQ(parsed, expected);
    }
}

TEST(ParseTimeTest, RejectsMalformed) {
    Time time = Time::fromHms(1, 1, 1);
    EXPECT_EQ(parseTime("", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("123:00", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12:5", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12:30:", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12:30.5", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12:30:00.", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12:30:00.1234567890", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("12:30:00 ", time), ParseStatus::Malformed);
    EXPECT_EQ(parseTime("-1:30", time), ParseStatus::Malformed);
    EXPECT_EQ(time, Time::fromHms(1, 1, 1));
}

TEST(ParseTimeTest, RejectsOutOfRange) {
    Time time;
    EXPECT_EQ(parseTime("24:00", time), ParseStatus::OutOfRange);
    EXPECT_EQ(parseTime("12:60", time), ParseStatus::OutOfRange);
    EXPECT_EQ(parseTime("12:00:60", time), ParseStatus::OutOfRange);
    EXPECT_EQ(time, Time::MIDNIGHT);
}

TEST(ParseDateTest, AcceptsDates) {
    Date date = Date::MIN;
    ASSERT_EQ(parseDate("2020-02-29", date), ParseStatus::Ok);
    EXPECT_EQ(date, Date::fromCalendarDate(2020, Month::February, 29));
    ASSERT_EQ(parseDate("-0001-03-04", date), ParseStatus::Ok);
    EXPECT_EQ(date, Date::fromCalendarDate(-1, Month::March, 4));
    ASSERT_EQ(parseDate(Date::MAX.toString(), date), ParseStatus::Ok);
    EXPECT_EQ(date, Date::MAX);
}

TEST(ParseDateTest, RejectsBadDates) {
    Date date = Date::MIN;
    EXPECT_EQ(parseDate("2020-2-29", date), ParseStatus::Malformed);
    EXPECT_EQ(parseDate("20200229", date), ParseStatus::Malformed);
    EXPECT_EQ(parseDate("12020-01-01", date), ParseStatus::Malformed);
    EXPECT_EQ(parseDate("2021-02-29", date), ParseStatus::OutOfRange);
    EXPECT_EQ(parseDate("2021-13-01", date), ParseStatus::OutOfRange);
    EXPECT_EQ(parseDate("2021-00-10", date), ParseStatus::OutOfRange);
    EXPECT_EQ(date, Date::MIN);
}

TEST(ParseDurationTest, AcceptsSignedSeconds) {
    Duration duration;
    ASSERT_EQ(parseDuration("0", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::ZERO);
    ASSERT_EQ(parseDuration("7200", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::hours(2));
    ASSERT_EQ(parseDuration("-90.5", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::milliseconds(-90500));
    ASSERT_EQ(parseDuration("-0.000000001", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, -Duration::NANOSECOND);
    ASSERT_EQ(parseDuration("9223372036854775807", duration), ParseStatus::Ok);
    EXPECT_EQ(duration.wholeSeconds(), 9223372036854775807LL);
}

TEST(ParseDurationTest, AcceptsMostNegativeSeconds) {
    Duration duration;
    ASSERT_EQ(parseDuration("-9223372036854775808", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::seconds(std::numeric_limits<std::int64_t>::min()));
    ASSERT_EQ(parseDuration("-9223372036854775808.999999999", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::MIN);
    ASSERT_EQ(parseDuration("9223372036854775807.999999999", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::MAX);
    ASSERT_EQ(parseDuration("-0", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::ZERO);
    ASSERT_EQ(parseDuration("0000000000000000000042", duration), ParseStatus::Ok);
    EXPECT_EQ(duration, Duration::seconds(42));
}

TEST(ParseDurationTest, RejectsBadDurations) {
    Duration duration = Duration::SECOND;
    EXPECT_EQ(parseDuration("", duration), ParseStatus::Malformed);
    EXPECT_EQ(parseDuration("-", duration), ParseStatus::Malformed);
    EXPECT_EQ(parseDuration("1h", duration), ParseStatus::Malformed);
    EXPECT_EQ(parseDuration("+5", duration), ParseStatus::Malformed);
    EXPECT_EQ(parseDuration("1.", duration), ParseStatus::Malformed);
    EXPECT_EQ(parseDuration("9223372036854775808", duration), ParseStatus::OutOfRange);
    EXPECT_EQ(parseDuration("-9223372036854775809", duration), ParseStatus::OutOfRange);
    EXPECT_EQ(parseDuration("18446744073709551616", duration), ParseStatus::OutOfRange);
    EXPECT_EQ(parseDuration("-123456789012345678901234567890", duration), ParseStatus::OutOfRange);
    EXPECT_EQ(duration, Duration::SECOND);
}
