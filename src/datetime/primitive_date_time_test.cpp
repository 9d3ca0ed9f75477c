#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <unordered_set>
#include "primitive_date_time.hpp"

using namespace wallclock;
using namespace std::chrono_literals;

namespace {
    PrimitiveDateTime at(std::int32_t year, Month month, std::uint8_t day, std::uint8_t hour, std::uint8_t minute,
                         std::uint8_t second = 0) {
        return {Date::fromCalendarDate(year, month, day), Time::fromHms(hour, minute, second)};
    }
}

TEST(PrimitiveDateTimeTest, Accessors) {
    auto dateTime = PrimitiveDateTime(Date::fromCalendarDate(2019, Month::January, 2), Time::fromHmsNano(3, 4, 5, 6));
    EXPECT_EQ(dateTime.year(), 2019);
    EXPECT_EQ(dateTime.month(), Month::January);
    EXPECT_EQ(dateTime.day(), 2);
    EXPECT_EQ(dateTime.ordinal(), 2);
    EXPECT_EQ(dateTime.hour(), 3);
    EXPECT_EQ(dateTime.minute(), 4);
    EXPECT_EQ(dateTime.second(), 5);
    EXPECT_EQ(dateTime.nanosecond(), 6u);
    EXPECT_EQ(dateTime.replaceTime(Time::MIDNIGHT), at(2019, Month::January, 2, 0, 0));
    EXPECT_EQ(dateTime.replaceDate(Date::MIN).date(), Date::MIN);
}

TEST(PrimitiveDateTimeTest, AddCarriesIntoDate) {
    EXPECT_EQ(at(2019, Month::December, 31, 23, 0) + Duration::hours(2), at(2020, Month::January, 1, 1, 0));
    EXPECT_EQ(at(2020, Month::January, 1, 0, 0, 1) + Duration::seconds(-2), at(2019, Month::December, 31, 23, 59, 59));
    EXPECT_EQ(at(2020, Month::February, 28, 12, 0) + Duration::days(1), at(2020, Month::February, 29, 12, 0));
    EXPECT_EQ(at(2020, Month::February, 28, 12, 0) + Duration::hours(36), at(2020, Month::March, 1, 0, 0));
}

TEST(PrimitiveDateTimeTest, SubCarriesIntoDate) {
    EXPECT_EQ(at(2020, Month::January, 1, 0, 0) - Duration::HOUR, at(2019, Month::December, 31, 23, 0));
    EXPECT_EQ(at(2020, Month::January, 1, 23, 0) - Duration::hours(-2), at(2020, Month::January, 2, 1, 0));
    EXPECT_EQ(at(2020, Month::March, 1, 0, 0) - Duration::hours(36), at(2020, Month::February, 28, 12, 0));
}

TEST(PrimitiveDateTimeTest, StdDurationUsesRolloverFlag) {
    EXPECT_EQ(at(2019, Month::December, 31, 23, 59, 59) + StdDuration(2s), at(2020, Month::January, 1, 0, 0, 1));
    EXPECT_EQ(at(2020, Month::January, 1, 0, 0, 1) - StdDuration(2s), at(2019, Month::December, 31, 23, 59, 59));
    EXPECT_EQ(at(2020, Month::January, 1, 12, 0) + StdDuration(49h), at(2020, Month::January, 3, 13, 0));
    EXPECT_EQ(at(2020, Month::January, 3, 13, 0) - StdDuration(49h), at(2020, Month::January, 1, 12, 0));
}

TEST(PrimitiveDateTimeTest, RangeExitIsReported) {
    EXPECT_EQ(PrimitiveDateTime::MAX.checkedAdd(Duration::NANOSECOND), std::nullopt);
    EXPECT_EQ(PrimitiveDateTime::MIN.checkedSub(Duration::NANOSECOND), std::nullopt);
    EXPECT_EQ(PrimitiveDateTime::MIN.checkedAdd(Duration::MIN), std::nullopt);
    EXPECT_THROW(PrimitiveDateTime::MAX + Duration::NANOSECOND, std::overflow_error);
    EXPECT_THROW(PrimitiveDateTime::MAX + StdDuration(1ns), std::overflow_error);
    EXPECT_THROW(PrimitiveDateTime::MIN - StdDuration(1ns), std::overflow_error);
    EXPECT_THROW(PrimitiveDateTime::MIN - Duration::DAY, std::overflow_error);
    EXPECT_EQ(PrimitiveDateTime::MAX.checkedSub(Duration::NANOSECOND)->time(), Time::fromHmsNano(23, 59, 59, 999999998));
}

TEST(PrimitiveDateTimeTest, CompoundAssignment) {
    auto dateTime = at(2021, Month::December, 31, 22, 0);
    dateTime += Duration::hours(3);
    EXPECT_EQ(dateTime, at(2022, Month::January, 1, 1, 0));
    dateTime -= StdDuration(2h);
    EXPECT_EQ(dateTime, at(2021, Month::December, 31, 23, 0));
    dateTime += StdDuration(1h);
    dateTime -= Duration::days(365);
    EXPECT_EQ(dateTime, at(2021, Month::January, 1, 0, 0));
}

TEST(PrimitiveDateTimeTest, Difference) {
    EXPECT_EQ(at(2020, Month::January, 2, 0, 0) - at(2020, Month::January, 1, 23, 0), Duration::HOUR);
    EXPECT_EQ(at(2020, Month::January, 1, 23, 0) - at(2020, Month::January, 2, 0, 0), -Duration::HOUR);
    EXPECT_EQ(at(2020, Month::March, 1, 12, 30) - at(2020, Month::February, 28, 12, 0), Duration::days(2) + Duration::minutes(30));
}

TEST(PrimitiveDateTimeTest, AddThenSubRestores) {
    auto start = at(2000, Month::February, 29, 23, 59, 59);
    const Duration durations[] = {
        Duration::SECOND, -Duration::SECOND, Duration::hours(49), Duration::days(-1000), Duration::milliseconds(86400500),
    };
    for (const auto &duration : durations) {
        EXPECT_EQ((start + duration) - duration, start) << duration;
        EXPECT_EQ((start + duration) - start, duration) << duration;
    }
}

TEST(PrimitiveDateTimeTest, OrderingAndDisplay) {
    EXPECT_LT(at(2019, Month::December, 31, 23, 59), at(2020, Month::January, 1, 0, 0));
    EXPECT_LT(at(2020, Month::January, 1, 0, 0), at(2020, Month::January, 1, 0, 1));
    EXPECT_EQ(at(2019, Month::January, 2, 3, 4, 5).toString(), "2019-01-02 3:04:05.0");
    EXPECT_EQ(PrimitiveDateTime::MAX.toString(), "9999-12-31 23:59:59.999999999");

    std::unordered_set<PrimitiveDateTime> values{at(2019, Month::January, 2, 3, 4), at(2019, Month::January, 2, 3, 4)};
    EXPECT_EQ(values.size(), 1u);
}
