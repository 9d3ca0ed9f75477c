#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "cascade.hpp"
#include "checked.hpp"
#include "units.hpp"

using namespace wallclock;

TEST(CascadeTest, InRangeValueIsUntouched) {
    int seconds = 59;
    int minutes = 10;
    ASSERT_EQ(cascade(seconds, 0, 60, minutes), 0);
    ASSERT_EQ(seconds, 59);
    ASSERT_EQ(minutes, 10);
}

TEST(CascadeTest, OverflowCarriesIntoNextField) {
    std::int32_t nanoseconds = 1500000000;
    std::int8_t seconds = 3;
    ASSERT_EQ(cascade(nanoseconds, 0, static_cast<std::int32_t>(NANOSECONDS_IN_SECOND), seconds), 1);
    ASSERT_EQ(nanoseconds, 500000000);
    ASSERT_EQ(seconds, 4);
}

TEST(CascadeTest, UnderflowBorrowsFromNextField) {
    int minutes = -1;
    int hours = 0;
    ASSERT_EQ(cascade(minutes, 0, 60, hours), -1);
    ASSERT_EQ(minutes, 59);
    ASSERT_EQ(hours, -1);
}

TEST(CascadeTest, UpperBoundIsExclusive) {
    int seconds = 60;
    int minutes = 0;
    ASSERT_EQ(cascade(seconds, 0, 60, minutes), 1);
    ASSERT_EQ(seconds, 0);
    ASSERT_EQ(minutes, 1);
}

TEST(CascadeTest, UnsignedFieldsCarry) {
    std::uint32_t nanoseconds = 1999999999u;
    std::uint8_t seconds = 59;
    ASSERT_EQ(cascade(nanoseconds, 0u, 1000000000u, seconds), 1);
    ASSERT_EQ(nanoseconds, 999999999u);
    ASSERT_EQ(seconds, 60);
}

TEST(CascadeTest, NonZeroMinimum) {
    int ordinal = 0;
    int year = 2020;
    ASSERT_EQ(cascade(ordinal, 1, 367, year), -1);
    ASSERT_EQ(ordinal, 366);
    ASSERT_EQ(year, 2019);
}

TEST(CascadeTest, SingleStepOnly) {
    int seconds = 150;
    int minutes = 0;
    cascade(seconds, 0, 60, minutes);
    ASSERT_EQ(seconds, 90);
    ASSERT_EQ(minutes, 1);
}

TEST(CheckedArithmeticTest, AddDetectsOverflow) {
    std::int64_t out = 7;
    ASSERT_TRUE(checkedAdd(1, 2, out));
    ASSERT_EQ(out, 3);
    ASSERT_FALSE(checkedAdd(std::numeric_limits<std::int64_t>::max(), 1, out));
    ASSERT_FALSE(checkedAdd(std::numeric_limits<std::int64_t>::min(), -1, out));
    ASSERT_EQ(out, 3);
}

TEST(CheckedArithmeticTest, SubDetectsOverflow) {
    std::int64_t out = 0;
    ASSERT_TRUE(checkedSub(-5, 10, out));
    ASSERT_EQ(out, -15);
    ASSERT_FALSE(checkedSub(std::numeric_limits<std::int64_t>::min(), 1, out));
    ASSERT_FALSE(checkedSub(0, std::numeric_limits<std::int64_t>::min(), out));
}

TEST(CheckedArithmeticTest, MulDetectsOverflow) {
    std::int64_t out = 0;
    ASSERT_TRUE(checkedMul(-4, 25, out));
    ASSERT_EQ(out, -100);
    ASSERT_TRUE(checkedMul(std::numeric_limits<std::int64_t>::min(), 1, out));
    ASSERT_EQ(out, std::numeric_limits<std::int64_t>::min());
    ASSERT_FALSE(checkedMul(std::numeric_limits<std::int64_t>::min(), -1, out));
    ASSERT_FALSE(checkedMul(std::numeric_limits<std::int64_t>::max() / 2 + 1, 2, out));
}
