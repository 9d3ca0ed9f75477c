#include <gtest/gtest.h>
#include <cstdlib>
#include "env.hpp"

using namespace wallclock;

TEST(GetFromEnvTest, ReadsTypedValues) {
    setenv("WALLCLOCK_TEST_INT", "-42", 1);
    setenv("WALLCLOCK_TEST_BOOL", "TRUE", 1);
    setenv("WALLCLOCK_TEST_TEXT", "12:30", 1);

    EXPECT_EQ(getFromEnv<int>("WALLCLOCK_TEST_INT", true), -42);
    EXPECT_TRUE(getFromEnv<bool>("WALLCLOCK_TEST_BOOL", true));
    EXPECT_STREQ(getFromEnv<const char*>("WALLCLOCK_TEST_TEXT", true), "12:30");

    setenv("WALLCLOCK_TEST_BOOL", "0", 1);
    EXPECT_FALSE(getFromEnv<bool>("WALLCLOCK_TEST_BOOL", false, true));

    unsetenv("WALLCLOCK_TEST_INT");
    unsetenv("WALLCLOCK_TEST_BOOL");
    unsetenv("WALLCLOCK_TEST_TEXT");
}

TEST(GetFromEnvTest, FallsBackToDefault) {
    unsetenv("WALLCLOCK_TEST_MISSING");
    EXPECT_EQ(getFromEnv<unsigned>("WALLCLOCK_TEST_MISSING", false, 7u), 7u);
    EXPECT_STREQ(getFromEnv<const char*>("WALLCLOCK_TEST_MISSING", false, "0"), "0");
}

TEST(GetFromEnvDeathTest, ExitsOnMissingRequired) {
    unsetenv("WALLCLOCK_TEST_MISSING");
    EXPECT_EXIT(getFromEnv<int>("WALLCLOCK_TEST_MISSING", true), testing::ExitedWithCode(1), "not found");
}

TEST(GetFromEnvDeathTest, ExitsOnInvalidInteger) {
    setenv("WALLCLOCK_TEST_INT", "12abc", 1);
    EXPECT_EXIT(getFromEnv<int>("WALLCLOCK_TEST_INT", true), testing::ExitedWithCode(1), "not a valid integer");
    unsetenv("WALLCLOCK_TEST_INT");
}
