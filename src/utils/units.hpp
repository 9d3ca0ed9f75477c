#pragma once
#include <cstdint>

namespace wallclock {

    /// @brief Constant for nanoseconds per second.
    inline constexpr std::int64_t NANOSECONDS_IN_SECOND = 1000000000L;
    inline constexpr std::int64_t NANOSECONDS_IN_MILLISECOND = 1000000L;
    inline constexpr std::int64_t NANOSECONDS_IN_MICROSECOND = 1000L;
    inline constexpr std::int64_t MICROSECONDS_IN_SECOND = 1000000L;
    inline constexpr std::int64_t MICROSECONDS_IN_MILLISECOND = 1000L;
    inline constexpr std::int64_t MILLISECONDS_IN_SECOND = 1000L;

    inline constexpr std::int64_t SECONDS_IN_MINUTE = 60;
    inline constexpr std::int64_t SECONDS_IN_HOUR = 3600;
    inline constexpr std::int64_t SECONDS_IN_DAY = 86400;
    inline constexpr std::int64_t SECONDS_IN_WEEK = 604800;
    inline constexpr std::int64_t MINUTES_IN_HOUR = 60;
    inline constexpr std::int64_t HOURS_IN_DAY = 24;
}
