#pragma once
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <time.h>
#include "../utils/units.hpp"

namespace wallclock {

    class Time;

    /// @brief Unsigned span of time as provided by the platform. Cannot represent negative spans.
    using StdDuration = std::chrono::duration<std::uint64_t, std::nano>;

    /// @brief Number of whole seconds in the unsigned duration.
    constexpr std::uint64_t asSecs(StdDuration duration) noexcept {
        return duration.count() / static_cast<std::uint64_t>(NANOSECONDS_IN_SECOND);
    }

    /// @brief Nanoseconds past the last whole second, always below 1'000'000'000.
    constexpr std::uint32_t subsecNanos(StdDuration duration) noexcept {
        return static_cast<std::uint32_t>(duration.count() % static_cast<std::uint64_t>(NANOSECONDS_IN_SECOND));
    }

    /// @brief Signed span of time with nanosecond precision.
    ///
    /// Stored as whole seconds plus a nanosecond remainder. Both parts always share the same sign
    /// and the remainder magnitude stays below one second.
    class Duration {
        private:
            std::int64_t secs;
            std::int32_t nanos;

            struct Unchecked {};
            constexpr Duration(std::int64_t seconds, std::int32_t nanoseconds, Unchecked) noexcept
                : secs(seconds), nanos(nanoseconds) {}

            friend Duration operator-(Time lhs, Time rhs) noexcept;

        public:
            static const Duration ZERO;
            static const Duration NANOSECOND;
            static const Duration MICROSECOND;
            static const Duration MILLISECOND;
            static const Duration SECOND;
            static const Duration MINUTE;
            static const Duration HOUR;
            static const Duration DAY;
            static const Duration WEEK;
            /// @brief Adding any negative duration to MIN overflows.
            static const Duration MIN;
            /// @brief Adding any positive duration to MAX overflows.
            static const Duration MAX;

            constexpr Duration() noexcept : secs(0), nanos(0) {}

            /// @brief Creates a duration from seconds and nanoseconds. Nanoseconds of any magnitude
            /// are folded into the seconds and the signs of both parts are harmonized.
            /// @throws std::overflow_error if the seconds overflow
            Duration(std::int64_t seconds, std::int32_t nanoseconds);

            static Duration weeks(std::int64_t weeks);
            static Duration days(std::int64_t days);
            static Duration hours(std::int64_t hours);
            static Duration minutes(std::int64_t minutes);
            static Duration seconds(std::int64_t seconds) noexcept;
            static Duration milliseconds(std::int64_t milliseconds) noexcept;
            static Duration microseconds(std::int64_t microseconds) noexcept;
            static Duration nanoseconds(std::int64_t nanoseconds) noexcept;

            static Duration fromStd(StdDuration duration) noexcept;
            /// @brief Normalizes any timespec, including one with a negative tv_nsec.
            /// @throws std::overflow_error if the value does not fit
            static Duration fromTimespec(const timespec &ts);

            bool isZero() const noexcept { return secs == 0 && nanos == 0; }
            bool isNegative() const noexcept { return secs < 0 || nanos < 0; }
            bool isPositive() const noexcept { return secs > 0 || nanos > 0; }

            /// @brief Absolute value, saturating at MAX.
            Duration abs() const noexcept;
            /// @brief Absolute value as an unsigned duration.
            /// @throws std::range_error if the magnitude exceeds the unsigned duration range (about 584 years)
            StdDuration unsignedAbs() const;

            std::int64_t wholeWeeks() const noexcept { return secs / SECONDS_IN_WEEK; }
            std::int64_t wholeDays() const noexcept { return secs / SECONDS_IN_DAY; }
            std::int64_t wholeHours() const noexcept { return secs / SECONDS_IN_HOUR; }
            std::int64_t wholeMinutes() const noexcept { return secs / SECONDS_IN_MINUTE; }
            std::int64_t wholeSeconds() const noexcept { return secs; }

            /// @brief Always in the range -1'000..1'000.
            std::int16_t subsecMilliseconds() const noexcept {
                return static_cast<std::int16_t>(nanos / NANOSECONDS_IN_MILLISECOND);
            }
            /// @brief Always in the range -1'000'000..1'000'000.
            std::int32_t subsecMicroseconds() const noexcept {
                return static_cast<std::int32_t>(nanos / NANOSECONDS_IN_MICROSECOND);
            }
            /// @brief Always in the range -1'000'000'000..1'000'000'000.
            std::int32_t subsecNanoseconds() const noexcept { return nanos; }

            std::optional<Duration> checkedAdd(Duration rhs) const noexcept;
            std::optional<Duration> checkedSub(Duration rhs) const noexcept;
            std::optional<Duration> checkedMul(std::int32_t rhs) const noexcept;
            /// @return empty when rhs is zero or the result overflows
            std::optional<Duration> checkedDiv(std::int32_t rhs) const noexcept;
            std::optional<Duration> checkedNeg() const noexcept;

            Duration saturatingAdd(Duration rhs) const noexcept;
            Duration saturatingSub(Duration rhs) const noexcept;
            Duration saturatingMul(std::int32_t rhs) const noexcept;

            /// @throws std::range_error if the duration is negative or exceeds the unsigned duration range
            StdDuration toStd() const;
            /// @brief Converts to a timespec with tv_nsec in [0, 1'000'000'000).
            /// @throws std::range_error if a negative sub-second part would borrow below the minimum tv_sec
            timespec toTimespec() const;

            /// @brief Full-precision rendering such as "1d2h3m4s5ms6µs7ns", or "0s".
            std::string toString() const;

            Duration operator-() const;
            Duration &operator+=(Duration rhs);
            Duration &operator-=(Duration rhs);
            Duration &operator*=(std::int32_t rhs);

            bool operator==(const Duration &) const = default;
            std::strong_ordering operator<=>(const Duration &) const = default;
    };

    Duration operator+(Duration lhs, Duration rhs);
    Duration operator-(Duration lhs, Duration rhs);
    Duration operator*(Duration lhs, std::int32_t rhs);
    Duration operator*(std::int32_t lhs, Duration rhs);
    Duration operator/(Duration lhs, std::int32_t rhs);

    std::ostream &operator<<(std::ostream &os, const Duration &duration);
}
