#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include "../duration/duration.hpp"
#include "../utils/date_adjustment.hpp"

namespace wallclock {

    /// @brief The clock time within a given date, with nanosecond precision.
    ///
    /// All minutes are assumed to have exactly 60 seconds; leap seconds are not represented.
    /// When comparing two Times, they are assumed to be in the same calendar date.
    class Time {
        private:
            std::uint8_t hours;
            std::uint8_t minutes;
            std::uint8_t seconds;
            std::uint32_t nanoseconds;

            /// @brief Builds a Time without validation; the caller guarantees every field is in range.
            constexpr Time(std::uint8_t hour, std::uint8_t minute, std::uint8_t second, std::uint32_t nanosecond) noexcept
                : hours(hour), minutes(minute), seconds(second), nanoseconds(nanosecond) {}

        public:
            /// @brief 00:00:00.0
            static const Time MIDNIGHT;
            /// @brief Smallest representable value, same as MIDNIGHT.
            static const Time MIN;
            /// @brief 23:59:59.999999999
            static const Time MAX;

            /// @brief Midnight.
            constexpr Time() noexcept : hours(0), minutes(0), seconds(0), nanoseconds(0) {}

            /// @brief Components are taken wide so that negative or oversized arguments reach validation intact.
            /// @throws ComponentRangeError unless 0 <= hour <= 23, 0 <= minute <= 59 and 0 <= second <= 59
            static Time fromHms(std::int64_t hour, std::int64_t minute, std::int64_t second);
            /// @throws ComponentRangeError additionally unless 0 <= millisecond <= 999
            static Time fromHmsMilli(std::int64_t hour, std::int64_t minute, std::int64_t second, std::int64_t millisecond);
            /// @throws ComponentRangeError additionally unless 0 <= microsecond <= 999'999
            static Time fromHmsMicro(std::int64_t hour, std::int64_t minute, std::int64_t second, std::int64_t microsecond);
            /// @throws ComponentRangeError additionally unless 0 <= nanosecond <= 999'999'999
            static Time fromHmsNano(std::int64_t hour, std::int64_t minute, std::int64_t second, std::int64_t nanosecond);

            std::tuple<std::uint8_t, std::uint8_t, std::uint8_t> asHms() const noexcept {
                return {hours, minutes, seconds};
            }
            std::tuple<std::uint8_t, std::uint8_t, std::uint8_t, std::uint16_t> asHmsMilli() const noexcept {
                return {hours, minutes, seconds, millisecond()};
            }
            std::tuple<std::uint8_t, std::uint8_t, std::uint8_t, std::uint32_t> asHmsMicro() const noexcept {
                return {hours, minutes, seconds, microsecond()};
            }
            std::tuple<std::uint8_t, std::uint8_t, std::uint8_t, std::uint32_t> asHmsNano() const noexcept {
                return {hours, minutes, seconds, nanoseconds};
            }

            std::uint8_t hour() const noexcept { return hours; }
            std::uint8_t minute() const noexcept { return minutes; }
            std::uint8_t second() const noexcept { return seconds; }
            std::uint16_t millisecond() const noexcept {
                return static_cast<std::uint16_t>(nanoseconds / NANOSECONDS_IN_MILLISECOND);
            }
            std::uint32_t microsecond() const noexcept {
                return static_cast<std::uint32_t>(nanoseconds / NANOSECONDS_IN_MICROSECOND);
            }
            std::uint32_t nanosecond() const noexcept { return nanoseconds; }

            /// @brief Adds the sub-day part of the duration, wrapping at midnight.
            /// @return whether the result lies on the next or previous day, and the new time
            std::pair<DateAdjustment, Time> adjustingAdd(Duration duration) const noexcept;
            /// @brief Subtracts the sub-day part of the duration, wrapping at midnight.
            std::pair<DateAdjustment, Time> adjustingSub(Duration duration) const noexcept;
            /// @brief Adds the sub-day part of the unsigned duration.
            /// @return true as first element when the result lies on the next day
            std::pair<bool, Time> adjustingAddStd(StdDuration duration) const noexcept;
            /// @brief Subtracts the sub-day part of the unsigned duration.
            /// @return true as first element when the result lies on the previous day
            std::pair<bool, Time> adjustingSubStd(StdDuration duration) const noexcept;

            /// @throws ComponentRangeError unless 0 <= hour <= 23
            Time replaceHour(std::int64_t hour) const;
            Time replaceMinute(std::int64_t minute) const;
            Time replaceSecond(std::int64_t second) const;
            /// @brief Replaces the whole fractional second.
            Time replaceMillisecond(std::int64_t millisecond) const;
            Time replaceMicrosecond(std::int64_t microsecond) const;
            Time replaceNanosecond(std::int64_t nanosecond) const;

            /// @brief Formats as H:MM:SS.f with the shortest fraction that keeps every non-zero digit.
            std::string toString() const;

            Time &operator+=(Duration duration) noexcept;
            Time &operator+=(StdDuration duration) noexcept;
            Time &operator-=(Duration duration) noexcept;
            Time &operator-=(StdDuration duration) noexcept;

            bool operator==(const Time &) const = default;
            std::strong_ordering operator<=>(const Time &) const = default;
    };

    /// @brief Wraps around midnight, the day change is discarded.
    Time operator+(Time time, Duration duration) noexcept;
    Time operator+(Time time, StdDuration duration) noexcept;
    Time operator-(Time time, Duration duration) noexcept;
    Time operator-(Time time, StdDuration duration) noexcept;

    /// @brief Signed distance between two times of the same calendar day.
    Duration operator-(Time lhs, Time rhs) noexcept;

    std::ostream &operator<<(std::ostream &os, const Time &time);
}

template <>
struct std::hash<wallclock::Time> {
    std::size_t operator()(const wallclock::Time &time) const noexcept {
        std::uint64_t packed = (static_cast<std::uint64_t>(time.hour()) << 48)
                             | (static_cast<std::uint64_t>(time.minute()) << 40)
                             | (static_cast<std::uint64_t>(time.second()) << 32)
                             | time.nanosecond();
        return std::hash<std::uint64_t>{}(packed);
    }
};
