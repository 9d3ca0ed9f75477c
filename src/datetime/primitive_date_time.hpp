#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "../date/date.hpp"
#include "../time/time.hpp"

namespace wallclock {

    /// @brief A Date and a Time without any UTC offset.
    class PrimitiveDateTime {
        private:
            Date dates;
            Time times;

        public:
            static const PrimitiveDateTime MIN;
            static const PrimitiveDateTime MAX;

            PrimitiveDateTime(Date date, Time time) noexcept : dates(date), times(time) {}

            Date date() const noexcept { return dates; }
            Time time() const noexcept { return times; }

            std::int32_t year() const noexcept { return dates.year(); }
            Month month() const noexcept { return dates.month(); }
            std::uint8_t day() const noexcept { return dates.day(); }
            std::uint16_t ordinal() const noexcept { return dates.ordinal(); }
            std::uint8_t hour() const noexcept { return times.hour(); }
            std::uint8_t minute() const noexcept { return times.minute(); }
            std::uint8_t second() const noexcept { return times.second(); }
            std::uint32_t nanosecond() const noexcept { return times.nanosecond(); }

            PrimitiveDateTime replaceDate(Date date) const noexcept { return {date, times}; }
            PrimitiveDateTime replaceTime(Time time) const noexcept { return {dates, time}; }

            /// @brief Shifts the date by the whole days of the duration and the time by the rest,
            /// carrying a midnight crossing into the date.
            /// @return empty if the result is outside the supported date range
            std::optional<PrimitiveDateTime> checkedAdd(Duration duration) const noexcept;
            std::optional<PrimitiveDateTime> checkedSub(Duration duration) const noexcept;

            std::string toString() const;

            PrimitiveDateTime &operator+=(Duration duration);
            PrimitiveDateTime &operator+=(StdDuration duration);
            PrimitiveDateTime &operator-=(Duration duration);
            PrimitiveDateTime &operator-=(StdDuration duration);

            bool operator==(const PrimitiveDateTime &) const = default;
            std::strong_ordering operator<=>(const PrimitiveDateTime &) const = default;
    };

    /// @throws std::overflow_error if the result is outside the supported date range
    PrimitiveDateTime operator+(PrimitiveDateTime dateTime, Duration duration);
    PrimitiveDateTime operator+(PrimitiveDateTime dateTime, StdDuration duration);
    PrimitiveDateTime operator-(PrimitiveDateTime dateTime, Duration duration);
    PrimitiveDateTime operator-(PrimitiveDateTime dateTime, StdDuration duration);

    Duration operator-(PrimitiveDateTime lhs, PrimitiveDateTime rhs);

    std::ostream &operator<<(std::ostream &os, const PrimitiveDateTime &dateTime);
}

template <>
struct std::hash<wallclock::PrimitiveDateTime> {
    std::size_t operator()(const wallclock::PrimitiveDateTime &dateTime) const noexcept {
        std::size_t seed = std::hash<wallclock::Date>{}(dateTime.date());
        seed ^= std::hash<wallclock::Time>{}(dateTime.time()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};
