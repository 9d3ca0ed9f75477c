#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include "../duration/duration.hpp"

namespace wallclock {

    inline constexpr std::int32_t MIN_YEAR = -9999;
    inline constexpr std::int32_t MAX_YEAR = 9999;

    enum class Month : std::uint8_t {
        January = 1,
        February,
        March,
        April,
        May,
        June,
        July,
        August,
        September,
        October,
        November,
        December,
    };

    /// @brief Proleptic Gregorian leap year rule.
    constexpr bool isLeapYear(std::int32_t year) noexcept {
        return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
    }

    constexpr std::uint16_t daysInYear(std::int32_t year) noexcept {
        return isLeapYear(year) ? 366 : 365;
    }

    constexpr std::uint8_t daysInYearMonth(std::int32_t year, Month month) noexcept {
        switch (month) {
            case Month::February:
                return isLeapYear(year) ? 29 : 28;
            case Month::April:
            case Month::June:
            case Month::September:
            case Month::November:
                return 30;
            default:
                return 31;
        }
    }

    /// @brief Calendar date in the proleptic Gregorian calendar, years -9999 through 9999.
    class Date {
        private:
            std::int32_t years;
            std::uint16_t ordinals;

            constexpr Date(std::int32_t year, std::uint16_t ordinal) noexcept : years(year), ordinals(ordinal) {}
            static Date fromJulianDayUnchecked(std::int32_t julianDay) noexcept;

        public:
            /// @brief -9999-01-01
            static const Date MIN;
            /// @brief 9999-12-31
            static const Date MAX;

            /// @throws ComponentRangeError if the year is out of range or the day does not exist in the month
            static Date fromCalendarDate(std::int64_t year, Month month, std::int64_t day);
            /// @throws ComponentRangeError if the year is out of range or the ordinal exceeds the year length
            static Date fromOrdinalDate(std::int64_t year, std::int64_t ordinal);
            /// @brief Julian day 0 is -4713-11-24; the supported range is -1'930'999 through 5'373'484.
            static Date fromJulianDay(std::int64_t julianDay);

            std::int32_t year() const noexcept { return years; }
            Month month() const noexcept;
            std::uint8_t day() const noexcept;
            /// @brief Day of the year, 1-based.
            std::uint16_t ordinal() const noexcept { return ordinals; }
            std::tuple<std::int32_t, Month, std::uint8_t> toCalendarDate() const noexcept;
            std::int32_t toJulianDay() const noexcept;

            /// @return empty for MAX
            std::optional<Date> nextDay() const noexcept;
            /// @return empty for MIN
            std::optional<Date> previousDay() const noexcept;

            /// @brief Only whole days of the duration are taken into account.
            std::optional<Date> checkedAdd(Duration duration) const noexcept;
            std::optional<Date> checkedSub(Duration duration) const noexcept;

            std::string toString() const;

            Date &operator+=(Duration duration);
            Date &operator+=(StdDuration duration);
            Date &operator-=(Duration duration);
            Date &operator-=(StdDuration duration);

            bool operator==(const Date &) const = default;
            std::strong_ordering operator<=>(const Date &) const = default;
    };

    /// @throws std::overflow_error if the result leaves the supported range
    Date operator+(Date date, Duration duration);
    Date operator+(Date date, StdDuration duration);
    Date operator-(Date date, Duration duration);
    Date operator-(Date date, StdDuration duration);

    /// @brief Number of days between the dates, as a Duration.
    Duration operator-(Date lhs, Date rhs) noexcept;

    std::ostream &operator<<(std::ostream &os, const Date &date);
    std::ostream &operator<<(std::ostream &os, Month month);
}

template <>
struct std::hash<wallclock::Date> {
    std::size_t operator()(const wallclock::Date &date) const noexcept {
        return std::hash<std::int32_t>{}(date.toJulianDay());
    }
};
