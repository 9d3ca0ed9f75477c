#include <array>
#include <format>
#include <stdexcept>
#include "date.hpp"
#include "../error/component_range.hpp"
#include "../utils/cascade.hpp"

using namespace wallclock;

namespace {
    constexpr std::int32_t MIN_JULIAN_DAY = -1930999;
    constexpr std::int32_t MAX_JULIAN_DAY = 5373484;

    /// Days before the first of each month, common years first.
    constexpr std::array<std::array<std::uint16_t, 12>, 2> DAYS_BEFORE_MONTH = {{
        {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334},
        {0, 31, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335},
    }};

    constexpr const char *MONTH_NAMES[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December",
    };

    constexpr std::int64_t floorDiv(std::int64_t lhs, std::int64_t rhs) noexcept {
        std::int64_t quotient = lhs / rhs;
        if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
            --quotient;
        }
        return quotient;
    }

    std::pair<Month, std::uint8_t> monthDay(std::int32_t year, std::uint16_t ordinal) noexcept {
        const auto &days = DAYS_BEFORE_MONTH[isLeapYear(year) ? 1 : 0];
        std::size_t index = days.size() - 1;
        while (index > 0 && ordinal <= days[index]) {
            --index;
        }
        return {static_cast<Month>(index + 1), static_cast<std::uint8_t>(ordinal - days[index])};
    }
}

const Date Date::MIN{MIN_YEAR, 1};
const Date Date::MAX{MAX_YEAR, 365};

Date Date::fromCalendarDate(std::int64_t year, Month month, std::int64_t day) {
    ensureInRange("year", year, MIN_YEAR, MAX_YEAR);
    ensureInRange("month", static_cast<std::int64_t>(month), 1, 12);
    const auto checkedYear = static_cast<std::int32_t>(year);
    ensureInConditionalRange("day", day, 1, daysInYearMonth(checkedYear, month));
    const auto &days = DAYS_BEFORE_MONTH[isLeapYear(checkedYear) ? 1 : 0];
    return Date(checkedYear, static_cast<std::uint16_t>(days[static_cast<std::size_t>(month) - 1] + day));
}

Date Date::fromOrdinalDate(std::int64_t year, std::int64_t ordinal) {
    ensureInRange("year", year, MIN_YEAR, MAX_YEAR);
    const auto checkedYear = static_cast<std::int32_t>(year);
    ensureInConditionalRange("ordinal", ordinal, 1, daysInYear(checkedYear));
    return Date(checkedYear, static_cast<std::uint16_t>(ordinal));
}

Date Date::fromJulianDay(std::int64_t julianDay) {
    ensureInRange("julian_day", julianDay, MIN_JULIAN_DAY, MAX_JULIAN_DAY);
    return fromJulianDayUnchecked(static_cast<std::int32_t>(julianDay));
}

Date Date::fromJulianDayUnchecked(std::int32_t julianDay) noexcept {
    // Counts from 0000-03-01 so that the leap day closes each cycle.
    const std::int64_t z = static_cast<std::int64_t>(julianDay) - 1721119;
    const std::int64_t g = 100 * z - 25;
    const std::int64_t a = g / 3652425;
    const std::int64_t b = a - a / 4;
    std::int32_t year = static_cast<std::int32_t>(floorDiv(100 * b + g, 36525));
    std::int32_t ordinal = static_cast<std::int32_t>(b + z - floorDiv(36525 * static_cast<std::int64_t>(year), 100));

    if (isLeapYear(year)) {
        ordinal += 60;
        cascade(ordinal, 1, 367, year);
    } else {
        ordinal += 59;
        cascade(ordinal, 1, 366, year);
    }
    return Date(year, static_cast<std::uint16_t>(ordinal));
}

Month Date::month() const noexcept {
    return monthDay(years, ordinals).first;
}

std::uint8_t Date::day() const noexcept {
    return monthDay(years, ordinals).second;
}

std::tuple<std::int32_t, Month, std::uint8_t> Date::toCalendarDate() const noexcept {
    auto [month, day] = monthDay(years, ordinals);
    return {years, month, day};
}

std::int32_t Date::toJulianDay() const noexcept {
    const std::int64_t year = static_cast<std::int64_t>(years) - 1;
    return static_cast<std::int32_t>(ordinals + 365 * year + floorDiv(year, 4) - floorDiv(year, 100)
                                     + floorDiv(year, 400) + 1721425);
}

std::optional<Date> Date::nextDay() const noexcept {
    if (ordinals < daysInYear(years)) {
        return Date(years, static_cast<std::uint16_t>(ordinals + 1));
    }
    if (years == MAX_YEAR) {
        return std::nullopt;
    }
    return Date(years + 1, 1);
}

std::optional<Date> Date::previousDay() const noexcept {
    if (ordinals > 1) {
        return Date(years, static_cast<std::uint16_t>(ordinals - 1));
    }
    if (years == MIN_YEAR) {
        return std::nullopt;
    }
    return Date(years - 1, daysInYear(years - 1));
}

std::optional<Date> Date::checkedAdd(Duration duration) const noexcept {
    const std::int64_t wholeDays = duration.wholeDays();
    if (wholeDays < MIN_JULIAN_DAY - MAX_JULIAN_DAY || wholeDays > MAX_JULIAN_DAY - MIN_JULIAN_DAY) {
        return std::nullopt;
    }
    const std::int64_t julianDay = toJulianDay() + wholeDays;
    if (julianDay < MIN_JULIAN_DAY || julianDay > MAX_JULIAN_DAY) {
        return std::nullopt;
    }
    return fromJulianDayUnchecked(static_cast<std::int32_t>(julianDay));
}

std::optional<Date> Date::checkedSub(Duration duration) const noexcept {
    const std::int64_t wholeDays = duration.wholeDays();
    if (wholeDays < MIN_JULIAN_DAY - MAX_JULIAN_DAY || wholeDays > MAX_JULIAN_DAY - MIN_JULIAN_DAY) {
        return std::nullopt;
    }
    const std::int64_t julianDay = toJulianDay() - wholeDays;
    if (julianDay < MIN_JULIAN_DAY || julianDay > MAX_JULIAN_DAY) {
        return std::nullopt;
    }
    return fromJulianDayUnchecked(static_cast<std::int32_t>(julianDay));
}

std::string Date::toString() const {
    auto [year, month, day] = toCalendarDate();
    return std::format("{:0{}}-{:02}-{:02}", year, year < 0 ? 5 : 4, static_cast<unsigned>(month),
                       static_cast<unsigned>(day));
}

Date &Date::operator+=(Duration duration) {
    *this = *this + duration;
    return *this;
}

Date &Date::operator+=(StdDuration duration) {
    *this = *this + duration;
    return *this;
}

Date &Date::operator-=(Duration duration) {
    *this = *this - duration;
    return *this;
}

Date &Date::operator-=(StdDuration duration) {
    *this = *this - duration;
    return *this;
}

Date wallclock::operator+(Date date, Duration duration) {
    auto result = date.checkedAdd(duration);
    if (!result) {
        throw std::overflow_error("overflow adding duration to date");
    }
    return *result;
}

Date wallclock::operator+(Date date, StdDuration duration) {
    const std::uint64_t wholeDays = asSecs(duration) / static_cast<std::uint64_t>(SECONDS_IN_DAY);
    if (wholeDays > static_cast<std::uint64_t>(MAX_JULIAN_DAY - date.toJulianDay())) {
        throw std::overflow_error("overflow adding duration to date");
    }
    return Date::fromJulianDay(date.toJulianDay() + static_cast<std::int32_t>(wholeDays));
}

Date wallclock::operator-(Date date, Duration duration) {
    auto result = date.checkedSub(duration);
    if (!result) {
        throw std::overflow_error("overflow subtracting duration from date");
    }
    return *result;
}

Date wallclock::operator-(Date date, StdDuration duration) {
    const std::uint64_t wholeDays = asSecs(duration) / static_cast<std::uint64_t>(SECONDS_IN_DAY);
    if (wholeDays > static_cast<std::uint64_t>(date.toJulianDay() - MIN_JULIAN_DAY)) {
        throw std::overflow_error("overflow subtracting duration from date");
    }
    return Date::fromJulianDay(date.toJulianDay() - static_cast<std::int32_t>(wholeDays));
}

Duration wallclock::operator-(Date lhs, Date rhs) noexcept {
    return Duration::seconds(static_cast<std::int64_t>(lhs.toJulianDay() - rhs.toJulianDay()) * SECONDS_IN_DAY);
}

std::ostream &wallclock::operator<<(std::ostream &os, const Date &date) {
    return os << date.toString();
}

std::ostream &wallclock::operator<<(std::ostream &os, Month month) {
    const auto index = static_cast<std::size_t>(month);
    if (index < 1 || index > 12) {
        return os << index;
    }
    return os << MONTH_NAMES[index - 1];
}
