#include <format>
#include "time.hpp"
#include "../error/component_range.hpp"
#include "../utils/cascade.hpp"

using namespace wallclock;

namespace {
    constexpr std::int32_t NANOS_PER_SECOND = static_cast<std::int32_t>(NANOSECONDS_IN_SECOND);
    constexpr std::int32_t SECONDS_PER_MINUTE = static_cast<std::int32_t>(SECONDS_IN_MINUTE);
    constexpr std::int32_t MINUTES_PER_HOUR = static_cast<std::int32_t>(MINUTES_IN_HOUR);
    constexpr std::int32_t HOURS_PER_DAY = static_cast<std::int32_t>(HOURS_IN_DAY);
}

const Time Time::MIDNIGHT{0, 0, 0, 0};
const Time Time::MIN{0, 0, 0, 0};
const Time Time::MAX{23, 59, 59, 999999999};

Time Time::fromHms(std::int64_t hour, std::int64_t minute, std::int64_t second) {
    return fromHmsNano(hour, minute, second, 0);
}

Time Time::fromHmsMilli(std::int64_t hour, std::int64_t minute, std::int64_t second, std::int64_t millisecond) {
    ensureInRange("millisecond", millisecond, 0, MILLISECONDS_IN_SECOND - 1);
    return fromHmsNano(hour, minute, second, millisecond * NANOSECONDS_IN_MILLISECOND);
}

Time Time::fromHmsMicro(std::int64_t hour, std::int64_t minute, std::int64_t second, std::int64_t microsecond) {
    ensureInRange("microsecond", microsecond, 0, MICROSECONDS_IN_SECOND - 1);
    return fromHmsNano(hour, minute, second, microsecond * NANOSECONDS_IN_MICROSECOND);
}

Time Time::fromHmsNano(std::int64_t hour, std::int64_t minute, std::int64_t second, std::int64_t nanosecond) {
    ensureInRange("hour", hour, 0, HOURS_IN_DAY - 1);
    ensureInRange("minute", minute, 0, MINUTES_IN_HOUR - 1);
    ensureInRange("second", second, 0, SECONDS_IN_MINUTE - 1);
    ensureInRange("nanosecond", nanosecond, 0, NANOSECONDS_IN_SECOND - 1);
    return Time(static_cast<std::uint8_t>(hour), static_cast<std::uint8_t>(minute), static_cast<std::uint8_t>(second),
                static_cast<std::uint32_t>(nanosecond));
}

std::pair<DateAdjustment, Time> Time::adjustingAdd(Duration duration) const noexcept {
    std::int32_t nanosecond = static_cast<std::int32_t>(nanoseconds) + duration.subsecNanoseconds();
    std::int32_t second = seconds + static_cast<std::int32_t>(duration.wholeSeconds() % SECONDS_IN_MINUTE);
    std::int32_t minute = minutes + static_cast<std::int32_t>(duration.wholeMinutes() % MINUTES_IN_HOUR);
    std::int32_t hour = hours + static_cast<std::int32_t>(duration.wholeHours() % HOURS_IN_DAY);
    auto adjustment = DateAdjustment::None;

    cascade(nanosecond, 0, NANOS_PER_SECOND, second);
    cascade(second, 0, SECONDS_PER_MINUTE, minute);
    cascade(minute, 0, MINUTES_PER_HOUR, hour);
    if (hour >= HOURS_PER_DAY) {
        hour -= HOURS_PER_DAY;
        adjustment = DateAdjustment::Next;
    } else if (hour < 0) {
        hour += HOURS_PER_DAY;
        adjustment = DateAdjustment::Previous;
    }

    return {adjustment, Time(static_cast<std::uint8_t>(hour), static_cast<std::uint8_t>(minute),
                             static_cast<std::uint8_t>(second), static_cast<std::uint32_t>(nanosecond))};
}

std::pair<DateAdjustment, Time> Time::adjustingSub(Duration duration) const noexcept {
    std::int32_t nanosecond = static_cast<std::int32_t>(nanoseconds) - duration.subsecNanoseconds();
    std::int32_t second = seconds - static_cast<std::int32_t>(duration.wholeSeconds() % SECONDS_IN_MINUTE);
    std::int32_t minute = minutes - static_cast<std::int32_t>(duration.wholeMinutes() % MINUTES_IN_HOUR);
    std::int32_t hour = hours - static_cast<std::int32_t>(duration.wholeHours() % HOURS_IN_DAY);
    auto adjustment = DateAdjustment::None;

    cascade(nanosecond, 0, NANOS_PER_SECOND, second);
    cascade(second, 0, SECONDS_PER_MINUTE, minute);
    cascade(minute, 0, MINUTES_PER_HOUR, hour);
    if (hour >= HOURS_PER_DAY) {
        hour -= HOURS_PER_DAY;
        adjustment = DateAdjustment::Next;
    } else if (hour < 0) {
        hour += HOURS_PER_DAY;
        adjustment = DateAdjustment::Previous;
    }

    return {adjustment, Time(static_cast<std::uint8_t>(hour), static_cast<std::uint8_t>(minute),
                             static_cast<std::uint8_t>(second), static_cast<std::uint32_t>(nanosecond))};
}

std::pair<bool, Time> Time::adjustingAddStd(StdDuration duration) const noexcept {
    const std::uint64_t wholeSeconds = asSecs(duration);
    std::uint32_t nanosecond = nanoseconds + subsecNanos(duration);
    std::uint8_t second = static_cast<std::uint8_t>(seconds + wholeSeconds % SECONDS_IN_MINUTE);
    std::uint8_t minute = static_cast<std::uint8_t>(minutes + wholeSeconds / SECONDS_IN_MINUTE % MINUTES_IN_HOUR);
    std::uint8_t hour = static_cast<std::uint8_t>(hours + wholeSeconds / SECONDS_IN_HOUR % HOURS_IN_DAY);
    bool isNextDay = false;

    cascade(nanosecond, 0u, static_cast<std::uint32_t>(NANOSECONDS_IN_SECOND), second);
    cascade(second, std::uint8_t{0}, static_cast<std::uint8_t>(SECONDS_IN_MINUTE), minute);
    cascade(minute, std::uint8_t{0}, static_cast<std::uint8_t>(MINUTES_IN_HOUR), hour);
    if (hour >= HOURS_IN_DAY) {
        hour -= HOURS_IN_DAY;
        isNextDay = true;
    }

    return {isNextDay, Time(hour, minute, second, nanosecond)};
}

std::pair<bool, Time> Time::adjustingSubStd(StdDuration duration) const noexcept {
    const std::uint64_t wholeSeconds = asSecs(duration);
    std::int32_t nanosecond = static_cast<std::int32_t>(nanoseconds) - static_cast<std::int32_t>(subsecNanos(duration));
    std::int32_t second = seconds - static_cast<std::int32_t>(wholeSeconds % SECONDS_IN_MINUTE);
    std::int32_t minute = minutes - static_cast<std::int32_t>(wholeSeconds / SECONDS_IN_MINUTE % MINUTES_IN_HOUR);
    std::int32_t hour = hours - static_cast<std::int32_t>(wholeSeconds / SECONDS_IN_HOUR % HOURS_IN_DAY);
    bool isPreviousDay = false;

    cascade(nanosecond, 0, NANOS_PER_SECOND, second);
    cascade(second, 0, SECONDS_PER_MINUTE, minute);
    cascade(minute, 0, MINUTES_PER_HOUR, hour);
    if (hour < 0) {
        hour += HOURS_PER_DAY;
        isPreviousDay = true;
    }

    return {isPreviousDay, Time(static_cast<std::uint8_t>(hour), static_cast<std::uint8_t>(minute),
                                static_cast<std::uint8_t>(second), static_cast<std::uint32_t>(nanosecond))};
}

Time Time::replaceHour(std::int64_t hour) const {
    ensureInRange("hour", hour, 0, HOURS_IN_DAY - 1);
    return Time(static_cast<std::uint8_t>(hour), minutes, seconds, nanoseconds);
}

Time Time::replaceMinute(std::int64_t minute) const {
    ensureInRange("minute", minute, 0, MINUTES_IN_HOUR - 1);
    return Time(hours, static_cast<std::uint8_t>(minute), seconds, nanoseconds);
}

Time Time::replaceSecond(std::int64_t second) const {
    ensureInRange("second", second, 0, SECONDS_IN_MINUTE - 1);
    return Time(hours, minutes, static_cast<std::uint8_t>(second), nanoseconds);
}

Time Time::replaceMillisecond(std::int64_t millisecond) const {
    ensureInRange("millisecond", millisecond, 0, MILLISECONDS_IN_SECOND - 1);
    return Time(hours, minutes, seconds, static_cast<std::uint32_t>(millisecond * NANOSECONDS_IN_MILLISECOND));
}

Time Time::replaceMicrosecond(std::int64_t microsecond) const {
    ensureInRange("microsecond", microsecond, 0, MICROSECONDS_IN_SECOND - 1);
    return Time(hours, minutes, seconds, static_cast<std::uint32_t>(microsecond * NANOSECONDS_IN_MICROSECOND));
}

Time Time::replaceNanosecond(std::int64_t nanosecond) const {
    ensureInRange("nanosecond", nanosecond, 0, NANOSECONDS_IN_SECOND - 1);
    return Time(hours, minutes, seconds, static_cast<std::uint32_t>(nanosecond));
}

std::string Time::toString() const {
    // Drop trailing zeros of the fraction, keeping at least one digit.
    std::uint32_t value = nanoseconds;
    int width = 9;
    while (width > 1 && value % 10 == 0) {
        value /= 10;
        --width;
    }
    return std::format("{}:{:02}:{:02}.{:0{}}", static_cast<unsigned>(hours), static_cast<unsigned>(minutes),
                       static_cast<unsigned>(seconds), value, width);
}

Time &Time::operator+=(Duration duration) noexcept {
    *this = adjustingAdd(duration).second;
    return *this;
}

Time &Time::operator+=(StdDuration duration) noexcept {
    *this = adjustingAddStd(duration).second;
    return *this;
}

Time &Time::operator-=(Duration duration) noexcept {
    *this = adjustingSub(duration).second;
    return *this;
}

Time &Time::operator-=(StdDuration duration) noexcept {
    *this = adjustingSubStd(duration).second;
    return *this;
}

Time wallclock::operator+(Time time, Duration duration) noexcept {
    return time.adjustingAdd(duration).second;
}

Time wallclock::operator+(Time time, StdDuration duration) noexcept {
    return time.adjustingAddStd(duration).second;
}

Time wallclock::operator-(Time time, Duration duration) noexcept {
    return time.adjustingSub(duration).second;
}

Time wallclock::operator-(Time time, StdDuration duration) noexcept {
    return time.adjustingSubStd(duration).second;
}

Duration wallclock::operator-(Time lhs, Time rhs) noexcept {
    const std::int64_t hourDiff = static_cast<std::int64_t>(lhs.hour()) - rhs.hour();
    const std::int64_t minuteDiff = static_cast<std::int64_t>(lhs.minute()) - rhs.minute();
    const std::int64_t secondDiff = static_cast<std::int64_t>(lhs.second()) - rhs.second();
    std::int32_t nanosecondDiff = static_cast<std::int32_t>(lhs.nanosecond()) - static_cast<std::int32_t>(rhs.nanosecond());

    std::int64_t seconds = hourDiff * SECONDS_IN_HOUR + minuteDiff * SECONDS_IN_MINUTE + secondDiff;
    // The nanosecond difference must carry the same sign as the seconds.
    if (seconds > 0 && nanosecondDiff < 0) {
        seconds -= 1;
        nanosecondDiff += NANOS_PER_SECOND;
    } else if (seconds < 0 && nanosecondDiff > 0) {
        seconds += 1;
        nanosecondDiff -= NANOS_PER_SECOND;
    }
    return Duration(seconds, nanosecondDiff, Duration::Unchecked{});
}

std::ostream &wallclock::operator<<(std::ostream &os, const Time &time) {
    return os << time.toString();
}
