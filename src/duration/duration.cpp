#include <format>
#include <limits>
#include <stdexcept>
#include "duration.hpp"
#include "../utils/checked.hpp"

using namespace wallclock;

namespace {
    constexpr std::int32_t NANOS_PER_SECOND = static_cast<std::int32_t>(NANOSECONDS_IN_SECOND);

    std::uint64_t unsignedMagnitude(std::int64_t value) noexcept {
        return value < 0 ? 0ULL - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
    }

    /// Packs a magnitude into unsigned nanoseconds, throwing when it exceeds the unsigned range.
    StdDuration toUnsignedNanoseconds(std::uint64_t seconds, std::uint64_t nanoseconds) {
        constexpr auto nanosPerSecond = static_cast<std::uint64_t>(NANOSECONDS_IN_SECOND);
        constexpr auto maxSeconds = std::numeric_limits<std::uint64_t>::max() / nanosPerSecond;
        constexpr auto maxSubsecond = std::numeric_limits<std::uint64_t>::max() % nanosPerSecond;
        if (seconds > maxSeconds || (seconds == maxSeconds && nanoseconds > maxSubsecond)) {
            throw std::range_error("Duration exceeds the unsigned duration range");
        }
        return StdDuration(seconds * nanosPerSecond + nanoseconds);
    }

    std::int64_t multiplyOrThrow(std::int64_t value, std::int64_t factor) {
        std::int64_t result = 0;
        if (!checkedMul(value, factor, result)) {
            throw std::overflow_error("overflow constructing Duration");
        }
        return result;
    }

    /// Folds a nanosecond sum back below one second and gives it the sign of the seconds.
    bool normalizeSum(std::int64_t &seconds, std::int32_t &nanoseconds) noexcept {
        if (nanoseconds >= NANOS_PER_SECOND || (seconds < 0 && nanoseconds > 0)) {
            nanoseconds -= NANOS_PER_SECOND;
            return checkedAdd(seconds, 1, seconds);
        }
        if (nanoseconds <= -NANOS_PER_SECOND || (seconds > 0 && nanoseconds < 0)) {
            nanoseconds += NANOS_PER_SECOND;
            return checkedSub(seconds, 1, seconds);
        }
        return true;
    }
}

const Duration Duration::ZERO{0, 0, Unchecked{}};
const Duration Duration::NANOSECOND{0, 1, Unchecked{}};
const Duration Duration::MICROSECOND{0, 1000, Unchecked{}};
const Duration Duration::MILLISECOND{0, 1000000, Unchecked{}};
const Duration Duration::SECOND{1, 0, Unchecked{}};
const Duration Duration::MINUTE{SECONDS_IN_MINUTE, 0, Unchecked{}};
const Duration Duration::HOUR{SECONDS_IN_HOUR, 0, Unchecked{}};
const Duration Duration::DAY{SECONDS_IN_DAY, 0, Unchecked{}};
const Duration Duration::WEEK{SECONDS_IN_WEEK, 0, Unchecked{}};
const Duration Duration::MIN{std::numeric_limits<std::int64_t>::min(), -(NANOS_PER_SECOND - 1), Unchecked{}};
const Duration Duration::MAX{std::numeric_limits<std::int64_t>::max(), NANOS_PER_SECOND - 1, Unchecked{}};

Duration::Duration(std::int64_t seconds, std::int32_t nanoseconds) {
    if (!wallclock::checkedAdd(seconds, nanoseconds / NANOS_PER_SECOND, seconds)) {
        throw std::overflow_error("overflow constructing Duration");
    }
    nanoseconds %= NANOS_PER_SECOND;
    if (seconds > 0 && nanoseconds < 0) {
        seconds -= 1;
        nanoseconds += NANOS_PER_SECOND;
    } else if (seconds < 0 && nanoseconds > 0) {
        seconds += 1;
        nanoseconds -= NANOS_PER_SECOND;
    }
    secs = seconds;
    nanos = nanoseconds;
}

Duration Duration::weeks(std::int64_t weeks) {
    return Duration::seconds(multiplyOrThrow(weeks, SECONDS_IN_WEEK));
}

Duration Duration::days(std::int64_t days) {
    return Duration::seconds(multiplyOrThrow(days, SECONDS_IN_DAY));
}

Duration Duration::hours(std::int64_t hours) {
    return Duration::seconds(multiplyOrThrow(hours, SECONDS_IN_HOUR));
}

Duration Duration::minutes(std::int64_t minutes) {
    return Duration::seconds(multiplyOrThrow(minutes, SECONDS_IN_MINUTE));
}

Duration Duration::seconds(std::int64_t seconds) noexcept {
    return Duration(seconds, 0, Unchecked{});
}

Duration Duration::milliseconds(std::int64_t milliseconds) noexcept {
    return Duration(milliseconds / MILLISECONDS_IN_SECOND,
                    static_cast<std::int32_t>(milliseconds % MILLISECONDS_IN_SECOND * NANOSECONDS_IN_MILLISECOND),
                    Unchecked{});
}

Duration Duration::microseconds(std::int64_t microseconds) noexcept {
    return Duration(microseconds / MICROSECONDS_IN_SECOND,
                    static_cast<std::int32_t>(microseconds % MICROSECONDS_IN_SECOND * NANOSECONDS_IN_MICROSECOND),
                    Unchecked{});
}

Duration Duration::nanoseconds(std::int64_t nanoseconds) noexcept {
    return Duration(nanoseconds / NANOSECONDS_IN_SECOND,
                    static_cast<std::int32_t>(nanoseconds % NANOSECONDS_IN_SECOND),
                    Unchecked{});
}

Duration Duration::fromStd(StdDuration duration) noexcept {
    return Duration(static_cast<std::int64_t>(asSecs(duration)),
                    static_cast<std::int32_t>(subsecNanos(duration)),
                    Unchecked{});
}

Duration Duration::fromTimespec(const timespec &ts) {
    std::int64_t seconds = 0;
    if (!wallclock::checkedAdd(ts.tv_sec, ts.tv_nsec / NANOSECONDS_IN_SECOND, seconds)) {
        throw std::overflow_error("overflow constructing Duration from timespec");
    }
    return Duration(seconds, static_cast<std::int32_t>(ts.tv_nsec % NANOSECONDS_IN_SECOND));
}

Duration Duration::abs() const noexcept {
    if (secs == std::numeric_limits<std::int64_t>::min()) {
        return MAX;
    }
    return Duration(secs < 0 ? -secs : secs, nanos < 0 ? -nanos : nanos, Unchecked{});
}

StdDuration Duration::unsignedAbs() const {
    return toUnsignedNanoseconds(unsignedMagnitude(secs), unsignedMagnitude(nanos));
}

std::optional<Duration> Duration::checkedAdd(Duration rhs) const noexcept {
    std::int64_t seconds = 0;
    if (!wallclock::checkedAdd(secs, rhs.secs, seconds)) {
        return std::nullopt;
    }
    std::int32_t nanoseconds = nanos + rhs.nanos;
    if (!normalizeSum(seconds, nanoseconds)) {
        return std::nullopt;
    }
    return Duration(seconds, nanoseconds, Unchecked{});
}

std::optional<Duration> Duration::checkedSub(Duration rhs) const noexcept {
    std::int64_t seconds = 0;
    if (!wallclock::checkedSub(secs, rhs.secs, seconds)) {
        return std::nullopt;
    }
    std::int32_t nanoseconds = nanos - rhs.nanos;
    if (!normalizeSum(seconds, nanoseconds)) {
        return std::nullopt;
    }
    return Duration(seconds, nanoseconds, Unchecked{});
}

std::optional<Duration> Duration::checkedMul(std::int32_t rhs) const noexcept {
    const std::int64_t totalNanos = static_cast<std::int64_t>(nanos) * rhs;
    const std::int64_t extraSeconds = totalNanos / NANOSECONDS_IN_SECOND;
    const auto nanoseconds = static_cast<std::int32_t>(totalNanos % NANOSECONDS_IN_SECOND);
    std::int64_t seconds = 0;
    if (!wallclock::checkedMul(secs, rhs, seconds) || !wallclock::checkedAdd(seconds, extraSeconds, seconds)) {
        return std::nullopt;
    }
    return Duration(seconds, nanoseconds, Unchecked{});
}

std::optional<Duration> Duration::checkedDiv(std::int32_t rhs) const noexcept {
    if (rhs == 0 || (rhs == -1 && secs == std::numeric_limits<std::int64_t>::min())) {
        return std::nullopt;
    }
    const std::int64_t seconds = secs / rhs;
    const std::int64_t carry = secs - seconds * rhs;
    const std::int64_t extraNanos = carry * NANOSECONDS_IN_SECOND / rhs;
    const auto nanoseconds = static_cast<std::int32_t>(nanos / rhs + extraNanos);
    return Duration(seconds, nanoseconds);
}

std::optional<Duration> Duration::checkedNeg() const noexcept {
    if (secs == std::numeric_limits<std::int64_t>::min()) {
        return std::nullopt;
    }
    return Duration(-secs, -nanos, Unchecked{});
}

Duration Duration::saturatingAdd(Duration rhs) const noexcept {
    std::int64_t seconds = 0;
    if (!wallclock::checkedAdd(secs, rhs.secs, seconds)) {
        return secs > 0 ? MAX : MIN;
    }
    std::int32_t nanoseconds = nanos + rhs.nanos;
    if (!normalizeSum(seconds, nanoseconds)) {
        return seconds > 0 ? MAX : MIN;
    }
    return Duration(seconds, nanoseconds, Unchecked{});
}

Duration Duration::saturatingSub(Duration rhs) const noexcept {
    std::int64_t seconds = 0;
    if (!wallclock::checkedSub(secs, rhs.secs, seconds)) {
        return secs >= 0 ? MAX : MIN;
    }
    std::int32_t nanoseconds = nanos - rhs.nanos;
    if (!normalizeSum(seconds, nanoseconds)) {
        return seconds > 0 ? MAX : MIN;
    }
    return Duration(seconds, nanoseconds, Unchecked{});
}

Duration Duration::saturatingMul(std::int32_t rhs) const noexcept {
    if (auto product = checkedMul(rhs)) {
        return *product;
    }
    const bool negative = isNegative() != (rhs < 0);
    return negative ? MIN : MAX;
}

StdDuration Duration::toStd() const {
    if (isNegative()) {
        throw std::range_error("negative Duration cannot be converted to an unsigned duration");
    }
    return toUnsignedNanoseconds(static_cast<std::uint64_t>(secs), static_cast<std::uint64_t>(nanos));
}

timespec Duration::toTimespec() const {
    timespec result;
    result.tv_sec = secs;
    result.tv_nsec = nanos;
    // Borrow a second so that tv_nsec is never negative.
    if (result.tv_nsec < 0) {
        if (secs == std::numeric_limits<std::int64_t>::min()) {
            throw std::range_error("Duration exceeds the timespec range");
        }
        result.tv_sec -= 1;
        result.tv_nsec += NANOSECONDS_IN_SECOND;
    }
    return result;
}

std::string Duration::toString() const {
    if (isZero()) {
        return "0s";
    }
    std::string result = isNegative() ? "-" : "";
    auto item = [&result](std::uint64_t value, const char *unit) {
        if (value != 0) {
            result += std::format("{}{}", value, unit);
        }
    };
    const auto seconds = unsignedMagnitude(secs);
    const auto nanoseconds = static_cast<std::uint32_t>(nanos < 0 ? -nanos : nanos);
    item(seconds / SECONDS_IN_DAY, "d");
    item(seconds / SECONDS_IN_HOUR % HOURS_IN_DAY, "h");
    item(seconds / SECONDS_IN_MINUTE % MINUTES_IN_HOUR, "m");
    item(seconds % SECONDS_IN_MINUTE, "s");
    item(nanoseconds / NANOSECONDS_IN_MILLISECOND, "ms");
    item(nanoseconds / NANOSECONDS_IN_MICROSECOND % MICROSECONDS_IN_MILLISECOND, "µs");
    item(nanoseconds % NANOSECONDS_IN_MICROSECOND, "ns");
    return result;
}

Duration Duration::operator-() const {
    if (auto negated = checkedNeg()) {
        return *negated;
    }
    throw std::overflow_error("overflow negating Duration");
}

Duration &Duration::operator+=(Duration rhs) {
    *this = *this + rhs;
    return *this;
}

Duration &Duration::operator-=(Duration rhs) {
    *this = *this - rhs;
    return *this;
}

Duration &Duration::operator*=(std::int32_t rhs) {
    *this = *this * rhs;
    return *this;
}

Duration wallclock::operator+(Duration lhs, Duration rhs) {
    if (auto sum = lhs.checkedAdd(rhs)) {
        return *sum;
    }
    throw std::overflow_error("overflow adding durations");
}

Duration wallclock::operator-(Duration lhs, Duration rhs) {
    if (auto difference = lhs.checkedSub(rhs)) {
        return *difference;
    }
    throw std::overflow_error("overflow subtracting durations");
}

Duration wallclock::operator*(Duration lhs, std::int32_t rhs) {
    if (auto product = lhs.checkedMul(rhs)) {
        return *product;
    }
    throw std::overflow_error("overflow multiplying duration");
}

Duration wallclock::operator*(std::int32_t lhs, Duration rhs) {
    return rhs * lhs;
}

Duration wallclock::operator/(Duration lhs, std::int32_t rhs) {
    if (rhs == 0) {
        throw std::invalid_argument("division of Duration by zero");
    }
    if (auto quotient = lhs.checkedDiv(rhs)) {
        return *quotient;
    }
    throw std::overflow_error("overflow dividing duration");
}

std::ostream &wallclock::operator<<(std::ostream &os, const Duration &duration) {
    return os << duration.toString();
}
