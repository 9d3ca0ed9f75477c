#include <charconv>
#include <iostream>
#include <limits>
#include <system_error>
#include "parsing.hpp"
#include "../error/component_range.hpp"

namespace {
    constexpr std::size_t MAX_FRACTION_DIGITS = 9;
    constexpr std::uint32_t FRACTION_SCALE[] = {
        1000000000, 100000000, 10000000, 1000000, 100000, 10000, 1000, 100, 10, 1,
    };

    inline bool isDigit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    std::size_t countDigits(std::string_view text, std::size_t pos) noexcept {
        std::size_t count = 0;
        while (pos + count < text.size() && isDigit(text[pos + count])) {
            ++count;
        }
        return count;
    }

    /// Reads between minDigits and maxDigits decimal digits at pos and advances pos past them.
    template <typename T>
    std::errc readNumber(std::string_view text, std::size_t &pos, std::size_t minDigits, std::size_t maxDigits, T &value) {
        const std::size_t digits = countDigits(text, pos);
        if (digits < minDigits || digits > maxDigits) {
            return std::errc::invalid_argument;
        }
        const char *begin = text.data() + pos;
        auto [ptr, ec] = std::from_chars(begin, begin + digits, value);
        if (ec != std::errc()) {
            return ec;
        }
        pos += digits;
        return std::errc();
    }

    bool expectChar(std::string_view text, std::size_t &pos, char expected) noexcept {
        if (pos >= text.size() || text[pos] != expected) {
            return false;
        }
        ++pos;
        return true;
    }

    /// Reads a fraction of a second after the decimal point as nanoseconds.
    bool readFraction(std::string_view text, std::size_t &pos, std::uint32_t &nanoseconds) {
        const std::size_t digits = countDigits(text, pos);
        std::uint32_t fraction = 0;
        if (readNumber(text, pos, 1, MAX_FRACTION_DIGITS, fraction) != std::errc()) {
            return false;
        }
        nanoseconds = fraction * FRACTION_SCALE[digits];
        return true;
    }

    wallclock::ParseStatus reject(const char *what, std::string_view text, wallclock::ParseStatus status) {
#ifndef NDEBUG
        std::cerr << what << ": rejected \"" << text << "\" (" << status << ")" << std::endl;
#else
        (void)what;
        (void)text;
#endif
        return status;
    }
}

namespace wallclock {

    std::string_view toString(ParseStatus status) noexcept {
        switch (status) {
            case ParseStatus::Ok:
                return "ok";
            case ParseStatus::Malformed:
                return "malformed";
            case ParseStatus::OutOfRange:
                return "out of range";
        }
        return "unknown";
    }

    std::ostream &operator<<(std::ostream &os, ParseStatus status) {
        return os << toString(status);
    }

    ParseStatus parseTime(std::string_view text, Time &time) {
        std::size_t pos = 0;
        unsigned hour = 0;
        unsigned minute = 0;
        unsigned second = 0;
        std::uint32_t nanosecond = 0;

        if (readNumber(text, pos, 1, 2, hour) != std::errc() || !expectChar(text, pos, ':')
            || readNumber(text, pos, 2, 2, minute) != std::errc()) {
            return reject("parseTime", text, ParseStatus::Malformed);
        }
        if (expectChar(text, pos, ':')) {
            if (readNumber(text, pos, 2, 2, second) != std::errc()) {
                return reject("parseTime", text, ParseStatus::Malformed);
            }
            if (expectChar(text, pos, '.') && !readFraction(text, pos, nanosecond)) {
                return reject("parseTime", text, ParseStatus::Malformed);
            }
        }
        if (pos != text.size()) {
            return reject("parseTime", text, ParseStatus::Malformed);
        }

        try {
            time = Time::fromHmsNano(hour, minute, second, nanosecond);
        } catch (const ComponentRangeError &) {
            return reject("parseTime", text, ParseStatus::OutOfRange);
        }
        return ParseStatus::Ok;
    }

    ParseStatus parseDate(std::string_view text, Date &date) {
        std::size_t pos = 0;
        const bool negative = expectChar(text, pos, '-');
        std::int32_t year = 0;
        unsigned month = 0;
        unsigned day = 0;

        if (readNumber(text, pos, 4, 4, year) != std::errc() || !expectChar(text, pos, '-')
            || readNumber(text, pos, 2, 2, month) != std::errc() || !expectChar(text, pos, '-')
            || readNumber(text, pos, 2, 2, day) != std::errc() || pos != text.size()) {
            return reject("parseDate", text, ParseStatus::Malformed);
        }

        try {
            date = Date::fromCalendarDate(negative ? -year : year, static_cast<Month>(month), day);
        } catch (const ComponentRangeError &) {
            return reject("parseDate", text, ParseStatus::OutOfRange);
        }
        return ParseStatus::Ok;
    }

    ParseStatus parseDuration(std::string_view text, Duration &duration) {
        std::size_t pos = 0;
        const bool negative = expectChar(text, pos, '-');
        std::uint64_t magnitude = 0;
        std::uint32_t nanoseconds = 0;

        const std::errc ec = readNumber(text, pos, 1, std::numeric_limits<std::size_t>::max(), magnitude);
        if (ec == std::errc::result_out_of_range) {
            return reject("parseDuration", text, ParseStatus::OutOfRange);
        }
        if (ec != std::errc()) {
            return reject("parseDuration", text, ParseStatus::Malformed);
        }
        if (expectChar(text, pos, '.') && !readFraction(text, pos, nanoseconds)) {
            return reject("parseDuration", text, ParseStatus::Malformed);
        }
        if (pos != text.size()) {
            return reject("parseDuration", text, ParseStatus::Malformed);
        }
        // The negative range reaches one second further than the positive one.
        const auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + (negative ? 1 : 0);
        if (magnitude > limit) {
            return reject("parseDuration", text, ParseStatus::OutOfRange);
        }

        const auto nanos = static_cast<std::int32_t>(nanoseconds);
        if (negative) {
            duration = Duration(static_cast<std::int64_t>(0ULL - magnitude), -nanos);
        } else {
            duration = Duration(static_cast<std::int64_t>(magnitude), nanos);
        }
        return ParseStatus::Ok;
    }
}
