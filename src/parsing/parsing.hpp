#pragma once
#include <cstdint>
#include <ostream>
#include <string_view>
#include "../date/date.hpp"
#include "../duration/duration.hpp"
#include "../time/time.hpp"

namespace wallclock {

    enum class ParseStatus : std::uint8_t {
        Ok = 0,
        /// @brief The text does not follow the expected layout.
        Malformed,
        /// @brief The layout is right but a component is outside its range.
        OutOfRange,
    };

    std::string_view toString(ParseStatus status) noexcept;
    std::ostream &operator<<(std::ostream &os, ParseStatus status);

    /// @brief Parses "H:MM", "H:MM:SS" or "H:MM:SS.fffffffff" (one to nine fraction digits).
    /// The hour takes one or two digits. `time` is written only on Ok.
    ParseStatus parseTime(std::string_view text, Time &time);

    /// @brief Parses "YYYY-MM-DD" with an optional leading '-' for years before 0.
    ParseStatus parseDate(std::string_view text, Date &date);

    /// @brief Parses a signed number of seconds with up to nine fraction digits, e.g. "-90.5".
    ParseStatus parseDuration(std::string_view text, Duration &duration);
}
