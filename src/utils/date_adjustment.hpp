#pragma once
#include <cstdint>
#include <ostream>
#include <string_view>

namespace wallclock {

    /// @brief Whether a time-of-day computation crossed midnight, and in which direction.
    enum class DateAdjustment : std::uint8_t {
        None = 0,
        Next,
        Previous,
    };

    inline std::string_view toString(DateAdjustment adjustment) noexcept {
        switch (adjustment) {
            case DateAdjustment::Next:
                return "next";
            case DateAdjustment::Previous:
                return "previous";
            case DateAdjustment::None:
                break;
        }
        return "none";
    }

    inline std::ostream &operator<<(std::ostream &os, DateAdjustment adjustment) {
        return os << toString(adjustment);
    }
}
