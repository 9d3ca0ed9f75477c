#pragma once
#include <type_traits>

namespace wallclock {

    /// @brief Brings a mixed-radix field back into [min, max) by carrying into, or borrowing
    /// from, the next larger field. Performs a single correction step: callers only combine
    /// values whose magnitude stays below one unit of the larger field.
    /// @param from field to normalize
    /// @param min inclusive lower bound of the field
    /// @param max exclusive upper bound of the field
    /// @param to next larger field, receives the carry
    /// @return 1 when carried, -1 when borrowed, 0 when already in range
    template <typename From, typename To>
    constexpr int cascade(From &from, From min, From max, To &to) noexcept {
        static_assert(std::is_integral_v<From> && std::is_integral_v<To>);
        if (from >= max) {
            from -= max - min;
            to += 1;
            return 1;
        }
        if (from < min) {
            from += max - min;
            to -= 1;
            return -1;
        }
        return 0;
    }
}
