#pragma once
#include <cstdint>
#include <limits>

namespace wallclock {

    /// @brief Adds two signed 64-bit values.
    /// @return false on overflow, out is left untouched in that case
    inline bool checkedAdd(std::int64_t a, std::int64_t b, std::int64_t &out) noexcept {
        if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) {
            return false;
        }
        if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) {
            return false;
        }
        out = a + b;
        return true;
    }

    inline bool checkedSub(std::int64_t a, std::int64_t b, std::int64_t &out) noexcept {
        if (b < 0 && a > std::numeric_limits<std::int64_t>::max() + b) {
            return false;
        }
        if (b > 0 && a < std::numeric_limits<std::int64_t>::min() + b) {
            return false;
        }
        out = a - b;
        return true;
    }

    inline bool checkedMul(std::int64_t a, std::int64_t b, std::int64_t &out) noexcept {
        using Limits = std::numeric_limits<std::int64_t>;
        if (a == 0 || b == 0) {
            out = 0;
            return true;
        }
        bool negative = (a < 0) ^ (b < 0);
        auto absA = a < 0 ? 0ULL - static_cast<std::uint64_t>(a) : static_cast<std::uint64_t>(a);
        auto absB = b < 0 ? 0ULL - static_cast<std::uint64_t>(b) : static_cast<std::uint64_t>(b);
        const auto maxPositive = static_cast<std::uint64_t>(Limits::max());
        const auto limit = negative ? maxPositive + 1ULL : maxPositive;
        if (absB > limit / absA) {
            return false;
        }
        auto absResult = absA * absB;
        if (negative) {
            out = absResult == maxPositive + 1ULL ? Limits::min() : -static_cast<std::int64_t>(absResult);
        } else {
            out = static_cast<std::int64_t>(absResult);
        }
        return true;
    }
}
