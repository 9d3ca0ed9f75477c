#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace wallclock {

    /// @brief Thrown when a component passed to a validated constructor is out of range.
    /// Bounds are inclusive on both sides.
    class ComponentRangeError : public std::out_of_range {
        private:
            const char *componentName;
            std::int64_t minimumValue;
            std::int64_t maximumValue;
            std::int64_t actualValue;
            bool conditionalRange;

            static std::string makeMessage(const char *name, std::int64_t minimum, std::int64_t maximum, bool conditional);

        public:
            /// @param name component name, must point to static storage
            /// @param conditional the bounds depend on the values of other parameters
            ComponentRangeError(const char *name, std::int64_t minimum, std::int64_t maximum, std::int64_t value,
                                bool conditional = false);

            const char *name() const noexcept { return componentName; }
            std::int64_t minimum() const noexcept { return minimumValue; }
            std::int64_t maximum() const noexcept { return maximumValue; }
            std::int64_t value() const noexcept { return actualValue; }
            bool isConditional() const noexcept { return conditionalRange; }
    };

    /// @brief Throws ComponentRangeError unless minimum <= value <= maximum.
    inline void ensureInRange(const char *name, std::int64_t value, std::int64_t minimum, std::int64_t maximum) {
        if (value < minimum || value > maximum) {
            throw ComponentRangeError(name, minimum, maximum, value);
        }
    }

    /// @brief Same as ensureInRange, for bounds that depend on other arguments.
    inline void ensureInConditionalRange(const char *name, std::int64_t value, std::int64_t minimum, std::int64_t maximum) {
        if (value < minimum || value > maximum) {
            throw ComponentRangeError(name, minimum, maximum, value, true);
        }
    }
}
