#include <format>
#include "component_range.hpp"

using namespace wallclock;

std::string ComponentRangeError::makeMessage(const char *name, std::int64_t minimum, std::int64_t maximum, bool conditional) {
    auto message = std::format("{} must be in the range {}..={}", name, minimum, maximum);
    if (conditional) {
        message += ", given values of other parameters";
    }
    return message;
}

ComponentRangeError::ComponentRangeError(const char *name, std::int64_t minimum, std::int64_t maximum,
                                         std::int64_t value, bool conditional)
    : std::out_of_range(makeMessage(name, minimum, maximum, conditional)),
      componentName(name),
      minimumValue(minimum),
      maximumValue(maximum),
      actualValue(value),
      conditionalRange(conditional) {
}
