#include <cstdlib>
#include <iostream>
#include <string_view>
#include "datetime/primitive_date_time.hpp"
#include "parsing/parsing.hpp"
#include "env.hpp"

using namespace wallclock;

namespace {
    constexpr int EXIT_BAD_INPUT = 2;
    constexpr int EXIT_OUT_OF_RANGE = 3;

    template <typename T, typename Parser>
    T parseOrExit(const char *variable, std::string_view text, Parser parser, T value) {
        auto status = parser(text, value);
        if (status != ParseStatus::Ok) {
            std::cerr << "Invalid " << variable << " \"" << text << "\": " << status << std::endl;
            std::exit(EXIT_BAD_INPUT);
        }
        return value;
    }
}

int main() {
    auto verbose = getFromEnv<bool>("WALLCLOCK_VERBOSE", false, false);
    auto timeText = getFromEnv<const char*>("WALLCLOCK_TIME", true);
    auto dateText = getFromEnv<const char*>("WALLCLOCK_DATE", false, nullptr);
    auto offsetText = getFromEnv<const char*>("WALLCLOCK_OFFSET", false, "0");
    auto subtract = getFromEnv<bool>("WALLCLOCK_SUBTRACT", false, false);

    auto time = parseOrExit("WALLCLOCK_TIME", timeText, parseTime, Time::MIDNIGHT);
    auto offset = parseOrExit("WALLCLOCK_OFFSET", offsetText, parseDuration, Duration::ZERO);

    if (verbose) {
        std::cerr << "time = " << time << ", offset = " << offset << (subtract ? " (subtracting)" : " (adding)") << std::endl;
    }

    if (dateText == nullptr) {
        auto [adjustment, shifted] = subtract ? time.adjustingSub(offset) : time.adjustingAdd(offset);
        std::cout << shifted << " " << adjustment << std::endl;
        return EXIT_SUCCESS;
    }

    auto date = parseOrExit("WALLCLOCK_DATE", dateText, parseDate, Date::MIN);
    if (verbose) {
        std::cerr << "date = " << date << std::endl;
    }

    PrimitiveDateTime start{date, time};
    auto shifted = subtract ? start.checkedSub(offset) : start.checkedAdd(offset);
    if (!shifted) {
        std::cerr << "Result of shifting " << start << " by " << offset << " is outside the supported date range" << std::endl;
        return EXIT_OUT_OF_RANGE;
    }
    std::cout << *shifted << std::endl;
    return EXIT_SUCCESS;
}
