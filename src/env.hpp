#pragma once
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string_view>
#include <strings.h>
#include <system_error>
#include <type_traits>

namespace wallclock {

    /// @brief Reads a configuration value from the environment.
    /// Exits with status 1 when a required variable is missing or an integer does not parse.
    template <typename T>
    T getFromEnv(const char* env_var_name, bool isRequired, T defaultVal = T()) {
        const char* env_var = std::getenv(env_var_name);

        if (env_var != nullptr) {
            if constexpr (std::is_same_v<T, bool>) {
                return (std::strcmp(env_var, "1") == 0 || strcasecmp(env_var, "true") == 0);
            }
            else if constexpr (std::is_integral_v<T>) {
                std::string_view text{env_var};
                T value{};
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec != std::errc() || ptr != text.data() + text.size()) {
                    std::cerr << "Environment variable " << env_var_name << " is not a valid integer: " << env_var << std::endl;
                    std::exit(1);
                }
                return value;
            }
            else if constexpr (std::is_same_v<T, const char*>) {
                return env_var;
            }
            else if constexpr (std::is_same_v<T, std::string_view>) {
                return std::string_view{env_var};
            }
            else {
                static_assert(sizeof(T) == 0, "Unsupported type for environment variable retrieval.");
            }
        }

        if (isRequired) {
            std::cerr << "Environment variable " << env_var_name << " not found." << std::endl;
            std::exit(1);
        }

        return defaultVal;
    }
}
