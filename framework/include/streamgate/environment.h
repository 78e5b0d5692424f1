#pragma once

#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace streamgate {

    bool load_env(const std::string& path = ".env");

    /**
     * @brief Reads a typed value from the process environment.
     * @throws std::runtime_error when the key is missing and no default is given,
     *         std::invalid_argument when the value does not parse.
     */
    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr || *val == '\0') {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw std::runtime_error("Missing environment variable: " + key);
        }

        std::string s_val = val;

        try {
            if constexpr (std::is_same_v<T, std::string>) {
                return s_val;
            }
            else if constexpr (std::is_same_v<T, int>) {
                return std::stoi(s_val);
            }
            else if constexpr (std::is_same_v<T, long>) {
                return std::stol(s_val);
            }
            else if constexpr (std::is_same_v<T, double>) {
                return std::stod(s_val);
            }
            else if constexpr (std::is_same_v<T, bool>) {
                return (s_val == "true" || s_val == "1" || s_val == "yes");
            }
            else if constexpr (std::is_same_v<T, std::chrono::milliseconds>) {
                return std::chrono::milliseconds(std::stoll(s_val));
            }
            else {
                static_assert(sizeof(T) == 0, "Unsupported type for streamgate::env");
            }
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Invalid value for environment variable " + key + ": " + s_val);
        }
    }

    // Comma-separated list, entries trimmed, empty entries dropped.
    std::vector<std::string> env_list(const std::string& key, const std::vector<std::string>& default_value = {});
}
