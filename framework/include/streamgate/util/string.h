#ifndef STREAMGATE_UTIL_STRING_H
#define STREAMGATE_UTIL_STRING_H

#include <string>
#include <string_view>
#include <type_traits>
#include <charconv>
#include <vector>
#include <streamgate/exceptions.h>

namespace streamgate::util {

/**
 * @brief Decodes a URL-encoded string (e.g., %20 to space).
 * Handles both '+' and '%xx' encodings.
 */
std::string url_decode(std::string_view str);

/**
 * @brief Converts a binary string or buffer to a hex-encoded string.
 */
std::string hex_encode(std::string_view input);

std::string trim(std::string_view input);
bool iequals(std::string_view a, std::string_view b);

/**
 * @brief Splits on a single delimiter, keeping empty fields.
 */
std::vector<std::string> split(std::string_view input, char delimiter);

/**
 * @brief Splits a URL path into its non-empty segments ("/a//b/" -> ["a", "b"]).
 */
std::vector<std::string_view> path_segments(std::string_view path);

/**
 * @brief Efficiently converts a string_view to a numeric or boolean type.
 * Uses std::from_chars for high-performance parsing without allocations.
 * @throws ValidationError if parsing fails.
 */
template<typename T>
T convert_string(std::string_view s) {
    using PureT = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<PureT, std::string>) {
        return std::string(s);
    } else if constexpr (std::is_same_v<PureT, bool>) {
        if (s == "true" || s == "1" || s == "yes" || s == "t") return true;
        if (s == "false" || s == "0" || s == "no" || s == "f") return false;
        throw ValidationError("Invalid boolean format: " + std::string(s));
    } else if constexpr (std::is_integral_v<PureT>) {
        PureT val{};
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
        if (ec != std::errc() || ptr != s.data() + s.size()) {
            throw ValidationError("Invalid integer format: " + std::string(s));
        }
        return val;
    } else {
        static_assert(sizeof(PureT) == 0, "Unsupported type for convert_string");
    }
}

} // namespace streamgate::util

namespace streamgate {
    using util::convert_string;
}

#endif // STREAMGATE_UTIL_STRING_H
