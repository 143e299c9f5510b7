#pragma once
#include <iterator>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>

namespace drisk::core {

/// @brief Trim leading and trailing white-space characters from a string.
std::string trim(std::string value) noexcept;

/// @brief Converts the given ASCII string to lower-case
std::string to_lower(const std::string_view &value) noexcept;

/// @brief Matches a file name against a glob-style pattern
/// @details Supports the @c * (any sequence) and @c ? (any single character) wildcards,
/// the comparison is case-sensitive.
/// @param text The file name to test
/// @param pattern The glob-style pattern
/// @return true if the whole name matches the pattern; otherwise, false.
bool wildcard_match(const std::string_view &text, const std::string_view &pattern) noexcept;

/// @brief Join a range of strings with a delimiter
/// @param delim The delimiter between consecutive strings
/// @param range Range of strings to join
/// @return A new string composed of the joined-up strings
template <std::ranges::input_range Range>
std::string join_strings(const std::string &delim, const Range &range) {
    std::stringstream ss;
    auto first = true;
    for (const auto &item : range) {
        if (!first) {
            ss << delim;
        }

        ss << item;
        first = false;
    }

    return ss.str();
}

/// @brief Case-insensitive operations on ASCII strings.
struct case_insensitive final {
    /// @brief Compare two case-insensitive ASCII string for equality
    /// @param left The left string to compare
    /// @param right The right string to compare
    /// @return true if the string are equal, otherwise, false
    static bool equals(const std::string_view &left, const std::string_view &right) noexcept;
};
} // namespace drisk::core
