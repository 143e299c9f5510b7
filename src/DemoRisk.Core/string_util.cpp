#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace drisk::core {

std::string trim(std::string value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }

    std::size_t pos = 0;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
        ++pos;
    }

    return value.substr(pos);
}

std::string to_lower(const std::string_view &value) noexcept {
    std::string result = std::string(value);
    std::transform(value.begin(), value.end(), result.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    return result;
}

bool wildcard_match(const std::string_view &text, const std::string_view &pattern) noexcept {
    std::size_t t = 0;
    std::size_t p = 0;
    auto star = std::string_view::npos;
    std::size_t mark = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string_view::npos) {
            // Backtrack, let the last star absorb one more character
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.size();
}

bool case_insensitive::equals(const std::string_view &left,
                              const std::string_view &right) noexcept {
    return std::ranges::equal(left, right, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}
} // namespace drisk::core
