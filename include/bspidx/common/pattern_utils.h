#pragma once

#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bspidx::common {

// String-like concept (C++20): anything convertible to std::string_view
template <class T>
concept StringLike = requires(T&& t) { std::string_view{std::forward<T>(t)}; };

/**
 * constexpr, allocation-free wildcard match supporting:
 *  - '?' matches any single character
 *  - '*' matches any sequence of characters (including empty and '/')
 *
 * Case-sensitive. Iterative, no backtracking explosion.
 */
[[nodiscard]] inline constexpr bool wildcard_match(std::string_view text,
                                                   std::string_view pattern) noexcept {
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;

    const size_t tlen = text.size();
    const size_t plen = pattern.size();

    while (t < tlen) {
        if (p < plen && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < plen && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
        } else if (starPos != std::string_view::npos) {
            // last star absorbs one more character
            p = starPos + 1;
            ++matchPos;
            t = matchPos;
        } else {
            return false;
        }
    }

    while (p < plen && pattern[p] == '*') {
        ++p;
    }

    return p == plen;
}

/**
 * Matches the given text against any of the provided patterns.
 */
template <std::ranges::input_range Range>
requires StringLike<std::ranges::range_value_t<Range>>
[[nodiscard]] inline bool matches_any(std::string_view text, const Range& patterns) noexcept {
    for (const auto& pat : patterns) {
        if (wildcard_match(text, std::string_view{pat})) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] inline std::string_view ltrim(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r'))
        ++i;
    return s.substr(i);
}

[[nodiscard]] inline std::string_view rtrim(std::string_view s) noexcept {
    size_t i = s.size();
    while (i > 0 && (s[i - 1] == ' ' || s[i - 1] == '\t' || s[i - 1] == '\n' || s[i - 1] == '\r'))
        --i;
    return s.substr(0, i);
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    return rtrim(ltrim(s));
}

/**
 * Split a comma-separated list of patterns into a vector of strings.
 * - Trims whitespace and surrounding quotes around each token
 * - Accepts a TOML array form: ["a", "b"]
 * - Skips empty entries
 */
[[nodiscard]] inline std::vector<std::string> split_patterns(std::string_view csv) {
    csv = trim(csv);
    if (csv.size() >= 2 && csv.front() == '[' && csv.back() == ']') {
        csv = csv.substr(1, csv.size() - 2);
    }
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t pos = csv.find(',', start);
        std::string_view token =
            (pos == std::string_view::npos) ? csv.substr(start) : csv.substr(start, pos - start);
        token = trim(token);
        if (token.size() >= 2 && (token.front() == '"' || token.front() == '\'') &&
            token.back() == token.front()) {
            token = token.substr(1, token.size() - 2);
        }
        if (!token.empty()) {
            out.emplace_back(token);
        }
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

} // namespace bspidx::common
