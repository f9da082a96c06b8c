#pragma once

#include <bspidx/common/utf8_utils.h>

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>

namespace bspidx::extraction {

/**
 * @brief Call fn(line, lineNumber) for every '\n'-separated line; numbers are 1-based.
 * A trailing '\r' is left in place; callers trim.
 */
template <typename Fn> void forEachLine(std::string_view content, Fn&& fn) {
    int lineNumber = 0;
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos)
            end = content.size();
        ++lineNumber;
        fn(content.substr(start, end - start), lineNumber);
        start = end + 1;
    }
}

// std::regex recurses per matched character; patterns only see this much of a line
// and anchor on its leading tokens. Values are sliced from the full text.
constexpr size_t kMatchWindow = 1024;

/**
 * @brief regex_search over the first kMatchWindow bytes of text.
 * Sub-match iterators point into text, so callers may slice past match.length(0).
 */
inline bool searchPrefix(std::string_view text, std::cmatch& match, const std::regex& re) {
    auto window = text.substr(0, kMatchWindow);
    return std::regex_search(window.data(), window.data() + window.size(), match, re);
}

inline std::string truncateValue(std::string_view value, size_t limit) {
    return common::truncateUtf8(value, limit);
}

} // namespace bspidx::extraction
