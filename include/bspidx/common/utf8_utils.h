#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace bspidx::common {

namespace detail {

// Length of the valid UTF-8 sequence starting at i, or 0 when the bytes there are invalid.
inline size_t utf8SequenceLength(const unsigned char* data, size_t i, size_t n) noexcept {
    unsigned char c = data[i];
    auto cont = [&](size_t k) { return i + k < n && (data[i + k] & 0xC0) == 0x80; };
    if (c < 0x80)
        return 1;
    if (c >= 0xC2 && c <= 0xDF && cont(1))
        return 2;
    if (c >= 0xE0 && c <= 0xEF && cont(1) && cont(2))
        return 3;
    if (c >= 0xF0 && c <= 0xF4 && cont(1) && cont(2) && cont(3))
        return 4;
    return 0;
}

} // namespace detail

// Drop invalid UTF-8 byte sequences. Source trees mix encodings; the index only keeps valid text.
inline std::string dropInvalidUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        size_t len = detail::utf8SequenceLength(data, i, n);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(input.data() + i, len);
        i += len;
    }
    return out;
}

// Number of code points in a valid UTF-8 string.
inline size_t utf8Length(std::string_view input) noexcept {
    size_t count = 0;
    for (unsigned char c : input) {
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

// Keep at most maxChars code points of a valid UTF-8 string.
inline std::string truncateUtf8(std::string_view input, size_t maxChars) {
    size_t chars = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        if ((static_cast<unsigned char>(input[i]) & 0xC0) != 0x80) {
            if (chars == maxChars)
                return std::string(input.substr(0, i));
            ++chars;
        }
    }
    return std::string(input);
}

} // namespace bspidx::common
