// MIT License
//
// Copyright (c) 2026. The cppmp authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
// cppmp: MessagePack codec for C++17

#pragma once
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace cppmp {
/**
 * Strict UTF-8 validation. Rejects overlong forms, surrogate halves, code points beyond
 * U+10FFFF and truncated sequences.
 */
template <typename BeginIt, typename EndIt>
bool is_valid_utf8(BeginIt it, EndIt const& end) noexcept
{
    for (; it != end;) {
        auto c = (unsigned char)*it++;
        int n;
        uint32_t cp;

        if (c <= 0x7f) {
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            n = 1, cp = c & 0x1F;  // 110bbbbb
        } else if ((c & 0xF0) == 0xE0) {
            n = 2, cp = c & 0x0F;  // 1110bbbb
        } else if ((c & 0xF8) == 0xF0) {
            n = 3, cp = c & 0x07;  // 11110bbb
        } else {
            return false;
        }

        for (auto j = 0; j < n; ++j) {
            if (it == end) { return false; }

            auto cc = (unsigned char)*it++;
            if ((cc & 0xC0) != 0x80) { return false; }

            cp = (cp << 6) | (cc & 0x3F);
        }

        constexpr uint32_t min_by_length[] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_by_length[n]) { return false; }
        if (cp > 0x10FFFF) { return false; }
        if (0xD800 <= cp && cp <= 0xDFFF) { return false; }
    }

    return true;
}

template <typename Range_>
bool is_valid_utf8(Range_ const& range) noexcept
{
    return is_valid_utf8(std::begin(range), std::end(range));
}

/**
 * Appends single code point as UTF-8. Returns false if code point is not a scalar value.
 */
inline bool append_utf8(std::string& out, char32_t cp)
{
    if (cp > 0x10FFFF || (0xD800 <= cp && cp <= 0xDFFF)) { return false; }

    if (cp < 0x80) {
        out += char(cp);
    } else if (cp < 0x800) {
        out += char(0xC0 | (cp >> 6));
        out += char(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += char(0xE0 | (cp >> 12));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    } else {
        out += char(0xF0 | (cp >> 18));
        out += char(0x80 | ((cp >> 12) & 0x3F));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }

    return true;
}

/**
 * Decodes a string holding exactly one code point. Input must be valid UTF-8.
 * @return false if the string is empty or holds more than one code point.
 */
inline bool decode_single_utf8(std::string_view str, char32_t* out) noexcept
{
    if (str.empty()) { return false; }

    auto c = (unsigned char)str[0];
    size_t n = c < 0x80 ? 1 : (c & 0xE0) == 0xC0 ? 2
                        : (c & 0xF0) == 0xE0   ? 3
                                               : 4;
    if (str.size() != n) { return false; }

    char32_t cp = n == 1 ? c : n == 2 ? (c & 0x1F) : n == 3 ? (c & 0x0F) : (c & 0x07);
    for (size_t i = 1; i < n; ++i)
        cp = (cp << 6) | ((unsigned char)str[i] & 0x3F);

    *out = cp;
    return true;
}
}  // namespace cppmp
