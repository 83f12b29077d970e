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

namespace cppmp {
/**
 * MessagePack marker families.
 *
 * Fix-family codes carry their small payload (value or length) in the low bits of the
 * marker byte. Only the family base is listed here.
 */
enum class typecode : uint8_t {
    positive_fixint = 0x00,
    fixmap = 0x80,
    fixarray = 0x90,
    fixstr = 0xa0,

    nil = 0xc0,
    never_used = 0xc1,
    bool_false = 0xc2,
    bool_true = 0xc3,

    bin8 = 0xc4,
    bin16,
    bin32,

    ext8 = 0xc7,
    ext16,
    ext32,

    float32 = 0xca,
    float64,

    uint8 = 0xcc,
    uint16,
    uint32,
    uint64,

    int8 = 0xd0,
    int16,
    int32,
    int64,

    fixext1 = 0xd4,
    fixext2,
    fixext4,
    fixext8,
    fixext16,

    str8 = 0xd9,
    str16,
    str32,

    array16 = 0xdc,
    array32,

    map16 = 0xde,
    map32,

    negative_fixint = 0xe0,
};

/**
 * A single decoded marker byte. Every byte maps to exactly one format, and as_byte()
 * restores the original byte.
 */
class format
{
   public:
    constexpr format(typecode code) noexcept : _code(code), _payload(0) {}

   private:
    constexpr format(typecode code, uint8_t payload) noexcept : _code(code), _payload(payload) {}

   public:
    static constexpr format from_byte(uint8_t byte) noexcept
    {
        switch (byte >> 4) {
            case 0x0:
            case 0x1:
            case 0x2:
            case 0x3:
            case 0x4:
            case 0x5:
            case 0x6:
            case 0x7: return {typecode::positive_fixint, uint8_t(byte & 0x7f)};

            case 0x8: return {typecode::fixmap, uint8_t(byte & 0x0f)};
            case 0x9: return {typecode::fixarray, uint8_t(byte & 0x0f)};

            case 0xa:
            case 0xb: return {typecode::fixstr, uint8_t(byte & 0x1f)};

            case 0xe:
            case 0xf: return {typecode::negative_fixint, uint8_t(byte & 0x1f)};

            default: return {typecode(byte), 0};
        }
    }

    static constexpr format positive_fixint(uint8_t value) noexcept { return {typecode::positive_fixint, uint8_t(value & 0x7f)}; }
    static constexpr format negative_fixint(int8_t value) noexcept { return {typecode::negative_fixint, uint8_t(value & 0x1f)}; }
    static constexpr format fixmap(uint8_t n) noexcept { return {typecode::fixmap, uint8_t(n & 0x0f)}; }
    static constexpr format fixarray(uint8_t n) noexcept { return {typecode::fixarray, uint8_t(n & 0x0f)}; }
    static constexpr format fixstr(uint8_t n) noexcept { return {typecode::fixstr, uint8_t(n & 0x1f)}; }

   public:
    constexpr uint8_t as_byte() const noexcept
    {
        switch (_code) {
            case typecode::positive_fixint: return _payload;
            case typecode::fixmap:
            case typecode::fixarray:
            case typecode::fixstr:
            case typecode::negative_fixint: return uint8_t(_code) | _payload;

            default: return uint8_t(_code);
        }
    }

    constexpr typecode code() const noexcept { return _code; }

    //! Element count of fixmap / fixarray, byte length of fixstr
    constexpr uint8_t fix_length() const noexcept { return _payload; }

    constexpr uint8_t positive_value() const noexcept { return _payload; }
    constexpr int8_t negative_value() const noexcept { return int8_t(as_byte()); }

    constexpr bool is_fix_family() const noexcept
    {
        switch (_code) {
            case typecode::positive_fixint:
            case typecode::fixmap:
            case typecode::fixarray:
            case typecode::fixstr:
            case typecode::negative_fixint: return true;

            default: return false;
        }
    }

    constexpr bool operator==(format const& other) const noexcept
    {
        return _code == other._code && _payload == other._payload;
    }

    constexpr bool operator!=(format const& other) const noexcept { return !(*this == other); }

   private:
    typecode _code;
    uint8_t _payload;
};

char const* to_string(typecode code) noexcept;

}  // namespace cppmp
