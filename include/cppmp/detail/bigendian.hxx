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
#include <cstring>
#include <type_traits>

namespace cppmp::detail {
template <size_t N_>
struct uint_of_size;

template <> struct uint_of_size<1> { using type = uint8_t; };
template <> struct uint_of_size<2> { using type = uint16_t; };
template <> struct uint_of_size<4> { using type = uint32_t; };
template <> struct uint_of_size<8> { using type = uint64_t; };

template <typename Ty_>
using uint_of_t = typename uint_of_size<sizeof(Ty_)>::type;

/**
 * Writes arithmetic value into 'out' in network byte order. Returns bytes written.
 */
template <typename Ty_, typename = std::enable_if_t<std::is_arithmetic_v<Ty_>>>
size_t store_big_endian(uint8_t* out, Ty_ value) noexcept
{
    uint_of_t<Ty_> bits;
    std::memcpy(&bits, &value, sizeof bits);

    for (size_t i = 0; i < sizeof bits; ++i)
        out[i] = uint8_t(bits >> (8 * (sizeof bits - 1 - i)));

    return sizeof bits;
}

template <typename Ty_, typename = std::enable_if_t<std::is_arithmetic_v<Ty_>>>
Ty_ load_big_endian(uint8_t const* in) noexcept
{
    uint_of_t<Ty_> bits = 0;
    for (size_t i = 0; i < sizeof bits; ++i)
        bits = uint_of_t<Ty_>((bits << 8) | in[i]);

    Ty_ value;
    std::memcpy(&value, &bits, sizeof value);
    return value;
}
}  // namespace cppmp::detail
