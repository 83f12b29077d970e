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
#include <cmath>
#include <limits>

#include "decode.hxx"
#include "encode.hxx"
#include "number.hxx"

namespace cppmp {
namespace detail {
template <typename Writer_>
size_t put_min_uint(Writer_& wr, uint64_t v)
{
    if (v <= 0xff)
        return cppmp::encode(wr, uint8_t(v));
    else if (v <= 0xffff)
        return cppmp::encode(wr, uint16_t(v));
    else if (v <= 0xffff'ffff)
        return cppmp::encode(wr, uint32_t(v));
    else
        return cppmp::encode(wr, v);
}

template <typename Writer_>
size_t put_min_int(Writer_& wr, int64_t v)
{
    if (v >= 0)
        return put_min_uint(wr, uint64_t(v));
    else if (v >= std::numeric_limits<int8_t>::min())
        return cppmp::encode(wr, int8_t(v));
    else if (v >= std::numeric_limits<int16_t>::min())
        return cppmp::encode(wr, int16_t(v));
    else if (v >= std::numeric_limits<int32_t>::min())
        return cppmp::encode(wr, int32_t(v));
    else
        return cppmp::encode(wr, v);
}

//! float64 shrinks to float32 only if it restores the identical value
template <typename Writer_>
size_t put_min_float(Writer_& wr, double v)
{
    if (std::isfinite(v) && std::fabs(v) <= double(std::numeric_limits<float>::max())) {
        auto narrow = float(v);
        if (double(narrow) == v) { return cppmp::encode(wr, narrow); }
    }

    return cppmp::encode(wr, v);
}

template <typename Writer_>
size_t put_min_number(Writer_& wr, number const& v)
{
    switch (v.type()) {
        case number::kind::positive_int: return put_min_uint(wr, *v.as_uint());
        case number::kind::negative_int: return put_min_int(wr, *v.as_int());
        default: return put_min_float(wr, *v.as_float());
    }
}

enum class number_family {
    none,
    integer,
    floating,
};

constexpr number_family number_family_of(format fmt) noexcept
{
    switch (fmt.code()) {
        case typecode::positive_fixint:
        case typecode::negative_fixint:
        case typecode::uint8:
        case typecode::uint16:
        case typecode::uint32:
        case typecode::uint64:
        case typecode::int8:
        case typecode::int16:
        case typecode::int32:
        case typecode::int64:
            return number_family::integer;

        case typecode::float32:
        case typecode::float64:
            return number_family::floating;

        default:
            return number_family::none;
    }
}

//! Reads any numeric tag. Next value must be a number.
template <typename Reader_>
number read_number(Reader_& rd)
{
    auto fmt = peek_format(rd);

    switch (fmt.code()) {
        case typecode::positive_fixint: return rd.get(), number{fmt.positive_value()};
        case typecode::negative_fixint: return rd.get(), number{fmt.negative_value()};
        case typecode::uint8: return cppmp::decode<uint8_t>(rd);
        case typecode::uint16: return cppmp::decode<uint16_t>(rd);
        case typecode::uint32: return cppmp::decode<uint32_t>(rd);
        case typecode::uint64: return cppmp::decode<uint64_t>(rd);
        case typecode::int8: return cppmp::decode<int8_t>(rd);
        case typecode::int16: return cppmp::decode<int16_t>(rd);
        case typecode::int32: return cppmp::decode<int32_t>(rd);
        case typecode::int64: return cppmp::decode<int64_t>(rd);
        case typecode::float32: return cppmp::decode<float>(rd);
        case typecode::float64: return cppmp::decode<double>(rd);

        default: throw_unexpected(fmt, "number");
    }
}

[[noreturn]] inline void throw_out_of_range(number const& n)
{
    if (n.is_floating())
        throw error::invalid_data{"%g does not fit into target type", n.to_double()};
    else if (auto i = n.as_int())
        throw error::invalid_data{"%lld does not fit into target type", (long long)*i};
    else
        throw error::invalid_data{"%llu does not fit into target type", (unsigned long long)*n.as_uint()};
}
}  // namespace detail

/**
 * Numeric encode policies. Each provides
 *   template <typename Writer_, typename Num_> static size_t encode(Writer_&, Num_);
 */
namespace num_encoder {
//! Tag implied by the source type's own width
struct exact {
    template <typename Writer_, typename Num_>
    static size_t encode(Writer_& wr, Num_ v) { return cppmp::encode(wr, v); }
};

//! Smallest tag which restores the value exactly
struct lossless_minimize {
    template <typename Writer_, typename Num_>
    static size_t encode(Writer_& wr, Num_ v)
    {
        if constexpr (std::is_integral_v<Num_> && std::is_signed_v<Num_>)
            return detail::put_min_int(wr, int64_t(v));
        else if constexpr (std::is_integral_v<Num_>)
            return detail::put_min_uint(wr, uint64_t(v));
        else if constexpr (std::is_same_v<Num_, double>)
            return detail::put_min_float(wr, v);
        else
            return cppmp::encode(wr, v);
    }
};

//! As lossless_minimize, but integral floats are written as integers
struct aggressive_minimize {
    template <typename Writer_, typename Num_>
    static size_t encode(Writer_& wr, Num_ v)
    {
        if constexpr (std::is_floating_point_v<Num_>) {
            if (auto integral = detail::integral_of(double(v)))
                return detail::put_min_number(wr, *integral);
        }

        return lossless_minimize::encode(wr, v);
    }
};
}  // namespace num_encoder

/**
 * Numeric decode policies. Each provides
 *   template <typename Num_, typename Reader_> static Num_ decode(Reader_&);
 *
 * Tag family mismatch raises error::unexpected_format without consuming input. A value which
 * doesn't fit into the target raises error::invalid_data.
 */
namespace num_decoder {
//! Accepts only the tag(s) the target's own encoder produces
struct exact {
    template <typename Num_, typename Reader_>
    static Num_ decode(Reader_& rd) { return cppmp::decode<Num_>(rd); }
};

//! Any integer tag into integer targets, any float tag into float targets
struct widening {
    template <typename Num_, typename Reader_>
    static Num_ decode(Reader_& rd)
    {
        constexpr auto expected = std::is_integral_v<Num_>
                                        ? detail::number_family::integer
                                        : detail::number_family::floating;

        auto fmt = detail::peek_format(rd);
        if (detail::number_family_of(fmt) != expected) {
            detail::throw_unexpected(fmt, std::is_integral_v<Num_> ? "integer" : "float");
        }

        auto n = detail::read_number(rd);
        if (auto value = n.template to<Num_>()) { return *value; }

        detail::throw_out_of_range(n);
    }
};

//! As widening, and also reinterprets integral floats as integers and integers as floats
struct lenient {
    template <typename Num_, typename Reader_>
    static Num_ decode(Reader_& rd)
    {
        auto fmt = detail::peek_format(rd);
        auto family = detail::number_family_of(fmt);

        if (family == detail::number_family::none) { detail::throw_unexpected(fmt, "number"); }

        auto n = detail::read_number(rd);
        if (auto value = n.template to<Num_>()) { return *value; }

        if constexpr (std::is_integral_v<Num_>) {
            if (n.is_floating()) {
                if (auto integral = detail::integral_of(*n.as_float()))
                    if (auto value = integral->template to<Num_>())
                        return *value;
            }
        } else {
            if (n.is_integer()) { return Num_(n.to_double()); }
        }

        detail::throw_out_of_range(n);
    }
};
}  // namespace num_decoder

template <>
struct encoder<number> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, number const& v) { return detail::put_min_number(wr, v); }
};

template <>
struct decoder<number> {
    template <typename Reader_>
    static number decode(Reader_& rd) { return detail::read_number(rd); }
};

/**
 * Writes number through given policy. Positive and negative integers are presented to the
 * policy as 64-bit values, floats as double.
 */
template <typename NumEncoder_, typename Writer_>
size_t encode_number(Writer_& wr, number const& v)
{
    switch (v.type()) {
        case number::kind::positive_int: return NumEncoder_::encode(wr, *v.as_uint());
        case number::kind::negative_int: return NumEncoder_::encode(wr, *v.as_int());
        default: return NumEncoder_::encode(wr, *v.as_float());
    }
}

}  // namespace cppmp
