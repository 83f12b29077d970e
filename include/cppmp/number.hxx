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
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace cppmp {
/**
 * Numeric value with its sign and float class kept distinct.
 *
 * Non-negative integers are always stored as positive_int, regardless of source signedness.
 */
class number
{
   public:
    enum class kind : uint8_t {
        positive_int,
        negative_int,
        floating,
    };

   public:
    number() noexcept : _kind(kind::positive_int) { _v.u = 0; }

    template <typename Int_,
              std::enable_if_t<std::is_integral_v<Int_> && not std::is_same_v<Int_, bool>, int> = 0>
    number(Int_ value) noexcept
    {
        if constexpr (std::is_signed_v<Int_>) {
            if (value < 0) {
                _kind = kind::negative_int, _v.i = value;
                return;
            }
        }

        _kind = kind::positive_int, _v.u = uint64_t(value);
    }

    number(double value) noexcept : _kind(kind::floating) { _v.f = value; }
    number(float value) noexcept : number(double(value)) {}

   public:
    kind type() const noexcept { return _kind; }
    bool is_integer() const noexcept { return _kind != kind::floating; }
    bool is_floating() const noexcept { return _kind == kind::floating; }

    std::optional<uint64_t> as_uint() const noexcept
    {
        if (_kind == kind::positive_int) { return _v.u; }
        return {};
    }

    std::optional<int64_t> as_int() const noexcept
    {
        if (_kind == kind::negative_int) { return _v.i; }
        if (_kind == kind::positive_int && _v.u <= uint64_t(std::numeric_limits<int64_t>::max())) { return int64_t(_v.u); }
        return {};
    }

    std::optional<double> as_float() const noexcept
    {
        if (_kind == kind::floating) { return _v.f; }
        return {};
    }

    //! Lossy conversion of any kind into double
    double to_double() const noexcept
    {
        switch (_kind) {
            case kind::positive_int: return double(_v.u);
            case kind::negative_int: return double(_v.i);
            default: return _v.f;
        }
    }

    /**
     * Exact conversion into arithmetic type. Integers convert into integer types within range,
     * floats into floating types within range. Never crosses integer/float boundary.
     */
    template <typename Num_>
    std::optional<Num_> to() const noexcept
    {
        static_assert(std::is_arithmetic_v<Num_> && not std::is_same_v<Num_, bool>);

        if constexpr (std::is_integral_v<Num_>) {
            using limits = std::numeric_limits<Num_>;

            if (_kind == kind::positive_int && _v.u <= uint64_t(limits::max()))
                return Num_(_v.u);

            if constexpr (std::is_signed_v<Num_>) {
                if (_kind == kind::negative_int && _v.i >= int64_t(limits::min()))
                    return Num_(_v.i);
            }

            return {};
        } else {
            if (_kind != kind::floating) { return {}; }

            if constexpr (sizeof(Num_) < sizeof(double)) {
                if (std::isfinite(_v.f) && std::fabs(_v.f) > double(std::numeric_limits<Num_>::max()))
                    return {};
            }

            return Num_(_v.f);
        }
    }

    bool operator==(number const& other) const noexcept
    {
        if (_kind != other._kind) { return false; }

        switch (_kind) {
            case kind::positive_int: return _v.u == other._v.u;
            case kind::negative_int: return _v.i == other._v.i;
            default: return _v.f == other._v.f;
        }
    }

    bool operator!=(number const& other) const noexcept { return !(*this == other); }

   private:
    kind _kind;

    union {
        uint64_t u;
        int64_t i;
        double f;
    } _v;
};

namespace detail {
/**
 * Integral value of a float, if it has no fractional part and fits into 64-bit integers.
 */
inline std::optional<number> integral_of(double value) noexcept
{
    if (not std::isfinite(value) || std::trunc(value) != value) { return {}; }

    constexpr double two_pow_63 = 9223372036854775808.0;
    constexpr double two_pow_64 = 18446744073709551616.0;

    if (value >= 0) {
        if (value < two_pow_64) { return number{uint64_t(value)}; }
    } else {
        if (value >= -two_pow_63) { return number{int64_t(value)}; }
    }

    return {};
}
}  // namespace detail
}  // namespace cppmp
