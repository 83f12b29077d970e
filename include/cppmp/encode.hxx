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
#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "detail/bigendian.hxx"
#include "error.hxx"
#include "format.hxx"
#include "utility/array_view.hxx"

/**
 * Primitive encoders.
 *
 * Specialize encoder<T> with
 *   template <typename Writer_> static size_t encode(Writer_&, T const&);
 * which returns number of bytes written.
 */
namespace cppmp {
template <typename Ty_, class = void>
struct encoder;

template <typename Writer_, typename Ty_>
size_t encode(Writer_& wr, Ty_ const& value)
{
    return encoder<Ty_>::encode(wr, value);
}

//! Declares array of 'size' elements. Elements must follow.
struct array_header {
    size_t size;
};

//! Declares map of 'size' key-value pairs. Keys and values must follow alternately.
struct map_header {
    size_t size;
};

namespace detail {
template <typename Writer_>
size_t put_format(Writer_& wr, format fmt)
{
    uint8_t byte = fmt.as_byte();
    wr.write({&byte, 1});
    return 1;
}

//! Marker and its big-endian payload, written as a single run
template <typename Writer_, typename Ty_>
size_t put_scalar(Writer_& wr, typecode code, Ty_ value)
{
    uint8_t buf[1 + sizeof(Ty_)];
    buf[0] = uint8_t(code);
    store_big_endian(buf + 1, value);

    wr.write({buf, sizeof buf});
    return sizeof buf;
}

inline void verify_length_32bit(size_t n, char const* what)
{
    if (n > 0xffff'ffffu)
        throw error::invalid_format{"%s length %zu exceeds 32-bit range", what, n};
}

//! str8, bin8 and ext8 families share the same 8/16/32 bit length prefix layout
template <typename Writer_>
size_t put_sized_header(Writer_& wr, typecode base8, size_t n)
{
    if (n <= 0xff)
        return put_scalar(wr, base8, uint8_t(n));
    else if (n <= 0xffff)
        return put_scalar(wr, typecode(uint8_t(base8) + 1), uint16_t(n));
    else
        return put_scalar(wr, typecode(uint8_t(base8) + 2), uint32_t(n));
}

template <typename Writer_>
size_t put_str(Writer_& wr, std::string_view str)
{
    verify_length_32bit(str.size(), "string");

    size_t n = str.size() < 32
                     ? put_format(wr, format::fixstr(uint8_t(str.size())))
                     : put_sized_header(wr, typecode::str8, str.size());

    wr.write({reinterpret_cast<uint8_t const*>(str.data()), str.size()});
    return n + str.size();
}

template <typename Writer_>
size_t put_bin(Writer_& wr, bytes_view data)
{
    verify_length_32bit(data.size(), "binary");

    auto n = put_sized_header(wr, typecode::bin8, data.size());
    wr.write(data);
    return n + data.size();
}

template <typename Writer_, typename Range_>
size_t put_array(Writer_& wr, Range_ const& range)
{
    auto n = cppmp::encode(wr, array_header{std::size(range)});
    for (auto const& elem : range)
        n += cppmp::encode(wr, elem);

    return n;
}

template <typename Writer_, typename Map_>
size_t put_map(Writer_& wr, Map_ const& map)
{
    auto n = cppmp::encode(wr, map_header{map.size()});
    for (auto const& [key, value] : map) {
        n += cppmp::encode(wr, key);
        n += cppmp::encode(wr, value);
    }

    return n;
}

template <typename Ty_>
constexpr typecode exact_int_typecode() noexcept
{
    static_assert(std::is_integral_v<Ty_>);

    if constexpr (std::is_signed_v<Ty_>) {
        switch (sizeof(Ty_)) {
            case 1: return typecode::int8;
            case 2: return typecode::int16;
            case 4: return typecode::int32;
            default: return typecode::int64;
        }
    } else {
        switch (sizeof(Ty_)) {
            case 1: return typecode::uint8;
            case 2: return typecode::uint16;
            case 4: return typecode::uint32;
            default: return typecode::uint64;
        }
    }
}

template <typename Ty_>
constexpr bool is_wire_int_v = std::is_same_v<Ty_, int8_t> || std::is_same_v<Ty_, int16_t>
                               || std::is_same_v<Ty_, int32_t> || std::is_same_v<Ty_, int64_t>
                               || std::is_same_v<Ty_, uint8_t> || std::is_same_v<Ty_, uint16_t>
                               || std::is_same_v<Ty_, uint32_t> || std::is_same_v<Ty_, uint64_t>;
}  // namespace detail

template <>
struct encoder<std::nullptr_t> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::nullptr_t)
    {
        return detail::put_format(wr, typecode::nil);
    }
};

template <>
struct encoder<bool> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, bool v)
    {
        return detail::put_format(wr, v ? typecode::bool_true : typecode::bool_false);
    }
};

/*
 * Integers: each width encodes with its own tag, except 8-bit values which fall into
 * fix-family when possible.
 */
template <>
struct encoder<uint8_t> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, uint8_t v)
    {
        if (v <= 0x7f)
            return detail::put_format(wr, format::positive_fixint(v));
        else
            return detail::put_scalar(wr, typecode::uint8, v);
    }
};

template <>
struct encoder<int8_t> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, int8_t v)
    {
        if (-32 <= v && v < 0)
            return detail::put_format(wr, format::negative_fixint(v));
        else
            return detail::put_scalar(wr, typecode::int8, v);
    }
};

template <typename Ty_>
struct encoder<Ty_, std::enable_if_t<detail::is_wire_int_v<Ty_> && (sizeof(Ty_) > 1)>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, Ty_ v)
    {
        return detail::put_scalar(wr, detail::exact_int_typecode<Ty_>(), v);
    }
};

template <>
struct encoder<float> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, float v)
    {
        return detail::put_scalar(wr, typecode::float32, v);
    }
};

template <>
struct encoder<double> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, double v)
    {
        return detail::put_scalar(wr, typecode::float64, v);
    }
};

/*
 * Strings and binaries
 */
template <>
struct encoder<std::string_view> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::string_view v) { return detail::put_str(wr, v); }
};

template <>
struct encoder<std::string> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::string const& v) { return detail::put_str(wr, v); }
};

template <size_t N_>
struct encoder<char[N_]> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, char const (&v)[N_]) { return detail::put_str(wr, std::string_view{v}); }
};

template <>
struct encoder<char const*> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, char const* v) { return detail::put_str(wr, std::string_view{v}); }
};

template <>
struct encoder<bytes_view> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, bytes_view v) { return detail::put_bin(wr, v); }
};

template <>
struct encoder<bytes> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, bytes const& v) { return detail::put_bin(wr, v); }
};

/*
 * Container headers
 */
template <>
struct encoder<array_header> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, array_header h)
    {
        detail::verify_length_32bit(h.size, "array");

        if (h.size < 16)
            return detail::put_format(wr, format::fixarray(uint8_t(h.size)));
        else if (h.size <= 0xffff)
            return detail::put_scalar(wr, typecode::array16, uint16_t(h.size));
        else
            return detail::put_scalar(wr, typecode::array32, uint32_t(h.size));
    }
};

template <>
struct encoder<map_header> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, map_header h)
    {
        detail::verify_length_32bit(h.size, "map");

        if (h.size < 16)
            return detail::put_format(wr, format::fixmap(uint8_t(h.size)));
        else if (h.size <= 0xffff)
            return detail::put_scalar(wr, typecode::map16, uint16_t(h.size));
        else
            return detail::put_scalar(wr, typecode::map32, uint32_t(h.size));
    }
};

/*
 * Containers
 */
template <typename Elem_, typename Alloc_>
struct encoder<std::vector<Elem_, Alloc_>, std::enable_if_t<not std::is_same_v<Elem_, uint8_t>>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::vector<Elem_, Alloc_> const& v) { return detail::put_array(wr, v); }
};

template <typename Elem_, size_t N_>
struct encoder<std::array<Elem_, N_>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::array<Elem_, N_> const& v) { return detail::put_array(wr, v); }
};

template <typename... Args_>
struct encoder<std::tuple<Args_...>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::tuple<Args_...> const& v)
    {
        auto n = encoder<array_header>::encode(wr, array_header{sizeof...(Args_)});
        std::apply([&](auto const&... elems) { ((n += cppmp::encode(wr, elems)), ...); }, v);
        return n;
    }
};

template <typename First_, typename Second_>
struct encoder<std::pair<First_, Second_>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::pair<First_, Second_> const& v)
    {
        auto n = encoder<array_header>::encode(wr, array_header{2});
        n += cppmp::encode(wr, v.first);
        n += cppmp::encode(wr, v.second);
        return n;
    }
};

template <typename Key_, typename Value_, typename... Rest_>
struct encoder<std::map<Key_, Value_, Rest_...>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::map<Key_, Value_, Rest_...> const& v) { return detail::put_map(wr, v); }
};

template <typename Key_, typename Value_, typename... Rest_>
struct encoder<std::unordered_map<Key_, Value_, Rest_...>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::unordered_map<Key_, Value_, Rest_...> const& v) { return detail::put_map(wr, v); }
};

template <typename Ty_>
struct encoder<std::optional<Ty_>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::optional<Ty_> const& v)
    {
        if (v)
            return cppmp::encode(wr, *v);
        else
            return detail::put_format(wr, typecode::nil);
    }
};

}  // namespace cppmp
