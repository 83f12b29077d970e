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
#include <algorithm>
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
#include "encode.hxx"
#include "error.hxx"
#include "format.hxx"
#include "helper/strutil.hxx"
#include "io.hxx"

/**
 * Primitive decoders.
 *
 * Specialize decoder<T> with
 *   template <typename Reader_> static T decode(Reader_&);
 *
 * Decoders accept only the tags their own encoder produces. A mismatching tag raises
 * error::unexpected_format before anything is consumed, so the caller may retry with another
 * target type.
 */
namespace cppmp {
template <typename Ty_, class = void>
struct decoder;

//! Nesting limit of dynamically shaped input
constexpr size_t default_max_depth = 256;

template <typename Ty_, typename Reader_>
Ty_ decode(Reader_& rd)
{
    return decoder<Ty_>::decode(rd);
}

namespace detail {
template <typename Reader_>
format peek_format(Reader_& rd)
{
    return format::from_byte(rd.peek());
}

[[noreturn]] inline void throw_unexpected(format fmt, char const* expected)
{
    throw error::unexpected_format{
            "%s expected, got %s (0x%02x)", expected, to_string(fmt.code()), unsigned(fmt.as_byte())};
}

template <typename Ty_, typename Reader_>
Ty_ read_big_endian(Reader_& rd)
{
    auto ref = rd.read(sizeof(Ty_));
    return load_big_endian<Ty_>(ref.data().data());
}

//! Length prefix of str8/bin8/ext8 families. Marker must be consumed already.
template <typename Reader_>
size_t read_sized_length(Reader_& rd, typecode base8, typecode code)
{
    switch (uint8_t(code) - uint8_t(base8)) {
        case 0: return read_big_endian<uint8_t>(rd);
        case 1: return read_big_endian<uint16_t>(rd);
        default: return read_big_endian<uint32_t>(rd);
    }
}

template <typename Reader_>
reference read_str(Reader_& rd)
{
    auto fmt = peek_format(rd);
    size_t len = 0;

    switch (fmt.code()) {
        case typecode::fixstr:
            rd.get();
            len = fmt.fix_length();
            break;

        case typecode::str8:
        case typecode::str16:
        case typecode::str32:
            rd.get();
            len = read_sized_length(rd, typecode::str8, fmt.code());
            break;

        default: throw_unexpected(fmt, "string");
    }

    auto ref = rd.read(len);
    if (not is_valid_utf8(ref.data()))
        throw error::invalid_data{"string of %zu bytes is not valid utf-8", len};

    return ref;
}

template <typename Reader_>
reference read_bin(Reader_& rd)
{
    auto fmt = peek_format(rd);

    switch (fmt.code()) {
        case typecode::bin8:
        case typecode::bin16:
        case typecode::bin32: {
            rd.get();
            auto len = read_sized_length(rd, typecode::bin8, fmt.code());
            return rd.read(len);
        }

        default: throw_unexpected(fmt, "binary");
    }
}

template <typename Reader_>
size_t read_array_len(Reader_& rd)
{
    auto fmt = peek_format(rd);

    switch (fmt.code()) {
        case typecode::fixarray: return rd.get(), fmt.fix_length();
        case typecode::array16: return rd.get(), read_big_endian<uint16_t>(rd);
        case typecode::array32: return rd.get(), read_big_endian<uint32_t>(rd);

        default: throw_unexpected(fmt, "array");
    }
}

template <typename Reader_>
size_t read_map_len(Reader_& rd)
{
    auto fmt = peek_format(rd);

    switch (fmt.code()) {
        case typecode::fixmap: return rd.get(), fmt.fix_length();
        case typecode::map16: return rd.get(), read_big_endian<uint16_t>(rd);
        case typecode::map32: return rd.get(), read_big_endian<uint32_t>(rd);

        default: throw_unexpected(fmt, "map");
    }
}

inline void verify_arity(size_t wire, size_t expected)
{
    if (wire != expected)
        throw error::invalid_data{"%zu elements expected, wire holds %zu", expected, wire};
}

//! Caps speculative reservation, so that hostile length prefix can't exhaust memory.
constexpr size_t max_reserve = 4096;

inline std::string_view as_chars(bytes_view v) noexcept
{
    return {reinterpret_cast<char const*>(v.data()), v.size()};
}
}  // namespace detail

template <typename Reader_>
size_t decode_array_len(Reader_& rd) { return detail::read_array_len(rd); }

template <typename Reader_>
size_t decode_map_len(Reader_& rd) { return detail::read_map_len(rd); }

template <>
struct decoder<std::nullptr_t> {
    template <typename Reader_>
    static std::nullptr_t decode(Reader_& rd)
    {
        auto fmt = detail::peek_format(rd);
        if (fmt.code() != typecode::nil) { detail::throw_unexpected(fmt, "nil"); }

        rd.get();
        return nullptr;
    }
};

template <>
struct decoder<bool> {
    template <typename Reader_>
    static bool decode(Reader_& rd)
    {
        auto fmt = detail::peek_format(rd);
        switch (fmt.code()) {
            case typecode::bool_true: return rd.get(), true;
            case typecode::bool_false: return rd.get(), false;
            default: detail::throw_unexpected(fmt, "boolean");
        }
    }
};

template <>
struct decoder<uint8_t> {
    template <typename Reader_>
    static uint8_t decode(Reader_& rd)
    {
        auto fmt = detail::peek_format(rd);
        switch (fmt.code()) {
            case typecode::positive_fixint: return rd.get(), fmt.positive_value();
            case typecode::uint8: return rd.get(), detail::read_big_endian<uint8_t>(rd);
            default: detail::throw_unexpected(fmt, "uint8");
        }
    }
};

template <>
struct decoder<int8_t> {
    template <typename Reader_>
    static int8_t decode(Reader_& rd)
    {
        auto fmt = detail::peek_format(rd);
        switch (fmt.code()) {
            case typecode::negative_fixint: return rd.get(), fmt.negative_value();
            case typecode::int8: return rd.get(), detail::read_big_endian<int8_t>(rd);
            default: detail::throw_unexpected(fmt, "int8");
        }
    }
};

namespace detail {
template <typename Ty_, typename Reader_>
Ty_ decode_exact_scalar(Reader_& rd, typecode code, char const* name)
{
    auto fmt = peek_format(rd);
    if (fmt.code() != code) { throw_unexpected(fmt, name); }

    rd.get();
    return read_big_endian<Ty_>(rd);
}
}  // namespace detail

template <typename Ty_>
struct decoder<Ty_, std::enable_if_t<detail::is_wire_int_v<Ty_> && (sizeof(Ty_) > 1)>> {
    template <typename Reader_>
    static Ty_ decode(Reader_& rd)
    {
        constexpr auto code = detail::exact_int_typecode<Ty_>();
        return detail::decode_exact_scalar<Ty_>(rd, code, to_string(code));
    }
};

template <>
struct decoder<float> {
    template <typename Reader_>
    static float decode(Reader_& rd) { return detail::decode_exact_scalar<float>(rd, typecode::float32, "float32"); }
};

template <>
struct decoder<double> {
    template <typename Reader_>
    static double decode(Reader_& rd) { return detail::decode_exact_scalar<double>(rd, typecode::float64, "float64"); }
};

/*
 * Strings and binaries. View types require zero-copy reader.
 */
template <>
struct decoder<std::string_view> {
    template <typename Reader_>
    static std::string_view decode(Reader_& rd) { return detail::as_chars(detail::read_str(rd).borrowed()); }
};

template <>
struct decoder<std::string> {
    template <typename Reader_>
    static std::string decode(Reader_& rd) { return std::string{detail::as_chars(detail::read_str(rd).data())}; }
};

template <>
struct decoder<bytes_view> {
    template <typename Reader_>
    static bytes_view decode(Reader_& rd) { return detail::read_bin(rd).borrowed(); }
};

template <>
struct decoder<bytes> {
    template <typename Reader_>
    static bytes decode(Reader_& rd)
    {
        auto data = detail::read_bin(rd).data();
        return bytes(data.begin(), data.end());
    }
};

template <>
struct decoder<array_header> {
    template <typename Reader_>
    static array_header decode(Reader_& rd) { return {detail::read_array_len(rd)}; }
};

template <>
struct decoder<map_header> {
    template <typename Reader_>
    static map_header decode(Reader_& rd) { return {detail::read_map_len(rd)}; }
};

/*
 * Containers
 */
template <typename Elem_, typename Alloc_>
struct decoder<std::vector<Elem_, Alloc_>, std::enable_if_t<not std::is_same_v<Elem_, uint8_t>>> {
    template <typename Reader_>
    static std::vector<Elem_, Alloc_> decode(Reader_& rd)
    {
        auto n = detail::read_array_len(rd);

        std::vector<Elem_, Alloc_> result;
        result.reserve(std::min(n, detail::max_reserve));

        for (size_t i = 0; i < n; ++i)
            result.push_back(cppmp::decode<Elem_>(rd));

        return result;
    }
};

template <typename Elem_, size_t N_>
struct decoder<std::array<Elem_, N_>> {
    template <typename Reader_>
    static std::array<Elem_, N_> decode(Reader_& rd)
    {
        detail::verify_arity(detail::read_array_len(rd), N_);

        std::array<Elem_, N_> result;
        for (auto& elem : result)
            elem = cppmp::decode<Elem_>(rd);

        return result;
    }
};

template <typename... Args_>
struct decoder<std::tuple<Args_...>> {
    template <typename Reader_>
    static std::tuple<Args_...> decode(Reader_& rd)
    {
        detail::verify_arity(detail::read_array_len(rd), sizeof...(Args_));

        // braced initialization keeps left-to-right evaluation order
        return std::tuple<Args_...>{cppmp::decode<Args_>(rd)...};
    }
};

template <typename First_, typename Second_>
struct decoder<std::pair<First_, Second_>> {
    template <typename Reader_>
    static std::pair<First_, Second_> decode(Reader_& rd)
    {
        detail::verify_arity(detail::read_array_len(rd), 2);

        auto first = cppmp::decode<First_>(rd);
        auto second = cppmp::decode<Second_>(rd);
        return {std::move(first), std::move(second)};
    }
};

namespace detail {
template <typename Map_, typename Reader_>
Map_ decode_map(Reader_& rd)
{
    auto n = read_map_len(rd);

    Map_ result;
    for (size_t i = 0; i < n; ++i) {
        auto key = cppmp::decode<typename Map_::key_type>(rd);
        auto value = cppmp::decode<typename Map_::mapped_type>(rd);
        result.insert_or_assign(std::move(key), std::move(value));
    }

    return result;
}
}  // namespace detail

template <typename Key_, typename Value_, typename... Rest_>
struct decoder<std::map<Key_, Value_, Rest_...>> {
    template <typename Reader_>
    static auto decode(Reader_& rd) { return detail::decode_map<std::map<Key_, Value_, Rest_...>>(rd); }
};

template <typename Key_, typename Value_, typename... Rest_>
struct decoder<std::unordered_map<Key_, Value_, Rest_...>> {
    template <typename Reader_>
    static auto decode(Reader_& rd) { return detail::decode_map<std::unordered_map<Key_, Value_, Rest_...>>(rd); }
};

template <typename Ty_>
struct decoder<std::optional<Ty_>> {
    template <typename Reader_>
    static std::optional<Ty_> decode(Reader_& rd)
    {
        if (detail::peek_format(rd).code() == typecode::nil) {
            rd.get();
            return std::nullopt;
        }

        return cppmp::decode<Ty_>(rd);
    }
};

}  // namespace cppmp
