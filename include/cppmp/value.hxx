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
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "extension.hxx"
#include "num_strategy.hxx"

namespace cppmp {
struct ref_storage {
    using string_type = std::string_view;
    using binary_type = bytes_view;
    using extension_type = extension_ref;
};

struct owned_storage {
    using string_type = std::string;
    using binary_type = bytes;
    using extension_type = extension;
};

/**
 * Any MessagePack value.
 *
 * Map is kept as sequence of pairs in wire order, not as lookup structure.
 * Storage_ decides whether strings, binaries and extensions borrow or own their bytes.
 */
template <typename Storage_>
class basic_value
{
   public:
    using string_type = typename Storage_::string_type;
    using binary_type = typename Storage_::binary_type;
    using extension_type = typename Storage_::extension_type;
    using array_type = std::vector<basic_value>;
    using map_type = std::vector<std::pair<basic_value, basic_value>>;

    //! Matches alternative index of the underlying variant
    enum class kind : uint8_t {
        nil,
        boolean,
        binary,
        extension,
        number,
        string,
        array,
        map,
    };

   private:
    using variant_type = std::variant<std::nullptr_t, bool, binary_type, extension_type,
                                      number, string_type, array_type, map_type>;

   public:
    basic_value() noexcept : _data(std::in_place_type<std::nullptr_t>, nullptr) {}
    basic_value(std::nullptr_t) noexcept : basic_value() {}
    basic_value(bool v) noexcept : _data(std::in_place_type<bool>, v) {}

    template <typename Num_,
              std::enable_if_t<std::is_arithmetic_v<Num_> && not std::is_same_v<Num_, bool>, int> = 0>
    basic_value(Num_ v) noexcept : _data(std::in_place_type<number>, v) {}

    basic_value(number v) noexcept : _data(std::in_place_type<number>, v) {}
    basic_value(string_type v) : _data(std::in_place_type<string_type>, std::move(v)) {}
    basic_value(char const* v) : _data(std::in_place_type<string_type>, v) {}
    basic_value(binary_type v) : _data(std::in_place_type<binary_type>, std::move(v)) {}
    basic_value(extension_type v) : _data(std::in_place_type<extension_type>, std::move(v)) {}
    basic_value(array_type v) : _data(std::in_place_type<array_type>, std::move(v)) {}
    basic_value(map_type v) : _data(std::in_place_type<map_type>, std::move(v)) {}

   public:
    kind type() const noexcept { return kind(_data.index()); }

    bool is_nil() const noexcept { return type() == kind::nil; }

    std::optional<bool> as_bool() const noexcept
    {
        if (auto p = std::get_if<bool>(&_data)) { return *p; }
        return {};
    }

    number const* as_number() const noexcept { return std::get_if<number>(&_data); }

    //! Exact numeric conversion. Empty if not a number, or out of target's range.
    template <typename Num_>
    std::optional<Num_> as() const noexcept
    {
        if (auto p = as_number()) { return p->template to<Num_>(); }
        return {};
    }

    string_type const* as_string() const noexcept { return std::get_if<string_type>(&_data); }
    binary_type const* as_binary() const noexcept { return std::get_if<binary_type>(&_data); }
    extension_type const* as_extension() const noexcept { return std::get_if<extension_type>(&_data); }

    array_type const* as_array() const noexcept { return std::get_if<array_type>(&_data); }
    array_type* as_array() noexcept { return std::get_if<array_type>(&_data); }

    map_type const* as_map() const noexcept { return std::get_if<map_type>(&_data); }
    map_type* as_map() noexcept { return std::get_if<map_type>(&_data); }

    //! First map entry whose key is given string
    basic_value const* find(std::string_view key) const noexcept
    {
        if (auto map = as_map()) {
            for (auto& [k, v] : *map)
                if (auto str = k.as_string(); str && std::string_view{*str} == key)
                    return &v;
        }

        return nullptr;
    }

    template <typename Visitor_>
    decltype(auto) visit(Visitor_&& visitor) const
    {
        return std::visit(std::forward<Visitor_>(visitor), _data);
    }

    bool operator==(basic_value const& other) const { return _data == other._data; }
    bool operator!=(basic_value const& other) const { return !(*this == other); }

   private:
    variant_type _data;
};

using value_ref = basic_value<ref_storage>;
using value = basic_value<owned_storage>;

//! Deep copy of every borrowed payload
value to_owned(value_ref const& v);

//! Borrowing view over 'v'. Valid while 'v' is alive and unmodified.
value_ref as_ref(value const& v);

//! Human readable, JSON-like rendering for diagnostics
std::string to_string(value_ref const& v);
std::string to_string(value const& v);

namespace detail {
template <typename NumEncoder_, typename Writer_, typename Storage_>
size_t put_value(Writer_& wr, basic_value<Storage_> const& v)
{
    using value_type = basic_value<Storage_>;

    return v.visit([&](auto const& elem) -> size_t {
        using elem_type = std::decay_t<decltype(elem)>;

        if constexpr (std::is_same_v<elem_type, number>) {
            return encode_number<NumEncoder_>(wr, elem);
        } else if constexpr (std::is_same_v<elem_type, typename value_type::array_type>) {
            auto n = cppmp::encode(wr, array_header{elem.size()});
            for (auto& child : elem)
                n += put_value<NumEncoder_>(wr, child);

            return n;
        } else if constexpr (std::is_same_v<elem_type, typename value_type::map_type>) {
            auto n = cppmp::encode(wr, map_header{elem.size()});
            for (auto& [key, child] : elem) {
                n += put_value<NumEncoder_>(wr, key);
                n += put_value<NumEncoder_>(wr, child);
            }

            return n;
        } else {
            return cppmp::encode(wr, elem);
        }
    });
}

template <typename Storage_, typename Reader_>
basic_value<Storage_> read_value(Reader_& rd, size_t depth_left)
{
    using value_type = basic_value<Storage_>;
    auto fmt = peek_format(rd);

    switch (fmt.code()) {
        case typecode::nil: return rd.get(), value_type{};

        case typecode::bool_false:
        case typecode::bool_true: return cppmp::decode<bool>(rd);

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
        case typecode::float32:
        case typecode::float64: return read_number(rd);

        case typecode::fixstr:
        case typecode::str8:
        case typecode::str16:
        case typecode::str32: return cppmp::decode<typename value_type::string_type>(rd);

        case typecode::bin8:
        case typecode::bin16:
        case typecode::bin32: return cppmp::decode<typename value_type::binary_type>(rd);

        case typecode::fixext1:
        case typecode::fixext2:
        case typecode::fixext4:
        case typecode::fixext8:
        case typecode::fixext16:
        case typecode::ext8:
        case typecode::ext16:
        case typecode::ext32: return cppmp::decode<typename value_type::extension_type>(rd);

        case typecode::fixarray:
        case typecode::array16:
        case typecode::array32: {
            if (depth_left == 0)
                throw error::recursion_limit_exceeded{"nesting deeper than configured limit"};

            auto n = read_array_len(rd);
            typename value_type::array_type array;
            array.reserve(std::min(n, max_reserve));

            for (size_t i = 0; i < n; ++i)
                array.push_back(read_value<Storage_>(rd, depth_left - 1));

            return array;
        }

        case typecode::fixmap:
        case typecode::map16:
        case typecode::map32: {
            if (depth_left == 0)
                throw error::recursion_limit_exceeded{"nesting deeper than configured limit"};

            auto n = read_map_len(rd);
            typename value_type::map_type map;
            map.reserve(std::min(n, max_reserve));

            for (size_t i = 0; i < n; ++i) {
                auto key = read_value<Storage_>(rd, depth_left - 1);
                auto child = read_value<Storage_>(rd, depth_left - 1);
                map.emplace_back(std::move(key), std::move(child));
            }

            return map;
        }

        default: throw_unexpected(fmt, "value");
    }
}
}  // namespace detail

/**
 * Decodes single value of any shape. value_ref requires zero-copy reader.
 */
template <typename Storage_, typename Reader_>
basic_value<Storage_> decode_value(Reader_& rd, size_t max_depth = default_max_depth)
{
    return detail::read_value<Storage_>(rd, max_depth);
}

template <typename NumEncoder_, typename Writer_, typename Storage_>
size_t encode_value(Writer_& wr, basic_value<Storage_> const& v)
{
    return detail::put_value<NumEncoder_>(wr, v);
}

template <typename Storage_>
struct encoder<basic_value<Storage_>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, basic_value<Storage_> const& v)
    {
        return detail::put_value<num_encoder::lossless_minimize>(wr, v);
    }
};

template <typename Storage_>
struct decoder<basic_value<Storage_>> {
    template <typename Reader_>
    static basic_value<Storage_> decode(Reader_& rd) { return detail::read_value<Storage_>(rd, default_max_depth); }
};

}  // namespace cppmp
