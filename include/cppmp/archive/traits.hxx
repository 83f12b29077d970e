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
#include <chrono>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <tuple>
#include <unordered_map>
#include <variant>
#include <vector>

#include "../helper/macros.hxx"
#include "../helper/strutil.hxx"
#include "../timestamp.hxx"
#include "../value.hxx"
#include "if_archive.hxx"

/**
 * Adapters between C++ types and archive interface.
 *
 * Specialize archive_traits<T> with
 *   static void archive(if_writer&, T const&);
 *   static void restore(if_reader&, T&);
 *
 * or give the type 'void archive(if_writer&) const' and 'void restore(if_reader&)' members.
 */
namespace cppmp::archive {
template <typename Ty_, class = void>
struct archive_traits;

template <typename Ty_>
if_writer& if_writer::write(Ty_ const& other)
{
    archive_traits<Ty_>::archive(*this, other);
    return *this;
}

template <typename Ty_>
if_reader& if_reader::read(Ty_& other)
{
    archive_traits<Ty_>::restore(*this, other);
    return *this;
}

namespace detail {
CPPMP_SFINAE_EXPR(has_archive_member, Ty_, std::declval<Ty_ const&>().archive(std::declval<if_writer&>()));

//! Integers which have no dedicated virtual, e.g. long long on LP64
template <typename Ty_>
constexpr bool is_extra_integral_v = std::is_integral_v<Ty_>
                                     && not cppmp::detail::is_wire_int_v<Ty_>
                                     && not std::is_same_v<Ty_, bool>
                                     && not std::is_same_v<Ty_, char>
                                     && not std::is_same_v<Ty_, char32_t>;

template <typename Ty_>
struct is_sequence : std::false_type {
};

template <typename Elem_, typename Alloc_>
struct is_sequence<std::vector<Elem_, Alloc_>> : std::bool_constant<not std::is_same_v<Elem_, uint8_t>> {
};

template <typename Elem_, typename Alloc_>
struct is_sequence<std::list<Elem_, Alloc_>> : std::true_type {
};

template <typename Elem_, typename Alloc_>
struct is_sequence<std::deque<Elem_, Alloc_>> : std::true_type {
};

template <typename Ty_>
struct is_dictionary : std::false_type {
};

template <typename... Args_>
struct is_dictionary<std::map<Args_...>> : std::true_type {
};

template <typename... Args_>
struct is_dictionary<std::unordered_map<Args_...>> : std::true_type {
};

template <typename Ptr_>
struct pointer_traits {
    static void archive(if_writer& wr, Ptr_ const& v)
    {
        if (v)
            wr.write(*v);
        else
            wr.write(nullptr);
    }

    template <typename Make_>
    static void restore(if_reader& rd, Ptr_& v, Make_&& make)
    {
        if (rd.is_null_next()) {
            rd.read(nullptr);
            v.reset();
        } else {
            if (not v) { v = make(); }
            rd.read(*v);
        }
    }
};

template <typename Timestamp_>
struct timestamp_traits {
    static void archive(if_writer& wr, Timestamp_ const& v)
    {
        auto ext = v.to_extension();
        wr.write_extension(ext.type(), ext.data());
    }

    static void restore(if_reader& rd, Timestamp_& v)
    {
        int8_t type = 0;
        bytes data;
        rd.read_extension(type, data);
        v = Timestamp_::from_extension({type, data});
    }
};
}  // namespace detail

template <typename Ty_>
struct archive_traits<Ty_, std::enable_if_t<detail::has_archive_member_v<Ty_>>> {
    static void archive(if_writer& wr, Ty_ const& v) { v.archive(wr); }
    static void restore(if_reader& rd, Ty_& v) { v.restore(rd); }
};

template <typename Ty_>
struct archive_traits<Ty_, std::enable_if_t<detail::is_extra_integral_v<Ty_>>> {
    using wide_type = std::conditional_t<std::is_signed_v<Ty_>, int64_t, uint64_t>;

    static void archive(if_writer& wr, Ty_ v) { wr.write(wide_type(v)); }

    static void restore(if_reader& rd, Ty_& v)
    {
        wide_type wide;
        rd.read(wide);

        number n{wide};
        if (auto value = n.to<Ty_>())
            v = *value;
        else
            cppmp::detail::throw_out_of_range(n);
    }
};

template <typename Ty_>
struct archive_traits<Ty_, std::enable_if_t<std::is_enum_v<Ty_>>> {
    using underlying_type = std::underlying_type_t<Ty_>;

    static void archive(if_writer& wr, Ty_ v) { wr.write(underlying_type(v)); }

    static void restore(if_reader& rd, Ty_& v)
    {
        underlying_type value;
        rd.read(value);
        v = Ty_(value);
    }
};

//! Single unicode scalar value, as one-character string
template <>
struct archive_traits<char32_t> {
    static void archive(if_writer& wr, char32_t v)
    {
        std::string str;
        if (not append_utf8(str, v))
            throw error::invalid_format{"U+%X is not a unicode scalar value", unsigned(v)};

        wr.write(str);
    }

    static void restore(if_reader& rd, char32_t& v)
    {
        std::string str;
        rd.read(str);

        if (not decode_single_utf8(str, &v))
            throw error::invalid_data{"single character expected, got %zu bytes", str.size()};
    }
};

template <typename Ty_>
struct archive_traits<Ty_, std::enable_if_t<detail::is_sequence<Ty_>::value>> {
    static void archive(if_writer& wr, Ty_ const& v)
    {
        wr.array_push(v.size());
        for (auto const& elem : v) { wr.write(elem); }
        wr.array_pop();
    }

    static void restore(if_reader& rd, Ty_& v)
    {
        v.clear();
        auto key = rd.begin_array();

        while (not rd.should_break(key)) {
            typename Ty_::value_type elem{};
            rd.read(elem);
            v.push_back(std::move(elem));
        }

        rd.end_array(key);
    }
};

template <typename Elem_, size_t N_>
struct archive_traits<std::array<Elem_, N_>> {
    static void archive(if_writer& wr, std::array<Elem_, N_> const& v)
    {
        wr.array_push(N_);
        for (auto const& elem : v) { wr.write(elem); }
        wr.array_pop();
    }

    static void restore(if_reader& rd, std::array<Elem_, N_>& v)
    {
        auto key = rd.begin_array();
        cppmp::detail::verify_arity(rd.elem_left(), N_);

        for (auto& elem : v) { rd.read(elem); }
        rd.end_array(key);
    }
};

template <typename... Args_>
struct archive_traits<std::tuple<Args_...>> {
    static void archive(if_writer& wr, std::tuple<Args_...> const& v)
    {
        wr.array_push(sizeof...(Args_));
        std::apply([&](auto const&... args) { (wr.write(args), ...); }, v);
        wr.array_pop();
    }

    static void restore(if_reader& rd, std::tuple<Args_...>& v)
    {
        auto key = rd.begin_array();
        cppmp::detail::verify_arity(rd.elem_left(), sizeof...(Args_));

        std::apply([&](auto&... args) { (rd.read(args), ...); }, v);
        rd.end_array(key);
    }
};

template <typename First_, typename Second_>
struct archive_traits<std::pair<First_, Second_>> {
    static void archive(if_writer& wr, std::pair<First_, Second_> const& v)
    {
        wr.array_push(2);
        wr.write(v.first), wr.write(v.second);
        wr.array_pop();
    }

    static void restore(if_reader& rd, std::pair<First_, Second_>& v)
    {
        auto key = rd.begin_array();
        cppmp::detail::verify_arity(rd.elem_left(), 2);

        rd.read(v.first), rd.read(v.second);
        rd.end_array(key);
    }
};

template <typename Ty_>
struct archive_traits<Ty_, std::enable_if_t<detail::is_dictionary<Ty_>::value>> {
    static void archive(if_writer& wr, Ty_ const& v)
    {
        wr.object_push(v.size());

        for (auto const& [key, value] : v) {
            wr.write_key_next();
            wr.write(key);
            wr.write(value);
        }

        wr.object_pop();
    }

    static void restore(if_reader& rd, Ty_& v)
    {
        v.clear();
        auto context = rd.begin_object();

        while (not rd.should_break(context)) {
            typename Ty_::key_type key{};
            typename Ty_::mapped_type value{};

            rd.read_key_next();
            rd.read(key);
            rd.read(value);

            v.insert_or_assign(std::move(key), std::move(value));
        }

        rd.end_object(context);
    }
};

template <typename Ty_>
struct archive_traits<std::optional<Ty_>> {
    static void archive(if_writer& wr, std::optional<Ty_> const& v)
    {
        if (v)
            wr.write(*v);
        else
            wr.write(nullptr);
    }

    static void restore(if_reader& rd, std::optional<Ty_>& v)
    {
        if (rd.is_null_next()) {
            rd.read(nullptr);
            v.reset();
        } else {
            if (not v) { v.emplace(); }
            rd.read(*v);
        }
    }
};

template <typename Ty_>
struct archive_traits<std::unique_ptr<Ty_>> : detail::pointer_traits<std::unique_ptr<Ty_>> {
    static void restore(if_reader& rd, std::unique_ptr<Ty_>& v)
    {
        detail::pointer_traits<std::unique_ptr<Ty_>>::restore(rd, v, [] { return std::make_unique<Ty_>(); });
    }
};

template <typename Ty_>
struct archive_traits<std::shared_ptr<Ty_>> : detail::pointer_traits<std::shared_ptr<Ty_>> {
    static void restore(if_reader& rd, std::shared_ptr<Ty_>& v)
    {
        detail::pointer_traits<std::shared_ptr<Ty_>>::restore(rd, v, [] { return std::make_shared<Ty_>(); });
    }
};

/**
 * Names of std::variant alternatives on the wire. Defaults to the alternative index.
 */
template <typename Variant_>
struct variant_names {
    static std::string name(size_t index) { return std::to_string(index); }
};

/**
 * std::monostate alternative is a unit variant. Any other alternative is written as a
 *  single entry map of its name to its value.
 */
template <typename... Args_>
struct archive_traits<std::variant<Args_...>> {
    using variant_type = std::variant<Args_...>;
    using names = variant_names<variant_type>;

    static void archive(if_writer& wr, variant_type const& v)
    {
        if (v.valueless_by_exception())
            throw error::writer_invalid_state{"valueless variant can't be archived"};

        auto name = names::name(v.index());
        std::visit(
                [&](auto const& alt) {
                    if constexpr (std::is_same_v<std::decay_t<decltype(alt)>, std::monostate>) {
                        wr.unit_variant(name);
                    } else {
                        wr.variant_push(name);
                        wr.write(alt);
                        wr.variant_pop();
                    }
                },
                v);
    }

    static void restore(if_reader& rd, variant_type& v)
    {
        std::string name;
        auto scope = rd.begin_variant(name);

        if (not _restore_any(rd, v, name, scope.has_payload(), std::index_sequence_for<Args_...>{}))
            throw error::invalid_data{"unknown variant '%s'", name.c_str()};

        rd.end_variant(scope);
    }

   private:
    template <size_t... Idx_>
    static bool _restore_any(if_reader& rd, variant_type& v, std::string const& name, bool has_payload,
                             std::index_sequence<Idx_...>)
    {
        return (_restore_at<Idx_>(rd, v, name, has_payload) || ...);
    }

    template <size_t Idx_>
    static bool _restore_at(if_reader& rd, variant_type& v, std::string const& name, bool has_payload)
    {
        using alt_type = std::variant_alternative_t<Idx_, variant_type>;
        if (names::name(Idx_) != name) { return false; }

        if constexpr (std::is_same_v<alt_type, std::monostate>) {
            if (has_payload)
                throw error::invalid_data{"unit variant '%s' must not carry payload", name.c_str()};

            v.template emplace<Idx_>();
        } else {
            if (not has_payload)
                throw error::invalid_data{"variant '%s' requires payload", name.c_str()};

            rd.read(v.template emplace<Idx_>());
        }

        return true;
    }
};

template <>
struct archive_traits<bytes> {
    static void archive(if_writer& wr, bytes const& v) { wr.write(bytes_view{v}); }
    static void restore(if_reader& rd, bytes& v) { rd.read(v); }
};

template <>
struct archive_traits<extension> {
    static void archive(if_writer& wr, extension const& v) { wr.write_extension(v.type(), v.data()); }

    static void restore(if_reader& rd, extension& v)
    {
        int8_t type = 0;
        bytes data;
        rd.read_extension(type, data);
        v = extension{type, std::move(data)};
    }
};

template <>
struct archive_traits<extension_ref> {
    static void archive(if_writer& wr, extension_ref const& v) { wr.write_extension(v.type, v.data); }
    static void restore(if_reader& rd, extension_ref& v) { rd.read_extension(v.type, v.data); }
};

template <size_t N_>
struct archive_traits<fixed_extension<N_>> {
    static void archive(if_writer& wr, fixed_extension<N_> const& v) { wr.write_extension(v.type(), v.data()); }

    static void restore(if_reader& rd, fixed_extension<N_>& v)
    {
        int8_t type = 0;
        bytes data;
        rd.read_extension(type, data);
        v.assign(type, data);
    }
};

template <>
struct archive_traits<timestamp32> : detail::timestamp_traits<timestamp32> {
};

template <>
struct archive_traits<timestamp64> : detail::timestamp_traits<timestamp64> {
};

template <>
struct archive_traits<timestamp96> : detail::timestamp_traits<timestamp96> {
};

//! Written in the smallest timestamp layout; any of the three layouts is accepted on read
template <typename Duration_>
struct archive_traits<std::chrono::time_point<std::chrono::system_clock, Duration_>> {
    using time_point = std::chrono::time_point<std::chrono::system_clock, Duration_>;

    static void archive(if_writer& wr, time_point const& v)
    {
        cppmp::detail::with_smallest_timestamp(
                std::chrono::time_point_cast<std::chrono::system_clock::duration>(v),
                [&](auto const& ts) { archive_traits<std::decay_t<decltype(ts)>>::archive(wr, ts); });
    }

    static void restore(if_reader& rd, time_point& v)
    {
        int8_t type = 0;
        bytes data;
        rd.read_extension(type, data);

        extension_ref ext{type, data};
        std::chrono::system_clock::time_point tp;

        switch (data.size()) {
            case 4: tp = timestamp32::from_extension(ext).to_time_point(); break;
            case 8: tp = timestamp64::from_extension(ext).to_time_point(); break;
            case 12: tp = timestamp96::from_extension(ext).to_time_point(); break;

            default:
                throw error::unexpected_format{"timestamp payload of %zu bytes", data.size()};
        }

        v = std::chrono::time_point_cast<Duration_>(tp);
    }
};

template <typename Storage_>
struct archive_traits<basic_value<Storage_>> {
    using value_type = basic_value<Storage_>;

    static void archive(if_writer& wr, value_type const& v)
    {
        v.visit([&](auto const& elem) {
            using elem_type = std::decay_t<decltype(elem)>;

            if constexpr (std::is_same_v<elem_type, typename value_type::array_type>) {
                wr.array_push(elem.size());
                for (auto& child : elem) { archive(wr, child); }
                wr.array_pop();
            } else if constexpr (std::is_same_v<elem_type, typename value_type::map_type>) {
                wr.object_push(elem.size());

                for (auto& [key, child] : elem) {
                    wr.write_key_next();
                    archive(wr, key);
                    archive(wr, child);
                }

                wr.object_pop();
            } else if constexpr (std::is_same_v<elem_type, extension>) {
                wr.write_extension(elem.type(), elem.data());
            } else if constexpr (std::is_same_v<elem_type, extension_ref>) {
                wr.write_extension(elem.type, elem.data);
            } else if constexpr (std::is_same_v<elem_type, typename value_type::binary_type>) {
                wr.write(bytes_view{elem});
            } else {
                wr.write(elem);
            }
        });
    }

    static void restore(if_reader& rd, value_type& v)
    {
        switch (rd.type_next()) {
            case entity_type::null:
                rd.read(nullptr);
                v = value_type{};
                break;

            case entity_type::boolean: {
                bool flag = false;
                rd.read(flag);
                v = flag;
                break;
            }

            case entity_type::integer:
            case entity_type::floating_point: {
                number n;
                rd.read(n);
                v = n;
                break;
            }

            case entity_type::string: {
                typename value_type::string_type str;
                rd.read(str);
                v = std::move(str);
                break;
            }

            case entity_type::binary: {
                typename value_type::binary_type bin;
                rd.read(bin);
                v = std::move(bin);
                break;
            }

            case entity_type::extension: {
                int8_t type = 0;

                if constexpr (std::is_same_v<typename value_type::extension_type, extension_ref>) {
                    bytes_view data;
                    rd.read_extension(type, data);
                    v = extension_ref{type, data};
                } else {
                    bytes data;
                    rd.read_extension(type, data);
                    v = extension{type, std::move(data)};
                }
                break;
            }

            case entity_type::array: {
                typename value_type::array_type array;
                auto key = rd.begin_array();
                array.reserve(std::min(rd.elem_left(), cppmp::detail::max_reserve));

                while (not rd.should_break(key)) {
                    restore(rd, array.emplace_back());
                }

                rd.end_array(key);
                v = std::move(array);
                break;
            }

            case entity_type::map: {
                typename value_type::map_type map;
                auto key = rd.begin_object();
                map.reserve(std::min(rd.elem_left() / 2, cppmp::detail::max_reserve));

                while (not rd.should_break(key)) {
                    auto& entry = map.emplace_back();
                    rd.read_key_next();
                    restore(rd, entry.first);
                    restore(rd, entry.second);
                }

                rd.end_object(key);
                v = std::move(map);
                break;
            }

            case entity_type::invalid:
                throw error::reader_invalid_context{"reader is in invalid state!"};
        }
    }
};

/**
 * Named member reference, for archiving structs as maps of field name to value
 */
template <typename Ty_>
struct field_ref {
    std::string_view name;
    Ty_& ref;
};

template <typename Ty_>
field_ref<Ty_> field(std::string_view name, Ty_& ref) noexcept
{
    return {name, ref};
}

//! Writes fields as a map of name to value, in given order
template <typename... Fields_>
void write_struct(if_writer& wr, Fields_ const&... fields)
{
    wr.object_push(sizeof...(Fields_));
    ((wr.write_key_next(), wr.write(fields.name), wr.write(fields.ref)), ...);
    wr.object_pop();
}

/**
 * Reads fields from a map of name to value, or from an array of values in declaration order.
 *
 * Unknown map keys are skipped, and fields absent from the map keep their current value. An
 *  array must hold exactly one element per field.
 */
template <typename... Fields_>
void read_struct(if_reader& rd, Fields_ const&... fields)
{
    switch (rd.type_next()) {
        case entity_type::map: {
            auto key = rd.begin_object();
            std::string name;

            while (not rd.should_break(key)) {
                rd.read_key_next();
                rd.read(name);

                bool found = ((name == fields.name && (rd.read(fields.ref), true)) || ...);
                if (not found) { rd.skip(); }
            }

            rd.end_object(key);
            break;
        }

        case entity_type::array: {
            auto key = rd.begin_array();
            cppmp::detail::verify_arity(rd.elem_left(), sizeof...(Fields_));

            (rd.read(fields.ref), ...);
            rd.end_array(key);
            break;
        }

        default:
            throw error::unexpected_format{"struct must be a map or an array"};
    }
}

}  // namespace cppmp::archive
