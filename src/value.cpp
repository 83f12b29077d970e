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

#include <iterator>

#include <fmt/format.h>

#include "cppmp/value.hxx"

namespace cppmp {
namespace {
template <typename Storage_>
void append_value(std::string& out, basic_value<Storage_> const& v)
{
    using value_type = basic_value<Storage_>;
    auto it = std::back_inserter(out);

    v.visit([&](auto const& elem) {
        using elem_type = std::decay_t<decltype(elem)>;

        if constexpr (std::is_same_v<elem_type, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<elem_type, bool>) {
            out += elem ? "true" : "false";
        } else if constexpr (std::is_same_v<elem_type, number>) {
            switch (elem.type()) {
                case number::kind::positive_int: fmt::format_to(it, "{}", *elem.as_uint()); break;
                case number::kind::negative_int: fmt::format_to(it, "{}", *elem.as_int()); break;
                default: fmt::format_to(it, "{}", *elem.as_float()); break;
            }
        } else if constexpr (std::is_same_v<elem_type, typename value_type::string_type>) {
            fmt::format_to(it, "\"{}\"", std::string_view{elem});
        } else if constexpr (std::is_same_v<elem_type, typename value_type::binary_type>) {
            out += "<bin";
            for (auto byte : bytes_view{elem}) { fmt::format_to(it, " {:02x}", byte); }
            out += '>';
        } else if constexpr (std::is_same_v<elem_type, typename value_type::array_type>) {
            out += '[';
            for (size_t i = 0; i < elem.size(); ++i) {
                if (i > 0) { out += ", "; }
                append_value(out, elem[i]);
            }
            out += ']';
        } else if constexpr (std::is_same_v<elem_type, typename value_type::map_type>) {
            out += '{';
            for (size_t i = 0; i < elem.size(); ++i) {
                if (i > 0) { out += ", "; }
                append_value(out, elem[i].first);
                out += ": ";
                append_value(out, elem[i].second);
            }
            out += '}';
        } else {
            extension_ref ext;
            if constexpr (std::is_same_v<elem_type, extension>)
                ext = elem.as_ref();
            else
                ext = elem;

            fmt::format_to(it, "<ext {}:", int(ext.type));
            for (auto byte : ext.data) { fmt::format_to(it, " {:02x}", byte); }
            out += '>';
        }
    });
}
}  // namespace

value to_owned(value_ref const& v)
{
    return v.visit([](auto const& elem) -> value {
        using elem_type = std::decay_t<decltype(elem)>;

        if constexpr (std::is_same_v<elem_type, std::string_view>) {
            return std::string{elem};
        } else if constexpr (std::is_same_v<elem_type, bytes_view>) {
            return bytes(elem.begin(), elem.end());
        } else if constexpr (std::is_same_v<elem_type, extension_ref>) {
            return extension{elem};
        } else if constexpr (std::is_same_v<elem_type, value_ref::array_type>) {
            value::array_type array;
            array.reserve(elem.size());

            for (auto& child : elem) { array.push_back(to_owned(child)); }
            return array;
        } else if constexpr (std::is_same_v<elem_type, value_ref::map_type>) {
            value::map_type map;
            map.reserve(elem.size());

            for (auto& [key, child] : elem) { map.emplace_back(to_owned(key), to_owned(child)); }
            return map;
        } else {
            return elem;
        }
    });
}

value_ref as_ref(value const& v)
{
    return v.visit([](auto const& elem) -> value_ref {
        using elem_type = std::decay_t<decltype(elem)>;

        if constexpr (std::is_same_v<elem_type, std::string>) {
            return std::string_view{elem};
        } else if constexpr (std::is_same_v<elem_type, bytes>) {
            return bytes_view{elem};
        } else if constexpr (std::is_same_v<elem_type, extension>) {
            return elem.as_ref();
        } else if constexpr (std::is_same_v<elem_type, value::array_type>) {
            value_ref::array_type array;
            array.reserve(elem.size());

            for (auto& child : elem) { array.push_back(as_ref(child)); }
            return array;
        } else if constexpr (std::is_same_v<elem_type, value::map_type>) {
            value_ref::map_type map;
            map.reserve(elem.size());

            for (auto& [key, child] : elem) { map.emplace_back(as_ref(key), as_ref(child)); }
            return map;
        } else {
            return elem;
        }
    });
}

std::string to_string(value_ref const& v)
{
    std::string out;
    append_value(out, v);
    return out;
}

std::string to_string(value const& v)
{
    std::string out;
    append_value(out, v);
    return out;
}
}  // namespace cppmp
