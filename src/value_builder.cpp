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

#include "cppmp/archive/value_builder.hxx"

#include "cppmp/helper/macros.hxx"

namespace cppmp::archive {

value value_builder::release()
{
    if (not ready())
        throw error::writer_invalid_state{"value is incomplete (%zu scopes open)", _ctx.depth()};

    auto result = std::move(*_result);
    clear();
    return result;
}

void value_builder::clear()
{
    _frames.clear();
    _result.reset();
    _binary.clear();
    _ctx.clear();
}

if_writer& value_builder::binary_push(size_t total)
{
    if (total == unknown_length) {
        CPPMP_DEBUG("binary of unknown length can't be built");
        throw error::seq_len_none{"binary length must be known before its content"};
    }

    _ctx.next_element();
    _ctx.enter_binary(total);

    _binary.clear();
    _binary.reserve(std::min(total, cppmp::detail::max_reserve));
    return *this;
}

if_writer& value_builder::binary_write_some(bytes_view v)
{
    _ctx.append_binary(v.size());
    _binary.insert(_binary.end(), v.begin(), v.end());
    return *this;
}

if_writer& value_builder::binary_pop()
{
    _ctx.leave_binary();
    _emplace(value{std::move(_binary)});
    _binary = {};
    return *this;
}

if_writer& value_builder::write_extension(int8_t type, bytes_view payload)
{
    return _put(value{extension{type, bytes(payload.begin(), payload.end())}});
}

if_writer& value_builder::object_push(size_t num_elems)
{
    if (num_elems == unknown_length) {
        CPPMP_DEBUG("map of unknown length can't be built (depth {})", _ctx.depth());
        throw error::seq_len_none{"map length must be known before its elements"};
    }

    _ctx.next_element();
    _ctx.enter_map(num_elems);

    value::map_type map;
    map.reserve(std::min(num_elems, cppmp::detail::max_reserve));
    _frames.push_back({value{std::move(map)}, std::nullopt});
    return *this;
}

if_writer& value_builder::object_pop()
{
    _ctx.leave_map();

    auto node = std::move(_frames.back().node);
    _frames.pop_back();
    _emplace(std::move(node));
    return *this;
}

if_writer& value_builder::array_push(size_t num_elems)
{
    if (num_elems == unknown_length) {
        CPPMP_DEBUG("array of unknown length can't be built (depth {})", _ctx.depth());
        throw error::seq_len_none{"array length must be known before its elements"};
    }

    _ctx.next_element();
    _ctx.enter_array(num_elems);

    value::array_type array;
    array.reserve(std::min(num_elems, cppmp::detail::max_reserve));
    _frames.push_back({value{std::move(array)}, std::nullopt});
    return *this;
}

if_writer& value_builder::array_pop()
{
    _ctx.leave_array();

    auto node = std::move(_frames.back().node);
    _frames.pop_back();
    _emplace(std::move(node));
    return *this;
}

if_writer& value_builder::_put(value v)
{
    _ctx.next_element();
    _emplace(std::move(v));
    return *this;
}

void value_builder::_emplace(value v)
{
    if (_frames.empty()) {
        if (_result)
            throw error::writer_invalid_state{"root value is already complete"};

        _result = std::move(v);
        return;
    }

    auto& top = _frames.back();
    if (auto array = top.node.as_array()) {
        array->push_back(std::move(v));
    } else if (not top.key) {
        top.key = std::move(v);
    } else {
        top.node.as_map()->emplace_back(std::move(*top.key), std::move(v));
        top.key.reset();
    }
}

}  // namespace cppmp::archive
