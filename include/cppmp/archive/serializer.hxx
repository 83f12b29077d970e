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
#include "../extension.hxx"
#include "../helper/macros.hxx"
#include "../num_strategy.hxx"
#include "detail/scope_tracker.hxx"
#include "if_archive.hxx"

namespace cppmp::archive {

/**
 * Archive writer which encodes every entity into Writer_ immediately.
 *
 * Containers must declare their exact size on push; MessagePack headers precede elements.
 */
template <typename Writer_, typename NumEncoder_ = num_encoder::lossless_minimize>
class serializer : public if_writer
{
    Writer_& _wr;
    size_t _length = 0;
    detail::scope_tracker _ctx;

   public:
    explicit serializer(Writer_& wr, size_t reserved_depth = 0) noexcept
            : _wr(wr)
    {
        _ctx.reserve_depth(reserved_depth);
    }

    //! Total bytes produced so far
    size_t bytes_written() const noexcept { return _length; }

    Writer_& writer() const noexcept { return _wr; }

    void clear() override
    {
        _ctx.clear();
        _length = 0;
    }

   public:
    if_writer& write(std::nullptr_t) override { return _put(nullptr); }
    if_writer& write(bool v) override { return _put(v); }

    if_writer& write(int8_t v) override { return _put_num(v); }
    if_writer& write(int16_t v) override { return _put_num(v); }
    if_writer& write(int32_t v) override { return _put_num(v); }
    if_writer& write(int64_t v) override { return _put_num(v); }
    if_writer& write(uint8_t v) override { return _put_num(v); }
    if_writer& write(uint16_t v) override { return _put_num(v); }
    if_writer& write(uint32_t v) override { return _put_num(v); }
    if_writer& write(uint64_t v) override { return _put_num(v); }
    if_writer& write(float v) override { return _put_num(v); }
    if_writer& write(double v) override { return _put_num(v); }

    if_writer& write(std::string_view v) override { return _put(v); }

    using if_writer::write;

    if_writer& binary_push(size_t total) override
    {
        if (total == unknown_length) { _throw_unknown_length("binary"); }

        _ctx.next_element();
        cppmp::detail::verify_length_32bit(total, "binary");

        _length += cppmp::detail::put_sized_header(_wr, typecode::bin8, total);
        _ctx.enter_binary(total);
        return *this;
    }

    if_writer& binary_write_some(bytes_view v) override
    {
        _ctx.append_binary(v.size());
        _wr.write(v);
        _length += v.size();
        return *this;
    }

    if_writer& binary_pop() override
    {
        _ctx.leave_binary();
        return *this;
    }

    if_writer& write_extension(int8_t type, bytes_view payload) override
    {
        _ctx.next_element();
        _length += cppmp::detail::put_extension(_wr, type, payload);
        return *this;
    }

    if_writer& object_push(size_t num_elems) override
    {
        if (num_elems == unknown_length) { _throw_unknown_length("map"); }

        _ctx.next_element();
        _length += cppmp::encode(_wr, map_header{num_elems});
        _ctx.enter_map(num_elems);
        return *this;
    }

    if_writer& object_pop() override
    {
        _ctx.leave_map();
        return *this;
    }

    if_writer& array_push(size_t num_elems) override
    {
        if (num_elems == unknown_length) { _throw_unknown_length("array"); }

        _ctx.next_element();
        _length += cppmp::encode(_wr, array_header{num_elems});
        _ctx.enter_array(num_elems);
        return *this;
    }

    if_writer& array_pop() override
    {
        _ctx.leave_array();
        return *this;
    }

    void write_key_next() override
    {
        _ctx.announce_key();
    }

   private:
    template <typename Ty_>
    if_writer& _put(Ty_ const& v)
    {
        _ctx.next_element();
        _length += cppmp::encode(_wr, v);
        return *this;
    }

    template <typename Num_>
    if_writer& _put_num(Num_ v)
    {
        _ctx.next_element();
        _length += NumEncoder_::encode(_wr, v);
        return *this;
    }

    [[noreturn]] void _throw_unknown_length(char const* what)
    {
        CPPMP_DEBUG("{} of unknown length can't be serialized (depth {})", what, _ctx.depth());
        throw error::seq_len_none{"%s length must be known before its elements", what};
    }
};

}  // namespace cppmp::archive
