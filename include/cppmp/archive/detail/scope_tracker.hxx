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
#include <vector>

#include "../if_archive.hxx"

namespace cppmp::archive::detail {

/**
 * Counts what a writer puts into each open container against the length it
 * announced, and enforces key/value alternation inside maps.
 */
class scope_tracker
{
    enum class kind_t : int8_t {
        array,
        map,
        binary,
    };

    struct frame_t {
        kind_t kind;
        size_t declared = 0;  // entries for arrays and maps, bytes for binary
        size_t written = 0;
        bool key_announced = false;
        bool key_written = false;
    };

    std::vector<frame_t> _frames;

   public:
    void reserve_depth(size_t n) { _frames.reserve(n); }
    bool empty() const noexcept { return _frames.empty(); }
    size_t depth() const noexcept { return _frames.size(); }
    void clear() noexcept { _frames.clear(); }

    //! Next element of the current map is a key
    void announce_key()
    {
        auto& top = _top("write_key_next()");
        if (top.kind != kind_t::map)
            throw error::writer_invalid_state{"key announced outside of a map"};
        if (top.key_announced || top.key_written)
            throw error::writer_invalid_state{"previous key has no value yet"};
        if (top.written == top.declared)
            throw error::writer_invalid_state{"map is already full (%zu entries)", top.declared};

        top.key_announced = true;
    }

    //! Accounts one element, either a map key or an array/map value
    void next_element()
    {
        if (_frames.empty())
            return;

        auto& top = _frames.back();
        switch (top.kind) {
            case kind_t::binary:
                throw error::writer_invalid_state{"binary can't contain elements"};

            case kind_t::array:
                _count(top, 1);
                break;

            case kind_t::map:
                if (top.key_announced) {
                    top.key_announced = false;
                    top.key_written = true;
                } else if (top.key_written) {
                    top.key_written = false;
                    _count(top, 1);
                } else {
                    throw error::writer_invalid_state{"map value written without a key"};
                }
                break;
        }
    }

    void enter_array(size_t n) { _frames.push_back({kind_t::array, n}); }
    void enter_map(size_t n) { _frames.push_back({kind_t::map, n}); }
    void enter_binary(size_t n) { _frames.push_back({kind_t::binary, n}); }

    void append_binary(size_t n)
    {
        auto& top = _top("binary_write_some()");
        if (top.kind != kind_t::binary)
            throw error::writer_invalid_state{"binary chunk outside of binary_push()"};

        _count(top, n);
    }

    size_t leave_array() { return _leave(kind_t::array); }
    size_t leave_map() { return _leave(kind_t::map); }
    size_t leave_binary() { return _leave(kind_t::binary); }

   private:
    frame_t& _top(char const* caller)
    {
        if (_frames.empty())
            throw error::writer_invalid_state{"%s called outside of any container", caller};

        return _frames.back();
    }

    static void _count(frame_t& frame, size_t n)
    {
        if (frame.written + n > frame.declared)
            throw error::writer_invalid_state{
                    "container overfilled: %zu of %zu", frame.written + n, frame.declared};

        frame.written += n;
    }

    size_t _leave(kind_t kind)
    {
        auto& top = _top("pop");
        if (top.kind != kind)
            throw error::writer_invalid_state{"popped scope doesn't match the pushed one"};
        if (top.written != top.declared || top.key_announced || top.key_written)
            throw error::writer_invalid_state{
                    "container closed with %zu of %zu elements", top.written, top.declared};

        auto n = top.written;
        _frames.pop_back();
        return n;
    }
};

}  // namespace cppmp::archive::detail
