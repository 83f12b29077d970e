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
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace cppmp {
template <typename Ty_>
class array_view
{
   public:
    using value_type = Ty_;
    using pointer = value_type*;
    using reference = value_type&;

   public:
    constexpr array_view() noexcept = default;
    constexpr array_view(Ty_* p, size_t n) noexcept
            : _ptr(p), _size(n) {}

    template <typename Range_,
              typename = decltype(std::data(std::declval<Range_&>())),
              typename = decltype(std::size(std::declval<Range_&>()))>
    constexpr array_view(Range_&& p) noexcept
            : array_view(std::data(p), std::size(p))
    {
    }

    template <size_t N_>
    constexpr array_view(Ty_ (&p)[N_]) noexcept
            : array_view(p, N_)
    {
    }

    constexpr size_t size() const noexcept { return _size; }
    constexpr pointer data() const noexcept { return _ptr; }

    constexpr pointer begin() const noexcept { return _ptr; }
    constexpr pointer end() const noexcept { return _ptr + _size; }

    constexpr bool empty() const noexcept { return _size == 0; }

    constexpr array_view subspan(size_t offset, size_t n = ~size_t{}) const noexcept
    {
        if (offset >= _size) { return array_view{_ptr + _size, 0}; }
        return array_view{_ptr + offset, std::min(n, _size - offset)};
    }

    template <typename RTy_>
    bool operator==(RTy_ const& op) const noexcept
    {
        return std::equal(begin(), end(), std::begin(op), std::end(op));
    }

    template <typename RTy_>
    bool operator!=(RTy_ const& op) const noexcept
    {
        return !(*this == op);
    }

    constexpr reference operator[](size_t idx) const noexcept { return _ptr[idx]; }

    constexpr reference at(size_t idx) const
    {
        if (idx >= _size) { throw std::out_of_range{"bad index"}; }
        return _ptr[idx];
    }

   private:
    Ty_* _ptr = nullptr;
    size_t _size = 0;
};

template <typename Ty_>
array_view(Ty_*, size_t n) -> array_view<Ty_>;

template <typename Range_, typename = decltype(std::size(std::declval<Range_>()))>
array_view(Range_&&) -> array_view<std::remove_reference_t<decltype(*std::data(std::declval<Range_&>()))>>;

/**
 * Byte vocabulary used throughout the codec
 */
using bytes = std::vector<uint8_t>;
using bytes_view = array_view<uint8_t const>;
using mutable_bytes_view = array_view<uint8_t>;

}  // namespace cppmp
