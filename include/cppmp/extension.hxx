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

#include "decode.hxx"
#include "encode.hxx"

namespace cppmp {
/**
 * Extension payload which borrows its data
 */
struct extension_ref {
    int8_t type = 0;
    bytes_view data;

    bool operator==(extension_ref const& other) const noexcept
    {
        return type == other.type && data == other.data;
    }

    bool operator!=(extension_ref const& other) const noexcept { return !(*this == other); }
};

/**
 * Extension payload which owns its data
 */
class extension
{
   public:
    extension() noexcept = default;
    extension(int8_t type, bytes data) noexcept : _type(type), _data(std::move(data)) {}
    explicit extension(extension_ref ref) : _type(ref.type), _data(ref.data.begin(), ref.data.end()) {}

    int8_t type() const noexcept { return _type; }
    bytes const& data() const noexcept { return _data; }
    bytes& data() noexcept { return _data; }

    extension_ref as_ref() const noexcept { return {_type, _data}; }

    bool operator==(extension const& other) const noexcept
    {
        return _type == other._type && _data == other._data;
    }

    bool operator!=(extension const& other) const noexcept { return !(*this == other); }

   private:
    int8_t _type = 0;
    bytes _data;
};

/**
 * Extension payload with inline storage of up to N_ bytes. Never allocates.
 */
template <size_t N_>
class fixed_extension
{
   public:
    fixed_extension() noexcept = default;
    fixed_extension(int8_t type, bytes_view data) { assign(type, data); }

    //! @throw error::invalid_data if data exceeds capacity
    void assign(int8_t type, bytes_view data)
    {
        if (data.size() > N_) {
            throw error::invalid_data{
                    "extension payload of %zu bytes exceeds capacity %zu", data.size(), N_};
        }

        _type = type;
        _size = data.size();
        std::copy(data.begin(), data.end(), _buf.begin());
    }

    int8_t type() const noexcept { return _type; }
    bytes_view data() const noexcept { return {_buf.data(), _size}; }
    static constexpr size_t capacity() noexcept { return N_; }

    extension_ref as_ref() const noexcept { return {_type, data()}; }

    bool operator==(fixed_extension const& other) const noexcept { return as_ref() == other.as_ref(); }
    bool operator!=(fixed_extension const& other) const noexcept { return !(*this == other); }

   private:
    int8_t _type = 0;
    size_t _size = 0;
    std::array<uint8_t, N_> _buf = {};
};

namespace detail {
struct extension_header {
    int8_t type;
    size_t length;
};

/**
 * Marker is chosen by payload length: fixext for 1/2/4/8/16 bytes, otherwise the smallest
 * ext8/16/32 that can hold it. Layout is [marker][length?][type][payload].
 */
template <typename Writer_>
size_t put_extension(Writer_& wr, int8_t type, bytes_view payload)
{
    verify_length_32bit(payload.size(), "extension");

    uint8_t header[6];
    size_t n = 0;

    switch (payload.size()) {
        case 1: header[n++] = uint8_t(typecode::fixext1); break;
        case 2: header[n++] = uint8_t(typecode::fixext2); break;
        case 4: header[n++] = uint8_t(typecode::fixext4); break;
        case 8: header[n++] = uint8_t(typecode::fixext8); break;
        case 16: header[n++] = uint8_t(typecode::fixext16); break;

        default:
            if (payload.size() <= 0xff) {
                header[n++] = uint8_t(typecode::ext8);
                header[n++] = uint8_t(payload.size());
            } else if (payload.size() <= 0xffff) {
                header[n++] = uint8_t(typecode::ext16);
                n += store_big_endian(header + n, uint16_t(payload.size()));
            } else {
                header[n++] = uint8_t(typecode::ext32);
                n += store_big_endian(header + n, uint32_t(payload.size()));
            }
    }

    header[n++] = uint8_t(type);

    wr.write({header, n});
    wr.write(payload);
    return n + payload.size();
}

template <typename Reader_>
extension_header read_extension_header(Reader_& rd)
{
    auto fmt = peek_format(rd);
    size_t len = 0;

    switch (fmt.code()) {
        case typecode::fixext1: len = 1; break;
        case typecode::fixext2: len = 2; break;
        case typecode::fixext4: len = 4; break;
        case typecode::fixext8: len = 8; break;
        case typecode::fixext16: len = 16; break;

        case typecode::ext8:
        case typecode::ext16:
        case typecode::ext32: break;

        default: throw_unexpected(fmt, "extension");
    }

    rd.get();
    if (len == 0) { len = read_sized_length(rd, typecode::ext8, fmt.code()); }

    auto type = read_big_endian<int8_t>(rd);
    return {type, len};
}
}  // namespace detail

template <>
struct encoder<extension_ref> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, extension_ref const& v) { return detail::put_extension(wr, v.type, v.data); }
};

template <>
struct encoder<extension> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, extension const& v) { return detail::put_extension(wr, v.type(), v.data()); }
};

template <size_t N_>
struct encoder<fixed_extension<N_>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, fixed_extension<N_> const& v) { return detail::put_extension(wr, v.type(), v.data()); }
};

template <>
struct decoder<extension_ref> {
    template <typename Reader_>
    static extension_ref decode(Reader_& rd)
    {
        auto header = detail::read_extension_header(rd);
        return {header.type, rd.read(header.length).borrowed()};
    }
};

template <>
struct decoder<extension> {
    template <typename Reader_>
    static extension decode(Reader_& rd)
    {
        auto header = detail::read_extension_header(rd);
        auto data = rd.read(header.length).data();
        return {header.type, bytes(data.begin(), data.end())};
    }
};

template <size_t N_>
struct decoder<fixed_extension<N_>> {
    template <typename Reader_>
    static fixed_extension<N_> decode(Reader_& rd)
    {
        auto header = detail::read_extension_header(rd);
        if (header.length > N_) {
            throw error::invalid_data{
                    "extension payload of %zu bytes exceeds capacity %zu", header.length, N_};
        }

        return {header.type, rd.read(header.length).data()};
    }
};

}  // namespace cppmp
