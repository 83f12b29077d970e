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
#include <cstring>
#include <streambuf>

#include "error.hxx"
#include "helper/macros.hxx"
#include "utility/array_view.hxx"

/**
 * Byte sinks and sources.
 *
 * Writer requirements
 *  - void write(bytes_view) lands whole run, or throws error::buffer_full
 *
 * Reader requirements
 *  - reference read(size_t n) yields exactly n bytes, or throws error::eof_data
 *  - uint8_t peek() returns next byte without consuming it
 *  - uint8_t get() consumes single byte
 */
namespace cppmp {

/**
 * Payload returned by readers. Borrowed payload points into caller-owned input and shares
 * its lifetime. Copied payload lives in reader's scratch buffer until next read.
 */
class reference
{
   public:
    enum class kind : uint8_t {
        borrowed,
        copied,
    };

   public:
    constexpr reference(kind k, bytes_view data) noexcept : _kind(k), _data(data) {}

    constexpr kind type() const noexcept { return _kind; }
    constexpr bool is_borrowed() const noexcept { return _kind == kind::borrowed; }
    constexpr bytes_view data() const noexcept { return _data; }
    constexpr size_t size() const noexcept { return _data.size(); }

    //! Zero-copy access. Fails if the payload had to be copied.
    bytes_view borrowed() const
    {
        if (_kind != kind::borrowed)
            throw error::invalid_data{"borrowed payload required, but reader yields copies"};

        return _data;
    }

   private:
    kind _kind;
    bytes_view _data;
};

/**
 * Writes into fixed-size buffer.
 */
class slice_writer
{
    mutable_bytes_view _buf;
    size_t _pos = 0;

   public:
    explicit slice_writer(mutable_bytes_view buf) noexcept : _buf(buf) {}

    void write(bytes_view content)
    {
        if (content.size() > remaining()) {
            throw error::buffer_full{
                    "%zu bytes requested, only %zu bytes left", content.size(), remaining()};
        }

        if (not content.empty())
            std::memcpy(_buf.data() + _pos, content.data(), content.size());

        _pos += content.size();
    }

    size_t written() const noexcept { return _pos; }
    size_t remaining() const noexcept { return _buf.size() - _pos; }
    bytes_view output() const noexcept { return {_buf.data(), _pos}; }
};

/**
 * Appends to referenced vector.
 */
class vector_writer
{
    bytes* _buf;

   public:
    explicit vector_writer(bytes& buf) noexcept : _buf(&buf) {}

    void write(bytes_view content)
    {
        _buf->insert(_buf->end(), content.begin(), content.end());
    }

    bytes const& output() const noexcept { return *_buf; }
};

/**
 * Writes to any std::streambuf
 */
class stream_writer
{
    std::streambuf* _buf;

   public:
    explicit stream_writer(std::streambuf* buf) noexcept : _buf(buf) {}

    void write(bytes_view content)
    {
        auto n = std::streamsize(content.size());
        if (_buf->sputn(reinterpret_cast<char const*>(content.data()), n) != n) {
            CPPMP_DEBUG("stream writer: short write of {} bytes", content.size());
            throw error::buffer_full{"stream rejected %zu bytes", content.size()};
        }
    }

    std::streambuf* rdbuf() const noexcept { return _buf; }
};

/**
 * Reads from caller-owned memory. Every payload is borrowed.
 */
class slice_reader
{
    bytes_view _buf;
    size_t _pos = 0;

   public:
    explicit slice_reader(bytes_view buf) noexcept : _buf(buf) {}

    reference read(size_t n)
    {
        _verify_left(n);

        auto view = _buf.subspan(_pos, n);
        _pos += n;
        return {reference::kind::borrowed, view};
    }

    uint8_t peek() const
    {
        _verify_left(1);
        return _buf[_pos];
    }

    uint8_t get()
    {
        _verify_left(1);
        return _buf[_pos++];
    }

    //! Unread part of the input. Subsequent values can be decoded from here.
    bytes_view rest() const noexcept { return _buf.subspan(_pos); }

    size_t position() const noexcept { return _pos; }
    bool empty() const noexcept { return _pos == _buf.size(); }

   private:
    void _verify_left(size_t n) const
    {
        if (_buf.size() - _pos < n) {
            throw error::eof_data{
                    "%zu bytes requested, only %zu bytes left", n, _buf.size() - _pos};
        }
    }
};

/**
 * Reads from any std::streambuf. Every payload is copied into internal buffer, which is
 * invalidated by next read() call.
 */
class stream_reader
{
    std::streambuf* _buf;
    bytes _scratch;

    enum : size_t { chunk_size = 64 << 10 };

   public:
    explicit stream_reader(std::streambuf* buf) noexcept : _buf(buf) {}

    reference read(size_t n)
    {
        _scratch.clear();

        // grow gradually, so that bogus length prefix can't make us allocate gigabytes up front
        for (size_t offset = 0; offset < n;) {
            auto to_read = std::min<size_t>(n - offset, chunk_size);
            _scratch.resize(offset + to_read);

            auto got = _buf->sgetn(reinterpret_cast<char*>(_scratch.data() + offset),
                                   std::streamsize(to_read));
            offset += size_t(got);

            if (size_t(got) != to_read) {
                CPPMP_DEBUG("stream reader: expected {} bytes, stream ended after {}", n, offset);
                throw error::eof_data{"%zu bytes requested, stream ended after %zu", n, offset};
            }
        }

        return {reference::kind::copied, _scratch};
    }

    uint8_t peek() const
    {
        auto ch = _buf->sgetc();
        if (ch == std::streambuf::traits_type::eof())
            throw error::eof_data{"unexpected end of stream"};

        return uint8_t(ch);
    }

    uint8_t get()
    {
        auto ch = _buf->sbumpc();
        if (ch == std::streambuf::traits_type::eof())
            throw error::eof_data{"unexpected end of stream"};

        return uint8_t(ch);
    }

    std::streambuf* rdbuf() const noexcept { return _buf; }
};

}  // namespace cppmp
