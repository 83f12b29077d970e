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
#include <cstdint>
#include <utility>

#include "helper/exception.hxx"

namespace cppmp {
/**
 * Error classification shared by every codec exception
 */
enum class errc : uint8_t {
    unexpected_format,         // wire tag doesn't match requested shape
    invalid_data,              // tag matched, but content is invalid
    eof_data,                  // reader ran out of bytes
    buffer_full,               // writer ran out of capacity
    invalid_format,            // value can't be expressed by any wire tag
    seq_len_none,              // container length unknown at encode time
    recursion_limit_exceeded,  // nested containers too deep
    custom,                    // raised by archive interface itself
};

char const* to_string(errc code) noexcept;

namespace error {
struct codec_exception : basic_exception<codec_exception> {
    template <typename... Args_>
    explicit codec_exception(errc code, char const* fmt = nullptr, Args_&&... args)
            : _code(code)
    {
        if (fmt) { message(fmt, std::forward<Args_>(args)...); }
    }

    errc code() const noexcept { return _code; }

   private:
    errc _code;
};

CPPMP_DECLARE_EXCEPTION(decode_error, codec_exception);
CPPMP_DECLARE_EXCEPTION(encode_error, codec_exception);
CPPMP_DECLARE_EXCEPTION(custom_error, codec_exception);

//! Errors which leave the input untouched, thus caller may retry with another type.
CPPMP_DECLARE_EXCEPTION(recoverable_error, decode_error);

}  // namespace error
}  // namespace cppmp

#define CPPMP_DECLARE_CODEC_ERROR(Name, Base, Code)                           \
    struct Name : Base {                                                      \
        template <typename... Args_>                                          \
        explicit Name(char const* fmt = nullptr, Args_&&... args)             \
                : Base(::cppmp::errc::Code, fmt, std::forward<Args_>(args)...) \
        {                                                                     \
        }                                                                     \
    }

namespace cppmp::error {
CPPMP_DECLARE_CODEC_ERROR(unexpected_format, recoverable_error, unexpected_format);
CPPMP_DECLARE_CODEC_ERROR(invalid_data, decode_error, invalid_data);
CPPMP_DECLARE_CODEC_ERROR(eof_data, decode_error, eof_data);
CPPMP_DECLARE_CODEC_ERROR(recursion_limit_exceeded, decode_error, recursion_limit_exceeded);

CPPMP_DECLARE_CODEC_ERROR(buffer_full, encode_error, buffer_full);
CPPMP_DECLARE_CODEC_ERROR(invalid_format, encode_error, invalid_format);
CPPMP_DECLARE_CODEC_ERROR(seq_len_none, encode_error, seq_len_none);

CPPMP_DECLARE_CODEC_ERROR(writer_invalid_state, custom_error, custom);
CPPMP_DECLARE_CODEC_ERROR(reader_invalid_context, custom_error, custom);
}  // namespace cppmp::error
