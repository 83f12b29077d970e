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

#include "cppmp/error.hxx"
#include "cppmp/format.hxx"

namespace cppmp {
char const* to_string(typecode code) noexcept
{
    switch (code) {
        case typecode::positive_fixint: return "positive_fixint";
        case typecode::fixmap: return "fixmap";
        case typecode::fixarray: return "fixarray";
        case typecode::fixstr: return "fixstr";
        case typecode::nil: return "nil";
        case typecode::never_used: return "never_used";
        case typecode::bool_false: return "false";
        case typecode::bool_true: return "true";
        case typecode::bin8: return "bin8";
        case typecode::bin16: return "bin16";
        case typecode::bin32: return "bin32";
        case typecode::ext8: return "ext8";
        case typecode::ext16: return "ext16";
        case typecode::ext32: return "ext32";
        case typecode::float32: return "float32";
        case typecode::float64: return "float64";
        case typecode::uint8: return "uint8";
        case typecode::uint16: return "uint16";
        case typecode::uint32: return "uint32";
        case typecode::uint64: return "uint64";
        case typecode::int8: return "int8";
        case typecode::int16: return "int16";
        case typecode::int32: return "int32";
        case typecode::int64: return "int64";
        case typecode::fixext1: return "fixext1";
        case typecode::fixext2: return "fixext2";
        case typecode::fixext4: return "fixext4";
        case typecode::fixext8: return "fixext8";
        case typecode::fixext16: return "fixext16";
        case typecode::str8: return "str8";
        case typecode::str16: return "str16";
        case typecode::str32: return "str32";
        case typecode::array16: return "array16";
        case typecode::array32: return "array32";
        case typecode::map16: return "map16";
        case typecode::map32: return "map32";
        case typecode::negative_fixint: return "negative_fixint";
    }

    return "unknown";
}

char const* to_string(errc code) noexcept
{
    switch (code) {
        case errc::unexpected_format: return "unexpected format";
        case errc::invalid_data: return "invalid data";
        case errc::eof_data: return "unexpected end of data";
        case errc::buffer_full: return "buffer full";
        case errc::invalid_format: return "invalid format";
        case errc::seq_len_none: return "sequence length unknown";
        case errc::recursion_limit_exceeded: return "recursion limit exceeded";
        case errc::custom: return "custom";
    }

    return "unknown";
}
}  // namespace cppmp
