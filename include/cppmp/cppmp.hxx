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
#include <utility>

#include "archive/deserializer.hxx"
#include "archive/serializer.hxx"
#include "archive/traits.hxx"
#include "archive/value_builder.hxx"
#include "decode.hxx"
#include "encode.hxx"
#include "extension.hxx"
#include "io.hxx"
#include "num_strategy.hxx"
#include "timestamp.hxx"
#include "value.hxx"

/**
 * One-call entry points over the archive layer
 */
namespace cppmp {

template <typename NumEncoder_ = num_encoder::lossless_minimize, typename Ty_>
bytes to_vector(Ty_ const& object)
{
    bytes buffer;
    vector_writer wr{buffer};
    archive::serializer<vector_writer, NumEncoder_>{wr}.write(object);
    return buffer;
}

//! @return number of bytes written into 'buffer'
//! @throw error::buffer_full if 'buffer' can't hold encoded object
template <typename NumEncoder_ = num_encoder::lossless_minimize, typename Ty_>
size_t to_slice(mutable_bytes_view buffer, Ty_ const& object)
{
    slice_writer wr{buffer};
    archive::serializer<slice_writer, NumEncoder_> serializer{wr};
    serializer.write(object);
    return serializer.bytes_written();
}

template <typename NumEncoder_ = num_encoder::lossless_minimize, typename Ty_>
size_t to_stream(std::streambuf* buf, Ty_ const& object)
{
    stream_writer wr{buf};
    archive::serializer<stream_writer, NumEncoder_> serializer{wr};
    serializer.write(object);
    return serializer.bytes_written();
}

/**
 * Decodes single object from the head of 'input'. Borrowing targets (std::string_view,
 *  bytes_view, value_ref) point into 'input'.
 */
template <typename Ty_, typename NumDecoder_ = num_decoder::widening>
Ty_ from_slice(bytes_view input)
{
    slice_reader rd{input};
    archive::deserializer<slice_reader, NumDecoder_> deserializer{rd};

    Ty_ object{};
    deserializer.read(object);
    return object;
}

//! Same as above, also returns unread remainder of 'input'
template <typename Ty_, typename NumDecoder_ = num_decoder::widening>
std::pair<Ty_, bytes_view> from_slice_partial(bytes_view input)
{
    slice_reader rd{input};
    archive::deserializer<slice_reader, NumDecoder_> deserializer{rd};

    Ty_ object{};
    deserializer.read(object);
    return {std::move(object), deserializer.rest()};
}

template <typename Ty_, typename NumDecoder_ = num_decoder::widening>
Ty_ from_stream(std::streambuf* buf)
{
    stream_reader rd{buf};
    archive::deserializer<stream_reader, NumDecoder_> deserializer{rd};

    Ty_ object{};
    deserializer.read(object);
    return object;
}

}  // namespace cppmp
