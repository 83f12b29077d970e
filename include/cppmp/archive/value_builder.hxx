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
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "../extension.hxx"

#include "../io.hxx"
#include "../value.hxx"
#include "deserializer.hxx"
#include "detail/scope_tracker.hxx"
#include "if_archive.hxx"
#include "traits.hxx"

namespace cppmp::archive {

/**
 * Archive writer which assembles a single owning value instead of bytes
 */
class value_builder : public if_writer
{
    struct frame_t {
        value node;
        std::optional<value> key;
    };

   private:
    std::vector<frame_t> _frames;
    std::optional<value> _result;
    bytes _binary;
    detail::scope_tracker _ctx;

   public:
    //! Whether a complete root value was written
    bool ready() const noexcept { return _result.has_value() && _ctx.empty(); }

    //! Takes out the root value and resets the builder.
    //! @throw error::writer_invalid_state if root value is incomplete
    value release();

    void clear() override;

   public:
    if_writer& write(std::nullptr_t) override { return _put(value{}); }
    if_writer& write(bool v) override { return _put(value{v}); }

    if_writer& write(int8_t v) override { return _put(value{v}); }
    if_writer& write(int16_t v) override { return _put(value{v}); }
    if_writer& write(int32_t v) override { return _put(value{v}); }
    if_writer& write(int64_t v) override { return _put(value{v}); }
    if_writer& write(uint8_t v) override { return _put(value{v}); }
    if_writer& write(uint16_t v) override { return _put(value{v}); }
    if_writer& write(uint32_t v) override { return _put(value{v}); }
    if_writer& write(uint64_t v) override { return _put(value{v}); }
    if_writer& write(float v) override { return _put(value{v}); }
    if_writer& write(double v) override { return _put(value{v}); }

    if_writer& write(std::string_view v) override { return _put(value{std::string{v}}); }

    using if_writer::write;

    if_writer& binary_push(size_t total) override;
    if_writer& binary_write_some(bytes_view v) override;
    if_writer& binary_pop() override;

    if_writer& write_extension(int8_t type, bytes_view payload) override;

    if_writer& object_push(size_t num_elems) override;
    if_writer& object_pop() override;

    if_writer& array_push(size_t num_elems) override;
    if_writer& array_pop() override;

    void write_key_next() override { _ctx.announce_key(); }

   private:
    if_writer& _put(value v);
    void _emplace(value v);
};

}  // namespace cppmp::archive

namespace cppmp {
/**
 * Builds a value from any archivable object
 */
template <typename Ty_>
value to_value(Ty_ const& object)
{
    archive::value_builder builder;
    builder.write(object);
    return builder.release();
}

/**
 * Restores a typed object from a value. Integers and floats are accepted the way
 *  num_decoder::widening accepts them from the wire.
 *
 * The result owns all of its data. Types which would borrow from the intermediate
 *  encoding, directly or as a member, fail with error::invalid_data.
 */
template <typename Ty_>
Ty_ from_value(value const& v)
{
    static_assert(not std::is_same_v<Ty_, std::string_view>
                          && not std::is_same_v<Ty_, bytes_view>
                          && not std::is_same_v<Ty_, value_ref>
                          && not std::is_same_v<Ty_, extension_ref>,
                  "from_value can't return a view");

    std::string encoded;
    {
        bytes buffer;
        vector_writer wr{buffer};
        encode_value<num_encoder::exact>(wr, v);
        encoded.assign(reinterpret_cast<char const*>(buffer.data()), buffer.size());
    }

    std::stringbuf source{std::move(encoded), std::ios_base::in};
    stream_reader rd{&source};
    archive::deserializer<stream_reader> reader{rd};

    Ty_ object{};
    reader.read(object);
    return object;
}
}  // namespace cppmp
