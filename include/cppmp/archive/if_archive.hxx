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
#include <string>
#include <string_view>

#include "../decode.hxx"
#include "../error.hxx"
#include "../number.hxx"
#include "../utility/array_view.hxx"

namespace cppmp::archive {

//! What the next value on the wire decodes as
enum class entity_type : uint16_t {
    invalid,
    null,
    boolean,
    integer,
    floating_point,
    string,
    binary,
    extension,
    array,
    map,
};

//! Length of a sequence whose size can't be known before iterating it
constexpr size_t unknown_length = ~size_t{};

struct archive_config {
    uint32_t max_depth;
    bool strict_scope_end : 1;

    archive_config() noexcept
            : max_depth(uint32_t(default_max_depth)),
              strict_scope_end(false)
    {
    }
};

class if_archive_base
{
   public:
    archive_config config;

   public:
    virtual ~if_archive_base() = default;

    //! Drops every open scope, ready for a new root value
    virtual void clear() = 0;
};

/**
 * Receives a value tree depth first. Containers announce their length before their first
 *  element, so a sequence of unknown length can't be written.
 */
class if_writer : public if_archive_base
{
   public:
    virtual if_writer& write(std::nullptr_t) = 0;
    virtual if_writer& write(bool v) = 0;
    inline if_writer& write(char v) { return this->write((int8_t)v); }

    virtual if_writer& write(int8_t v) = 0;
    virtual if_writer& write(int16_t v) = 0;
    virtual if_writer& write(int32_t v) = 0;
    virtual if_writer& write(int64_t v) = 0;

    virtual if_writer& write(uint8_t v) = 0;
    virtual if_writer& write(uint16_t v) = 0;
    virtual if_writer& write(uint32_t v) = 0;
    virtual if_writer& write(uint64_t v) = 0;

    virtual if_writer& write(float v) = 0;
    virtual if_writer& write(double v) = 0;

    virtual if_writer& write(std::string_view v) = 0;

    if_writer& write(std::string const& v)
    {
        return this->write(std::string_view{v});
    }

    template <size_t N_>
    if_writer& write(char const (&v)[N_])
    {
        return this->write(std::string_view(v));
    }

    if_writer& write(char const* v)
    {
        return this->write(std::string_view(v));
    }

    if_writer& write(bytes_view v)
    {
        binary_push(v.size());
        binary_write_some(v);
        binary_pop();
        return *this;
    }

    if_writer& write(number const& v)
    {
        switch (v.type()) {
            case number::kind::positive_int: return this->write(*v.as_uint());
            case number::kind::negative_int: return this->write(*v.as_int());
            default: return this->write(*v.as_float());
        }
    }

    //! Anything with an archive_traits specialization
    template <typename Ty_>
    if_writer& write(Ty_ const& other);

    //! Binary written in chunks. Exactly 'total' bytes must arrive before binary_pop().
    virtual if_writer& binary_push(size_t total) = 0;
    virtual if_writer& binary_write_some(bytes_view) = 0;
    virtual if_writer& binary_pop() = 0;

    //! Extension value of given type code. Counts as single element of the enclosing scope.
    virtual if_writer& write_extension(int8_t type, bytes_view payload) = 0;

    //! Map of 'num_elems' key/value pairs. unknown_length raises error::seq_len_none.
    virtual if_writer& object_push(size_t num_elems) = 0;
    virtual if_writer& object_pop() = 0;

    virtual if_writer& array_push(size_t num_elems) = 0;
    virtual if_writer& array_pop() = 0;

    //! Marks the next written value as a map key
    virtual void write_key_next() = 0;

   public:
    //! Variant without payload, written as its name
    if_writer& unit_variant(std::string_view name) { return this->write(name); }

    //! Variant with payload: single entry map of name to payload. Write payload, then call
    //!  variant_pop().
    if_writer& variant_push(std::string_view name)
    {
        object_push(1);
        write_key_next();
        return this->write(name);
    }

    if_writer& variant_pop() { return object_pop(); }
};

//! Identifies an open array or map of a reader
struct context_key {
    int64_t value;
};

/**
 * Scope opened by if_reader::begin_variant()
 */
struct variant_scope {
    context_key key;
    entity_type type;

    //! Unit variants carry nothing after the name
    bool has_payload() const noexcept { return type != entity_type::string; }
};

/**
 * Pulls a value tree depth first
 */
class if_reader : public if_archive_base
{
   public:
    //! Consumes nil
    virtual if_reader& read(std::nullptr_t) = 0;

    virtual if_reader& read(bool& v) = 0;

    inline if_reader& read(char& v) { return read((int8_t&)v); }
    virtual if_reader& read(int8_t& v) = 0;
    virtual if_reader& read(int16_t& v) = 0;
    virtual if_reader& read(int32_t& v) = 0;
    virtual if_reader& read(int64_t& v) = 0;

    virtual if_reader& read(uint8_t& v) = 0;
    virtual if_reader& read(uint16_t& v) = 0;
    virtual if_reader& read(uint32_t& v) = 0;
    virtual if_reader& read(uint64_t& v) = 0;

    virtual if_reader& read(float& v) = 0;
    virtual if_reader& read(double& v) = 0;

    //! Any integer or float, keeping its sign and float class
    virtual if_reader& read(number& v) = 0;

    virtual if_reader& read(std::string& v) = 0;
    virtual if_reader& read(bytes& v) = 0;

    //! Borrowing reads. Fails with error::invalid_data if the reader can't yield a view into
    //!  its input.
    virtual if_reader& read(std::string_view& v) = 0;
    virtual if_reader& read(bytes_view& v) = 0;

    template <typename Ty_>
    if_reader& read(Ty_& other);

    virtual if_reader& read_extension(int8_t& type, bytes& payload) = 0;
    virtual if_reader& read_extension(int8_t& type, bytes_view& payload) = 0;

    //! Discards next entity entirely, including its children
    virtual void skip() = 0;

    //! Unread elements of the innermost scope, map keys and values counted one by one
    virtual size_t elem_left() const = 0;

    //! Opens the next container. Throws error::unexpected_format for anything else.
    virtual context_key begin_object() = 0;
    virtual context_key begin_array() = 0;

    //! True once every element of the scope 'key' was consumed
    virtual bool should_break(context_key const& key) const = 0;

    //! Closes the scope 'key'. Leftovers are skipped, or rejected under strict_scope_end.
    //! Throws error::reader_invalid_context if 'key' isn't the innermost scope.
    virtual void end_object(context_key) = 0;
    virtual void end_array(context_key) = 0;

    //! Next read of the current map must be a key
    virtual void read_key_next() = 0;

    //! Peeks next value without consuming it
    virtual entity_type type_next() const = 0;

    template <typename T>
    T read();

   public:
    /**
     * Opens tagged union. Unit variant is a bare name; variant with payload is either single
     *  entry map of name to payload, or 2-element array of name and payload.
     *
     * If returned scope has payload, read it next and close the scope with end_variant().
     */
    variant_scope begin_variant(std::string& name)
    {
        switch (auto type = type_next()) {
            case entity_type::string:
                read(name);
                return {{}, type};

            case entity_type::map: {
                auto key = begin_object();
                if (elem_left() != 2)
                    throw error::invalid_data{"variant map must hold single entry, got %zu", elem_left() / 2};

                read_key_next();
                read(name);
                return {key, type};
            }

            case entity_type::array: {
                auto key = begin_array();
                if (elem_left() != 2)
                    throw error::invalid_data{"variant array must hold 2 elements, got %zu", elem_left()};

                read(name);
                return {key, type};
            }

            default:
                throw error::unexpected_format{"variant must be a string, map or array"};
        }
    }

    void end_variant(variant_scope const& scope)
    {
        if (scope.type == entity_type::map)
            end_object(scope.key);
        else if (scope.type == entity_type::array)
            end_array(scope.key);
    }

   public:
    //! Moves the next value, children included, from this reader into 'target'
    virtual void dump_single_object(if_writer* target)
    {
        std::string text;
        bytes blob;
        _transfer(*target, text, blob);
    }

   private:
    void _transfer(if_writer& out, std::string& text, bytes& blob)
    {
        auto const type = type_next();

        if (type == entity_type::array || type == entity_type::map) {
            bool const is_map = type == entity_type::map;
            auto scope = is_map ? begin_object() : begin_array();

            if (is_map)
                out.object_push(elem_left() / 2);
            else
                out.array_push(elem_left());

            while (not should_break(scope)) {
                if (is_map) {
                    read_key_next();
                    out.write_key_next();
                    _transfer(out, text, blob);
                }

                _transfer(out, text, blob);
            }

            if (is_map)
                out.object_pop(), end_object(scope);
            else
                out.array_pop(), end_array(scope);

            return;
        }

        switch (type) {
            case entity_type::null: read(nullptr), out.write(nullptr); break;
            case entity_type::string: read(text), out.write(text); break;
            case entity_type::binary: read(blob), out.write(bytes_view{blob}); break;

            case entity_type::boolean: {
                bool b = false;
                read(b), out.write(b);
                break;
            }

            case entity_type::integer:
            case entity_type::floating_point: {
                number n;
                read(n), out.write(n);
                break;
            }

            case entity_type::extension: {
                int8_t ext_type = 0;
                read_extension(ext_type, blob), out.write_extension(ext_type, bytes_view{blob});
                break;
            }

            default:
                throw error::reader_invalid_context{"no value can be read at this position"};
        }
    }

   public:
    //! check if next statement is null
    bool is_null_next() const
    {
        return type_next() == entity_type::null;
    };

    //! type getters
    bool is_object_next() const { return type_next() == entity_type::map; }
    bool is_array_next() const { return type_next() == entity_type::array; }

    bool is_number_next() const
    {
        switch (type_next()) {
            case entity_type::integer:
            case entity_type::floating_point:
                return true;
            default:
                return false;
        }
    }

    bool is_boolean_next() const { return type_next() == entity_type::boolean; }
    bool is_string_next() const { return type_next() == entity_type::string; }
    bool is_extension_next() const { return type_next() == entity_type::extension; }
};

template <typename Any_>
if_writer& operator<<(if_writer& writer, Any_ const& value)
{
    return writer.write(value);
}

template <typename Any_>
if_writer& operator<<(if_writer&& writer, Any_ const& value)
{
    return writer.write(value);
}

template <typename Any_>
if_reader& operator>>(if_reader& reader, Any_& ref)
{
    return reader.read(ref);
}

template <typename Any_>
if_reader& operator>>(if_reader&& reader, Any_& ref)
{
    return reader.read(ref);
}

inline if_reader& operator>>(if_reader& reader, std::nullptr_t nil)
{
    return reader.read(nil);
}

template <typename T>
T if_reader::read()
{
    T value;
    *this >> value;
    return value;
}

}  // namespace cppmp::archive
