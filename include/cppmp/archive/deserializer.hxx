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

#include "../extension.hxx"
#include "../helper/macros.hxx"
#include "../num_strategy.hxx"
#include "if_archive.hxx"

namespace cppmp::archive {

/**
 * Archive reader over Reader_.
 *
 * Every read validates the current scope first, decodes, then steps the scope. A decode
 * which fails with error::unexpected_format leaves both the input and the scope untouched.
 */
template <typename Reader_, typename NumDecoder_ = num_decoder::widening>
class deserializer : public if_reader
{
    struct frame_t {
        enum kind_t {
            kind_map,
            kind_array,
        };

        context_key id;
        kind_t kind;

        size_t remaining;
        bool key_pending = false;
    };

   private:
    Reader_& _rd;
    std::vector<frame_t> _frames;
    int64_t _frame_id_seq = 0;

   public:
    explicit deserializer(Reader_& rd, size_t reserved_depth = 0)
            : _rd(rd)
    {
        reserve_depth(reserved_depth);
    }

    void reserve_depth(size_t n) { _frames.reserve(n); }

    //! Clears internal parsing state
    void clear() override { _frames.clear(), _frame_id_seq = 0; }

    Reader_& reader() const noexcept { return _rd; }

    //! Unread remainder of underlying slice reader
    bytes_view rest() const noexcept { return _rd.rest(); }

    size_t depth() const noexcept { return _frames.size(); }

   public:
    if_reader& read(std::nullptr_t) override
    {
        return _read_value([&] { cppmp::decode<std::nullptr_t>(_rd); });
    }

    if_reader& read(bool& v) override
    {
        return _read_value([&] { v = cppmp::decode<bool>(_rd); });
    }

    if_reader& read(int8_t& v) override { return _read_num(v); }
    if_reader& read(int16_t& v) override { return _read_num(v); }
    if_reader& read(int32_t& v) override { return _read_num(v); }
    if_reader& read(int64_t& v) override { return _read_num(v); }
    if_reader& read(uint8_t& v) override { return _read_num(v); }
    if_reader& read(uint16_t& v) override { return _read_num(v); }
    if_reader& read(uint32_t& v) override { return _read_num(v); }
    if_reader& read(uint64_t& v) override { return _read_num(v); }
    if_reader& read(float& v) override { return _read_num(v); }
    if_reader& read(double& v) override { return _read_num(v); }

    if_reader& read(number& v) override
    {
        return _read_value([&] { v = cppmp::detail::read_number(_rd); });
    }

    if_reader& read(std::string& v) override
    {
        return _read_value([&] { v = cppmp::decode<std::string>(_rd); });
    }

    if_reader& read(bytes& v) override
    {
        return _read_value([&] { v = cppmp::decode<bytes>(_rd); });
    }

    if_reader& read(std::string_view& v) override
    {
        return _read_value([&] { v = cppmp::decode<std::string_view>(_rd); });
    }

    if_reader& read(bytes_view& v) override
    {
        return _read_value([&] { v = cppmp::decode<bytes_view>(_rd); });
    }

    using if_reader::read;

    if_reader& read_extension(int8_t& type, bytes& payload) override
    {
        return _read_value([&] {
            auto ext = cppmp::decode<extension>(_rd);
            type = ext.type();
            payload = std::move(ext.data());
        });
    }

    if_reader& read_extension(int8_t& type, bytes_view& payload) override
    {
        return _read_value([&] {
            auto ext = cppmp::decode<extension_ref>(_rd);
            type = ext.type;
            payload = ext.data;
        });
    }

    void skip() override
    {
        _ensure_readable();
        _skip_once();
    }

    size_t elem_left() const override { return _top_frame().remaining; }

    bool should_break(const context_key& key) const override
    {
        auto scope = &_top_frame();
        return key.value == scope->id.value && scope->remaining == 0;
    }

    context_key begin_object() override
    {
        _ensure_readable();
        auto n_elem = cppmp::detail::read_map_len(_rd);

        _consume_one();
        return _push_frame(frame_t::kind_map, n_elem)->id;
    }

    void end_object(context_key key) override
    {
        _close_scope(frame_t::kind_map, key, config.strict_scope_end);
    }

    context_key begin_array() override
    {
        _ensure_readable();
        auto n_elem = cppmp::detail::read_array_len(_rd);

        _consume_one();
        return _push_frame(frame_t::kind_array, n_elem)->id;
    }

    void end_array(context_key key) override
    {
        _close_scope(frame_t::kind_array, key, config.strict_scope_end);
    }

    void read_key_next() override
    {
        auto scope = _require_frame(frame_t::kind_map);

        if (scope->remaining & 1)
            throw error::reader_invalid_context{"not a valid order for key!"};
        if (scope->key_pending)
            throw error::reader_invalid_context{"duplicated call for read_key_next()"};

        scope->key_pending = true;
    }

    entity_type type_next() const override
    {
        auto fmt = cppmp::detail::peek_format(_rd);
        switch (fmt.code()) {
            case typecode::float32:
            case typecode::float64:
                return entity_type::floating_point;

            case typecode::positive_fixint:
            case typecode::negative_fixint:
            case typecode::uint8:
            case typecode::uint16:
            case typecode::uint32:
            case typecode::uint64:
            case typecode::int8:
            case typecode::int16:
            case typecode::int32:
            case typecode::int64:
                return entity_type::integer;

            case typecode::bool_false:
            case typecode::bool_true:
                return entity_type::boolean;

            case typecode::fixstr:
            case typecode::str8:
            case typecode::str16:
            case typecode::str32:
                return entity_type::string;

            case typecode::bin8:
            case typecode::bin16:
            case typecode::bin32:
                return entity_type::binary;

            case typecode::fixext1:
            case typecode::fixext2:
            case typecode::fixext4:
            case typecode::fixext8:
            case typecode::fixext16:
            case typecode::ext8:
            case typecode::ext16:
            case typecode::ext32:
                return entity_type::extension;

            case typecode::fixarray:
            case typecode::array16:
            case typecode::array32:
                return entity_type::array;

            case typecode::fixmap:
            case typecode::map16:
            case typecode::map32:
                return entity_type::map;

            case typecode::nil:
                return entity_type::null;

            default:
                cppmp::detail::throw_unexpected(fmt, "any value");
        }
    }

   private:
    template <typename Fn_>
    if_reader& _read_value(Fn_&& fn)
    {
        _ensure_readable();
        fn();
        _consume_one();
        return *this;
    }

    template <typename Num_>
    if_reader& _read_num(Num_& ref)
    {
        return _read_value([&] { ref = NumDecoder_::template decode<Num_>(_rd); });
    }

    void _close_scope(typename frame_t::kind_t type, context_key key, bool strict)
    {
        auto nbrk = _frames_to_close(type, key);
        while (nbrk--) { _drain_frame(strict); }
    }

    void _drain_frame(bool strict)
    {
        // skipping nested containers pushes scopes, thus the pointer is refreshed each round
        for (auto scope = &_top_frame(); scope->remaining > 0; scope = &_top_frame()) {
            if (strict)
                throw error::invalid_data{"%zu elements left unread", scope->remaining};

            if (scope->kind == frame_t::kind_map && (scope->remaining & 1) == 0)
                scope->key_pending = true;

            _skip_once();
        }

        _frames.pop_back();
    }

    void _skip_once()
    {
        auto fmt = cppmp::detail::peek_format(_rd);
        size_t skip_bytes = 0;

        switch (fmt.code()) {
            case typecode::fixarray:
            case typecode::array16:
            case typecode::array32:
                _close_scope(frame_t::kind_array, begin_array(), false);
                return;

            case typecode::fixmap:
            case typecode::map16:
            case typecode::map32:
                _close_scope(frame_t::kind_map, begin_object(), false);
                return;

            case typecode::positive_fixint:
            case typecode::negative_fixint:
            case typecode::nil:
            case typecode::bool_false:
            case typecode::bool_true:
                _rd.get();
                break;

            case typecode::uint8:
            case typecode::int8: skip_bytes = 2; break;
            case typecode::uint16:
            case typecode::int16: skip_bytes = 3; break;
            case typecode::uint32:
            case typecode::int32:
            case typecode::float32: skip_bytes = 5; break;
            case typecode::uint64:
            case typecode::int64:
            case typecode::float64: skip_bytes = 9; break;

            case typecode::fixstr:
                skip_bytes = 1 + fmt.fix_length();
                break;

            case typecode::str8:
            case typecode::str16:
            case typecode::str32:
                _rd.get();
                _rd.read(cppmp::detail::read_sized_length(_rd, typecode::str8, fmt.code()));
                break;

            case typecode::bin8:
            case typecode::bin16:
            case typecode::bin32:
                _rd.get();
                _rd.read(cppmp::detail::read_sized_length(_rd, typecode::bin8, fmt.code()));
                break;

            case typecode::fixext1:
            case typecode::fixext2:
            case typecode::fixext4:
            case typecode::fixext8:
            case typecode::fixext16:
            case typecode::ext8:
            case typecode::ext16:
            case typecode::ext32:
                _rd.read(cppmp::detail::read_extension_header(_rd).length);
                break;

            default:
                cppmp::detail::throw_unexpected(fmt, "any value");
        }

        if (skip_bytes) { _rd.read(skip_bytes); }
        _consume_skipped();
    }

    size_t _frames_to_close(typename frame_t::kind_t type, context_key key)
    {
        for (auto it = _frames.rbegin(), end = _frames.rend(); it != end; ++it)
            if (it->id.value == key.value) {
                if (it->kind == type)
                    return it - _frames.rbegin() + 1;
                else
                    throw error::reader_invalid_context{"scope closed as the wrong container kind"};
            }

        throw error::reader_invalid_context{"scope is not open"};
    }

    frame_t* _push_frame(typename frame_t::kind_t ty, size_t n_elems)
    {
        if (_frames.size() >= config.max_depth) {
            CPPMP_DEBUG("nesting depth {} reached while opening container", _frames.size());
            throw error::recursion_limit_exceeded{"nesting deeper than %u", unsigned(config.max_depth)};
        }

        auto scope = &_frames.emplace_back();
        scope->kind = ty;
        scope->remaining = n_elems * (ty == frame_t::kind_map ? 2 : 1);
        scope->key_pending = false;
        scope->id.value = ++_frame_id_seq;

        return scope;
    }

    void _ensure_readable() const
    {
        if (_frames.empty()) { return; }

        auto scope = &_frames.back();
        if (scope->remaining == 0)
            throw error::reader_invalid_context{"every element of the container was read"};

        if (scope->kind == frame_t::kind_map && not(scope->remaining & 1) && not scope->key_pending)
            throw error::reader_invalid_context{"map key read without read_key_next()"};
    }

    void _consume_one()
    {
        if (_frames.empty()) { return; }

        auto scope = &_frames.back();
        if (scope->kind == frame_t::kind_map && not(scope->remaining & 1))
            scope->key_pending = false;

        --scope->remaining;
    }

    void _consume_skipped()
    {
        if (_frames.empty()) { return; }

        // skipped map keys need no read_key_next()
        auto scope = &_frames.back();
        scope->key_pending = false;
        --scope->remaining;
    }

    frame_t const& _top_frame() const
    {
        auto size = _frames.size();
        if (size == 0)
            throw error::reader_invalid_context{"no container is open"};

        return _frames[size - 1];
    }

    frame_t& _top_frame() { return const_cast<frame_t&>(((deserializer const*)this)->_top_frame()); }

    frame_t* _require_frame(typename frame_t::kind_t t)
    {
        auto scope = &_top_frame();
        if (scope->kind != t)
            throw error::reader_invalid_context{
                    "invalid scope type: was %d - %d expected", int(scope->kind), int(t)};

        return scope;
    }
};

}  // namespace cppmp::archive
