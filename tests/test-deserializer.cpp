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
#include <catch2/catch.hpp>
#include <chrono>
#include <map>
#include <sstream>

#include "cppmp/cppmp.hxx"

using namespace cppmp;
using namespace cppmp::archive;

namespace {
struct record {
    int32_t id = -1;
    std::string name = "unnamed";
    std::vector<double> scores;

    void archive(if_writer& wr) const
    {
        write_struct(wr, field("id", id), field("name", name), field("scores", scores));
    }

    void restore(if_reader& rd)
    {
        read_struct(rd, field("id", id), field("name", name), field("scores", scores));
    }
};

using command = std::variant<std::monostate, int32_t, record>;

bytes str_bytes(std::string_view s) { return bytes(s.begin(), s.end()); }

bytes concat(std::initializer_list<bytes> parts)
{
    bytes out;
    for (auto& part : parts) { out.insert(out.end(), part.begin(), part.end()); }
    return out;
}

bytes nested_arrays(size_t depth)
{
    bytes out(depth, 0x91);
    out.push_back(0xc0);
    return out;
}
}  // namespace

namespace cppmp::archive {
template <>
struct variant_names<command> {
    static std::string name(size_t index)
    {
        static char const* const names[] = {"Unit", "Newtype", "Record"};
        return names[index];
    }
};
}  // namespace cppmp::archive

TEST_CASE("primitives through deserializer", "[deserializer]")
{
    REQUIRE(from_slice<bool>(bytes{0xc3}) == true);
    REQUIRE(from_slice<std::string>(concat({{0xa5}, str_bytes("Today")})) == "Today");
    REQUIRE_FALSE(from_slice<std::optional<int>>(bytes{0xc0}));
    REQUIRE(from_slice<std::optional<int>>(bytes{0x07}) == 7);
    REQUIRE(from_slice<long long>(bytes{0xd3, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe}) == -2);
    REQUIRE(from_slice<char32_t>(bytes{0xa3, 0xed, 0x95, 0x9c}) == U'\xd55c');

    SECTION("numbers widen by default")
    {
        REQUIRE(from_slice<uint8_t>(bytes{0xcd, 0x00, 0x05}) == 5);
        REQUIRE(from_slice<double>(bytes{0xca, 0x3f, 0xc0, 0x00, 0x00}) == 1.5);
        REQUIRE_THROWS_AS(from_slice<uint8_t>(bytes{0xcd, 0x01, 0x00}), error::invalid_data);
        REQUIRE_THROWS_AS(from_slice<int>(bytes{0xc3}), error::unexpected_format);
    }

    SECTION("other policies")
    {
        REQUIRE_THROWS_AS((from_slice<int32_t, num_decoder::exact>(bytes{0x05})), error::unexpected_format);
        REQUIRE((from_slice<int32_t, num_decoder::lenient>(bytes{0xcb, 0x3f, 0xf0, 0, 0, 0, 0, 0, 0})) == 1);
    }

    SECTION("character must be single")
    {
        REQUIRE_THROWS_AS(from_slice<char32_t>(bytes{0xa2, 'a', 'b'}), error::invalid_data);
    }
}

TEST_CASE("structs from maps and arrays", "[deserializer]")
{
    record src{7, "seven", {0.5, 1.25}};
    auto buf = to_vector(src);

    auto restored = from_slice<record>(buf);
    REQUIRE(restored.id == 7);
    REQUIRE(restored.name == "seven");
    REQUIRE(restored.scores == std::vector<double>{0.5, 1.25});

    SECTION("array form")
    {
        bytes arr = {0x93, 0x07, 0xa1, 'x', 0x91, 0xca, 0x3f, 0xc0, 0x00, 0x00};
        auto rec = from_slice<record>(arr);
        REQUIRE(rec.id == 7);
        REQUIRE(rec.name == "x");
        REQUIRE(rec.scores == std::vector<double>{1.5});
    }

    SECTION("array arity")
    {
        REQUIRE_THROWS_AS(from_slice<record>(bytes{0x92, 0x07, 0xa1, 'x'}), error::invalid_data);
    }

    SECTION("unknown keys are skipped, missing keep defaults")
    {
        auto in = concat({{0x82},
                          {0xa5}, str_bytes("extra"), {0x82, 0xa1, 'a', 0x92, 0x01, 0x02, 0xa1, 'b', 0xd6, 0x01, 0, 0, 0, 0},
                          {0xa2, 'i', 'd'}, {0x2a}});

        auto rec = from_slice<record>(in);
        REQUIRE(rec.id == 42);
        REQUIRE(rec.name == "unnamed");
        REQUIRE(rec.scores.empty());
    }

    SECTION("neither map nor array")
    {
        REQUIRE_THROWS_AS(from_slice<record>(bytes{0xc0}), error::unexpected_format);
    }
}

TEST_CASE("deserializing variants", "[deserializer][variant]")
{
    SECTION("unit")
    {
        auto v = from_slice<command>(concat({{0xa4}, str_bytes("Unit")}));
        REQUIRE(v.index() == 0);
    }

    SECTION("single entry map")
    {
        auto v = from_slice<command>(concat({{0x81, 0xa7}, str_bytes("Newtype"), {0x1b}}));
        REQUIRE(std::get<int32_t>(v) == 27);
    }

    SECTION("two element array")
    {
        auto v = from_slice<command>(concat({{0x92, 0xa7}, str_bytes("Newtype"), {0x1b}}));
        REQUIRE(std::get<int32_t>(v) == 27);
    }

    SECTION("struct payload")
    {
        command src = record{3, "r", {}};
        auto v = from_slice<command>(to_vector(src));
        REQUIRE(std::get<record>(v).name == "r");
    }

    SECTION("malformed")
    {
        // unit with payload
        REQUIRE_THROWS_AS(from_slice<command>(concat({{0x81, 0xa4}, str_bytes("Unit"), {0xc0}})), error::invalid_data);

        // payload missing
        REQUIRE_THROWS_AS(from_slice<command>(concat({{0xa7}, str_bytes("Newtype")})), error::invalid_data);

        // unknown name
        REQUIRE_THROWS_AS(from_slice<command>(concat({{0xa4}, str_bytes("Nope")})), error::invalid_data);

        // map of two entries
        REQUIRE_THROWS_AS(from_slice<command>(bytes{0x82, 0xa1, '1', 0x01, 0xa1, '2', 0x02}), error::invalid_data);

        REQUIRE_THROWS_AS(from_slice<command>(bytes{0x01}), error::unexpected_format);
    }
}

TEST_CASE("reader scope validation", "[deserializer]")
{
    bytes in = {0x92, 0x01, 0x02, 0xc3};
    slice_reader rd{in};
    deserializer<slice_reader> de{rd};

    SECTION("non-strict end skips the rest")
    {
        auto key = de.begin_array();
        REQUIRE(de.elem_left() == 2);
        REQUIRE(de.read<int>() == 1);
        de.end_array(key);

        REQUIRE(de.read<bool>() == true);
        REQUIRE(de.rest().empty());
    }

    SECTION("strict end")
    {
        de.config.strict_scope_end = true;

        auto key = de.begin_array();
        de.read<int>();
        REQUIRE_THROWS_AS(de.end_array(key), error::invalid_data);
    }

    SECTION("reading past the end")
    {
        auto key = de.begin_array();
        de.read<int>(), de.read<int>();
        REQUIRE(de.should_break(key));
        REQUIRE_THROWS_AS(de.read<int>(), error::reader_invalid_context);
    }

    SECTION("mismatched scope")
    {
        auto key = de.begin_array();
        REQUIRE_THROWS_AS(de.end_object(key), error::reader_invalid_context);
    }

    SECTION("unexpected format keeps the scope")
    {
        auto key = de.begin_array();
        REQUIRE_THROWS_AS(de.read<std::string>(), error::unexpected_format);
        REQUIRE(de.elem_left() == 2);
        REQUIRE(de.read<int>() == 1);
        REQUIRE(de.read<int>() == 2);
        de.end_array(key);
    }
}

TEST_CASE("map keys must be announced", "[deserializer]")
{
    bytes in = {0x81, 0xa1, 'k', 0x01};
    slice_reader rd{in};
    deserializer<slice_reader> de{rd};

    auto key = de.begin_object();
    REQUIRE(de.elem_left() == 2);
    REQUIRE_THROWS_AS(de.read<std::string>(), error::reader_invalid_context);

    de.read_key_next();
    REQUIRE(de.read<std::string>() == "k");
    REQUIRE_THROWS_AS(de.read_key_next(), error::reader_invalid_context);
    REQUIRE(de.read<int>() == 1);
    de.end_object(key);
}

TEST_CASE("skip", "[deserializer]")
{
    // [{"a": [1, "xyz"], "b": <bin 2>, "c": 1.5}, "tail"]
    auto in = concat({{0x92, 0x83},
                      {0xa1, 'a', 0x92, 0x01, 0xa3, 'x', 'y', 'z'},
                      {0xa1, 'b', 0xc4, 0x02, 0xff, 0xff},
                      {0xa1, 'c', 0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0},
                      {0xa4}, str_bytes("tail")});

    slice_reader rd{in};
    deserializer<slice_reader> de{rd};

    auto key = de.begin_array();
    de.skip();
    REQUIRE(de.depth() == 1);
    REQUIRE(de.read<std::string>() == "tail");
    de.end_array(key);
    REQUIRE(rd.empty());
}

TEST_CASE("deserializer recursion limit", "[deserializer]")
{
    REQUIRE(from_slice<value>(nested_arrays(256)).type() == value::kind::array);
    REQUIRE_THROWS_AS(from_slice<value>(nested_arrays(257)), error::recursion_limit_exceeded);

    SECTION("skip is bounded too")
    {
        auto in = nested_arrays(300);
        slice_reader rd{in};
        deserializer<slice_reader> de{rd};
        REQUIRE_THROWS_AS(de.skip(), error::recursion_limit_exceeded);
    }

    SECTION("configured depth")
    {
        auto in = nested_arrays(3);
        slice_reader rd{in};
        deserializer<slice_reader> de{rd};
        de.config.max_depth = 2;

        value v;
        REQUIRE_THROWS_AS(de.read(v), error::recursion_limit_exceeded);
    }
}

TEST_CASE("partial input", "[deserializer]")
{
    bytes in = {0x01, 0xa1, 'z'};

    auto [first, rest] = from_slice_partial<int>(in);
    REQUIRE(first == 1);
    REQUIRE(rest.size() == 2);
    REQUIRE(from_slice<std::string>(rest) == "z");

    REQUIRE_THROWS_AS(from_slice<std::string>(bytes{0xa3, 'a'}), error::eof_data);
}

TEST_CASE("borrowing reads", "[deserializer]")
{
    auto in = concat({{0x92, 0xa3}, str_bytes("abc"), {0xc4, 0x01, 0x09}});

    auto [text, bin] = from_slice<std::tuple<std::string_view, bytes_view>>(in);
    REQUIRE(text == "abc");
    REQUIRE(reinterpret_cast<uint8_t const*>(text.data()) == in.data() + 2);
    REQUIRE(bin.data() == in.data() + 7);

    auto ref = from_slice<value_ref>(in);
    REQUIRE(*ref.as_array()->at(0).as_string() == "abc");

    SECTION("streams copy")
    {
        std::stringbuf sbuf{std::string(in.begin(), in.end())};
        REQUIRE_THROWS_AS((from_stream<std::tuple<std::string_view, bytes_view>>(&sbuf)), error::invalid_data);
    }

    SECTION("streams into owned types")
    {
        std::stringbuf sbuf{std::string(in.begin(), in.end())};
        auto [owned_text, owned_bin] = from_stream<std::tuple<std::string, bytes>>(&sbuf);
        REQUIRE(owned_text == "abc");
        REQUIRE(owned_bin == bytes{0x09});
    }
}

TEST_CASE("deserializing extensions and timestamps", "[deserializer]")
{
    REQUIRE(from_slice<extension>(bytes{0xd6, 0x05, 1, 2, 3, 4}) == extension{5, {1, 2, 3, 4}});
    REQUIRE(from_slice<fixed_extension<4>>(bytes{0xd4, 0x01, 0x09}).data() == bytes{0x09});

    using std::chrono::system_clock;
    auto tp = system_clock::time_point{} + std::chrono::milliseconds{1500};
    REQUIRE(from_slice<system_clock::time_point>(to_vector(tp)) == tp);
    REQUIRE(from_slice<timestamp64>(to_vector(timestamp64{5, 6})) == timestamp64{5, 6});

    REQUIRE_THROWS_AS(from_slice<system_clock::time_point>(bytes{0xd5, 0xff, 0, 0}), error::unexpected_format);
    REQUIRE_THROWS_AS(from_slice<timestamp32>(bytes{0xd6, 0x01, 0, 0, 0, 0}), error::invalid_data);
}

TEST_CASE("dump single object", "[deserializer]")
{
    auto in = concat({{0x84},
                      {0xa1, 'a', 0x93, 0x01, 0xc3, 0xc0},
                      {0xa1, 'b', 0xc4, 0x02, 0x01, 0x02},
                      {0xa1, 'c', 0xd6, 0x05, 1, 2, 3, 4},
                      {0xa1, 'd', 0xca, 0x3f, 0xc0, 0x00, 0x00}});

    slice_reader rd{in};
    deserializer<slice_reader> de{rd};

    bytes out;
    vector_writer wr{out};
    serializer<vector_writer> ser{wr};

    de.dump_single_object(&ser);
    REQUIRE(out == in);
    REQUIRE(rd.empty());

    SECTION("into value")
    {
        slice_reader rd2{in};
        deserializer<slice_reader> de2{rd2};
        value_builder builder;

        de2.dump_single_object(&builder);
        auto v = builder.release();
        REQUIRE(to_string(v) == R"({"a": [1, true, null], "b": <bin 01 02>, "c": <ext 5: 01 02 03 04>, "d": 1.5})");
    }
}

TEST_CASE("type inspection", "[deserializer]")
{
    bytes in = {0x95, 0xc0, 0xcc, 0x01, 0xcb, 0, 0, 0, 0, 0, 0, 0, 0, 0xd4, 0x01, 0x00, 0xc1};
    slice_reader rd{in};
    deserializer<slice_reader> de{rd};

    REQUIRE(de.is_array_next());
    auto key = de.begin_array();

    REQUIRE(de.is_null_next());
    de.read(nullptr);
    REQUIRE(de.type_next() == entity_type::integer);
    de.skip();
    REQUIRE(de.type_next() == entity_type::floating_point);
    REQUIRE(de.is_number_next());
    de.skip();
    REQUIRE(de.is_extension_next());
    de.skip();
    REQUIRE_THROWS_AS(de.type_next(), error::unexpected_format);

    REQUIRE(de.elem_left() == 1);
    (void)key;
}
