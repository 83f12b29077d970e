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
#include <sstream>

#include "cppmp/io.hxx"
#include "cppmp/value.hxx"

using namespace cppmp;

namespace {
bytes nested_arrays(size_t depth)
{
    bytes out(depth, 0x91);
    out.push_back(0xc0);
    return out;
}

template <typename Storage_ = owned_storage>
basic_value<Storage_> parse(bytes const& in)
{
    slice_reader rd{in};
    auto v = decode_value<Storage_>(rd);
    REQUIRE(rd.empty());
    return v;
}

template <typename NumEncoder_ = num_encoder::lossless_minimize, typename Storage_>
bytes pack(basic_value<Storage_> const& v)
{
    bytes out;
    vector_writer wr{out};
    encode_value<NumEncoder_>(wr, v);
    return out;
}
}  // namespace

TEST_CASE("dynamic value decoding", "[value]")
{
    // {"a": [1, true, nil], "b": {"c": 1.5}}
    bytes in = {0x82,
                0xa1, 'a', 0x93, 0x01, 0xc3, 0xc0,
                0xa1, 'b', 0x81, 0xa1, 'c', 0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0};

    auto v = parse(in);
    REQUIRE(v.type() == value::kind::map);
    REQUIRE(v.as_map()->size() == 2);

    auto a = v.find("a");
    REQUIRE(a);
    REQUIRE(a->as_array()->size() == 3);
    REQUIRE(a->as_array()->at(0).as<int>() == 1);
    REQUIRE(a->as_array()->at(1).as_bool() == true);
    REQUIRE(a->as_array()->at(2).is_nil());

    auto c = v.find("b")->find("c");
    REQUIRE(c);
    REQUIRE(c->as<double>() == 1.5);
    REQUIRE_FALSE(c->as<int>());

    REQUIRE_FALSE(v.find("z"));
    REQUIRE(to_string(v) == R"({"a": [1, true, null], "b": {"c": 1.5}})");
}

TEST_CASE("value kinds", "[value]")
{
    REQUIRE(value{}.type() == value::kind::nil);
    REQUIRE(value{nullptr}.is_nil());
    REQUIRE(value{false}.type() == value::kind::boolean);
    REQUIRE(value{-7}.type() == value::kind::number);
    REQUIRE(value{"text"}.type() == value::kind::string);
    REQUIRE(value{bytes{1}}.type() == value::kind::binary);
    REQUIRE(value{extension{1, {}}}.type() == value::kind::extension);
    REQUIRE(value{value::array_type{}}.type() == value::kind::array);
    REQUIRE(value{value::map_type{}}.type() == value::kind::map);

    REQUIRE(value{-1}.as<int8_t>() == int8_t(-1));
    REQUIRE_FALSE(value{300}.as<uint8_t>());
    REQUIRE_FALSE(value{"300"}.as<int>());
    REQUIRE(*value{"x"}.as_string() == "x");
}

TEST_CASE("dynamic value encoding", "[value]")
{
    REQUIRE(pack(value{5u}) == bytes{0x05});
    REQUIRE(pack(value{true}) == bytes{0xc3});
    REQUIRE(pack(value{1.5}) == bytes{0xca, 0x3f, 0xc0, 0x00, 0x00});
    REQUIRE(pack<num_encoder::exact>(value{1.5}) == bytes{0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0});
    REQUIRE(pack<num_encoder::aggressive_minimize>(value{2.0}) == bytes{0x02});

    value v = value::map_type{{"Newtype", 27}};
    REQUIRE(pack(v) == bytes{0x81, 0xa7, 'N', 'e', 'w', 't', 'y', 'p', 'e', 0x1b});

    value doc = value::map_type{
            {"list", value::array_type{1, -1, "two", nullptr}},
            {"bin", bytes{0xde, 0xad}},
            {"ext", extension{9, {1, 2, 3, 4}}},
            {7, false},
    };

    REQUIRE(parse(pack(doc)) == doc);
}

TEST_CASE("value recursion limit", "[value]")
{
    REQUIRE(parse(nested_arrays(256)).type() == value::kind::array);
    REQUIRE_THROWS_AS(parse(nested_arrays(257)), error::recursion_limit_exceeded);

    SECTION("configured depth")
    {
        auto in = nested_arrays(2);
        slice_reader rd{in};
        REQUIRE_THROWS_AS(decode_value<owned_storage>(rd, 1), error::recursion_limit_exceeded);
    }

    SECTION("maps count too")
    {
        bytes in = {0x81, 0xc0, 0x81, 0xc0, 0xc0};
        slice_reader rd{in};
        REQUIRE_THROWS_AS(decode_value<owned_storage>(rd, 1), error::recursion_limit_exceeded);
    }
}

TEST_CASE("borrowed values", "[value]")
{
    bytes in = {0x92, 0xa2, 'h', 'i', 0xc4, 0x01, 0x7f};

    auto ref = parse<ref_storage>(in);
    auto& elems = *ref.as_array();
    REQUIRE(elems[0].as_string()->data() == reinterpret_cast<char const*>(in.data() + 2));
    REQUIRE(elems[1].as_binary()->data() == in.data() + 6);

    auto owned = to_owned(ref);
    REQUIRE(*owned.as_array()->at(0).as_string() == "hi");
    REQUIRE(as_ref(owned) == ref);
    REQUIRE(to_string(owned) == to_string(ref));
    REQUIRE(to_string(ref) == R"(["hi", <bin 7f>])");

    SECTION("stream reader can't borrow")
    {
        std::stringbuf sbuf{std::string(in.begin(), in.end())};
        stream_reader rd{&sbuf};
        REQUIRE_THROWS_AS(decode_value<ref_storage>(rd), error::invalid_data);
    }

    SECTION("stream reader into owned value")
    {
        std::stringbuf sbuf{std::string(in.begin(), in.end())};
        stream_reader rd{&sbuf};
        REQUIRE(decode_value<owned_storage>(rd) == owned);
    }
}

TEST_CASE("value rendering", "[value]")
{
    REQUIRE(to_string(value{}) == "null");
    REQUIRE(to_string(value{-3}) == "-3");
    REQUIRE(to_string(value{bytes{0x01, 0xab}}) == "<bin 01 ab>");
    REQUIRE(to_string(value{extension{3, {0x01}}}) == "<ext 3: 01>");
    REQUIRE(to_string(value{value::map_type{{1, "x"}}}) == R"({1: "x"})");
}

TEST_CASE("reserved marker", "[value]")
{
    bytes in = {0xc1};
    slice_reader rd{in};
    REQUIRE_THROWS_AS(decode_value<owned_storage>(rd), error::unexpected_format);
}
