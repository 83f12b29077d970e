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

#include "cppmp/decode.hxx"
#include "cppmp/encode.hxx"
#include "cppmp/io.hxx"

using namespace cppmp;

TEST_CASE("slice writer", "[io]")
{
    uint8_t buf[4] = {};
    slice_writer wr{{buf, sizeof buf}};

    uint8_t content[] = {1, 2, 3};
    wr.write({content, sizeof content});
    REQUIRE(wr.written() == 3);
    REQUIRE(wr.remaining() == 1);

    SECTION("overflow keeps previous content")
    {
        REQUIRE_THROWS_AS(wr.write(bytes_view{content, 2}), error::buffer_full);
        REQUIRE(wr.written() == 3);
        REQUIRE(wr.output() == bytes{1, 2, 3});
    }

    SECTION("fill exactly")
    {
        wr.write(bytes_view{content, 1});
        REQUIRE(wr.remaining() == 0);
        REQUIRE(wr.output() == bytes{1, 2, 3, 1});
    }

    SECTION("encode into full buffer")
    {
        REQUIRE_THROWS_AS(cppmp::encode(wr, std::string_view{"abc"}), error::buffer_full);
    }
}

TEST_CASE("vector writer appends", "[io]")
{
    bytes out = {0xff};
    vector_writer wr{out};

    cppmp::encode(wr, true);
    cppmp::encode(wr, nullptr);

    REQUIRE(out == bytes{0xff, 0xc3, 0xc0});
}

TEST_CASE("stream writer", "[io]")
{
    std::stringbuf sbuf;
    stream_writer wr{&sbuf};

    cppmp::encode(wr, std::string_view{"hi"});
    REQUIRE(sbuf.str() == "\xa2hi");
}

TEST_CASE("slice reader borrows", "[io]")
{
    bytes input = {0xa2, 'h', 'i', 0xc3};
    slice_reader rd{input};

    REQUIRE(rd.peek() == 0xa2);
    REQUIRE(rd.get() == 0xa2);
    REQUIRE(rd.position() == 1);

    auto ref = rd.read(2);
    REQUIRE(ref.is_borrowed());
    REQUIRE(ref.data().data() == input.data() + 1);
    REQUIRE(ref.borrowed().size() == 2);

    REQUIRE(rd.rest().size() == 1);
    REQUIRE(rd.rest()[0] == 0xc3);

    REQUIRE_THROWS_AS(rd.read(2), error::eof_data);
    REQUIRE(rd.get() == 0xc3);
    REQUIRE(rd.empty());
    REQUIRE_THROWS_AS(rd.peek(), error::eof_data);
}

TEST_CASE("stream reader copies", "[io]")
{
    std::stringbuf sbuf{std::string{"\xa2hi\xc3", 4}};
    stream_reader rd{&sbuf};

    REQUIRE(rd.peek() == 0xa2);
    REQUIRE(rd.get() == 0xa2);

    auto ref = rd.read(2);
    REQUIRE_FALSE(ref.is_borrowed());
    REQUIRE(ref.data() == bytes{'h', 'i'});
    REQUIRE_THROWS_AS(ref.borrowed(), error::invalid_data);

    REQUIRE_THROWS_AS(rd.read(2), error::eof_data);
}

TEST_CASE("borrowing decode needs a borrowing reader", "[io]")
{
    std::string text = "\xa5Today";

    SECTION("slice")
    {
        slice_reader rd{bytes_view{reinterpret_cast<uint8_t const*>(text.data()), text.size()}};
        REQUIRE(cppmp::decode<std::string_view>(rd) == "Today");
    }

    SECTION("stream")
    {
        std::stringbuf sbuf{text};
        stream_reader rd{&sbuf};
        REQUIRE_THROWS_AS(cppmp::decode<std::string_view>(rd), error::invalid_data);
    }

    SECTION("stream into owned string")
    {
        std::stringbuf sbuf{text};
        stream_reader rd{&sbuf};
        REQUIRE(cppmp::decode<std::string>(rd) == "Today");
    }
}
