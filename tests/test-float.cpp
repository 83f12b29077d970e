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
#include <cmath>
#include <limits>

#include "cppmp/io.hxx"
#include "cppmp/num_strategy.hxx"

using namespace cppmp;

namespace {
template <typename Encoder_ = num_encoder::exact, typename Ty_>
bytes write_float(Ty_ v)
{
    bytes out;
    vector_writer wr{out};
    Encoder_::encode(wr, v);
    return out;
}

template <typename Num_>
Num_ read_float(bytes const& in)
{
    slice_reader rd{in};
    return num_decoder::widening::decode<Num_>(rd);
}
}  // namespace

TEST_CASE("float tags", "[float][encode]")
{
    REQUIRE(write_float(1.0f) == bytes{0xca, 0x3f, 0x80, 0x00, 0x00});
    REQUIRE(write_float(-2.5f) == bytes{0xca, 0xc0, 0x20, 0x00, 0x00});
    REQUIRE(write_float(1.5) == bytes{0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0});
    REQUIRE(write_float(0.1) == bytes{0xcb, 0x3f, 0xb9, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a});
}

TEST_CASE("float64 shrinks only when exact", "[float][encode]")
{
    using minimize = num_encoder::lossless_minimize;

    REQUIRE(write_float<minimize>(1.5) == bytes{0xca, 0x3f, 0xc0, 0x00, 0x00});
    REQUIRE(write_float<minimize>(0.1).size() == 9);
    REQUIRE(write_float<minimize>(1e300).size() == 9);
    REQUIRE(write_float<minimize>(std::numeric_limits<double>::quiet_NaN()).size() == 9);
}

TEST_CASE("aggressive minimize writes integral floats as integers", "[float][encode]")
{
    using aggressive = num_encoder::aggressive_minimize;

    REQUIRE(write_float<aggressive>(1.0) == bytes{0x01});
    REQUIRE(write_float<aggressive>(-3.0) == bytes{0xfd});
    REQUIRE(write_float<aggressive>(300.0f) == bytes{0xcd, 0x01, 0x2c});
    REQUIRE(write_float<aggressive>(1.5) == bytes{0xca, 0x3f, 0xc0, 0x00, 0x00});
    REQUIRE(write_float<aggressive>(std::numeric_limits<double>::infinity()).size() == 9);
}

TEST_CASE("float decoding", "[float][decode]")
{
    REQUIRE(read_float<double>({0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0}) == 1.5);
    REQUIRE(read_float<double>({0xca, 0x3f, 0xc0, 0x00, 0x00}) == 1.5);
    REQUIRE(read_float<float>({0xca, 0xc0, 0x20, 0x00, 0x00}) == -2.5f);

    SECTION("exact decoder rejects the other width")
    {
        bytes in = {0xca, 0x3f, 0xc0, 0x00, 0x00};
        slice_reader rd{in};
        REQUIRE_THROWS_AS(cppmp::decode<double>(rd), error::unexpected_format);
        REQUIRE(cppmp::decode<float>(rd) == 1.5f);
    }

    SECTION("integers are not floats without lenient policy")
    {
        REQUIRE_THROWS_AS(read_float<double>({0x05}), error::unexpected_format);
    }

    SECTION("too large for float32")
    {
        REQUIRE_THROWS_AS(read_float<float>(write_float(1e300)), error::invalid_data);
    }
}

TEST_CASE("special values survive", "[float]")
{
    auto nan = read_float<double>(write_float(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE(std::isnan(nan));

    auto inf = read_float<float>(write_float(-std::numeric_limits<float>::infinity()));
    REQUIRE(std::isinf(inf));
    REQUIRE(inf < 0);

    auto zero = read_float<double>(write_float(-0.0));
    REQUIRE(zero == 0.0);
    REQUIRE(std::signbit(zero));
}
