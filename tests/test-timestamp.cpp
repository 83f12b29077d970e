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
#include <limits>

#include "cppmp/io.hxx"
#include "cppmp/timestamp.hxx"

using namespace cppmp;
using namespace std::chrono_literals;

namespace {
using std::chrono::system_clock;

template <typename Ty_>
bytes pack(Ty_ const& v)
{
    bytes out;
    vector_writer wr{out};
    cppmp::encode(wr, v);
    return out;
}

template <typename Ty_>
Ty_ unpack(bytes const& in)
{
    slice_reader rd{in};
    return cppmp::decode<Ty_>(rd);
}

bytes fixext8_timestamp(uint64_t packed)
{
    bytes out = {0xd7, 0xff};
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(uint8_t(packed >> shift));

    return out;
}
}  // namespace

TEST_CASE("timestamp layouts", "[timestamp][encode]")
{
    REQUIRE(pack(timestamp32{1}) == bytes{0xd6, 0xff, 0x00, 0x00, 0x00, 0x01});
    REQUIRE(pack(timestamp64{1, 1}) == fixext8_timestamp(0x4'0000'0001));
    REQUIRE(pack(timestamp96{-1, 0})
            == bytes{0xc7, 0x0c, 0xff,
                     0x00, 0x00, 0x00, 0x00,
                     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
}

TEST_CASE("timestamp decoding", "[timestamp][decode]")
{
    REQUIRE(unpack<timestamp32>({0xd6, 0xff, 0x00, 0x00, 0x01, 0x00}).seconds() == 256);

    auto ts = unpack<timestamp64>(fixext8_timestamp(0x7735'9400'0000'0001));
    REQUIRE(ts.seconds() == 1);
    REQUIRE(ts.nanoseconds() == 500'000'000);

    auto ts96 = unpack<timestamp96>(pack(timestamp96{-100, 999'999'999}));
    REQUIRE(ts96.seconds() == -100);
    REQUIRE(ts96.nanoseconds() == 999'999'999);

    SECTION("nanoseconds out of range")
    {
        REQUIRE_THROWS_AS(unpack<timestamp64>(fixext8_timestamp(0xee6b'2800'0000'0000)), error::invalid_data);

        bytes in = {0xc7, 0x0c, 0xff,
                    0x3b, 0x9a, 0xca, 0x00,
                    0, 0, 0, 0, 0, 0, 0, 0};
        REQUIRE_THROWS_AS(unpack<timestamp96>(in), error::invalid_data);
    }

    SECTION("wrong extension type")
    {
        REQUIRE_THROWS_AS(unpack<timestamp32>({0xd6, 0x05, 0, 0, 0, 1}), error::invalid_data);
    }

    SECTION("wrong layout")
    {
        auto buf = pack(timestamp32{1});
        slice_reader rd{buf};
        REQUIRE_THROWS_AS(cppmp::decode<timestamp64>(rd), error::unexpected_format);
        REQUIRE(rd.position() == 0);
    }
}

TEST_CASE("timestamp construction", "[timestamp]")
{
    REQUIRE_THROWS_AS(timestamp64(timestamp64::max_seconds + 1, 0), error::invalid_data);
    REQUIRE_THROWS_AS(timestamp64(0, 1'000'000'000), error::invalid_data);
    REQUIRE_THROWS_AS(timestamp96(0, 1'000'000'000), error::invalid_data);

    REQUIRE(unpack<timestamp64>(pack(timestamp64{timestamp64::max_seconds, 999'999'999}))
            == timestamp64{timestamp64::max_seconds, 999'999'999});
}

TEST_CASE("timestamps from time points", "[timestamp]")
{
    auto epoch = system_clock::time_point{};

    REQUIRE(timestamp32::from_time_point(epoch + 7s) == timestamp32{7});
    REQUIRE(timestamp32::from_time_point(epoch + 7s).to_time_point() == epoch + 7s);
    REQUIRE_THROWS_AS(timestamp32::from_time_point(epoch + 7s + 1ms), error::invalid_data);
    REQUIRE_THROWS_AS(timestamp32::from_time_point(epoch - 1s), error::invalid_data);
    REQUIRE_THROWS_AS(timestamp32::from_time_point(epoch + std::chrono::seconds{int64_t(1) << 32}),
                      error::invalid_data);

    REQUIRE(timestamp64::from_time_point(epoch + 1s + 500ms) == timestamp64{1, 500'000'000});
    REQUIRE(timestamp64::from_time_point(epoch + std::chrono::seconds{int64_t(1) << 33})
            == timestamp64{uint64_t(1) << 33, 0});
    REQUIRE_THROWS_AS(timestamp64::from_time_point(epoch - 1ms), error::invalid_data);

    REQUIRE(timestamp96::from_time_point(epoch - 1s + 250ms) == timestamp96{-1, 250'000'000});
}

TEST_CASE("time points pick the smallest layout", "[timestamp]")
{
    auto epoch = system_clock::time_point{};

    SECTION("whole seconds")
    {
        auto tp = epoch + 1s;
        auto buf = pack(tp);
        REQUIRE(buf == bytes{0xd6, 0xff, 0x00, 0x00, 0x00, 0x01});
        REQUIRE(unpack<system_clock::time_point>(buf) == tp);
    }

    SECTION("fractional")
    {
        auto tp = epoch + 1s + 500ms;
        auto buf = pack(tp);
        REQUIRE(buf == fixext8_timestamp(0x7735'9400'0000'0001));
        REQUIRE(unpack<system_clock::time_point>(buf) == tp);
    }

    SECTION("beyond 32-bit seconds")
    {
        auto tp = epoch + std::chrono::seconds{int64_t(1) << 32};
        auto buf = pack(tp);
        REQUIRE(buf.size() == 10);
        REQUIRE(buf[0] == 0xd7);
        REQUIRE(unpack<system_clock::time_point>(buf) == tp);
    }

    SECTION("before epoch")
    {
        auto tp = epoch - 1s + 250ms;
        auto buf = pack(tp);
        REQUIRE(buf.size() == 15);
        REQUIRE(buf[0] == 0xc7);

        auto ts = unpack<timestamp96>(buf);
        REQUIRE(ts.seconds() == -1);
        REQUIRE(ts.nanoseconds() == 250'000'000);
        REQUIRE(unpack<system_clock::time_point>(buf) == tp);
    }

    SECTION("coarser duration")
    {
        auto tp = std::chrono::time_point_cast<std::chrono::seconds>(epoch + 90s);
        REQUIRE(unpack<decltype(tp)>(pack(tp)) == tp);
    }

    SECTION("out of clock range")
    {
        auto buf = pack(timestamp96{std::numeric_limits<int64_t>::max(), 0});
        REQUIRE_THROWS_AS(unpack<system_clock::time_point>(buf), error::invalid_data);
    }
}
