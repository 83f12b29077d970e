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
#include <chrono>
#include <limits>
#include <utility>

#include "extension.hxx"

/**
 * Timestamp extension type (-1), in three layouts
 *
 *  timestamp32: fixext4, uint32 seconds
 *  timestamp64: fixext8, uint64 of (nanoseconds << 34 | seconds)
 *  timestamp96: ext8 of 12 bytes, uint32 nanoseconds followed by int64 seconds
 */
namespace cppmp {
constexpr int8_t timestamp_extension_type = -1;

namespace detail {
using system_clock = std::chrono::system_clock;

inline void verify_timestamp_type(int8_t type)
{
    if (type != timestamp_extension_type)
        throw error::invalid_data{"timestamp extension type -1 expected, got %d", int(type)};
}

inline void verify_nanoseconds(uint32_t ns)
{
    if (ns >= 1'000'000'000u)
        throw error::invalid_data{"nanoseconds out of range: %u", unsigned(ns)};
}

inline void verify_timestamp_length(extension_ref ext, size_t expected)
{
    if (ext.data.size() != expected) {
        throw error::unexpected_format{
                "timestamp payload of %zu bytes expected, got %zu", expected, ext.data.size()};
    }
}

inline system_clock::time_point make_time_point(int64_t seconds, uint32_t nanoseconds)
{
    using namespace std::chrono;
    constexpr auto limit = duration_cast<std::chrono::seconds>(system_clock::duration::max()).count() - 1;

    if (seconds > limit || seconds < -limit)
        throw error::invalid_data{"timestamp %lld is out of system clock range", (long long)seconds};

    return system_clock::time_point{
            duration_cast<system_clock::duration>(
                    std::chrono::seconds{seconds} + std::chrono::nanoseconds{nanoseconds})};
}

inline std::pair<int64_t, uint32_t> split_time_point(system_clock::time_point tp)
{
    using namespace std::chrono;
    auto ns = duration_cast<nanoseconds>(tp.time_since_epoch()).count();

    int64_t seconds = ns / 1'000'000'000;
    int64_t remainder = ns % 1'000'000'000;
    if (remainder < 0) { remainder += 1'000'000'000, --seconds; }

    return {seconds, uint32_t(remainder)};
}
}  // namespace detail

class timestamp32
{
   public:
    constexpr explicit timestamp32(uint32_t seconds = 0) noexcept : _seconds(seconds) {}

    uint32_t seconds() const noexcept { return _seconds; }

    detail::system_clock::time_point to_time_point() const { return detail::make_time_point(_seconds, 0); }

    //! @throw error::invalid_data if 'tp' has a fraction of second or lies outside [0, 2^32) seconds
    static timestamp32 from_time_point(detail::system_clock::time_point tp)
    {
        auto [seconds, nanoseconds] = detail::split_time_point(tp);
        if (nanoseconds != 0)
            throw error::invalid_data{"timestamp32 can't hold %u nanoseconds", unsigned(nanoseconds)};
        if (seconds < 0 || seconds > int64_t(std::numeric_limits<uint32_t>::max()))
            throw error::invalid_data{"timestamp %lld is out of 32-bit range", (long long)seconds};

        return timestamp32{uint32_t(seconds)};
    }

    fixed_extension<4> to_extension() const
    {
        uint8_t buf[4];
        detail::store_big_endian(buf, _seconds);
        return {timestamp_extension_type, {buf, sizeof buf}};
    }

    static timestamp32 from_extension(extension_ref ext)
    {
        detail::verify_timestamp_type(ext.type);
        detail::verify_timestamp_length(ext, 4);

        return timestamp32{detail::load_big_endian<uint32_t>(ext.data.data())};
    }

    bool operator==(timestamp32 const& other) const noexcept { return _seconds == other._seconds; }
    bool operator!=(timestamp32 const& other) const noexcept { return !(*this == other); }

   private:
    uint32_t _seconds;
};

class timestamp64
{
   public:
    static constexpr uint64_t max_seconds = (uint64_t(1) << 34) - 1;

   public:
    //! @throw error::invalid_data if seconds exceed 34 bits or nanoseconds exceed 999,999,999
    explicit timestamp64(uint64_t seconds = 0, uint32_t nanoseconds = 0)
            : _seconds(seconds), _nanoseconds(nanoseconds)
    {
        if (seconds > max_seconds)
            throw error::invalid_data{"seconds exceed 34-bit range: %llu", (unsigned long long)seconds};

        detail::verify_nanoseconds(nanoseconds);
    }

    uint64_t seconds() const noexcept { return _seconds; }
    uint32_t nanoseconds() const noexcept { return _nanoseconds; }

    detail::system_clock::time_point to_time_point() const
    {
        return detail::make_time_point(int64_t(_seconds), _nanoseconds);
    }

    //! @throw error::invalid_data if 'tp' lies outside [0, 2^34) seconds
    static timestamp64 from_time_point(detail::system_clock::time_point tp)
    {
        auto [seconds, nanoseconds] = detail::split_time_point(tp);
        if (seconds < 0 || uint64_t(seconds) > max_seconds)
            throw error::invalid_data{"timestamp %lld is out of 34-bit range", (long long)seconds};

        return timestamp64{uint64_t(seconds), nanoseconds};
    }

    fixed_extension<8> to_extension() const
    {
        uint8_t buf[8];
        detail::store_big_endian(buf, (uint64_t(_nanoseconds) << 34) | _seconds);
        return {timestamp_extension_type, {buf, sizeof buf}};
    }

    static timestamp64 from_extension(extension_ref ext)
    {
        detail::verify_timestamp_type(ext.type);
        detail::verify_timestamp_length(ext, 8);

        auto packed = detail::load_big_endian<uint64_t>(ext.data.data());
        return timestamp64{packed & max_seconds, uint32_t(packed >> 34)};
    }

    bool operator==(timestamp64 const& other) const noexcept
    {
        return _seconds == other._seconds && _nanoseconds == other._nanoseconds;
    }

    bool operator!=(timestamp64 const& other) const noexcept { return !(*this == other); }

   private:
    uint64_t _seconds;
    uint32_t _nanoseconds;
};

class timestamp96
{
   public:
    //! @throw error::invalid_data if nanoseconds exceed 999,999,999
    explicit timestamp96(int64_t seconds = 0, uint32_t nanoseconds = 0)
            : _seconds(seconds), _nanoseconds(nanoseconds)
    {
        detail::verify_nanoseconds(nanoseconds);
    }

    int64_t seconds() const noexcept { return _seconds; }
    uint32_t nanoseconds() const noexcept { return _nanoseconds; }

    detail::system_clock::time_point to_time_point() const
    {
        return detail::make_time_point(_seconds, _nanoseconds);
    }

    static timestamp96 from_time_point(detail::system_clock::time_point tp)
    {
        auto [seconds, nanoseconds] = detail::split_time_point(tp);
        return timestamp96{seconds, nanoseconds};
    }

    fixed_extension<12> to_extension() const
    {
        uint8_t buf[12];
        detail::store_big_endian(buf, _nanoseconds);
        detail::store_big_endian(buf + 4, _seconds);
        return {timestamp_extension_type, {buf, sizeof buf}};
    }

    static timestamp96 from_extension(extension_ref ext)
    {
        detail::verify_timestamp_type(ext.type);
        if (ext.data.size() != 12)
            throw error::invalid_data{"timestamp96 payload must be 12 bytes, got %zu", ext.data.size()};

        return timestamp96{detail::load_big_endian<int64_t>(ext.data.data() + 4),
                           detail::load_big_endian<uint32_t>(ext.data.data())};
    }

    bool operator==(timestamp96 const& other) const noexcept
    {
        return _seconds == other._seconds && _nanoseconds == other._nanoseconds;
    }

    bool operator!=(timestamp96 const& other) const noexcept { return !(*this == other); }

   private:
    int64_t _seconds;
    uint32_t _nanoseconds;
};

namespace detail {
template <typename Timestamp_, typename Reader_>
Timestamp_ decode_timestamp(Reader_& rd, typecode marker, char const* name)
{
    auto fmt = peek_format(rd);
    if (fmt.code() != marker) { throw_unexpected(fmt, name); }

    auto header = read_extension_header(rd);
    verify_timestamp_type(header.type);

    return Timestamp_::from_extension({header.type, rd.read(header.length).data()});
}

//! Invokes fn with the smallest timestamp layout which represents given instant exactly
template <typename Fn_>
decltype(auto) with_smallest_timestamp(system_clock::time_point tp, Fn_&& fn)
{
    auto [seconds, nanoseconds] = split_time_point(tp);

    if (nanoseconds == 0 && 0 <= seconds && seconds <= int64_t(0xffff'ffffu))
        return fn(timestamp32{uint32_t(seconds)});
    else if (0 <= seconds && uint64_t(seconds) <= timestamp64::max_seconds)
        return fn(timestamp64{uint64_t(seconds), nanoseconds});
    else
        return fn(timestamp96{seconds, nanoseconds});
}

template <typename Writer_>
size_t put_time_point(Writer_& wr, system_clock::time_point tp)
{
    return with_smallest_timestamp(tp, [&](auto const& ts) { return cppmp::encode(wr, ts); });
}
}  // namespace detail

template <>
struct encoder<timestamp32> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, timestamp32 const& v) { return cppmp::encode(wr, v.to_extension()); }
};

template <>
struct encoder<timestamp64> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, timestamp64 const& v) { return cppmp::encode(wr, v.to_extension()); }
};

template <>
struct encoder<timestamp96> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, timestamp96 const& v) { return cppmp::encode(wr, v.to_extension()); }
};

template <>
struct decoder<timestamp32> {
    template <typename Reader_>
    static timestamp32 decode(Reader_& rd) { return detail::decode_timestamp<timestamp32>(rd, typecode::fixext4, "timestamp32"); }
};

template <>
struct decoder<timestamp64> {
    template <typename Reader_>
    static timestamp64 decode(Reader_& rd) { return detail::decode_timestamp<timestamp64>(rd, typecode::fixext8, "timestamp64"); }
};

template <>
struct decoder<timestamp96> {
    template <typename Reader_>
    static timestamp96 decode(Reader_& rd) { return detail::decode_timestamp<timestamp96>(rd, typecode::ext8, "timestamp96"); }
};

template <typename Duration_>
struct encoder<std::chrono::time_point<std::chrono::system_clock, Duration_>> {
    template <typename Writer_>
    static size_t encode(Writer_& wr, std::chrono::time_point<std::chrono::system_clock, Duration_> const& v)
    {
        return detail::put_time_point(wr, std::chrono::time_point_cast<detail::system_clock::duration>(v));
    }
};

template <typename Duration_>
struct decoder<std::chrono::time_point<std::chrono::system_clock, Duration_>> {
    template <typename Reader_>
    static auto decode(Reader_& rd)
    {
        detail::system_clock::time_point tp;

        switch (auto fmt = detail::peek_format(rd); fmt.code()) {
            case typecode::fixext4: tp = cppmp::decode<timestamp32>(rd).to_time_point(); break;
            case typecode::fixext8: tp = cppmp::decode<timestamp64>(rd).to_time_point(); break;
            case typecode::ext8: tp = cppmp::decode<timestamp96>(rd).to_time_point(); break;
            default: detail::throw_unexpected(fmt, "timestamp");
        }

        return std::chrono::time_point_cast<Duration_>(tp);
    }
};

}  // namespace cppmp
