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
#include <type_traits>

#include "../logging.hxx"

#define INTERNAL_CPPMP_CONCAT2(A, B) A##B
#define INTERNAL_CPPMP_CONCAT(A, B)  INTERNAL_CPPMP_CONCAT2(A, B)

/* spdlog *****************************************************************************************/
#define CPPMP_TRACE(...)    SPDLOG_LOGGER_TRACE(CPPMP_LOGGER(), __VA_ARGS__)
#define CPPMP_DEBUG(...)    SPDLOG_LOGGER_DEBUG(CPPMP_LOGGER(), __VA_ARGS__)
#define CPPMP_INFO(...)     SPDLOG_LOGGER_INFO(CPPMP_LOGGER(), __VA_ARGS__)
#define CPPMP_WARN(...)     SPDLOG_LOGGER_WARN(CPPMP_LOGGER(), __VA_ARGS__)
#define CPPMP_ERROR(...)    SPDLOG_LOGGER_ERROR(CPPMP_LOGGER(), __VA_ARGS__)
#define CPPMP_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(CPPMP_LOGGER(), __VA_ARGS__)

/* template utils *********************************************************************************/
#define CPPMP_SFINAE_EXPR(Name, TParam, ...)                                   \
    template <typename TParam, class = void>                                   \
    struct Name : std::false_type {                                            \
    };                                                                         \
    template <typename TParam>                                                 \
    struct Name<TParam, std::void_t<decltype(__VA_ARGS__)>> : std::true_type { \
    };                                                                         \
                                                                               \
    template <typename TParam>                                                 \
    constexpr bool INTERNAL_CPPMP_CONCAT(Name, _v) = Name<TParam>::value;

