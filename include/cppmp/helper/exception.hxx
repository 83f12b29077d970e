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
#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <typeinfo>

namespace cppmp {

/**
 * Exception with a printf-style message. what() of an exception without any message
 *  falls back to its dynamic type name.
 */
template <typename Ty_>
struct basic_exception : std::exception {
   private:
    mutable std::string _what;
    std::string _text;

   public:
    void message(std::string_view content) { _text.assign(content), _what.clear(); }

    template <typename Arg0_, typename... Args_>
    void message(char const* fmt, Arg0_&& arg0, Args_&&... args)
    {
        auto len = std::snprintf(nullptr, 0, fmt, arg0, args...);
        if (len < 0) { return message(fmt); }

        std::string buf(size_t(len) + 1, '\0');
        std::snprintf(buf.data(), buf.size(), fmt, arg0, args...);
        buf.resize(size_t(len));
        message(buf);
    }

    std::string const& text() const noexcept { return _text; }

    char const* what() const noexcept override
    {
        if (_what.empty()) {
            _what.append(typeid(*this).name());
            if (not _text.empty()) { _what.append(": ").append(_text); }
        }

        return _what.c_str();
    }
};

}  // namespace cppmp

#ifndef CPPMP_DECLARE_EXCEPTION
#    define CPPMP_DECLARE_EXCEPTION(Name, Base) \
        struct Name : Base {                    \
            using Base::Base;                   \
        }
#endif
