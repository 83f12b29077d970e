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

#include <mutex>

#include "cppmp/logging.hxx"

namespace cppmp {
namespace {
std::mutex g_logger_lock;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default_logger()
{
    if (auto existing = spdlog::get("cppmp")) { return existing; }

    auto logger = spdlog::default_logger()->clone("cppmp");
    spdlog::register_logger(logger);
    return logger;
}
}  // namespace

void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    std::lock_guard _lc_{g_logger_lock};
    g_logger = logger ? std::move(logger) : make_default_logger();
}

spdlog::logger* detail::logger()
{
    std::lock_guard _lc_{g_logger_lock};
    if (not g_logger) { g_logger = make_default_logger(); }

    return g_logger.get();
}
}  // namespace cppmp
