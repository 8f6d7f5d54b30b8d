// MIT License
//
// Copyright (c) 2021-2022. Seungwoo Kang
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
// project home: https://github.com/perfkitpp

#include "teakit/detail/logging.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "teakit/detail/base.hpp"

namespace {
constexpr auto LIBRARY_LOGGER = "TEAKIT";
constexpr auto STDERR_LOGGER = "TEAKIT.stderr";
std::mutex g_logger_lock;
}  // namespace

std::shared_ptr<spdlog::logger> teakit::glog()
{
    std::lock_guard _{g_logger_lock};

    auto ptr = spdlog::get(LIBRARY_LOGGER);
    if (not ptr) {
        // terminal is occupied by the program; keep silent unless redirected.
        ptr = spdlog::null_logger_mt(LIBRARY_LOGGER);
    }

    return ptr;
}

teakit::logger_ptr teakit::stderr_log()
{
    std::lock_guard _{g_logger_lock};

    auto ptr = spdlog::get(STDERR_LOGGER);
    if (not ptr) {
        ptr = spdlog::stderr_color_mt(STDERR_LOGGER);
        ptr->set_pattern("[teakit] %^%l%$: %v");
        ptr->set_level(spdlog::level::warn);
    }

    return ptr;
}

teakit::logger_ptr teakit::log_to_file(std::string const& path, std::string prefix)
{
    if (not prefix.empty() && prefix.back() != ' ') { prefix += ' '; }

    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    auto logger = std::make_shared<spdlog::logger>(LIBRARY_LOGGER, std::move(sink));
    logger->set_pattern(prefix + "%v");
    logger->flush_on(spdlog::level::warn);

    std::lock_guard _{g_logger_lock};
    spdlog::drop(LIBRARY_LOGGER);
    spdlog::register_logger(logger);

    return logger;
}

void teakit::set_log_level(std::string const& level)
{
    glog()->set_level(spdlog::level::from_str(level));
}
