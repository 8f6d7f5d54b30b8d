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

#pragma once
#include <memory>
#include <string>

#include <teakit/fwd.hpp>

namespace teakit {
using logger_ptr = std::shared_ptr<spdlog::logger>;

/**
 * Logger which writes to stderr, at warn level and above.
 *
 * Used by the program to report problems which happened after the terminal was handed
 * back, while library log is not redirected. Registered as "TEAKIT.stderr"; register
 * another logger under that name beforehand to capture these reports elsewhere.
 */
logger_ptr stderr_log();

/**
 * Redirect library log output into given file.
 *
 * As the terminal is owned by running program, library log is discarded by default.
 * Call this before program::run() to keep track of what happened.
 *
 * @param path log file path. Content will be appended.
 * @param prefix string prepended to every log line. A space is inserted if missing.
 * @return replaced library logger
 */
logger_ptr log_to_file(std::string const& path, std::string prefix = {});

/**
 * Set level of library logger, e.g. "trace", "debug", "info", "warn" ...
 */
void set_log_level(std::string const& level);
}  // namespace teakit
