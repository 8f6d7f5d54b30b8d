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
#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "teakit/detail/messages.hpp"
#include "teakit/fwd.hpp"

namespace teakit {
struct options_load_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Behavioral switches of a program, which can be loaded from JSON object.
 *
 * @code
 *  {
 *    "alt_screen": false,
 *    "bracketed_paste": true,
 *    "report_focus": false,
 *    "catch_panics": true,
 *    "handle_signals": true,
 *    "without_renderer": false,
 *    "log_file": "",
 *    "log_level": "info"
 *  }
 * @endcode
 *
 * Absent keys keep their defaults, unknown keys are ignored.
 */
struct program_settings {
    bool alt_screen = false;
    bool bracketed_paste = true;
    bool report_focus = false;

    /** Turn exceptions escaping model into program_panic_error, instead of rethrowing. */
    bool catch_panics = true;

    /** Interrupt/terminate signals stop the program. */
    bool handle_signals = true;

    bool without_renderer = false;

    /** Redirects library log to given file, if not empty. */
    std::string log_file;
    std::string log_level = "info";
};

void to_json(nlohmann::json& js, program_settings const& settings);
void from_json(nlohmann::json const& js, program_settings& settings);

/**
 * @throw options_load_error if given object has a value of invalid type
 */
program_settings parse_program_settings(nlohmann::json const& js);

/**
 * @throw options_load_error if file can't be read, or is malformed
 */
program_settings load_program_settings(std::string const& path);

/**
 * Overrides settings with JSON object in TEAKIT_SETTINGS environment variable, if set.
 *
 * @throw options_load_error if variable content is malformed
 */
void apply_environment(program_settings* settings);

using message_filter = std::function<msg(model_ptr const& model, msg message)>;

/**
 * Every collaborator of program. Empty ones are filled with defaults on startup.
 */
struct program_options {
    /** Custom input. If empty, backend opens terminal input device. */
    std::shared_ptr<if_input_stream> input;

    /** Defaults to std::cout */
    std::ostream* output = nullptr;

    /** Defaults to create_default_terminal_backend() */
    std::shared_ptr<if_terminal_backend> backend;

    /** Defaults to standard_renderer over output, or nil_renderer if disabled. */
    std::shared_ptr<if_renderer> renderer;

    /** Defaults to basic_input_decoder */
    std::shared_ptr<if_input_decoder> decoder;

    /**
     * Invoked for every message before update. Returning empty message drops it.
     */
    message_filter filter;

    program_settings settings;
};
}  // namespace teakit
