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

#include "teakit/detail/options.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

void teakit::to_json(nlohmann::json& js, program_settings const& settings)
{
    js = {
            {"alt_screen", settings.alt_screen},
            {"bracketed_paste", settings.bracketed_paste},
            {"report_focus", settings.report_focus},
            {"catch_panics", settings.catch_panics},
            {"handle_signals", settings.handle_signals},
            {"without_renderer", settings.without_renderer},
            {"log_file", settings.log_file},
            {"log_level", settings.log_level},
    };
}

void teakit::from_json(nlohmann::json const& js, program_settings& settings)
{
    settings.alt_screen = js.value("alt_screen", settings.alt_screen);
    settings.bracketed_paste = js.value("bracketed_paste", settings.bracketed_paste);
    settings.report_focus = js.value("report_focus", settings.report_focus);
    settings.catch_panics = js.value("catch_panics", settings.catch_panics);
    settings.handle_signals = js.value("handle_signals", settings.handle_signals);
    settings.without_renderer = js.value("without_renderer", settings.without_renderer);
    settings.log_file = js.value("log_file", settings.log_file);
    settings.log_level = js.value("log_level", settings.log_level);
}

namespace {
void merge_settings(nlohmann::json const& js, teakit::program_settings* settings)
{
    if (not js.is_object()) {
        throw teakit::options_load_error(
                fmt::format("settings must be an object, not {}", js.type_name()));
    }

    try {
        teakit::from_json(js, *settings);
    } catch (nlohmann::json::exception& e) {
        throw teakit::options_load_error(fmt::format("invalid settings: {}", e.what()));
    }
}
}  // namespace

auto teakit::parse_program_settings(nlohmann::json const& js) -> program_settings
{
    program_settings settings;
    merge_settings(js, &settings);
    return settings;
}

auto teakit::load_program_settings(std::string const& path) -> program_settings
{
    std::ifstream file{path};
    if (not file) { throw options_load_error(fmt::format("failed to open '{}'", path)); }

    nlohmann::json js;
    try {
        file >> js;
    } catch (nlohmann::json::parse_error& e) {
        throw options_load_error(fmt::format("failed to parse '{}': {}", path, e.what()));
    }

    return parse_program_settings(js);
}

void teakit::apply_environment(program_settings* settings)
{
    auto content = std::getenv("TEAKIT_SETTINGS");
    if (content == nullptr || *content == '\0') { return; }

    nlohmann::json js;
    try {
        js = nlohmann::json::parse(content);
    } catch (nlohmann::json::parse_error& e) {
        throw options_load_error(fmt::format("failed to parse TEAKIT_SETTINGS: {}", e.what()));
    }

    merge_settings(js, settings);
}
