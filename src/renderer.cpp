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

#include "teakit/detail/renderer.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace {
constexpr std::string_view HIDE_CURSOR = "\x1b[?25l";
constexpr std::string_view SHOW_CURSOR = "\x1b[?25h";
constexpr std::string_view ENTER_ALT_SCREEN = "\x1b[?1049h\x1b[2J\x1b[H";
constexpr std::string_view EXIT_ALT_SCREEN = "\x1b[?1049l";
constexpr std::string_view ENABLE_BRACKETED_PASTE = "\x1b[?2004h";
constexpr std::string_view DISABLE_BRACKETED_PASTE = "\x1b[?2004l";
constexpr std::string_view ENABLE_REPORT_FOCUS = "\x1b[?1004h";
constexpr std::string_view DISABLE_REPORT_FOCUS = "\x1b[?1004l";
constexpr std::string_view ERASE_LINE = "\x1b[2K";
constexpr std::string_view ERASE_BELOW = "\x1b[0J";
constexpr std::string_view CURSOR_HOME = "\x1b[H";

std::vector<std::string_view> split_lines(std::string_view str)
{
    std::vector<std::string_view> lines;
    if (str.empty()) { return lines; }

    for (size_t pos = 0;;) {
        auto next = str.find('\n', pos);
        auto line = str.substr(pos, next == std::string_view::npos ? next : next - pos);

        if (not line.empty() && line.back() == '\r') { line.remove_suffix(1); }
        lines.push_back(line);

        if (next == std::string_view::npos) { break; }
        pos = next + 1;
    }

    return lines;
}

/** Cuts line to given number of code points */
std::string_view truncate(std::string_view line, int width)
{
    if (width <= 0) { return line; }

    int count = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        bool is_lead_byte = (uint8_t(line[i]) & 0xc0) != 0x80;
        if (is_lead_byte && count++ == width) { return line.substr(0, i); }
    }

    return line;
}
}  // namespace

teakit::standard_renderer::standard_renderer(std::ostream& out, renderer_settings settings)
        : _out(out), _settings(settings)
{
}

void teakit::standard_renderer::start()
{
    if (_running) { return; }
    _running = true;

    // screen content is unknown after a restart; draw next frame in full
    _lines_rendered = 0;
    _repaint = true;

    _out << HIDE_CURSOR;
    if (_settings.alt_screen) { enter_alt_screen(); }
    if (_settings.bracketed_paste) { _out << ENABLE_BRACKETED_PASTE; }
    if (_settings.report_focus) { _out << ENABLE_REPORT_FOCUS; }

    _out.flush();
    _check_output();
}

void teakit::standard_renderer::stop()
{
    if (not _running) { return; }

    _flush();
    if (not _alt_screen && _lines_rendered > 0) { _out << "\r\n"; }

    _restore();
}

void teakit::standard_renderer::kill()
{
    if (not _running) { return; }
    _restore();
}

void teakit::standard_renderer::write(std::string_view view)
{
    _pending_frame.assign(view.begin(), view.end());
    _flush();
}

void teakit::standard_renderer::resize(window_size const& size)
{
    _width = size.width;
    _height = size.height;
    _repaint = true;
}

void teakit::standard_renderer::print_line(std::string_view line)
{
    // lines printed on alternate screen would be lost anyway
    if (_alt_screen) { return; }

    for (auto each : split_lines(line)) { _queued_lines.emplace_back(each); }
}

void teakit::standard_renderer::enter_alt_screen()
{
    if (_alt_screen) { return; }
    _alt_screen = true;

    _out << ENTER_ALT_SCREEN << HIDE_CURSOR;
    _out.flush();

    _lines_rendered = 0;
    _repaint = true;
}

void teakit::standard_renderer::exit_alt_screen()
{
    if (not _alt_screen) { return; }
    _alt_screen = false;

    _out << EXIT_ALT_SCREEN;
    _out.flush();

    _lines_rendered = 0;
    _repaint = true;
}

void teakit::standard_renderer::_flush()
{
    if (not _running) { return; }
    if (_queued_lines.empty() && not _repaint && _pending_frame == _last_frame) { return; }

    std::string buffer;

    if (_alt_screen) {
        buffer += CURSOR_HOME;
    } else if (_lines_rendered > 1) {
        buffer += "\x1b[" + std::to_string(_lines_rendered - 1) + "A";
    }
    buffer += '\r';

    for (auto& line : _queued_lines) {
        buffer.append(ERASE_LINE).append(truncate(line, _width)).append("\r\n");
    }
    _queued_lines.clear();

    auto lines = split_lines(_pending_frame);
    if (_height > 0 && lines.size() > size_t(_height)) {
        lines.erase(lines.begin(), lines.end() - _height);
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) { buffer += "\r\n"; }
        buffer.append(ERASE_LINE).append(truncate(lines[i], _width));
    }
    buffer += ERASE_BELOW;

    _out << buffer;
    _out.flush();

    _lines_rendered = lines.size();
    _last_frame = _pending_frame;
    _repaint = false;

    _check_output();
}

void teakit::standard_renderer::_restore()
{
    _running = false;

    if (_settings.report_focus) { _out << DISABLE_REPORT_FOCUS; }
    if (_settings.bracketed_paste) { _out << DISABLE_BRACKETED_PASTE; }
    exit_alt_screen();

    _out << SHOW_CURSOR;
    _out.flush();
    _check_output();
}

void teakit::standard_renderer::_check_output()
{
    if (_out.good()) { return; }

    _out.clear();
    throw renderer_output_error("failed to write terminal output");
}
