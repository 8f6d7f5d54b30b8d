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
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "teakit/detail/messages.hpp"

namespace teakit {
struct renderer_output_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Draws views of the model onto the terminal.
 *
 * Every method is invoked from the program loop only.
 */
class if_renderer
{
   public:
    virtual ~if_renderer() = default;

    virtual void start() = 0;

    /** Paints the last frame, then restores the screen state. */
    virtual void stop() = 0;

    /** Restores the screen state, without painting anything more. */
    virtual void kill() = 0;

    /** Submits a new frame */
    virtual void write(std::string_view view) = 0;

    virtual void resize(window_size const& size) = 0;

    /** Prints a line above the frame, which is kept in terminal scrollback. */
    virtual void print_line(std::string_view line) = 0;
};

/**
 * Renderer which does nothing. Used when the program does not own any display.
 */
class nil_renderer : public if_renderer
{
   public:
    void start() override {}
    void stop() override {}
    void kill() override {}
    void write(std::string_view) override {}
    void resize(window_size const&) override {}
    void print_line(std::string_view) override {}
};

struct renderer_settings {
    bool alt_screen = false;
    bool bracketed_paste = true;
    bool report_focus = false;
};

/**
 * Line based renderer for VT compatible terminals.
 *
 * Repaints only when the frame actually changed, or after resize. Lines are truncated to
 * the terminal width once it's known.
 */
class standard_renderer : public if_renderer
{
   public:
    explicit standard_renderer(std::ostream& out, renderer_settings settings = {});

   public:
    void start() override;
    void stop() override;
    void kill() override;
    void write(std::string_view view) override;
    void resize(window_size const& size) override;
    void print_line(std::string_view line) override;

   public:
    void enter_alt_screen();
    void exit_alt_screen();

    bool running() const noexcept { return _running; }
    bool alt_screen() const noexcept { return _alt_screen; }

   private:
    void _flush();
    void _restore();
    void _check_output();

   private:
    std::ostream& _out;
    renderer_settings _settings;

    bool _running = false;
    bool _alt_screen = false;
    bool _repaint = false;

    std::string _last_frame;
    std::string _pending_frame;
    size_t _lines_rendered = 0;
    std::vector<std::string> _queued_lines;

    int _width = 0;
    int _height = 0;
};
}  // namespace teakit
