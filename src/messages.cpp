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

#include "teakit/detail/messages.hpp"

#include <array>
#include <string_view>

namespace {
using teakit::key_type;

std::string_view key_name(key_type type)
{
    switch (type) {
        case key_type::runes: return "runes";
        case key_type::enter: return "enter";
        case key_type::tab: return "tab";
        case key_type::shift_tab: return "shift+tab";
        case key_type::backspace: return "backspace";
        case key_type::escape: return "esc";
        case key_type::space: return " ";
        case key_type::up: return "up";
        case key_type::down: return "down";
        case key_type::right: return "right";
        case key_type::left: return "left";
        case key_type::home: return "home";
        case key_type::end: return "end";
        case key_type::page_up: return "pgup";
        case key_type::page_down: return "pgdown";
        case key_type::insert: return "insert";
        case key_type::del: return "delete";
        case key_type::f1: return "f1";
        case key_type::f2: return "f2";
        case key_type::f3: return "f3";
        case key_type::f4: return "f4";
        case key_type::ctrl_at: return "ctrl+@";
        case key_type::ctrl_backslash: return "ctrl+\\";
        case key_type::ctrl_close_bracket: return "ctrl+]";
        case key_type::ctrl_caret: return "ctrl+^";
        case key_type::ctrl_underscore: return "ctrl+_";
        default: break;
    }

    static auto const ctrl_letters = [] {
        std::array<std::string, 26> names;
        for (size_t i = 0; i < names.size(); ++i) {
            names[i] = "ctrl+";
            names[i] += char('a' + i);
        }
        return names;
    }();

    auto index = int(type) - int(key_type::ctrl_a);
    if (index >= 0 && index < int(ctrl_letters.size())) { return ctrl_letters[index]; }

    return "unknown";
}

void append_utf8(std::string& out, char32_t cp)
{
    if (cp < 0x80) {
        out += char(cp);
    } else if (cp < 0x800) {
        out += char(0xC0 | (cp >> 6));
        out += char(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += char(0xE0 | (cp >> 12));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    } else {
        out += char(0xF0 | (cp >> 18));
        out += char(0x80 | ((cp >> 12) & 0x3F));
        out += char(0x80 | ((cp >> 6) & 0x3F));
        out += char(0x80 | (cp & 0x3F));
    }
}
}  // namespace

std::string teakit::key_msg::to_string() const
{
    std::string str;
    if (alt) { str += "alt+"; }

    if (type == key_type::runes) {
        for (auto cp : runes) { append_utf8(str, cp); }
    } else {
        str += key_name(type);
    }

    return str;
}

std::string teakit::error_msg::what() const
{
    if (not error) { return {}; }

    try {
        std::rethrow_exception(error);
    } catch (std::exception const& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

teakit::msg teakit::make_error_msg(std::exception_ptr error)
{
    return error_msg{std::move(error)};
}
