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
#include <any>
#include <exception>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace teakit {
/**
 * Type-erased message value which flows through program loop.
 *
 * Empty message means 'no message', which is never delivered to models. Any copyable
 * application-defined value can be carried without modification.
 */
class msg
{
   public:
    msg() noexcept = default;
    msg(std::nullptr_t) noexcept {}

    template <typename Ty_,
              typename = std::enable_if_t<not std::is_same_v<std::decay_t<Ty_>, msg>
                                          && not std::is_same_v<std::decay_t<Ty_>, std::nullptr_t>>>
    msg(Ty_&& value) : _value(std::forward<Ty_>(value))
    {
    }

   public:
    bool empty() const noexcept { return not _value.has_value(); }
    explicit operator bool() const noexcept { return _value.has_value(); }

    /** Discriminator of carried value. typeid(void) if empty. */
    std::type_info const& type() const noexcept { return _value.type(); }

    template <typename Ty_>
    bool is() const noexcept { return _value.type() == typeid(Ty_); }

    template <typename Ty_>
    Ty_ const* get_if() const noexcept { return std::any_cast<Ty_>(&_value); }

    template <typename Ty_>
    Ty_* get_if() noexcept { return std::any_cast<Ty_>(&_value); }

    /** @throw std::bad_any_cast if type mismatches */
    template <typename Ty_>
    Ty_ const& as() const { return std::any_cast<Ty_ const&>(_value); }

    void reset() noexcept { _value.reset(); }

   private:
    std::any _value;
};

/** Sent to request program termination. Has no payload. */
struct quit_msg {
};

/**
 * Asks program to hand the terminal back and stop the process, like Ctrl+Z in a shell.
 * Consumed by the program.
 */
struct suspend_msg {
};

/** Delivered to model once the process was continued after suspend. */
struct resume_msg {
};

/** Reports size of terminal, on startup and on every resize. */
struct window_size_msg {
    int width = 0;
    int height = 0;
};

using window_size = window_size_msg;

struct focus_msg {
};

struct blur_msg {
};

enum class key_type {
    runes,
    enter,
    tab,
    shift_tab,
    backspace,
    escape,
    space,
    up,
    down,
    right,
    left,
    home,
    end,
    page_up,
    page_down,
    insert,
    del,
    f1,
    f2,
    f3,
    f4,

    ctrl_at,
    ctrl_a,
    ctrl_b,
    ctrl_c,
    ctrl_d,
    ctrl_e,
    ctrl_f,
    ctrl_g,
    ctrl_h,
    ctrl_i,
    ctrl_j,
    ctrl_k,
    ctrl_l,
    ctrl_m,
    ctrl_n,
    ctrl_o,
    ctrl_p,
    ctrl_q,
    ctrl_r,
    ctrl_s,
    ctrl_t,
    ctrl_u,
    ctrl_v,
    ctrl_w,
    ctrl_x,
    ctrl_y,
    ctrl_z,
    ctrl_backslash,
    ctrl_close_bracket,
    ctrl_caret,
    ctrl_underscore,
};

/** Single key press decoded from terminal input */
struct key_msg {
    key_type type = key_type::runes;
    std::u32string runes;
    bool alt = false;

    /** Human readable key name, e.g. "a", "ctrl+c", "alt+enter" */
    std::string to_string() const;
};

/** Content of a bracketed paste */
struct paste_msg {
    std::string content;
};

/** Escape sequence which could not be recognized */
struct unknown_sequence_msg {
    std::string sequence;
};

/** Printed above the program view, see println() */
struct print_line_msg {
    std::string line;
};

/** Results of concurrently executed commands, see batch() */
struct batch_msg {
    std::vector<msg> msgs;

    size_t size() const noexcept { return msgs.size(); }
    bool empty() const noexcept { return msgs.empty(); }
};

/**
 * Failure of a command, delivered to model as ordinary message.
 */
struct error_msg {
    std::exception_ptr error;

    /** what() of carried exception, if it's derived from std::exception */
    std::string what() const;

    [[noreturn]] void rethrow() const { std::rethrow_exception(error); }
};

msg make_error_msg(std::exception_ptr error);
}  // namespace teakit
