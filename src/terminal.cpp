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

#include "teakit/terminal.h"

#include <utility>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <spdlog/spdlog.h>

#include "teakit/detail/base.hpp"

char const* teakit::to_string(os_signal sig) noexcept
{
    switch (sig) {
        case os_signal::interrupt: return "interrupt";
        case os_signal::terminate: return "terminate";
        case os_signal::suspend: return "suspend";
    }
    return "unknown";
}

teakit::watch_handle::watch_handle(std::function<void()> cancel_fn) noexcept
        : _cancel(std::move(cancel_fn))
{
}

teakit::watch_handle::watch_handle(watch_handle&& other) noexcept
        : _cancel(std::move(other._cancel))
{
    other._cancel = nullptr;
}

auto teakit::watch_handle::operator=(watch_handle&& other) noexcept -> watch_handle&
{
    if (this != &other) {
        cancel();
        _cancel = std::move(other._cancel);
        other._cancel = nullptr;
    }

    return *this;
}

void teakit::watch_handle::cancel() noexcept
{
    auto fn = std::move(_cancel);
    _cancel = nullptr;

    if (not fn) { return; }

    try {
        fn();
    } catch (std::exception& e) {
        glog()->warn("failed to cancel watch: {}", e.what());
    }
}

teakit::terminal_mode_guard::terminal_mode_guard(if_terminal_backend& backend, if_input_stream& input)
        : _backend(&backend)
{
    backend.enable_modes(input);
}

teakit::terminal_mode_guard::~terminal_mode_guard()
{
    try {
        release();
    } catch (std::exception& e) {
        glog()->warn("failed to restore terminal modes: {}", e.what());
    }
}

void teakit::terminal_mode_guard::release()
{
    if (_backend == nullptr) { return; }
    std::exchange(_backend, nullptr)->restore_modes();
}

teakit::headless_terminal_backend::headless_terminal_backend(std::optional<window_size> initial_size)
        : _input(std::make_shared<pipe_stream>()),
          _size(initial_size)
{
}

teakit::headless_terminal_backend::~headless_terminal_backend()
{
    std::lock_guard _{_mtx};
    for (auto& [id, w] : _resize_watchers) { w.alive->store(false); }
    for (auto& [id, w] : _signal_watchers) { w.alive->store(false); }
}

template <typename Fn_, typename Arg_>
void teakit::headless_terminal_backend::_notify_all(
        std::map<uint64_t, watcher<Fn_>> const& watchers, Arg_ arg)
{
    for (auto& [id, w] : watchers) {
        asio::post(*w.loop, [fn = w.fn, alive = w.alive, arg] {
            if (alive->load()) { fn(arg); }
        });
    }
}

void teakit::headless_terminal_backend::notify_resize(window_size size)
{
    std::lock_guard _{_mtx};
    _size = size;
    _notify_all(_resize_watchers, size);
}

void teakit::headless_terminal_backend::notify_signal(os_signal sig)
{
    std::lock_guard _{_mtx};
    _notify_all(_signal_watchers, sig);
}

size_t teakit::headless_terminal_backend::num_enable_modes() const
{
    std::lock_guard _{_mtx};
    return _num_enable_modes;
}

size_t teakit::headless_terminal_backend::num_restore_modes() const
{
    std::lock_guard _{_mtx};
    return _num_restore_modes;
}

size_t teakit::headless_terminal_backend::num_suspends() const
{
    std::lock_guard _{_mtx};
    return _num_suspends;
}

size_t teakit::headless_terminal_backend::num_resize_watches_opened() const
{
    std::lock_guard _{_mtx};
    return _num_resize_watches_opened;
}

size_t teakit::headless_terminal_backend::num_resize_watches_active() const
{
    std::lock_guard _{_mtx};
    return _resize_watchers.size();
}

size_t teakit::headless_terminal_backend::num_signal_watches_active() const
{
    std::lock_guard _{_mtx};
    return _signal_watchers.size();
}

bool teakit::headless_terminal_backend::device_closed() const
{
    std::lock_guard _{_mtx};
    return _device_closed;
}

auto teakit::headless_terminal_backend::open_input_device() -> std::shared_ptr<if_input_stream>
{
    return _input;
}

void teakit::headless_terminal_backend::enable_modes(if_input_stream&)
{
    std::lock_guard _{_mtx};
    ++_num_enable_modes;
}

void teakit::headless_terminal_backend::restore_modes()
{
    std::lock_guard _{_mtx};
    ++_num_restore_modes;
}

auto teakit::headless_terminal_backend::watch_resize(asio::io_context& loop, resize_fn fn)
        -> watch_handle
{
    std::lock_guard _{_mtx};
    auto id = ++_watch_id_gen;
    auto alive = std::make_shared<std::atomic_bool>(true);

    _resize_watchers.emplace(id, watcher<resize_fn>{&loop, std::move(fn), alive});
    ++_num_resize_watches_opened;

    return watch_handle{[this, id, alive] {
        alive->store(false);

        std::lock_guard _{_mtx};
        _resize_watchers.erase(id);
    }};
}

auto teakit::headless_terminal_backend::watch_signals(asio::io_context& loop, signal_fn fn)
        -> watch_handle
{
    std::lock_guard _{_mtx};
    auto id = ++_watch_id_gen;
    auto alive = std::make_shared<std::atomic_bool>(true);

    _signal_watchers.emplace(id, watcher<signal_fn>{&loop, std::move(fn), alive});

    return watch_handle{[this, id, alive] {
        alive->store(false);

        std::lock_guard _{_mtx};
        _signal_watchers.erase(id);
    }};
}

auto teakit::headless_terminal_backend::query_size() -> std::optional<window_size>
{
    std::lock_guard _{_mtx};
    return _size;
}

void teakit::headless_terminal_backend::suspend_process()
{
    // there is no process to stop; resumes right away
    std::lock_guard _{_mtx};
    ++_num_suspends;
}

void teakit::headless_terminal_backend::close_device()
{
    std::lock_guard _{_mtx};
    _device_closed = true;
}
