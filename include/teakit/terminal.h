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
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "teakit/detail/input_reader.hpp"
#include "teakit/detail/messages.hpp"
#include "teakit/fwd.hpp"

namespace teakit {
enum class os_signal {
    interrupt,
    terminate,
    suspend,
};

char const* to_string(os_signal sig) noexcept;

/**
 * Keeps a subscription alive. Subscription is canceled on destruction.
 */
class watch_handle
{
   public:
    watch_handle() noexcept = default;
    explicit watch_handle(std::function<void()> cancel_fn) noexcept;
    ~watch_handle() { cancel(); }

    watch_handle(watch_handle&& other) noexcept;
    watch_handle& operator=(watch_handle&& other) noexcept;

   public:
    /** Idempotent. */
    void cancel() noexcept;
    bool active() const noexcept { return bool(_cancel); }

   private:
    std::function<void()> _cancel;
};

/**
 * Platform services program requires from the terminal.
 *
 * enable_modes() and restore_modes() are always called in pairs, from the program loop.
 */
class if_terminal_backend
{
   public:
    using resize_fn = std::function<void(window_size)>;
    using signal_fn = std::function<void(os_signal)>;

   public:
    virtual ~if_terminal_backend() = default;

    /**
     * Opens terminal input, which is used when no custom input was given.
     */
    virtual std::shared_ptr<if_input_stream> open_input_device() = 0;

    /**
     * Puts terminal into raw mode, if the input is attached to one.
     */
    virtual void enable_modes(if_input_stream& input) = 0;
    virtual void restore_modes() = 0;

    /**
     * Invokes fn on loop whenever terminal size changes. Returns empty handle if size
     * changes can't be observed.
     */
    virtual watch_handle watch_resize(asio::io_context& loop, resize_fn fn) = 0;

    /**
     * Invokes fn on loop for interrupt/terminate/suspend requests from outside.
     */
    virtual watch_handle watch_signals(asio::io_context& loop, signal_fn fn) = 0;

    virtual std::optional<window_size> query_size() = 0;

    /**
     * Stops the process until it is continued by job control. Invoked while terminal
     * modes are restored; returns after the process was resumed.
     */
    virtual void suspend_process() = 0;

    /**
     * Releases input device opened by open_input_device(). Idempotent.
     */
    virtual void close_device() = 0;
};

using terminal_backend_ptr = std::shared_ptr<if_terminal_backend>;

/**
 * Keeps terminal modes enabled for its lifetime. Modes are restored exactly once.
 */
class terminal_mode_guard
{
   public:
    terminal_mode_guard(if_terminal_backend& backend, if_input_stream& input);
    ~terminal_mode_guard();

    terminal_mode_guard(terminal_mode_guard const&) = delete;
    terminal_mode_guard& operator=(terminal_mode_guard const&) = delete;

   public:
    /**
     * Restores modes now. Subsequent calls have no effect.
     * @throw whatever backend throws from restore_modes()
     */
    void release();

   private:
    if_terminal_backend* _backend;
};

/**
 * Creates backend for current platform.
 */
terminal_backend_ptr create_default_terminal_backend();

/**
 * In-process pseudo console.
 *
 * Host side pushes input via console_input(), and emulates window/signal events with
 * notify_resize() and notify_signal(). Host side methods are thread safe.
 */
class headless_terminal_backend : public if_terminal_backend
{
   public:
    explicit headless_terminal_backend(std::optional<window_size> initial_size = {});
    ~headless_terminal_backend() override;

   public:
    std::shared_ptr<pipe_stream> const& console_input() const noexcept { return _input; }

    void notify_resize(window_size size);
    void notify_signal(os_signal sig);

    size_t num_enable_modes() const;
    size_t num_restore_modes() const;
    size_t num_suspends() const;
    size_t num_resize_watches_opened() const;
    size_t num_resize_watches_active() const;
    size_t num_signal_watches_active() const;
    bool device_closed() const;

   public:
    std::shared_ptr<if_input_stream> open_input_device() override;
    void enable_modes(if_input_stream& input) override;
    void restore_modes() override;
    watch_handle watch_resize(asio::io_context& loop, resize_fn fn) override;
    watch_handle watch_signals(asio::io_context& loop, signal_fn fn) override;
    std::optional<window_size> query_size() override;
    void suspend_process() override;
    void close_device() override;

   private:
    template <typename Fn_>
    struct watcher {
        asio::io_context* loop;
        Fn_ fn;
        std::shared_ptr<std::atomic_bool> alive;
    };

    template <typename Fn_, typename Arg_>
    static void _notify_all(std::map<uint64_t, watcher<Fn_>> const& watchers, Arg_ arg);

   private:
    std::shared_ptr<pipe_stream> _input;

    mutable std::mutex _mtx;
    std::optional<window_size> _size;
    size_t _num_enable_modes = 0;
    size_t _num_restore_modes = 0;
    size_t _num_suspends = 0;
    size_t _num_resize_watches_opened = 0;
    bool _device_closed = false;

    uint64_t _watch_id_gen = 0;
    std::map<uint64_t, watcher<resize_fn>> _resize_watchers;
    std::map<uint64_t, watcher<signal_fn>> _signal_watchers;
};
}  // namespace teakit
