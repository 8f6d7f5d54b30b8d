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
#include <mutex>
#include <optional>
#include <thread>

#include <termios.h>

#include "teakit/detail/input_reader.hpp"
#include "teakit/terminal.h"

namespace teakit {
/**
 * Input stream over a file descriptor.
 *
 * A reader thread runs while a listener is subscribed, so that bytes which nobody
 * listens to are left in the descriptor.
 */
class fd_stream : public if_input_stream
{
   public:
    /**
     * @param owns_fd close fd on close() or destruction
     */
    explicit fd_stream(int fd, bool owns_fd = false);
    ~fd_stream() override;

    fd_stream(fd_stream const&) = delete;
    fd_stream& operator=(fd_stream const&) = delete;

   public:
    int fd() const noexcept { return _fd; }

    /** Stops reading. Stream can't be used anymore. */
    void close();

   public:
    void subscribe(listener l) override;
    void unsubscribe() noexcept override;

   private:
    void _read_loop();
    void _stop_reader() noexcept;

    void _emit_data(std::string chunk);
    void _emit_end();
    void _emit_error(std::exception_ptr error);

   private:
    int _fd;
    bool _owns_fd;

    std::mutex _mtx;
    listener _listener;
    bool _finished = false;
    bool _closed = false;

    std::thread _reader;
    std::atomic_bool _stop_requested{false};
};

/**
 * Backend for POSIX terminals.
 *
 * Uses stdin, or /dev/tty if stdin is not a terminal, as input device. Raw mode is
 * applied with termios, and resize/interrupt/terminate are observed with signal sets.
 */
class posix_terminal_backend : public if_terminal_backend
{
   public:
    posix_terminal_backend() = default;
    ~posix_terminal_backend() override;

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
    std::shared_ptr<fd_stream> _device;

    int _raw_fd = -1;
    std::optional<termios> _saved_modes;
};
}  // namespace teakit
