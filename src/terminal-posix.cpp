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

#include <cerrno>
#include <cstring>
#include <csignal>
#include <system_error>

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <fcntl.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "teakit/detail/base.hpp"
#include "teakit/detail/posix_terminal.hpp"

namespace {
constexpr int POLL_INTERVAL_MS = 50;
constexpr int MIN_READ_SIZE = 256;

std::exception_ptr make_errno_error(char const* what)
{
    return std::make_exception_ptr(std::system_error(errno, std::generic_category(), what));
}

/**
 * Delivers given signals to handler on loop, until canceled.
 */
class signal_watch : public std::enable_shared_from_this<signal_watch>
{
   public:
    signal_watch(asio::io_context& loop, std::function<void(int)> handler)
            : _signals(loop), _handler(std::move(handler))
    {
    }

    void add(int signal_number) { _signals.add(signal_number); }

    void arm()
    {
        _signals.async_wait([self = shared_from_this()](asio::error_code const& ec, int signal_number) {
            if (ec) { return; }

            self->_handler(signal_number);
            self->arm();
        });
    }

    void cancel()
    {
        asio::error_code ec;
        _signals.cancel(ec);
        _signals.clear(ec);
    }

   private:
    asio::signal_set _signals;
    std::function<void(int)> _handler;
};
}  // namespace

teakit::fd_stream::fd_stream(int fd, bool owns_fd)
        : _fd(fd), _owns_fd(owns_fd)
{
}

teakit::fd_stream::~fd_stream()
{
    close();
}

void teakit::fd_stream::close()
{
    unsubscribe();

    std::lock_guard _{_mtx};
    if (_closed) { return; }
    _closed = true;

    if (_owns_fd && ::close(_fd) != 0) {
        glog()->warn("failed to close fd {}: {}", _fd, std::strerror(errno));
    }
}

void teakit::fd_stream::subscribe(listener l)
{
    _stop_reader();

    std::lock_guard _{_mtx};
    if (_closed) { throw std::logic_error("subscribing to closed fd stream"); }

    _listener = std::move(l);
    if (_finished) { return; }

    _stop_requested.store(false);
    _reader = std::thread{[this] { _read_loop(); }};
}

void teakit::fd_stream::unsubscribe() noexcept
{
    {
        std::lock_guard _{_mtx};
        _listener = {};
    }

    _stop_reader();
}

void teakit::fd_stream::_stop_reader() noexcept
{
    if (not _reader.joinable()) { return; }
    _stop_requested.store(true);

    if (_reader.get_id() == std::this_thread::get_id()) {
        // unsubscribed from its own callback; loop exits right after returning.
        _reader.detach();
        return;
    }

    _reader.join();
}

void teakit::fd_stream::_read_loop()
{
    pollfd pollee;
    pollee.fd = _fd;
    pollee.events = POLLIN;

    while (not _stop_requested.load()) {
        pollee.revents = 0;

        auto n_ready = ::poll(&pollee, 1, POLL_INTERVAL_MS);
        if (n_ready < 0) {
            if (errno == EINTR) { continue; }
            return _emit_error(make_errno_error("poll"));
        }

        if (n_ready == 0 || _stop_requested.load()) { continue; }

        int n_avail = 0;
        if (::ioctl(_fd, FIONREAD, &n_avail) != 0 || n_avail < MIN_READ_SIZE) {
            n_avail = MIN_READ_SIZE;
        }

        std::string bytes;
        bytes.resize(n_avail);

        auto n_read = ::read(_fd, bytes.data(), bytes.size());
        if (n_read < 0) {
            if (errno == EINTR || errno == EAGAIN) { continue; }
            return _emit_error(make_errno_error("read"));
        }

        if (n_read == 0) { return _emit_end(); }

        bytes.resize(n_read);
        _emit_data(std::move(bytes));
    }
}

void teakit::fd_stream::_emit_data(std::string chunk)
{
    std::lock_guard _{_mtx};
    if (_finished || not _listener.on_data) { return; }

    _listener.on_data(std::move(chunk));
}

void teakit::fd_stream::_emit_end()
{
    std::lock_guard _{_mtx};
    if (_finished) { return; }
    _finished = true;

    if (_listener.on_end) { _listener.on_end(); }
}

void teakit::fd_stream::_emit_error(std::exception_ptr error)
{
    std::lock_guard _{_mtx};
    if (_finished) { return; }
    _finished = true;

    if (_listener.on_error) { _listener.on_error(std::move(error)); }
}

teakit::posix_terminal_backend::~posix_terminal_backend()
{
    if (_saved_modes && ::tcsetattr(_raw_fd, TCSANOW, &*_saved_modes) != 0) {
        glog()->warn("failed to restore terminal modes: {}", std::strerror(errno));
    }
}

auto teakit::posix_terminal_backend::open_input_device() -> std::shared_ptr<if_input_stream>
{
    if (_device) { return _device; }

    if (::isatty(STDIN_FILENO)) {
        _device = std::make_shared<fd_stream>(STDIN_FILENO);
        return _device;
    }

    auto fd = ::open("/dev/tty", O_RDONLY | O_CLOEXEC);
    if (fd < 0) { throw std::system_error(errno, std::generic_category(), "failed to open /dev/tty"); }

    glog()->debug("stdin is not a terminal; reading /dev/tty");
    _device = std::make_shared<fd_stream>(fd, true);
    return _device;
}

void teakit::posix_terminal_backend::enable_modes(if_input_stream& input)
{
    auto stream = dynamic_cast<fd_stream*>(&input);
    if (stream == nullptr || not ::isatty(stream->fd())) {
        glog()->debug("input is not a terminal; raw mode is not applied");
        return;
    }

    if (_saved_modes) { return; }

    auto fd = stream->fd();
    termios modes;
    if (::tcgetattr(fd, &modes) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcgetattr");
    }

    auto raw = modes;
    ::cfmakeraw(&raw);

    if (::tcsetattr(fd, TCSANOW, &raw) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcsetattr");
    }

    _saved_modes = modes;
    _raw_fd = fd;
}

void teakit::posix_terminal_backend::restore_modes()
{
    if (not _saved_modes) { return; }

    auto saved = *_saved_modes;
    _saved_modes.reset();

    if (::tcsetattr(_raw_fd, TCSANOW, &saved) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcsetattr");
    }
}

auto teakit::posix_terminal_backend::watch_resize(asio::io_context& loop, resize_fn fn)
        -> watch_handle
{
    if (not ::isatty(STDOUT_FILENO)) { return {}; }

    auto watch = std::make_shared<signal_watch>(loop, [this, fn = std::move(fn)](int) {
        if (auto size = query_size()) { fn(*size); }
    });

    watch->add(SIGWINCH);
    watch->arm();

    return watch_handle{[watch] { watch->cancel(); }};
}

auto teakit::posix_terminal_backend::watch_signals(asio::io_context& loop, signal_fn fn)
        -> watch_handle
{
    auto watch = std::make_shared<signal_watch>(loop, [fn = std::move(fn)](int signal_number) {
        switch (signal_number) {
            case SIGINT: return fn(os_signal::interrupt);
            case SIGTSTP: return fn(os_signal::suspend);
            default: return fn(os_signal::terminate);
        }
    });

    watch->add(SIGINT);
    watch->add(SIGTERM);
    watch->add(SIGTSTP);
    watch->arm();

    return watch_handle{[watch] { watch->cancel(); }};
}

auto teakit::posix_terminal_backend::query_size() -> std::optional<window_size>
{
    for (auto fd : {int(STDOUT_FILENO), _raw_fd}) {
        winsize ws = {};
        if (fd >= 0 && ::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
            return window_size{ws.ws_col, ws.ws_row};
        }
    }

    return std::nullopt;
}

void teakit::posix_terminal_backend::suspend_process()
{
    // SIGTSTP may be watched; default action is required to actually stop.
    struct sigaction default_action = {};
    struct sigaction saved_action = {};
    default_action.sa_handler = SIG_DFL;
    ::sigemptyset(&default_action.sa_mask);

    if (::sigaction(SIGTSTP, &default_action, &saved_action) != 0) {
        throw std::system_error(errno, std::generic_category(), "sigaction");
    }

    // whole process group, so that a pipeline we belong to stops together. Returns once
    // SIGCONT continued the process.
    auto result = ::kill(0, SIGTSTP);
    if (result != 0 && errno == EPERM) { result = ::kill(::getpid(), SIGTSTP); }
    auto error = errno;

    if (::sigaction(SIGTSTP, &saved_action, nullptr) != 0) {
        glog()->warn("failed to reinstall SIGTSTP handler: {}", std::strerror(errno));
    }

    if (result != 0) {
        throw std::system_error(error, std::generic_category(), "failed to suspend process");
    }
}

void teakit::posix_terminal_backend::close_device()
{
    if (not _device) { return; }

    _device->close();
    _device.reset();
}

auto teakit::create_default_terminal_backend() -> terminal_backend_ptr
{
    return std::make_shared<posix_terminal_backend>();
}
