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

#include "teakit/detail/input_reader.hpp"

#include <spdlog/spdlog.h>

#include "teakit/detail/base.hpp"

void teakit::pipe_stream::write(std::string chunk)
{
    _emit({event::kind::data, std::move(chunk), nullptr});
}

void teakit::pipe_stream::end(std::string last_chunk)
{
    if (not last_chunk.empty()) { write(std::move(last_chunk)); }
    _emit({event::kind::end, {}, nullptr});
}

void teakit::pipe_stream::destroy(std::exception_ptr error)
{
    if (error) {
        _emit({event::kind::error, {}, std::move(error)});
    } else {
        _emit({event::kind::end, {}, nullptr});
    }
}

bool teakit::pipe_stream::finished() const
{
    std::lock_guard _{_mtx};
    return _finished;
}

void teakit::pipe_stream::subscribe(listener l)
{
    std::lock_guard _{_mtx};
    _listener = std::move(l);
    _subscribed = true;

    while (not _backlog.empty() && _subscribed) {
        auto ev = std::move(_backlog.front());
        _backlog.pop_front();
        _deliver(ev);
    }
}

void teakit::pipe_stream::unsubscribe() noexcept
{
    std::lock_guard _{_mtx};
    _subscribed = false;
    _listener = {};
}

void teakit::pipe_stream::_emit(event ev)
{
    std::lock_guard _{_mtx};
    if (_finished) { return; }

    _finished = ev.type != event::kind::data;

    if (_subscribed) {
        _deliver(ev);
    } else {
        _backlog.push_back(std::move(ev));
    }
}

void teakit::pipe_stream::_deliver(event& ev)
{
    switch (ev.type) {
        case event::kind::data:
            if (_listener.on_data) { _listener.on_data(std::move(ev.chunk)); }
            break;

        case event::kind::end:
            if (_listener.on_end) { _listener.on_end(); }
            break;

        case event::kind::error:
            if (_listener.on_error) { _listener.on_error(ev.cause); }
            break;
    }
}

namespace teakit {
struct input_reader::impl {
    input_stream_ptr stream;

    mutable std::mutex mtx;
    state status = state::open;
    std::deque<std::string> buffered;
    std::optional<std::promise<std::optional<std::string>>> pending;
    std::exception_ptr error;

    void on_data(std::string chunk)
    {
        std::lock_guard _{mtx};
        if (status != state::open) { return; }

        if (pending) {
            pending->set_value(std::move(chunk));
            pending.reset();
        } else {
            buffered.push_back(std::move(chunk));
        }
    }

    void on_end()
    {
        std::lock_guard _{mtx};
        if (status != state::open) { return; }

        status = state::closed;
        if (pending) {
            pending->set_value(std::nullopt);
            pending.reset();
        }
    }

    void on_error(std::exception_ptr ep)
    {
        std::lock_guard _{mtx};
        if (status != state::open) { return; }

        if (not ep) { ep = std::make_exception_ptr(std::runtime_error("input stream error")); }

        SPDLOG_LOGGER_DEBUG(glog(), "input stream failed");
        status = state::errored;
        error = ep;
        buffered.clear();

        if (pending) {
            pending->set_exception(error);
            pending.reset();
        }
    }
};
}  // namespace teakit

teakit::input_reader::input_reader(input_stream_ptr stream)
        : _self(std::make_shared<impl>())
{
    if (not stream) { throw std::invalid_argument("input stream is required"); }
    _self->stream = std::move(stream);

    std::weak_ptr<impl> weak = _self;
    if_input_stream::listener l;
    l.on_data = [weak](std::string chunk) {
        if (auto self = weak.lock()) { self->on_data(std::move(chunk)); }
    };
    l.on_end = [weak] {
        if (auto self = weak.lock()) { self->on_end(); }
    };
    l.on_error = [weak](std::exception_ptr ep) {
        if (auto self = weak.lock()) { self->on_error(std::move(ep)); }
    };

    _self->stream->subscribe(std::move(l));
}

teakit::input_reader::~input_reader()
{
    _self->stream->unsubscribe();
}

auto teakit::input_reader::next() -> chunk_future
{
    std::promise<std::optional<std::string>> promise;
    auto future = promise.get_future();

    std::lock_guard _{_self->mtx};
    auto& self = *_self;

    if (self.status == state::canceled) {
        promise.set_exception(std::make_exception_ptr(input_reader_canceled_error{}));
    } else if (self.status == state::errored) {
        promise.set_exception(self.error);
    } else if (self.pending) {
        promise.set_exception(std::make_exception_ptr(input_reader_busy_error{}));
    } else if (not self.buffered.empty()) {
        promise.set_value(std::move(self.buffered.front()));
        self.buffered.pop_front();
    } else if (self.status == state::closed) {
        promise.set_value(std::nullopt);
    } else {
        self.pending = std::move(promise);
    }

    return future;
}

bool teakit::input_reader::cancel()
{
    std::optional<std::promise<std::optional<std::string>>> pending;

    {
        std::lock_guard _{_self->mtx};
        if (_self->status != state::open) { return false; }

        _self->status = state::canceled;
        _self->buffered.clear();
        pending.swap(_self->pending);
    }

    if (pending) {
        pending->set_exception(std::make_exception_ptr(input_reader_canceled_error{}));
    }

    _self->stream->unsubscribe();
    return true;
}

void teakit::input_reader::close()
{
    {
        std::lock_guard _{_self->mtx};
        if (_self->status != state::open) { return; }

        _self->status = state::closed;
        if (_self->pending) {
            _self->pending->set_value(std::nullopt);
            _self->pending.reset();
        }
    }

    _self->stream->unsubscribe();
}

auto teakit::input_reader::status() const -> state
{
    std::lock_guard _{_self->mtx};
    return _self->status;
}

char const* teakit::to_string(input_reader::state s) noexcept
{
    switch (s) {
        case input_reader::state::open: return "open";
        case input_reader::state::canceled: return "canceled";
        case input_reader::state::closed: return "closed";
        case input_reader::state::errored: return "errored";
    }
    return "unknown";
}
