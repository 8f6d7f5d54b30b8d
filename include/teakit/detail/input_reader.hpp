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
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace teakit {
/** Pending or subsequent read was abandoned since the reader was canceled. */
struct input_reader_canceled_error : std::runtime_error {
    input_reader_canceled_error() : std::runtime_error("input reader canceled") {}
};

/** Another read request is already pending on the reader. */
struct input_reader_busy_error : std::logic_error {
    input_reader_busy_error() : std::logic_error("input reader already has a pending read") {}
};

/**
 * Push-style byte source.
 *
 * Listener callbacks may be invoked from any thread, but never concurrently. After on_end
 * or on_error, no more callbacks are made.
 */
class if_input_stream
{
   public:
    struct listener {
        std::function<void(std::string chunk)> on_data;
        std::function<void()> on_end;
        std::function<void(std::exception_ptr)> on_error;
    };

   public:
    virtual ~if_input_stream() = default;

    /**
     * Starts delivering stream events to given listener. Only one listener is allowed.
     */
    virtual void subscribe(listener l) = 0;

    /**
     * Detach listener. Stream itself keeps its state.
     */
    virtual void unsubscribe() noexcept = 0;
};

using input_stream_ptr = std::shared_ptr<if_input_stream>;

/**
 * In-memory pass-through stream.
 *
 * Everything written before subscription is buffered, then replayed to the listener.
 */
class pipe_stream : public if_input_stream
{
   public:
    void write(std::string chunk);

    /** Writes last chunk if not empty, then finishes the stream. */
    void end(std::string last_chunk = {});

    /** Finishes the stream with error. Null error finishes it gracefully. */
    void destroy(std::exception_ptr error = nullptr);

    bool finished() const;

   public:
    void subscribe(listener l) override;
    void unsubscribe() noexcept override;

   private:
    struct event {
        enum class kind { data, end, error };

        kind type;
        std::string chunk;
        std::exception_ptr cause;
    };

    void _emit(event ev);
    void _deliver(event& ev);

   private:
    mutable std::mutex _mtx;
    listener _listener;
    bool _subscribed = false;
    bool _finished = false;
    std::deque<event> _backlog;
};

/**
 * Turns an input stream into a cancelable, single-pass sequence of chunks.
 *
 * Chunks are delivered in the order and the shape the stream emitted them. The reader owns
 * the stream subscription for its whole lifetime.
 */
class input_reader
{
   public:
    enum class state {
        open,
        canceled,
        closed,
        errored,
    };

    using chunk_future = std::future<std::optional<std::string>>;

   public:
    /** @throw std::invalid_argument if stream is null */
    explicit input_reader(input_stream_ptr stream);
    ~input_reader();

    input_reader(input_reader const&) = delete;
    input_reader& operator=(input_reader const&) = delete;

   public:
    /**
     * Requests next chunk.
     *
     * Future yields the chunk, or std::nullopt when the sequence ended. It fails with
     * input_reader_canceled_error after cancel(), with the stream's own error after stream
     * failure, and with input_reader_busy_error if another request is still pending.
     */
    chunk_future next();

    /**
     * Blocking version of next().
     */
    std::optional<std::string> read() { return next().get(); }

    /**
     * Cancels the reader. Pending request fails with input_reader_canceled_error, and
     * buffered chunks are discarded.
     *
     * @return true only on the call which actually canceled an open reader.
     */
    bool cancel();

    /**
     * Finishes the reader gracefully. Already buffered chunks are still delivered, but
     * anything arriving later is dropped.
     */
    void close();

    state status() const;

   private:
    struct impl;
    std::shared_ptr<impl> _self;
};

char const* to_string(input_reader::state s) noexcept;
}  // namespace teakit
