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
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "teakit/detail/messages.hpp"
#include "teakit/fwd.hpp"

namespace teakit {
using completion_fn = std::function<void(msg)>;

/**
 * Executes commands on behalf of program loop.
 *
 * Blocking work is dispatched to internal worker pool, and its result is posted back to
 * the loop. Every completion handler is invoked from the thread which runs the loop.
 *
 * Destruction never waits for blocking work which is still running; such work finishes
 * in background and its result is discarded.
 *
 * @warning The loop context must outlive the scheduler.
 */
class scheduler
{
    struct impl;
    std::unique_ptr<impl> _self;

   public:
    explicit scheduler(asio::io_context& loop, size_t num_workers = 0);
    ~scheduler();

    scheduler(scheduler const&) = delete;
    scheduler& operator=(scheduler const&) = delete;

   public:
    asio::io_context& loop() const noexcept;

    /**
     * Runs given function in worker pool, then delivers its result to the loop.
     * Any exception thrown from fn is delivered as error_msg.
     */
    void dispatch_blocking(std::function<msg()> fn, completion_fn on_done);

    /**
     * Posts a function to the loop.
     */
    void post(std::function<void()> fn);

    /**
     * Once called, every dispatch/post request is ignored, and results of work which is
     * already running will be silently discarded. No result is posted to the loop after
     * this returns.
     */
    void stop_accepting() noexcept;
    bool accepting() const noexcept;
};

/**
 * A deferred unit of work, which resolves to a single message.
 *
 * Empty command represents 'no effect'.
 */
class cmd
{
   public:
    using async_fn = std::function<void(scheduler&, completion_fn)>;

   public:
    cmd() noexcept = default;
    cmd(std::nullptr_t) noexcept {}

    /**
     * Creates command from blocking function, which will be executed in worker pool.
     * Function must return a value which is convertible to msg.
     */
    template <typename Fn_,
              typename = std::enable_if_t<
                      not std::is_same_v<std::decay_t<Fn_>, cmd>
                      && not std::is_same_v<std::decay_t<Fn_>, std::nullptr_t>
                      && std::is_invocable_v<Fn_&>>>
    cmd(Fn_&& fn)
    {
        static_assert(std::is_convertible_v<std::invoke_result_t<Fn_&>, msg>,
                      "command function must return a value convertible to msg");

        _fn = [fn = std::forward<Fn_>(fn)](scheduler& s, completion_fn done) {
            s.dispatch_blocking([fn]() mutable -> msg { return fn(); }, std::move(done));
        };
    }

    /**
     * Creates command which performs asynchronous operation natively.
     *
     * Given function must call completion exactly once, from the scheduler's loop. Use
     * scheduler::post() to get back to the loop from other contexts.
     */
    static cmd async(async_fn fn)
    {
        cmd c;
        c._fn = std::move(fn);
        return c;
    }

   public:
    bool empty() const noexcept { return not _fn; }
    explicit operator bool() const noexcept { return bool(_fn); }

    /**
     * Starts the command. Never throws; a synchronous failure is delivered as error_msg.
     */
    void launch(scheduler& s, completion_fn on_done) const noexcept;

   private:
    async_fn _fn;
};

using tick_fn = std::function<msg(std::chrono::system_clock::time_point)>;

/**
 * Runs all given commands concurrently, and collects their non-empty results into batch_msg
 * in submission order.
 *
 * Empty commands are filtered out. Returns empty command if nothing remains, and the only
 * command as-is if single command remains.
 */
cmd batch(std::vector<cmd> cmds);

template <typename... Cmds_>
cmd batch(Cmds_&&... cmds)
{
    return batch(std::vector<cmd>{cmd(std::forward<Cmds_>(cmds))...});
}

/**
 * Runs given commands one at a time, in order. Stops at the first command which resolves
 * to non-empty message, and that message becomes the result. Remaining commands are never
 * started.
 *
 * Shares filtering rule of batch().
 */
cmd sequence(std::vector<cmd> cmds);

template <typename... Cmds_>
cmd sequence(Cmds_&&... cmds)
{
    return sequence(std::vector<cmd>{cmd(std::forward<Cmds_>(cmds))...});
}

template <typename... Cmds_>
cmd sequentially(Cmds_&&... cmds)
{
    return sequence(std::forward<Cmds_>(cmds)...);
}

/**
 * Resolves to fn(now) after given duration elapsed.
 */
cmd tick(std::chrono::nanoseconds duration, tick_fn fn);

/**
 * Resolves to fn(now) once, at the first wall-clock multiple of given interval which is
 * at least one interval away from launch. Re-issue the command to keep ticking.
 */
cmd every(std::chrono::nanoseconds interval, tick_fn fn);

/**
 * Resolves to quit_msg immediately.
 */
cmd quit();

/**
 * Resolves to suspend_msg immediately. Model receives resume_msg when the process is
 * continued.
 */
cmd suspend();

/**
 * Prints given line above the program view. Has no effect when the program is on the
 * alternate screen.
 */
cmd println(std::string line);

/**
 * Runs single command to completion on a private loop, and returns its result.
 * Blocks the caller. Intended for tools and tests.
 */
msg run_cmd(cmd const& c);
}  // namespace teakit
