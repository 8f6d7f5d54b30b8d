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

#include "teakit/detail/commands.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <thread>

#include <asio/io_context.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/move.hpp>
#include <spdlog/spdlog.h>

#include "teakit/detail/base.hpp"

namespace teakit {
struct scheduler::impl {
    /** Shared with queued work, which may outlive the scheduler. */
    struct gate {
        asio::io_context& loop;
        std::mutex lock;
        bool accepting = true;

        explicit gate(asio::io_context& loop) : loop(loop) {}
    };

    std::shared_ptr<gate> shared;
    std::shared_ptr<asio::thread_pool> workers;

    impl(asio::io_context& loop, size_t num_workers)
            : shared(std::make_shared<gate>(loop)),
              workers(std::make_shared<asio::thread_pool>(
                      num_workers == 0 ? std::max(2u, std::thread::hardware_concurrency())
                                       : num_workers))
    {
    }
};
}  // namespace teakit

teakit::scheduler::scheduler(asio::io_context& loop, size_t num_workers)
        : _self(std::make_unique<impl>(loop, num_workers))
{
}

teakit::scheduler::~scheduler()
{
    stop_accepting();

    // Blocking commands can't be interrupted. The pool is joined on a detached thread
    // instead, so that destruction returns without waiting for them.
    auto workers = std::move(_self->workers);
    workers->stop();

    try {
        std::thread{[workers] { workers->join(); }}.detach();
    } catch (std::system_error& e) {
        glog()->warn("failed to hand off worker pool, joining in place: {}", e.what());
        workers->join();
    }
}

asio::io_context& teakit::scheduler::loop() const noexcept
{
    return _self->shared->loop;
}

void teakit::scheduler::dispatch_blocking(std::function<msg()> fn, completion_fn on_done)
{
    if (not accepting()) { return; }

    asio::post(
            *_self->workers,
            [gate = _self->shared, fn = std::move(fn), on_done = std::move(on_done)]() mutable {
                msg result;
                try {
                    result = fn();
                } catch (...) {
                    result = make_error_msg(std::current_exception());
                }

                // loop is only guaranteed to be alive while the gate is open
                std::lock_guard _{gate->lock};
                if (not gate->accepting) { return; }

                asio::post(
                        gate->loop,
                        [on_done = std::move(on_done), result = std::move(result)]() mutable {
                            on_done(std::move(result));
                        });
            });
}

void teakit::scheduler::post(std::function<void()> fn)
{
    if (not accepting()) { return; }
    asio::post(_self->shared->loop, std::move(fn));
}

void teakit::scheduler::stop_accepting() noexcept
{
    std::lock_guard _{_self->shared->lock};
    _self->shared->accepting = false;
}

bool teakit::scheduler::accepting() const noexcept
{
    std::lock_guard _{_self->shared->lock};
    return _self->shared->accepting;
}

void teakit::cmd::launch(scheduler& s, completion_fn on_done) const noexcept
{
    if (not _fn) { return; }

    try {
        _fn(s, on_done);
    } catch (...) {
        glog()->debug("command failed on launch; delivering as error message");
        s.post([on_done = std::move(on_done), error = std::current_exception()] {
            on_done(make_error_msg(error));
        });
    }
}

namespace {
using teakit::cmd;
using teakit::completion_fn;
using teakit::msg;
using teakit::scheduler;

std::vector<cmd> compact(std::vector<cmd> cmds)
{
    return cmds
           | ranges::views::move
           | ranges::views::filter([](cmd const& c) { return bool(c); })
           | ranges::to<std::vector>();
}

/**
 * Launches every command at once, and invokes on_all_done with their results in
 * submission order once every one of them resolved.
 */
void launch_join_all(
        scheduler& s,
        std::vector<cmd> const& cmds,
        std::function<void(std::vector<msg>)> on_all_done)
{
    struct join_state {
        std::vector<msg> results;
        size_t num_remaining = 0;
        std::function<void(std::vector<msg>)> on_all_done;
    };

    auto state = std::make_shared<join_state>();
    state->results.resize(cmds.size());
    state->num_remaining = cmds.size();
    state->on_all_done = std::move(on_all_done);

    for (size_t index = 0; index < cmds.size(); ++index) {
        cmds[index].launch(s, [state, index](msg result) {
            state->results[index] = std::move(result);

            if (--state->num_remaining == 0) {
                state->on_all_done(std::move(state->results));
            }
        });
    }
}

using cmd_list_ptr = std::shared_ptr<std::vector<cmd> const>;

class sequence_runner : public std::enable_shared_from_this<sequence_runner>
{
   public:
    sequence_runner(scheduler& s, cmd_list_ptr cmds, completion_fn on_done)
            : _sched(s), _cmds(std::move(cmds)), _on_done(std::move(on_done))
    {
    }

    void step()
    {
        if (_next == _cmds->size()) {
            _on_done({});
            return;
        }

        auto& current = (*_cmds)[_next++];
        current.launch(_sched, [self = shared_from_this()](msg result) {
            if (result) {
                self->_on_done(std::move(result));
            } else {
                self->step();
            }
        });
    }

   private:
    scheduler& _sched;
    cmd_list_ptr _cmds;
    completion_fn _on_done;
    size_t _next = 0;
};

template <typename Fn_>
cmd compact_then(std::vector<cmd> cmds, Fn_&& make_multi)
{
    auto valid = compact(std::move(cmds));

    if (valid.empty()) { return {}; }
    if (valid.size() == 1) { return std::move(valid.front()); }

    return make_multi(std::make_shared<std::vector<cmd> const>(std::move(valid)));
}

msg invoke_tick_fn(teakit::tick_fn const& fn)
{
    try {
        return fn(std::chrono::system_clock::now());
    } catch (...) {
        return teakit::make_error_msg(std::current_exception());
    }
}

cmd timer_cmd(std::function<std::chrono::nanoseconds()> delay_fn, teakit::tick_fn fn)
{
    return cmd::async(
            [delay_fn = std::move(delay_fn), fn = std::move(fn)](scheduler& s, completion_fn done) {
                auto timer = std::make_shared<asio::steady_timer>(s.loop(), delay_fn());
                timer->async_wait([timer, fn, done = std::move(done)](asio::error_code const& ec) {
                    if (ec == asio::error::operation_aborted) { return; }
                    done(invoke_tick_fn(fn));
                });
            });
}
}  // namespace

cmd teakit::batch(std::vector<cmd> cmds)
{
    return compact_then(std::move(cmds), [](auto valid) {
        return cmd::async([valid](scheduler& s, completion_fn done) {
            launch_join_all(
                    s, *valid,
                    [valid, done = std::move(done)](std::vector<msg> results) {
                        auto num_valid = ranges::count_if(results, [](msg const& m) { return bool(m); });
                        if (num_valid == 0) { return done({}); }

                        batch_msg batch;
                        batch.msgs = results
                                     | ranges::views::move
                                     | ranges::views::filter([](msg const& m) { return bool(m); })
                                     | ranges::to<std::vector>();

                        done(std::move(batch));
                    });
        });
    });
}

cmd teakit::sequence(std::vector<cmd> cmds)
{
    return compact_then(std::move(cmds), [](auto valid) {
        return cmd::async([valid](scheduler& s, completion_fn done) {
            std::make_shared<sequence_runner>(s, valid, std::move(done))->step();
        });
    });
}

cmd teakit::tick(std::chrono::nanoseconds duration, tick_fn fn)
{
    duration = std::max(duration, std::chrono::nanoseconds{0});
    return timer_cmd([duration] { return duration; }, std::move(fn));
}

cmd teakit::every(std::chrono::nanoseconds interval, tick_fn fn)
{
    interval = std::max(interval, std::chrono::nanoseconds{0});

    auto delay_fn = [interval]() -> std::chrono::nanoseconds {
        if (interval.count() == 0) { return interval; }

        auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch());
        auto remainder = now % interval;

        // next boundary, skipping one which is closer than a full interval
        return remainder.count() == 0 ? interval : 2 * interval - remainder;
    };

    return timer_cmd(std::move(delay_fn), std::move(fn));
}

cmd teakit::quit()
{
    static cmd const instance = cmd::async([](scheduler& s, completion_fn done) {
        s.post([done = std::move(done)] { done(quit_msg{}); });
    });

    return instance;
}

cmd teakit::suspend()
{
    return cmd::async([](scheduler& s, completion_fn done) {
        s.post([done = std::move(done)] { done(suspend_msg{}); });
    });
}

cmd teakit::println(std::string line)
{
    return cmd::async([line = std::move(line)](scheduler& s, completion_fn done) {
        s.post([line, done = std::move(done)] { done(print_line_msg{line}); });
    });
}

teakit::msg teakit::run_cmd(cmd const& c)
{
    if (not c) { return {}; }

    asio::io_context loop;
    auto work = asio::make_work_guard(loop);
    msg result;

    {
        scheduler sched{loop};
        c.launch(sched, [&](msg m) {
            result = std::move(m);
            work.reset();
            loop.stop();
        });

        loop.run();
    }

    return result;
}
