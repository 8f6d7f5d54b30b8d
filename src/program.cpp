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

#include "teakit/program.h"

#include <atomic>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "teakit/detail/base.hpp"
#include "teakit/detail/input_decoder.hpp"
#include "teakit/detail/input_reader.hpp"
#include "teakit/detail/logging.hpp"
#include "teakit/detail/renderer.hpp"
#include "teakit/terminal.h"

namespace {
std::string describe(std::exception_ptr const& ep)
{
    try {
        std::rethrow_exception(ep);
    } catch (std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}
}  // namespace

char const* teakit::to_string(program_state state) noexcept
{
    switch (state) {
        case program_state::initializing: return "initializing";
        case program_state::running: return "running";
        case program_state::quitting: return "quitting";
        case program_state::stopped: return "stopped";
    }
    return "unknown";
}

namespace teakit {
struct program::impl {
    model_ptr model;
    program_options opts;
    std::atomic<program_state> state{program_state::initializing};

    // declared before scheduler; blocking work still running on destruction must not
    // reach the loop anymore.
    asio::io_context loop;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;

    std::unique_ptr<scheduler> sched;
    std::shared_ptr<if_input_stream> input;
    std::unique_ptr<input_reader> reader;
    std::thread pump;

    terminal_backend_ptr backend;
    std::shared_ptr<if_renderer> renderer;
    std::shared_ptr<if_input_decoder> decoder;

    std::optional<terminal_mode_guard> mode_guard;
    watch_handle resize_watch;
    watch_handle signal_watch;
    bool device_opened = false;
    bool renderer_started = false;

    std::exception_ptr error;
    bool rethrow_panic = false;
    std::vector<std::string> teardown_failures;

   public:
    void setup()
    {
        auto& settings = opts.settings;
        apply_environment(&settings);

        if (not settings.log_file.empty()) { log_to_file(settings.log_file, "[teakit]"); }
        set_log_level(settings.log_level);

        backend = opts.backend ? opts.backend : create_default_terminal_backend();
        decoder = opts.decoder ? opts.decoder : std::make_shared<basic_input_decoder>();

        if (opts.renderer) {
            renderer = opts.renderer;
        } else if (settings.without_renderer) {
            renderer = std::make_shared<nil_renderer>();
        } else {
            renderer_settings rs;
            rs.alt_screen = settings.alt_screen;
            rs.bracketed_paste = settings.bracketed_paste;
            rs.report_focus = settings.report_focus;

            auto output = opts.output ? opts.output : &std::cout;
            renderer = std::make_shared<standard_renderer>(*output, rs);
        }

        if (opts.input) {
            input = opts.input;
        } else {
            input = backend->open_input_device();
            device_opened = true;
        }

        mode_guard.emplace(*backend, *input);
        reader = std::make_unique<input_reader>(input);
        sched = std::make_unique<scheduler>(loop);

        renderer->start();
        renderer_started = true;

        resize_watch = backend->watch_resize(loop, [this](window_size size) { dispatch(size); });
        if (auto size = backend->query_size()) {
            asio::post(loop, [this, size = *size] { dispatch(size); });
        }

        if (settings.handle_signals) {
            signal_watch = backend->watch_signals(loop, [this](os_signal sig) { on_signal(sig); });
        }

        pump = std::thread{[this] { pump_input(); }};
        glog()->debug("program set up");
    }

    void start_running()
    {
        state = program_state::running;
        glog()->debug("program running");

        cmd initial;
        if (not call_model([&] { initial = model->init(); })) { return; }

        launch(std::move(initial));
        render();
    }

    void pump_input()
    {
        auto emit = [this](msg message) {
            asio::post(loop, [this, message = std::move(message)]() mutable {
                dispatch(std::move(message));
            });
        };

        try {
            for (;;) {
                auto chunk = reader->next().get();

                if (not chunk) {
                    decoder->flush(emit);
                    glog()->debug("end of input");
                    return;
                }

                decoder->feed(*chunk, false, emit);
            }
        } catch (input_reader_canceled_error&) {
            return;
        } catch (...) {
            auto error = std::current_exception();
            glog()->debug("input failed: {}", describe(error));
            asio::post(loop, [this, error] { finish(error, false); });
        }
    }

    void dispatch(msg message)
    {
        if (state != program_state::running) { return; }

        if (opts.filter) {
            if (not call_model([&] { message = opts.filter(model, std::move(message)); })) { return; }
            if (not message) { return; }
        }

        if (auto batch = message.get_if<batch_msg>()) {
            auto msgs = std::move(batch->msgs);
            for (auto& each : msgs) {
                if (each) { dispatch(std::move(each)); }
            }
            return;
        }

        if (message.is<quit_msg>()) {
            finish(nullptr, false);
            return;
        }

        if (message.is<suspend_msg>()) {
            suspend();
            return;
        }

        if (auto line = message.get_if<print_line_msg>()) {
            renderer->print_line(line->line);
            render();
            return;
        }

        if (auto size = message.get_if<window_size_msg>()) {
            renderer->resize(*size);
        }

        update_result result;
        if (not call_model([&] { result = model->update(message); })) { return; }

        if (result.model) { model = std::move(result.model); }
        launch(std::move(result.command));
        render();
    }

    /**
     * Hands the terminal back, and stops the process until it is continued. Runs on the
     * loop, so nothing is dispatched while the process is stopped.
     */
    void suspend()
    {
        glog()->debug("suspending");

        try {
            if (renderer_started) {
                renderer_started = false;
                renderer->stop();
            }

            if (mode_guard) {
                mode_guard->release();
                mode_guard.reset();
            }

            backend->suspend_process();

            mode_guard.emplace(*backend, *input);
            renderer->start();
            renderer_started = true;
        } catch (std::exception& e) {
            glog()->error("suspend failed: {}", e.what());
            finish(std::current_exception(), true);
            return;
        }

        glog()->debug("resumed");
        dispatch(resume_msg{});

        // terminal may have been resized meanwhile
        if (auto size = backend->query_size()) { dispatch(*size); }
    }

    void launch(cmd command)
    {
        if (not command || not sched) { return; }

        command.launch(*sched, [this](msg result) {
            if (result) { dispatch(std::move(result)); }
        });
    }

    void render()
    {
        if (state != program_state::running) { return; }

        std::string view;
        if (not call_model([&] { view = model->view(); })) { return; }

        try {
            renderer->write(view);
        } catch (std::exception& e) {
            glog()->error("rendering failed: {}", e.what());
            finish(std::current_exception(), true);
        }
    }

    template <typename Fn_>
    bool call_model(Fn_&& fn)
    {
        try {
            fn();
            return true;
        } catch (...) {
            on_panic(std::current_exception());
            return false;
        }
    }

    void on_panic(std::exception_ptr ep)
    {
        glog()->error("model panicked: {}", describe(ep));

        if (not opts.settings.catch_panics) {
            rethrow_panic = true;
            finish(ep, true);
            return;
        }

        std::exception_ptr wrapped;
        try {
            std::rethrow_exception(ep);
        } catch (...) {
            try {
                std::throw_with_nested(program_panic_error("program panicked: " + describe(ep)));
            } catch (...) {
                wrapped = std::current_exception();
            }
        }

        finish(wrapped, true);
    }

    void on_signal(os_signal sig)
    {
        glog()->debug("received {} signal", to_string(sig));

        switch (sig) {
            case os_signal::interrupt:
                finish(std::make_exception_ptr(program_interrupted_error{}), false);
                break;

            case os_signal::suspend:
                dispatch(suspend_msg{});
                break;

            case os_signal::terminate:
                dispatch(quit_msg{});
                break;
        }
    }

    void finish(std::exception_ptr err, bool killed)
    {
        auto current = state.load();
        if (current == program_state::quitting || current == program_state::stopped) { return; }
        state = program_state::quitting;

        glog()->debug("program quitting{}", err ? ": " + describe(err) : std::string{});
        error = std::move(err);

        teardown(killed);
        report_teardown_failures();

        state = program_state::stopped;
        work.reset();
        loop.stop();
    }

    template <typename Fn_>
    void try_teardown(char const* step, Fn_&& fn)
    {
        try {
            fn();
        } catch (std::exception& e) {
            glog()->warn("teardown step '{}' failed: {}", step, e.what());
            teardown_failures.push_back(fmt::format("teardown step '{}' failed: {}", step, e.what()));
        }
    }

    /**
     * Library log is discarded unless redirected, so failures to give the terminal back
     * are written to stderr, which is usable again at this point.
     */
    void report_teardown_failures()
    {
        auto failures = std::move(teardown_failures);
        teardown_failures.clear();

        if (not opts.settings.log_file.empty()) { return; }
        for (auto& failure : failures) { stderr_log()->warn("{}", failure); }
    }

    void teardown(bool killed)
    {
        if (reader) { reader->cancel(); }
        if (pump.joinable()) { pump.join(); }
        if (sched) { sched->stop_accepting(); }

        resize_watch.cancel();
        signal_watch.cancel();

        if (renderer_started) {
            renderer_started = false;
            try_teardown("stop renderer", [&] { killed ? renderer->kill() : renderer->stop(); });
        }

        if (mode_guard) {
            try_teardown("restore modes", [&] { mode_guard->release(); });
            mode_guard.reset();
        }

        if (device_opened) {
            device_opened = false;
            try_teardown("close device", [&] { backend->close_device(); });
        }

        glog()->debug("program torn down");
    }
};
}  // namespace teakit

teakit::program::program(model_ptr model, program_options options)
        : _self(std::make_unique<impl>())
{
    if (not model) { throw std::invalid_argument("model is required"); }

    _self->model = std::move(model);
    _self->opts = std::move(options);
}

teakit::program::~program()
{
    if (_self->pump.joinable()) {
        if (_self->reader) { _self->reader->cancel(); }
        _self->pump.join();
    }
}

auto teakit::program::run() -> run_result
{
    auto& self = *_self;
    if (self.state != program_state::initializing || self.work) {
        throw std::logic_error("program can run only once");
    }

    self.work.emplace(asio::make_work_guard(self.loop));

    try {
        self.setup();
    } catch (...) {
        auto error = std::current_exception();
        glog()->debug("program setup failed: {}", describe(error));
        self.finish(error, true);
        return {self.model, self.error};
    }

    self.start_running();
    self.loop.run();

    if (self.rethrow_panic) { std::rethrow_exception(self.error); }
    return {self.model, self.error};
}

void teakit::program::quit()
{
    asio::post(_self->loop, [self = _self.get()] { self->dispatch(quit_msg{}); });
}

void teakit::program::send(msg message)
{
    auto state = _self->state.load();
    if (state == program_state::quitting || state == program_state::stopped) { return; }
    if (not message) { return; }

    asio::post(_self->loop, [self = _self.get(), message = std::move(message)]() mutable {
        self->dispatch(std::move(message));
    });
}

void teakit::program::kill()
{
    asio::post(_self->loop, [self = _self.get()] {
        self->finish(std::make_exception_ptr(program_killed_error{}), true);
    });
}

auto teakit::program::state() const noexcept -> program_state
{
    return _self->state.load();
}
