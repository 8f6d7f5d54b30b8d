#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "teakit/teakit.h"

using namespace std::literals;
using teakit::cmd;
using teakit::headless_terminal_backend;
using teakit::msg;
using teakit::window_size;

namespace {
/**
 * Model which records every message, and reacts as the test case scripts it.
 */
struct test_model : teakit::if_model {
    std::vector<msg> received;
    std::function<cmd()> on_init;
    std::function<cmd(test_model&, msg const&)> on_update;
    std::string view_text = "test model view";
    int num_views = 0;

    cmd init() override { return on_init ? on_init() : nullptr; }

    teakit::update_result update(msg const& message) override
    {
        received.push_back(message);
        return {nullptr, on_update ? on_update(*this, message) : nullptr};
    }

    std::string view() override
    {
        ++num_views;
        return view_text;
    }

    template <typename Ty_>
    std::vector<Ty_> received_of() const
    {
        std::vector<Ty_> result;
        for (auto& m : received) {
            if (auto p = m.get_if<Ty_>()) { result.push_back(*p); }
        }
        return result;
    }
};

bool is_key(msg const& m, std::string_view name)
{
    auto key = m.get_if<teakit::key_msg>();
    return key && key->to_string() == name;
}

/** Holds everything a program needs to run headless. */
struct fixture {
    std::shared_ptr<test_model> model = std::make_shared<test_model>();
    std::shared_ptr<headless_terminal_backend> backend;
    std::ostringstream output;
    teakit::program_options opts;

    explicit fixture(std::shared_ptr<headless_terminal_backend> custom_backend = nullptr)
            : backend(custom_backend
                              ? std::move(custom_backend)
                              : std::make_shared<headless_terminal_backend>(window_size{80, 24}))
    {
        opts.backend = backend;
        opts.output = &output;
    }
};

void wait_until_started(teakit::program& app)
{
    while (app.state() == teakit::program_state::initializing) {
        std::this_thread::sleep_for(1ms);
    }
}

template <typename Error_>
bool holds(std::exception_ptr const& ep)
{
    try {
        std::rethrow_exception(ep);
    } catch (Error_&) {
        return true;
    } catch (std::exception&) {
        return false;
    }
}

struct model_failure : std::runtime_error {
    using std::runtime_error::runtime_error;
};
}  // namespace

TEST_SUITE_BEGIN("Program");

TEST_CASE("Quit From Init")
{
    fixture f;
    f.model->on_init = [] { return teakit::quit(); };

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();

    CHECK(result);
    CHECK(result.model == f.model);
    CHECK(app.state() == teakit::program_state::stopped);
    CHECK(f.model->received_of<teakit::quit_msg>().empty());

    CHECK(f.output.str().find("test model view") != std::string::npos);
    CHECK(f.model->num_views >= 1);
}

TEST_CASE("Key Press Quits")
{
    fixture f;
    f.backend->console_input()->write("q");
    f.model->on_update = [](test_model&, msg const& m) {
        return is_key(m, "q") ? teakit::quit() : nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();

    CHECK(result);
    REQUIRE_FALSE(f.model->received_of<teakit::key_msg>().empty());
    CHECK(f.model->received_of<teakit::key_msg>().back().to_string() == "q");
}

TEST_CASE("Terminal Is Set Up And Restored Once")
{
    fixture f;
    auto backend = f.backend;

    f.model->on_update = [backend](test_model&, msg const& m) -> cmd {
        auto size = m.get_if<window_size>();
        if (not size) { return nullptr; }

        if (size->width == 80) {
            backend->notify_resize({100, 40});
            return nullptr;
        }

        return teakit::quit();
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    auto sizes = f.model->received_of<window_size>();
    REQUIRE(sizes.size() == 2);
    CHECK(sizes[0].width == 80);
    CHECK(sizes[0].height == 24);
    CHECK(sizes[1].width == 100);
    CHECK(sizes[1].height == 40);

    CHECK(backend->num_enable_modes() == 1);
    CHECK(backend->num_restore_modes() == 1);
    CHECK(backend->num_resize_watches_opened() == 1);
    CHECK(backend->num_resize_watches_active() == 0);
    CHECK(backend->num_signal_watches_active() == 0);
    CHECK(backend->device_closed());
}

TEST_CASE("Setup Failure Is Returned")
{
    struct no_terminal_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct failing_backend : headless_terminal_backend {
        void enable_modes(teakit::if_input_stream&) override
        {
            throw no_terminal_error("not a terminal");
        }
    };

    auto backend = std::make_shared<failing_backend>();
    fixture f{backend};

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();

    REQUIRE_FALSE(result);
    CHECK(holds<no_terminal_error>(result.err));
    CHECK(f.model->received.empty());
    CHECK(f.model->num_views == 0);

    // device was opened before failure, so it's released
    CHECK(backend->device_closed());
    CHECK(backend->num_restore_modes() == 0);
}

TEST_CASE("Teardown Failure Does Not Hide Graceful Quit")
{
    struct flaky_backend : headless_terminal_backend {
        using headless_terminal_backend::headless_terminal_backend;
        void restore_modes() override { throw std::runtime_error("restore failed"); }
    };

    auto backend = std::make_shared<flaky_backend>(window_size{80, 24});
    fixture f{backend};
    f.model->on_init = [] { return teakit::quit(); };

    std::ostringstream reported;
    spdlog::drop("TEAKIT.stderr");
    spdlog::register_logger(std::make_shared<spdlog::logger>(
            "TEAKIT.stderr", std::make_shared<spdlog::sinks::ostream_sink_mt>(reported)));

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();
    spdlog::drop("TEAKIT.stderr");

    CHECK(result);
    CHECK(backend->device_closed());

    // library log is silent, so the failure is reported once terminal is given back
    CHECK(reported.str().find("restore modes") != std::string::npos);
    CHECK(reported.str().find("restore failed") != std::string::npos);
}

TEST_CASE("Suspend Releases Terminal Until Resumed")
{
    struct recording_backend : headless_terminal_backend {
        using headless_terminal_backend::headless_terminal_backend;

        size_t enabled_while_stopped = 0;
        size_t restored_while_stopped = 0;

        void suspend_process() override
        {
            enabled_while_stopped = num_enable_modes();
            restored_while_stopped = num_restore_modes();
            headless_terminal_backend::suspend_process();
        }
    };

    auto backend = std::make_shared<recording_backend>(window_size{80, 24});
    fixture f{backend};

    size_t enabled_on_resume = 0;
    size_t restored_on_resume = 0;

    f.model->on_update = [&](test_model& self, msg const& m) -> cmd {
        if (m.is<teakit::resume_msg>()) {
            enabled_on_resume = backend->num_enable_modes();
            restored_on_resume = backend->num_restore_modes();
            return teakit::quit();
        }

        bool resumed = not self.received_of<teakit::resume_msg>().empty();
        if (m.is<window_size>() && not resumed) { return teakit::suspend(); }
        return nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    CHECK(backend->num_suspends() == 1);
    CHECK(backend->enabled_while_stopped == 1);
    CHECK(backend->restored_while_stopped == 1);
    CHECK(enabled_on_resume == 2);
    CHECK(restored_on_resume == 1);
    CHECK(backend->num_enable_modes() == 2);
    CHECK(backend->num_restore_modes() == 2);

    CHECK(f.model->received_of<teakit::suspend_msg>().empty());
    CHECK(f.model->received_of<teakit::resume_msg>().size() == 1);

    // size is reported again after resume, and the unchanged view is drawn again
    CHECK(f.model->received_of<window_size>().size() == 2);

    auto out = f.output.str();
    auto first = out.find("test model view");
    REQUIRE(first != std::string::npos);
    CHECK(out.find("test model view", first + 1) != std::string::npos);
}

TEST_CASE("Suspend Signal Suspends Program")
{
    fixture f;
    auto backend = f.backend;

    f.model->on_update = [backend](test_model& self, msg const& m) -> cmd {
        if (m.is<teakit::resume_msg>()) { return teakit::quit(); }

        bool resumed = not self.received_of<teakit::resume_msg>().empty();
        if (m.is<window_size>() && not resumed) { backend->notify_signal(teakit::os_signal::suspend); }
        return nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    CHECK(backend->num_suspends() == 1);
    CHECK(backend->num_restore_modes() == 2);
}

TEST_CASE("Filter Can Veto Suspend")
{
    fixture f;
    f.model->on_init = [] { return teakit::sequence(teakit::suspend(), teakit::quit()); };
    f.opts.filter = [](teakit::model_ptr const&, msg m) -> msg {
        if (m.is<teakit::suspend_msg>()) { return "vetoed"s; }
        return m;
    };
    f.model->on_update = [](test_model&, msg const& m) {
        return m.is<std::string>() ? teakit::quit() : nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    CHECK(f.backend->num_suspends() == 0);
    CHECK(f.model->received_of<std::string>().size() == 1);
}

TEST_CASE("Interrupt Signal Stops Program")
{
    fixture f;
    auto backend = f.backend;
    f.model->on_update = [backend](test_model&, msg const& m) -> cmd {
        if (m.is<window_size>()) { backend->notify_signal(teakit::os_signal::interrupt); }
        return nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();

    REQUIRE_FALSE(result);
    CHECK(holds<teakit::program_interrupted_error>(result.err));
    CHECK(backend->num_restore_modes() == 1);
}

TEST_CASE("Terminate Signal Quits Gracefully")
{
    fixture f;
    auto backend = f.backend;
    f.model->on_update = [backend](test_model&, msg const& m) -> cmd {
        if (m.is<window_size>()) { backend->notify_signal(teakit::os_signal::terminate); }
        return nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
}

TEST_CASE("Signals Are Ignored When Not Handled")
{
    fixture f;
    f.opts.settings.handle_signals = false;

    auto backend = f.backend;
    f.model->on_update = [backend](test_model&, msg const& m) -> cmd {
        if (m.is<window_size>()) {
            backend->notify_signal(teakit::os_signal::interrupt);
            return teakit::tick(20ms, [](auto) { return "still running"s; });
        }

        return m.is<std::string>() ? teakit::quit() : nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
    CHECK(backend->num_signal_watches_active() == 0);
    CHECK(f.model->received_of<std::string>().size() == 1);
}

TEST_CASE("Model Panic Is Caught")
{
    fixture f;
    f.model->on_update = [](test_model&, msg const& m) -> cmd {
        if (m.is<window_size>()) { throw model_failure("model broke"); }
        return nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();

    REQUIRE_FALSE(result);
    CHECK(f.backend->num_restore_modes() == 1);

    try {
        std::rethrow_exception(result.err);
    } catch (teakit::program_panic_error& e) {
        CHECK_THROWS_WITH_AS(std::rethrow_if_nested(e), "model broke", model_failure);
    }
}

TEST_CASE("Model Panic Is Rethrown When Not Caught")
{
    fixture f;
    f.opts.settings.catch_panics = false;
    f.model->on_init = []() -> cmd { throw model_failure("init broke"); };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK_THROWS_AS(app.run(), model_failure);

    // terminal was restored before rethrowing
    CHECK(f.backend->num_restore_modes() == 1);
    CHECK(app.state() == teakit::program_state::stopped);
}

TEST_CASE("Messages Sent From Other Thread")
{
    fixture f;
    f.model->on_update = [](test_model&, msg const& m) {
        return m.is<std::string>() ? teakit::quit() : nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    std::thread sender{[&] {
        wait_until_started(app);
        app.send("from outside"s);
    }};

    auto result = app.run();
    sender.join();

    CHECK(result);
    REQUIRE(f.model->received_of<std::string>().size() == 1);
    CHECK(f.model->received_of<std::string>()[0] == "from outside");

    // ignored once stopped
    app.send("too late"s);
    CHECK(f.model->received_of<std::string>().size() == 1);
}

TEST_CASE("Quit From Other Thread")
{
    fixture f;
    teakit::program app{f.model, std::move(f.opts)};

    std::thread quitter{[&] {
        wait_until_started(app);
        app.quit();
    }};

    auto result = app.run();
    quitter.join();

    CHECK(result);
}

TEST_CASE("Filter Drops And Transforms Messages")
{
    fixture f;
    f.backend->console_input()->write("x");
    f.backend->console_input()->write("q");

    f.opts.filter = [](teakit::model_ptr const&, msg m) -> msg {
        if (is_key(m, "x")) { return {}; }
        if (is_key(m, "q")) { return teakit::quit_msg{}; }
        return m;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
    CHECK(f.model->received_of<teakit::key_msg>().empty());
}

TEST_CASE("Filter Applies To Command Results")
{
    fixture f;
    f.model->on_init = [] { return cmd([] { return 7; }); };
    f.model->on_update = [](test_model&, msg const& m) {
        return m.is<std::string>() ? teakit::quit() : nullptr;
    };

    f.opts.filter = [](teakit::model_ptr const&, msg m) -> msg {
        if (auto value = m.get_if<int>()) { return std::to_string(*value); }
        return m;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
    CHECK(f.model->received_of<int>().empty());
    REQUIRE(f.model->received_of<std::string>().size() == 1);
    CHECK(f.model->received_of<std::string>()[0] == "7");
}

TEST_CASE("Kill Stops Program")
{
    fixture f;
    teakit::program app{f.model, std::move(f.opts)};

    f.model->on_update = [&app](test_model&, msg const& m) -> cmd {
        if (m.is<window_size>()) { app.kill(); }
        return nullptr;
    };

    auto result = app.run();
    REQUIRE_FALSE(result);
    CHECK(holds<teakit::program_killed_error>(result.err));
    CHECK(f.backend->num_restore_modes() == 1);
}

TEST_CASE("Input Stream Failure Stops Program")
{
    fixture f;
    auto input = std::make_shared<teakit::pipe_stream>();
    input->destroy(std::make_exception_ptr(std::runtime_error("device gone")));
    f.opts.input = input;

    teakit::program app{f.model, std::move(f.opts)};
    auto result = app.run();

    REQUIRE_FALSE(result);
    CHECK(teakit::error_msg{result.err}.what() == "device gone");

    // custom input is not the backend's device
    CHECK_FALSE(f.backend->device_closed());
    CHECK(f.backend->num_restore_modes() == 1);
}

TEST_CASE("End Of Input Keeps Program Running")
{
    fixture f;
    f.backend->console_input()->end("a");

    f.model->on_update = [](test_model&, msg const& m) -> cmd {
        if (is_key(m, "a")) { return teakit::tick(30ms, [](auto) { return "timer"s; }); }
        if (m.is<std::string>()) { return teakit::quit(); }
        return nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
    CHECK(f.model->received_of<std::string>().size() == 1);
}

TEST_CASE("Batch Results Are Delivered One By One")
{
    fixture f;
    f.model->on_init = [] {
        return teakit::batch(
                cmd([] {
                    std::this_thread::sleep_for(20ms);
                    return 1;
                }),
                cmd([] { return 2; }));
    };

    f.model->on_update = [](test_model& self, msg const&) -> cmd {
        return self.received_of<int>().size() == 2 ? teakit::quit() : nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    CHECK(f.model->received_of<teakit::batch_msg>().empty());
    CHECK(f.model->received_of<int>() == std::vector<int>{1, 2});
}

TEST_CASE("Printed Lines Reach Output")
{
    fixture f;
    f.model->on_init = [] { return teakit::batch(teakit::println("above the view"), teakit::quit()); };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    auto out = f.output.str();
    CHECK(out.find("above the view") != std::string::npos);
    CHECK(f.model->received_of<teakit::print_line_msg>().empty());
}

TEST_CASE("Command Failure Reaches Model")
{
    fixture f;
    f.model->on_init = [] { return cmd([]() -> msg { throw std::runtime_error("cmd failed"); }); };
    f.model->on_update = [](test_model&, msg const& m) {
        return m.is<teakit::error_msg>() ? teakit::quit() : nullptr;
    };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());

    auto errors = f.model->received_of<teakit::error_msg>();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].what() == "cmd failed");
}

TEST_CASE("Model Can Be Replaced By Update")
{
    struct forwarding_model : teakit::if_model {
        teakit::model_ptr next;

        cmd init() override { return nullptr; }
        std::string view() override { return "original view"; }

        teakit::update_result update(msg const&) override
        {
            return {next, cmd([] { return "next"s; })};
        }
    };

    auto replacement = std::make_shared<test_model>();
    replacement->view_text = "replacement view";
    replacement->on_update = [](test_model&, msg const&) { return teakit::quit(); };

    auto first = std::make_shared<forwarding_model>();
    first->next = replacement;

    fixture f;
    teakit::program app{first, std::move(f.opts)};
    auto result = app.run();

    CHECK(result);
    CHECK(result.model == replacement);
    CHECK(replacement->received_of<std::string>().size() == 1);

    auto out = f.output.str();
    CHECK(out.find("original view") < out.find("replacement view"));
}

TEST_CASE("Destruction Does Not Wait For Blocking Command")
{
    fixture f;
    std::promise<void> release;
    auto released = release.get_future().share();
    auto started = std::make_shared<std::atomic_bool>(false);
    auto finished = std::make_shared<std::atomic_bool>(false);

    f.model->on_init = [=] {
        return cmd([=] {
            started->store(true);
            released.wait_for(5s);
            finished->store(true);
            return 1;
        });
    };

    auto app = std::make_unique<teakit::program>(f.model, std::move(f.opts));
    auto running = std::async(std::launch::async, [&] { return app->run(); });

    while (not started->load()) { std::this_thread::sleep_for(1ms); }
    app->quit();
    CHECK(running.get());

    auto begin = std::chrono::steady_clock::now();
    app.reset();
    CHECK(std::chrono::steady_clock::now() - begin < 1s);

    // the command completes later, and its result goes nowhere
    release.set_value();
    while (not finished->load()) { std::this_thread::sleep_for(1ms); }
    CHECK(f.model->received_of<int>().empty());
}

TEST_CASE("Program Runs Only Once")
{
    fixture f;
    f.model->on_init = [] { return teakit::quit(); };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
    CHECK_THROWS_AS(app.run(), std::logic_error);

    CHECK_THROWS_AS(teakit::program(nullptr), std::invalid_argument);
}

TEST_CASE("Runs Without Renderer")
{
    fixture f;
    f.opts.settings.without_renderer = true;
    f.model->on_init = [] { return teakit::quit(); };

    teakit::program app{f.model, std::move(f.opts)};
    CHECK(app.run());
    CHECK(f.output.str().empty());
}

TEST_SUITE_END();
