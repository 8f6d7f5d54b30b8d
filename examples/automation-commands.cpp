#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <doctest/doctest.h>

#include "teakit/detail/commands.hpp"

using namespace std::literals;
using teakit::cmd;
using teakit::msg;

namespace {
struct tick_msg {
    std::chrono::system_clock::time_point at;
};

cmd returns_nothing()
{
    return cmd([] { return msg{}; });
}

cmd throws_error(char const* what)
{
    return cmd([what]() -> msg { throw std::runtime_error(what); });
}
}  // namespace

TEST_SUITE_BEGIN("Commands");

TEST_CASE("Blocking Command Resolves To Its Value")
{
    auto result = teakit::run_cmd(cmd([] { return 42; }));
    REQUIRE(result.is<int>());
    CHECK(result.as<int>() == 42);

    CHECK(teakit::run_cmd(returns_nothing()).empty());
    CHECK(teakit::run_cmd(nullptr).empty());
}

TEST_CASE("Failing Command Resolves To Error Message")
{
    auto result = teakit::run_cmd(throws_error("boom"));
    REQUIRE(result.is<teakit::error_msg>());
    CHECK(result.as<teakit::error_msg>().what() == "boom");

    auto async_failure = cmd::async([](teakit::scheduler&, teakit::completion_fn) {
        throw std::logic_error("failed on launch");
    });

    result = teakit::run_cmd(async_failure);
    REQUIRE(result.is<teakit::error_msg>());
    CHECK(result.as<teakit::error_msg>().what() == "failed on launch");
}

TEST_CASE("Batch Shortcuts")
{
    CHECK(teakit::batch().empty());
    CHECK(teakit::batch(nullptr, nullptr).empty());
    CHECK(teakit::batch(std::vector<cmd>{}).empty());

    auto single = teakit::batch(nullptr, teakit::quit(), nullptr);
    REQUIRE(single);
    CHECK(teakit::run_cmd(single).is<teakit::quit_msg>());
}

TEST_CASE("Batch Collects Non-Empty Results")
{
    auto combined = teakit::batch(
            nullptr, teakit::quit(), nullptr, nullptr, teakit::quit(), nullptr);

    auto result = teakit::run_cmd(combined);
    REQUIRE(result.is<teakit::batch_msg>());

    auto& batch = result.as<teakit::batch_msg>();
    REQUIRE(batch.size() == 2);
    CHECK(batch.msgs[0].is<teakit::quit_msg>());
    CHECK(batch.msgs[1].is<teakit::quit_msg>());

    auto partly_empty = teakit::run_cmd(teakit::batch(returns_nothing(), cmd([] { return 1; })));
    REQUIRE(partly_empty.is<teakit::batch_msg>());
    CHECK(partly_empty.as<teakit::batch_msg>().size() == 1);

    CHECK(teakit::run_cmd(teakit::batch(returns_nothing(), returns_nothing())).empty());
}

TEST_CASE("Batch Keeps Submission Order")
{
    auto slow = cmd([] {
        std::this_thread::sleep_for(50ms);
        return std::string{"slow"};
    });

    auto fast = cmd([] { return std::string{"fast"}; });

    auto result = teakit::run_cmd(teakit::batch(slow, fast));
    REQUIRE(result.is<teakit::batch_msg>());

    auto& msgs = result.as<teakit::batch_msg>().msgs;
    REQUIRE(msgs.size() == 2);
    CHECK(msgs[0].as<std::string>() == "slow");
    CHECK(msgs[1].as<std::string>() == "fast");
}

TEST_CASE("Sequence Stops At First Result")
{
    CHECK(teakit::sequence().empty());
    CHECK(teakit::sequence(nullptr).empty());
    CHECK(teakit::run_cmd(teakit::sequentially(nullptr, teakit::quit())).is<teakit::quit_msg>());

    std::atomic_int num_started = 0;
    auto counted = [&](msg result) {
        return cmd([&num_started, result] {
            ++num_started;
            return result;
        });
    };

    auto result = teakit::run_cmd(teakit::sequence(counted({}), counted(1), counted(2)));
    REQUIRE(result.is<int>());
    CHECK(result.as<int>() == 1);
    CHECK(num_started.load() == 2);
}

TEST_CASE("Sequence Resolves To Error")
{
    std::atomic_bool last_started = false;
    auto last = cmd([&] {
        last_started = true;
        return msg{};
    });

    auto result = teakit::run_cmd(teakit::sequence(returns_nothing(), throws_error("second"), last));
    REQUIRE(result.is<teakit::error_msg>());
    CHECK(result.as<teakit::error_msg>().what() == "second");
    CHECK_FALSE(last_started.load());

    CHECK(teakit::run_cmd(teakit::sequence(returns_nothing(), returns_nothing())).empty());
}

TEST_CASE("Sequence Runs One After Another")
{
    std::atomic_int running = 0;
    std::atomic_bool overlapped = false;

    auto step = [&] {
        return cmd([&] {
            if (++running > 1) { overlapped = true; }
            std::this_thread::sleep_for(10ms);
            --running;
            return msg{};
        });
    };

    CHECK(teakit::run_cmd(teakit::sequence(step(), step(), step())).empty());
    CHECK_FALSE(overlapped.load());
}

TEST_CASE("Tick Waits For Duration")
{
    auto begin = std::chrono::steady_clock::now();
    auto result = teakit::run_cmd(teakit::tick(50ms, [](auto at) { return tick_msg{at}; }));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    CHECK(result.is<tick_msg>());
    CHECK(elapsed >= 50ms);
}

TEST_CASE("Every Waits At Least An Interval")
{
    auto begin = std::chrono::steady_clock::now();
    auto result = teakit::run_cmd(teakit::every(50ms, [](auto at) { return tick_msg{at}; }));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    CHECK(result.is<tick_msg>());
    CHECK(elapsed >= 50ms);
}

TEST_CASE("Tick Callback Failure")
{
    auto result = teakit::run_cmd(teakit::tick(1ms, [](auto) -> msg { throw std::runtime_error("tick"); }));
    REQUIRE(result.is<teakit::error_msg>());
    CHECK(result.as<teakit::error_msg>().what() == "tick");
}

TEST_CASE("Println Resolves To Print Line")
{
    auto result = teakit::run_cmd(teakit::println("hello"));
    REQUIRE(result.is<teakit::print_line_msg>());
    CHECK(result.as<teakit::print_line_msg>().line == "hello");
}

TEST_SUITE_END();
