#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

#include <unistd.h>

#include "teakit/detail/input_reader.hpp"
#include "teakit/detail/posix_terminal.hpp"

using namespace std::literals;
using teakit::input_reader;
using teakit::pipe_stream;

namespace {
/** Reads every chunk until the reader finishes, or fails. */
std::vector<std::string> drain(input_reader& reader)
{
    std::vector<std::string> chunks;
    while (auto chunk = reader.read()) { chunks.push_back(*chunk); }
    return chunks;
}

template <typename Fn_>
bool wait_until(Fn_&& fn, std::chrono::milliseconds timeout = 1s)
{
    auto until = std::chrono::steady_clock::now() + timeout;
    while (not fn()) {
        if (std::chrono::steady_clock::now() > until) { return false; }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}
}  // namespace

TEST_SUITE_BEGIN("Input Reader");

TEST_CASE("Yields Chunks Until Stream Ends")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    auto consumer = std::async(std::launch::async, [&] { return drain(reader); });

    stream->write("hello ");
    stream->write("world");
    stream->end("!");

    CHECK(consumer.get() == std::vector<std::string>{"hello ", "world", "!"});
    CHECK(reader.status() == input_reader::state::closed);
    CHECK_FALSE(reader.cancel());
}

TEST_CASE("Chunks Written Before Reader Was Created")
{
    auto stream = std::make_shared<pipe_stream>();
    stream->write("early");
    stream->end();

    input_reader reader{stream};
    CHECK(drain(reader) == std::vector<std::string>{"early"});
}

TEST_CASE("Cancel Succeeds Exactly Once")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    auto pending = reader.next();
    CHECK(pending.wait_for(0s) == std::future_status::timeout);

    CHECK(reader.cancel());
    CHECK_THROWS_AS(pending.get(), teakit::input_reader_canceled_error);

    CHECK_FALSE(reader.cancel());
    CHECK(reader.status() == input_reader::state::canceled);

    // every later request fails the same way
    CHECK_THROWS_AS(reader.read(), teakit::input_reader_canceled_error);
}

TEST_CASE("Cancel Beats Buffered Data")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    stream->write("buffered");
    CHECK(reader.cancel());
    CHECK_THROWS_AS(reader.read(), teakit::input_reader_canceled_error);
}

TEST_CASE("Stops Delivering Once Canceled")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    std::vector<std::string> received;
    std::atomic_size_t num_received = 0;

    auto consumer = std::async(std::launch::async, [&] {
        try {
            while (auto chunk = reader.read()) {
                received.push_back(*chunk);
                ++num_received;
            }
        } catch (teakit::input_reader_canceled_error&) {
            return true;
        }
        return false;
    });

    stream->write("a");
    REQUIRE(wait_until([&] { return num_received.load() == 1; }));

    reader.cancel();
    stream->write("b");
    stream->end("c");

    CHECK(consumer.get());
    CHECK(received == std::vector<std::string>{"a"});
}

TEST_CASE("Close Drains Buffered Chunks")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    stream->write("first chunk");
    reader.close();
    stream->write("ignored");

    CHECK(drain(reader) == std::vector<std::string>{"first chunk"});
    CHECK_FALSE(reader.cancel());
    CHECK(reader.status() == input_reader::state::closed);

    // closing twice, or after cancel, is harmless
    reader.close();
}

TEST_CASE("Close Never Undoes Cancel")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    CHECK(reader.cancel());
    reader.close();

    CHECK(reader.status() == input_reader::state::canceled);
    CHECK_THROWS_AS(reader.read(), teakit::input_reader_canceled_error);
}

TEST_CASE("Close Ends Pending Read")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    auto pending = reader.next();
    reader.close();

    CHECK_FALSE(pending.get().has_value());
}

TEST_CASE("Propagates Identical Stream Error")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    auto pending = reader.next();
    auto failure = std::make_exception_ptr(std::runtime_error("boom"));

    std::runtime_error const* original = nullptr;
    try {
        std::rethrow_exception(failure);
    } catch (std::runtime_error& e) {
        original = &e;
    }

    stream->destroy(failure);

    auto same_object = [&](std::future<std::optional<std::string>> fut) {
        try {
            fut.get();
        } catch (std::runtime_error& e) {
            return &e == original;
        }
        return false;
    };

    CHECK(same_object(std::move(pending)));
    CHECK(reader.status() == input_reader::state::errored);

    // subsequent requests fail with the same error, and cancel has nothing to do
    CHECK(same_object(reader.next()));
    CHECK_FALSE(reader.cancel());
}

TEST_CASE("Stream Error Written Before Reader Was Created")
{
    auto stream = std::make_shared<pipe_stream>();
    stream->write("partial");
    stream->destroy(std::make_exception_ptr(std::runtime_error("unplugged")));
    CHECK(stream->finished());

    // later events are ignored once the stream finished
    stream->write("ignored");
    stream->end();

    input_reader reader{stream};
    CHECK(reader.status() == input_reader::state::errored);
    CHECK_THROWS_WITH_AS(reader.read(), "unplugged", std::runtime_error);
}

TEST_CASE("Writer Racing Cancel Never Delivers Late Chunks")
{
    for (int iteration = 0; iteration < 200; ++iteration) {
        auto stream = std::make_shared<pipe_stream>();
        input_reader reader{stream};

        std::thread writer{[&] {
            for (int i = 0; i < 16; ++i) { stream->write("x"); }
        }};

        bool canceled = reader.cancel();
        writer.join();
        stream->end("late");

        REQUIRE(canceled);
        CHECK(reader.status() == input_reader::state::canceled);
        CHECK_THROWS_AS(reader.read(), teakit::input_reader_canceled_error);
    }
}

TEST_CASE("Only One Pending Request")
{
    auto stream = std::make_shared<pipe_stream>();
    input_reader reader{stream};

    auto first = reader.next();
    CHECK_THROWS_AS(reader.next().get(), teakit::input_reader_busy_error);

    stream->write("data");
    CHECK(first.get() == "data"s);
}

TEST_CASE("Null Stream Is Rejected")
{
    CHECK_THROWS_AS(input_reader{nullptr}, std::invalid_argument);
}

TEST_CASE("Descriptor Stream Delivers Data Then End")
{
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    auto stream = std::make_shared<teakit::fd_stream>(fds[0], true);
    input_reader reader{stream};

    auto consumer = std::async(std::launch::async, [&] {
        std::string all;
        while (auto chunk = reader.read()) { all += *chunk; }
        return all;
    });

    std::string_view text = "typed keys";
    REQUIRE(::write(fds[1], text.data(), text.size()) == ssize_t(text.size()));
    ::close(fds[1]);

    CHECK(consumer.get() == text);
    CHECK(reader.status() == input_reader::state::closed);
}

TEST_SUITE_END();
