#include <sstream>
#include <string>

#include <doctest/doctest.h>

#include "teakit/detail/renderer.hpp"

using teakit::renderer_settings;
using teakit::standard_renderer;

namespace {
bool contains(std::string const& str, std::string_view what)
{
    return str.find(what) != std::string::npos;
}

/** Returns whatever was written since last call */
std::string take(std::ostringstream& out)
{
    auto str = out.str();
    out.str({});
    return str;
}
}  // namespace

TEST_SUITE_BEGIN("Renderer");

TEST_CASE("Start And Stop Toggle Terminal Features")
{
    std::ostringstream out;
    renderer_settings settings;
    settings.report_focus = true;

    standard_renderer renderer{out, settings};
    renderer.start();
    CHECK(renderer.running());

    auto started = take(out);
    CHECK(contains(started, "\x1b[?25l"));
    CHECK(contains(started, "\x1b[?2004h"));
    CHECK(contains(started, "\x1b[?1004h"));
    CHECK_FALSE(contains(started, "\x1b[?1049h"));

    renderer.write("hello");
    renderer.stop();
    CHECK_FALSE(renderer.running());

    auto stopped = take(out);
    CHECK(contains(stopped, "\x1b[?25h"));
    CHECK(contains(stopped, "\x1b[?2004l"));
    CHECK(contains(stopped, "\x1b[?1004l"));

    // stopping twice writes nothing
    renderer.stop();
    CHECK(take(out).empty());
}

TEST_CASE("Skips Unchanged Frames")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();
    take(out);

    renderer.write("line 1\nline 2");
    auto first = take(out);
    CHECK(contains(first, "line 1\r\n\x1b[2Kline 2"));
    CHECK(contains(first, "\x1b[0J"));

    renderer.write("line 1\nline 2");
    CHECK(take(out).empty());

    // two lines were rendered, so cursor moves one line up before redrawing
    renderer.write("line 1\nline 3");
    auto third = take(out);
    CHECK(contains(third, "\x1b[1A"));
    CHECK(contains(third, "line 3"));
}

TEST_CASE("Resize Repaints And Truncates")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();

    renderer.write("repaint me");
    take(out);

    renderer.resize({4, 10});
    renderer.write("repaint me");

    auto frame = take(out);
    CHECK(contains(frame, "repa"));
    CHECK_FALSE(contains(frame, "repai"));
}

TEST_CASE("Keeps Only Lines Which Fit Height")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();
    renderer.resize({80, 2});

    renderer.write("first\nsecond\nthird");
    auto frame = take(out);
    CHECK_FALSE(contains(frame, "first"));
    CHECK(contains(frame, "second"));
    CHECK(contains(frame, "third"));
}

TEST_CASE("Alternate Screen")
{
    std::ostringstream out;
    renderer_settings settings;
    settings.alt_screen = true;

    standard_renderer renderer{out, settings};
    renderer.start();
    CHECK(renderer.alt_screen());
    CHECK(contains(take(out), "\x1b[?1049h"));

    // entering again is a no-op
    renderer.enter_alt_screen();
    CHECK(take(out).empty());

    renderer.write("frame");
    CHECK(contains(take(out), "frame"));

    renderer.exit_alt_screen();
    CHECK_FALSE(renderer.alt_screen());
    CHECK(contains(take(out), "\x1b[?1049l"));

    renderer.exit_alt_screen();
    CHECK(take(out).empty());

    renderer.enter_alt_screen();
    renderer.stop();
    CHECK(contains(take(out), "\x1b[?1049l"));
}

TEST_CASE("Frame On Alternate Screen Starts From Home")
{
    std::ostringstream out;
    renderer_settings settings;
    settings.alt_screen = true;

    standard_renderer renderer{out, settings};
    renderer.start();
    take(out);

    renderer.write("frame");
    CHECK(contains(take(out), "\x1b[H\r\x1b[2Kframe"));
}

TEST_CASE("Printed Lines Go Above The Frame")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();
    renderer.write("view");
    take(out);

    renderer.print_line("log line");
    renderer.write("view");

    auto frame = take(out);
    auto printed = frame.find("log line\r\n");
    auto view = frame.find("view");

    REQUIRE(printed != std::string::npos);
    REQUIRE(view != std::string::npos);
    CHECK(printed < view);

    // once printed, lines are not repeated
    renderer.write("view 2");
    CHECK_FALSE(contains(take(out), "log line"));
}

TEST_CASE("Printed Lines Are Ignored On Alternate Screen")
{
    std::ostringstream out;
    renderer_settings settings;
    settings.alt_screen = true;

    standard_renderer renderer{out, settings};
    renderer.start();
    renderer.write("view");
    take(out);

    renderer.print_line("invisible");
    renderer.write("view");
    CHECK_FALSE(contains(take(out), "invisible"));
}

TEST_CASE("Kill Restores Without Flushing")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();
    renderer.write("view");
    take(out);

    renderer.print_line("never shown");
    renderer.kill();

    auto rest = take(out);
    CHECK_FALSE(contains(rest, "never shown"));
    CHECK(contains(rest, "\x1b[?25h"));
    CHECK_FALSE(renderer.running());
}

TEST_CASE("Restart Redraws Full Frame")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();
    renderer.write("line 1\nline 2");
    renderer.stop();
    take(out);

    renderer.start();
    CHECK(renderer.running());
    take(out);

    // same frame as before stop, yet drawn again without moving over old lines
    renderer.write("line 1\nline 2");
    auto redrawn = take(out);
    CHECK(contains(redrawn, "line 1"));
    CHECK(contains(redrawn, "line 2"));
    CHECK_FALSE(contains(redrawn, "\x1b[1A"));
}

TEST_CASE("Broken Output Is Reported")
{
    std::ostringstream out;
    standard_renderer renderer{out};
    renderer.start();

    out.setstate(std::ios::badbit);
    CHECK_THROWS_AS(renderer.write("view"), teakit::renderer_output_error);
}

TEST_SUITE_END();
