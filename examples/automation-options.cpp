#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include "teakit/detail/options.hpp"

using nlohmann::json;
using teakit::program_settings;

namespace {
std::string temp_path(char const* name)
{
    auto dir = std::getenv("TMPDIR");
    return std::string(dir ? dir : "/tmp") + "/" + name;
}
}  // namespace

TEST_SUITE_BEGIN("Options");

TEST_CASE("Default Settings")
{
    program_settings settings;
    CHECK_FALSE(settings.alt_screen);
    CHECK(settings.bracketed_paste);
    CHECK_FALSE(settings.report_focus);
    CHECK(settings.catch_panics);
    CHECK(settings.handle_signals);
    CHECK_FALSE(settings.without_renderer);
    CHECK(settings.log_file.empty());
    CHECK(settings.log_level == "info");

    json js = settings;
    CHECK(js.size() == 8);
    CHECK(js["log_level"] == "info");
}

TEST_CASE("Absent Keys Keep Defaults")
{
    auto settings = teakit::parse_program_settings(
            json{{"alt_screen", true}, {"log_level", "debug"}, {"some_unknown_key", 3}});

    CHECK(settings.alt_screen);
    CHECK(settings.log_level == "debug");
    CHECK(settings.bracketed_paste);
    CHECK(settings.catch_panics);
}

TEST_CASE("Malformed Settings")
{
    CHECK_THROWS_AS(teakit::parse_program_settings(json{{"alt_screen", "yes"}}),
                    teakit::options_load_error);
    CHECK_THROWS_AS(teakit::parse_program_settings(json::array({1, 2})), teakit::options_load_error);
    CHECK_THROWS_AS(teakit::parse_program_settings(json(42)), teakit::options_load_error);
}

TEST_CASE("Load From File")
{
    auto path = temp_path("teakit-automation-settings.json");
    {
        std::ofstream file{path};
        file << R"({ "report_focus": true, "handle_signals": false })";
    }

    auto settings = teakit::load_program_settings(path);
    CHECK(settings.report_focus);
    CHECK_FALSE(settings.handle_signals);

    {
        std::ofstream file{path};
        file << "{ not json";
    }

    CHECK_THROWS_AS(teakit::load_program_settings(path), teakit::options_load_error);
    std::remove(path.c_str());

    CHECK_THROWS_AS(teakit::load_program_settings(temp_path("teakit-no-such-file.json")),
                    teakit::options_load_error);
}

TEST_CASE("Environment Overrides")
{
    program_settings settings;
    settings.alt_screen = true;

    ::unsetenv("TEAKIT_SETTINGS");
    teakit::apply_environment(&settings);
    CHECK(settings.alt_screen);

    ::setenv("TEAKIT_SETTINGS", R"({"alt_screen": false, "log_level": "trace"})", 1);
    teakit::apply_environment(&settings);
    CHECK_FALSE(settings.alt_screen);
    CHECK(settings.log_level == "trace");

    ::setenv("TEAKIT_SETTINGS", "[", 1);
    CHECK_THROWS_AS(teakit::apply_environment(&settings), teakit::options_load_error);

    ::unsetenv("TEAKIT_SETTINGS");
}

TEST_SUITE_END();
