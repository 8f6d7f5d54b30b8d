#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <doctest/doctest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "teakit/detail/base.hpp"
#include "teakit/detail/logging.hpp"

TEST_SUITE_BEGIN("Logging");

TEST_CASE("Library Log Is Silent By Default")
{
    auto logger = teakit::glog();
    REQUIRE(logger);
    CHECK(logger->name() == "TEAKIT");
    CHECK(teakit::glog() == logger);
}

TEST_CASE("Library Log Redirected To File")
{
    auto dir = std::getenv("TMPDIR");
    auto path = std::string(dir ? dir : "/tmp") + "/teakit-automation.log";
    std::remove(path.c_str());

    teakit::log_to_file(path, "[test]");
    teakit::set_log_level("debug");

    teakit::glog()->debug("visible {}", 1);
    teakit::glog()->trace("hidden {}", 2);
    teakit::glog()->flush();

    std::ifstream file{path};
    std::stringstream content;
    content << file.rdbuf();

    CHECK(content.str().find("[test] visible 1") != std::string::npos);
    CHECK(content.str().find("hidden") == std::string::npos);

    // next access falls back to the silent logger
    spdlog::drop("TEAKIT");
    std::remove(path.c_str());
}

TEST_CASE("Error Log Keeps Warnings Only")
{
    auto logger = teakit::stderr_log();
    REQUIRE(logger);
    CHECK(logger->name() == "TEAKIT.stderr");
    CHECK(teakit::stderr_log() == logger);

    CHECK(logger->should_log(spdlog::level::warn));
    CHECK(logger->should_log(spdlog::level::err));
    CHECK_FALSE(logger->should_log(spdlog::level::info));

    // independent of library log level
    teakit::set_log_level("trace");
    CHECK_FALSE(logger->should_log(spdlog::level::debug));
    teakit::set_log_level("info");
}

TEST_CASE("Error Log Can Be Captured")
{
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    spdlog::drop("TEAKIT.stderr");
    spdlog::register_logger(std::make_shared<spdlog::logger>("TEAKIT.stderr", sink));

    teakit::stderr_log()->warn("captured {}", 3);
    CHECK(captured.str().find("captured 3") != std::string::npos);

    spdlog::drop("TEAKIT.stderr");
}

TEST_SUITE_END();
