/**
 * @file test_log.cpp
 * @brief Level parsing, filtering and output routing of the logger.
 */

#include <catch2/catch.hpp>

#include "test_utils.hpp"

#include "common/Log.hpp"

#include <iostream>

using namespace nexus;
using test_helpers::CaptureStream;

namespace {
// Restores the quiet level the other tests run with.
struct LevelGuard {
    ~LevelGuard() { log::set_level(log::Level::Error); }
};
} // namespace

TEST_CASE("level names parse back to the same level", "[log]") {
    for (auto lv : {log::Level::Debug, log::Level::Info, log::Level::Warn, log::Level::Error}) {
        REQUIRE(log::parse_level(log::level_name(lv)) == lv);
    }
    REQUIRE_FALSE(log::parse_level("verbose"));
}

TEST_CASE("set_level filters lower levels", "[log]") {
    LevelGuard guard;
    log::set_level(log::Level::Warn);
    REQUIRE(log::level() == log::Level::Warn);

    CaptureStream out(std::cout);
    CaptureStream err(std::cerr);
    log::info("test", "hidden");
    log::warn("test", "shown ", 42);

    REQUIRE(out.text().empty());
    REQUIRE(err.text() == "[test] shown 42\n");
}

TEST_CASE("info goes to stdout, error to stderr", "[log]") {
    LevelGuard guard;
    log::set_level(log::Level::Debug);

    CaptureStream out(std::cout);
    CaptureStream err(std::cerr);
    log::debug("a", "one");
    log::error("b", "two");

    REQUIRE(out.text() == "[a] one\n");
    REQUIRE(err.text() == "[b] two\n");
}
