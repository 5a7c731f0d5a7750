#include <catch2/catch_test_macros.hpp>
#include "services/logger/LogManager.h"

#include <cstring>

#include <spdlog/spdlog.h>

using namespace lmenu::logging;

namespace {
bool contains_line(Level level, const std::string& needle) {
    for (const auto& line : read_log_lines_snapshot()) {
        if (line.level == level && line.text.find(needle) != std::string::npos) return true;
    }
    return false;
}

Config test_config(Level level) {
    Config cfg;
    cfg.level = level;
    cfg.console = false;
    return cfg;
}

// Restores the run's logger however the test case ends.
struct ReinitOnExit {
    ~ReinitOnExit() { (void)LogManager::init(test_config(Level::debug)); }
};
}

TEST_CASE("logging is initialised once for the run", "[logger]") {
    REQUIRE(LogManager::isInitialized());
    REQUIRE(LogManager::init(test_config(Level::debug)) == Status::already_initialized);
}

TEST_CASE("messages are formatted into the memory buffer", "[logger]") {
    clear_log_buffer();
    LogManager::info("Loaded {} item(s) from {}", 3, "config.json");
    LogManager::warn("careful");
    LogManager::error("boom {}", 42);
    REQUIRE(contains_line(Level::info, "Loaded 3 item(s) from config.json"));
    REQUIRE(contains_line(Level::warn, "careful"));
    REQUIRE(contains_line(Level::err, "boom 42"));
}

TEST_CASE("reconfigure filters by level", "[logger]") {
    clear_log_buffer();
    REQUIRE(LogManager::reconfigure(test_config(Level::warn)) == Status::ok);
    LogManager::info("hidden message");
    LogManager::warn("visible message");
    REQUIRE(LogManager::reconfigure(test_config(Level::debug)) == Status::ok);
    REQUIRE_FALSE(contains_line(Level::info, "hidden message"));
    REQUIRE(contains_line(Level::warn, "visible message"));
}

TEST_CASE("a bad format string does not throw", "[logger]") {
    REQUIRE_NOTHROW(LogManager::info("unbalanced {} {}", 1));
}

TEST_CASE("buffer capacity drops the oldest lines", "[logger]") {
    clear_log_buffer();
    set_log_buffer_capacity(3);
    for (int i = 0; i < 5; ++i) LogManager::info("line {}", i);
    auto lines = read_log_lines_snapshot();
    set_log_buffer_capacity(2000);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines.front().text.find("line 2") != std::string::npos);
    REQUIRE(lines.back().text.find("line 4") != std::string::npos);
}

TEST_CASE("level names parse and print", "[logger]") {
    REQUIRE(level_from_name("trace") == Level::trace);
    REQUIRE(level_from_name("warning") == Level::warn);
    REQUIRE(level_from_name("error") == Level::err);
    REQUIRE(level_from_name("off") == Level::off);
    REQUIRE(level_from_name("nonsense") == Level::info);
    REQUIRE(std::strcmp(level_to_label(Level::warn), "WARN") == 0);
}

TEST_CASE("after shutdown only held handles still log", "[logger]") {
    ReinitOnExit reinit;
    auto handle = LogManager::acquire();
    REQUIRE(handle);
    REQUIRE(LogManager::shutdown() == Status::ok);
    clear_log_buffer();

    LogManager::info("dropped after shutdown");
    REQUIRE_FALSE(LogManager::isInitialized());
    REQUIRE(LogManager::acquire() == nullptr);

    handle->warn("from a held handle");
    REQUIRE(contains_line(Level::warn, "from a held handle"));
    REQUIRE_FALSE(contains_line(Level::info, "dropped after shutdown"));

    REQUIRE(LogManager::init(test_config(Level::debug)) == Status::ok);
    REQUIRE(LogManager::acquire() != nullptr);
}
