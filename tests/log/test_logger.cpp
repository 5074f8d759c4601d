#include <iostream>
#include <sstream>
#include <string>

#include "dashwire/log/logger.hpp"
#include "common/test_check.hpp"

using namespace dashwire::log;

// -----------------------------------------------------------------------------
// Test: level names
// -----------------------------------------------------------------------------
void test_parse_level() {
    std::cout << "[TEST] Logger parse_level\n";

    Level lvl = Level::Info;
    TEST_CHECK(parse_level("trace", lvl) && lvl == Level::Trace);
    TEST_CHECK(parse_level("debug", lvl) && lvl == Level::Debug);
    TEST_CHECK(parse_level("warn", lvl) && lvl == Level::Warn);
    TEST_CHECK(parse_level("fatal", lvl) && lvl == Level::Fatal);

    lvl = Level::Error;
    TEST_CHECK(!parse_level("verbose", lvl));
    TEST_CHECK(!parse_level("INFO", lvl));
    TEST_CHECK(lvl == Level::Error);

    TEST_CHECK(std::string(Logger::level_name(Level::Warn)) == "WARN");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: filtering and output redirection
// -----------------------------------------------------------------------------
void test_filtering() {
    std::cout << "[TEST] Logger filtering\n";

    std::ostringstream sink;
    auto& logger = Logger::instance();
    logger.set_output(&sink);
    logger.enable_color(false);

    TEST_CHECK(set_level("warn"));
    DW_INFO("[TEST] hidden " << 1);
    DW_WARN("[TEST] shown " << 2);
    DW_ERROR("[TEST] shown " << 3);

    const std::string out = sink.str();
    TEST_CHECK(out.find("hidden") == std::string::npos);
    TEST_CHECK(out.find("[WARN] [TEST] shown 2") != std::string::npos);
    TEST_CHECK(out.find("[ERROR] [TEST] shown 3") != std::string::npos);
    TEST_CHECK(out.find("\033[") == std::string::npos);

    // Unknown names leave the level untouched
    TEST_CHECK(!set_level("loud"));
    TEST_CHECK(logger.level() == Level::Warn);

    // Disabled levels never evaluate their arguments
    int evaluated = 0;
    DW_DEBUG("[TEST] " << ++evaluated);
    TEST_CHECK(evaluated == 0);

    logger.set_output(nullptr);
    logger.enable_color(true);
    logger.set_level(Level::Info);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_parse_level();
    test_filtering();

    std::cout << "\n[ALL LOGGER TESTS PASSED]\n";
    return 0;
}
