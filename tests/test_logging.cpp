// Tests for leveled stderr logging.

#include "utils/logging.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace test_logging {

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

// Test: lines below the minimum level are suppressed; others carry prefix and component.
static bool test_level_filter() {
    logging::Level saved = logging::minimum_level();
    logging::set_minimum_level(logging::Level::Warning);

    std::ostringstream captured;
    std::streambuf *previous = std::cerr.rdbuf(captured.rdbuf());
    logging::info("quiet line");
    logging::warning("loud line");
    std::cerr.rdbuf(previous);
    logging::set_minimum_level(saved);

    std::string output = captured.str();
    return check(output.find("quiet line") == std::string::npos &&
                     output.find("[toolwire] WARNING tests: loud line") != std::string::npos,
                 "Minimum level filters lines and the format is [toolwire] LEVEL component: message");
}

// Test: debug output follows the configured level.
static bool test_debug_toggle() {
    logging::Level saved = logging::minimum_level();
    logging::set_minimum_level(logging::Level::Debug);
    bool enabled = logging::is_debug_enabled();
    logging::set_minimum_level(logging::Level::Info);
    bool disabled = !logging::is_debug_enabled();
    logging::set_minimum_level(saved);
    return check(enabled && disabled, "is_debug_enabled tracks the minimum level");
}

// Test: level names parse case-insensitively.
static bool test_parse_level() {
    logging::Level level = logging::Level::Info;
    bool warning = logging::parse_level("WARNING", level) && level == logging::Level::Warning;
    bool debug = logging::parse_level("debug", level) && level == logging::Level::Debug;
    bool unknown = !logging::parse_level("chatty", level) && level == logging::Level::Debug;
    return check(warning && debug && unknown, "Level names parse and unknown names are refused");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_level_filter();
    all_passed &= test_debug_toggle();
    all_passed &= test_parse_level();
    return all_passed;
}

} // namespace test_logging
