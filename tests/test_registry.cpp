// Tests for the tool registry and the handler wrapping layers.

#include "protocol/envelope.hpp"
#include "server/handler_wrapping.hpp"
#include "server/tool_registry.hpp"
#include "utils/logging.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using json = nlohmann::json;

namespace test_registry {

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static tool_registry::ToolDefinition make_tool(const std::string &name) {
    return {name, "test tool", json{{"type", "object"}}, [](const json &arguments) { return arguments; }};
}

// Test: duplicate, empty and handler-less registrations are refused.
static bool test_register_rejects_bad_definitions() {
    tool_registry::ToolRegistry registry;
    bool first = registry.register_tool(make_tool("scan"));
    bool duplicate = registry.register_tool(make_tool("scan"));
    bool empty_name = registry.register_tool(make_tool(""));
    tool_registry::ToolDefinition no_handler = make_tool("lonely");
    no_handler.handler = nullptr;
    bool missing_handler = registry.register_tool(no_handler);
    return check(first && !duplicate && !empty_name && !missing_handler && registry.size() == 1,
                 "Registry refuses duplicates, empty names and missing handlers");
}

// Test: no registration after freeze().
static bool test_frozen_registry() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_tool("scan"));
    registry.freeze();
    bool late = registry.register_tool(make_tool("late"));
    return check(registry.is_frozen() && !late && registry.find("late") == nullptr,
                 "Frozen registry refuses new tools");
}

// Test: the discovery listing enumerates exactly the registered names.
static bool test_listing_matches_registry() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_tool("scan"));
    registry.register_tool(make_tool("echo"));
    registry.register_tool(make_tool("file_stats"));

    json listing = registry.build_tools_list_response();
    std::vector<std::string> listed;
    for (const auto &tool : listing["tools"]) {
        listed.push_back(tool["name"].get<std::string>());
    }
    return check(listed == registry.names() && listed.size() == 3 && listed[0] == "echo",
                 "Discovery listing equals the sorted registry names");
}

// Test: argument summaries redact secrets and shorten long values.
static bool test_summarize_arguments() {
    json arguments;
    arguments["path"] = "/x";
    arguments["api_token"] = "abc123";
    arguments["body"] = std::string(500, 'z');
    arguments["items"] = json::array({1, 2, 3});
    std::string summary = handler_wrapping::summarize_arguments(arguments);

    return check(summary.find("abc123") == std::string::npos && summary.find("api_token=<redacted>") != std::string::npos &&
                     summary.find("path=\"/x\"") != std::string::npos && summary.find("items=[3 items]") != std::string::npos &&
                     summary.size() < 300,
                 "Summary redacts secrets, keeps keys and truncates values");
}

// Test: each exception family maps to its error code.
static bool test_failure_normalization_codes() {
    auto run = [](tool_registry::ToolHandler handler) {
        return handler_wrapping::with_failure_normalization("measure", handler)(json::object());
    };

    auto typed = run([](const json &) -> json { throw handler_wrapping::ToolError(-32010, "custom"); });
    auto invalid = run([](const json &) -> json { throw std::invalid_argument("bad input"); });
    auto json_error = run([](const json &arguments) -> json { return arguments.at("missing"); });
    auto not_found = run([](const json &) -> json {
        throw std::filesystem::filesystem_error("stat", "/nope",
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    });
    auto denied = run([](const json &) -> json {
        throw std::system_error(std::make_error_code(std::errc::permission_denied), "open");
    });
    auto generic = run([](const json &) -> json { throw std::runtime_error("kaboom"); });
    auto non_standard = run([](const json &) -> json { throw 42; });
    auto fine = run([](const json &) -> json { return json{{"ok", true}}; });

    return check(!typed.success && typed.error_code == -32010 && typed.error_message == "custom" &&
                     invalid.error_code == envelope::INVALID_PARAMS &&
                     json_error.error_code == envelope::INVALID_PARAMS &&
                     not_found.error_code == envelope::NOT_FOUND &&
                     denied.error_code == envelope::PERMISSION_DENIED &&
                     generic.error_code == envelope::INTERNAL_ERROR &&
                     generic.error_message == "Failed to execute measure: kaboom" &&
                     non_standard.error_code == envelope::INTERNAL_ERROR && fine.success &&
                     fine.result["ok"] == true,
                 "Exceptions are normalized into typed error outcomes");
}

// Test: the logging layer records the attempt before a failing handler runs.
static bool test_logging_precedes_normalization() {
    std::vector<std::string> events;
    handler_wrapping::set_invocation_observer([&](const std::string &tool_name, const std::string &summary) {
        events.push_back("logged:" + tool_name + ":" + summary);
    });

    tool_registry::ToolDefinition definition = make_tool("explode");
    definition.handler = [&](const json &) -> json {
        events.push_back("executed");
        throw std::runtime_error("failure after logging");
    };
    handler_wrapping::HandlerOutcome outcome = handler_wrapping::wrap(definition)(json{{"path", "/x"}});
    handler_wrapping::set_invocation_observer(nullptr);

    return check(events.size() == 2 && events[0] == "logged:explode:{path=\"/x\"}" && events[1] == "executed" &&
                     !outcome.success && outcome.error_code == envelope::INTERNAL_ERROR,
                 "Invocation is recorded before the handler fault is converted");
}

// Test: failures carry a remediation hint, and the error log names the arguments.
static bool test_failure_hints_and_context() {
    auto run = [](tool_registry::ToolHandler handler, const json &arguments) {
        return handler_wrapping::with_failure_normalization("measure", handler)(arguments);
    };

    std::ostringstream captured;
    std::streambuf *previous = std::cerr.rdbuf(captured.rdbuf());
    auto not_found = run(
        [](const json &) -> json {
            throw std::filesystem::filesystem_error("stat", "/nope",
                                                    std::make_error_code(std::errc::no_such_file_or_directory));
        },
        json{{"project_path", "/work/app"}, {"token", "s3cr3t"}});
    auto invalid = run([](const json &) -> json { throw std::invalid_argument("bad input"); }, json::object());
    auto generic = run([](const json &) -> json { throw std::runtime_error("kaboom"); }, json::object());
    std::cerr.rdbuf(previous);

    std::string log = captured.str();
    return check(not_found.hint == "Verify the resource exists and path is correct" &&
                     invalid.hint == "Check input parameters and try again" && generic.hint.empty() &&
                     handler_wrapping::remediation_hint(envelope::PERMISSION_DENIED) ==
                         std::string("Check file and directory permissions") &&
                     log.find("measure_not_found") != std::string::npos &&
                     log.find("project_path=\"/work/app\"") != std::string::npos &&
                     log.find("token=<redacted>") != std::string::npos &&
                     log.find("s3cr3t") == std::string::npos,
                 "Failures carry hints and are logged with redacted argument context");
}

// Test: an observer may replace itself while it is being called.
static bool test_observer_may_replace_itself() {
    int calls = 0;
    handler_wrapping::set_invocation_observer([&](const std::string &, const std::string &) {
        calls++;
        handler_wrapping::set_invocation_observer(nullptr);
    });

    handler_wrapping::WrappedHandler wrapped = handler_wrapping::wrap(make_tool("echo"));
    handler_wrapping::HandlerOutcome first = wrapped(json{{"n", 1}});
    handler_wrapping::HandlerOutcome second = wrapped(json{{"n", 2}});
    return check(calls == 1 && first.success && second.success && second.result["n"] == 2,
                 "Observer can unregister itself from inside the callback");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_register_rejects_bad_definitions();
    all_passed &= test_frozen_registry();
    all_passed &= test_listing_matches_registry();
    all_passed &= test_summarize_arguments();
    all_passed &= test_failure_normalization_codes();
    all_passed &= test_logging_precedes_normalization();
    all_passed &= test_failure_hints_and_context();
    all_passed &= test_observer_may_replace_itself();
    return all_passed;
}

} // namespace test_registry
