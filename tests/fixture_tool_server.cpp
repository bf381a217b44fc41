// Fixture tool server for the client tests.
// Same dispatcher and stdio loop as toolwire_server, but with tools whose
// behavior the tests control: slow answers, transient and permanent failures,
// handler faults, stray output on stdout/stderr and abrupt exit.
//
// Reply modes (first argument):
//   --reverse-pairs      hold each response until the next request is handled,
//                        then write the two in reverse order
//   --malformed-replies  answer with {"version", "id"} and neither result nor error
//   --duplicate-replies  write every response twice

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "protocol/envelope.hpp"
#include "protocol/framing.hpp"
#include "server/handler_wrapping.hpp"
#include "server/server_loop.hpp"
#include "server/tool_dispatch.hpp"
#include "server/tool_registry.hpp"
#include "utils/logging.hpp"

using json = nlohmann::json;

static std::mutex call_counts_mutex;
static std::map<std::string, int> call_counts;

static void count_call(const std::string &tool_name) {
    std::lock_guard<std::mutex> lock(call_counts_mutex);
    call_counts[tool_name]++;
}

static void add(tool_registry::ToolRegistry &registry, const std::string &name, tool_registry::ToolHandler handler) {
    registry.register_tool({name, "fixture tool " + name, json{{"type", "object"}},
                            [name, handler](const json &arguments) {
                                count_call(name);
                                return handler(arguments);
                            }});
}

static void register_fixture_tools(tool_registry::ToolRegistry &registry) {
    add(registry, "echo", [](const json &arguments) { return arguments; });

    add(registry, "scan", [](const json &arguments) {
        (void)arguments;
        return json{{"elements", json::array()}};
    });

    add(registry, "slow", [](const json &arguments) {
        int milliseconds = arguments.value("milliseconds", 1000);
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
        return json{{"slept", milliseconds}, {"tag", arguments.value("tag", "")}};
    });

    add(registry, "busy", [](const json &arguments) -> json {
        (void)arguments;
        throw handler_wrapping::ToolError(envelope::TOOL_ERROR, "Resource busy, try again later");
    });

    add(registry, "reject", [](const json &arguments) -> json {
        (void)arguments;
        throw handler_wrapping::ToolError(envelope::TOOL_ERROR, "Invalid project path");
    });

    add(registry, "boom", [](const json &arguments) -> json {
        (void)arguments;
        throw std::runtime_error("kaboom");
    });

    add(registry, "orphan", [](const json &arguments) {
        // A response nobody asked for, written ahead of the real one.
        int64_t stray_id = arguments.value("stray_id", static_cast<int64_t>(999999));
        framing::write_message(std::cout, envelope::serialize(envelope::build_response(stray_id, json::object())));
        return json{{"ok", true}};
    });

    add(registry, "stderr_noise", [](const json &arguments) {
        (void)arguments;
        std::cerr << "{\"version\":\"1.0\",\"id\":1,\"result\":\"not protocol\"}" << std::endl;
        return json{{"ok", true}};
    });

    add(registry, "exit", [](const json &arguments) -> json {
        std::cout.flush();
        std::_Exit(arguments.value("code", 3));
    });

    add(registry, "stats", [](const json &arguments) {
        (void)arguments;
        std::lock_guard<std::mutex> lock(call_counts_mutex);
        json counts = json::object();
        for (const auto &entry : call_counts) {
            counts[entry.first] = entry.second;
        }
        return counts;
    });
}

// Scripted reply loop for the modes above. Requests are still dispatched
// normally; only the shape or order of what goes back on stdout changes.
static void run_scripted(const tool_dispatch::Dispatcher &dispatcher, const std::string &mode) {
    framing::FrameDecoder decoder;
    std::string raw_message;
    std::vector<json> held;

    while (framing::read_message(std::cin, decoder, raw_message)) {
        tool_dispatch::DispatchResult result = dispatcher.dispatch(raw_message);
        if (!result.has_response) {
            continue;
        }
        json response = result.response;
        if (mode == "--malformed-replies") {
            response.erase("result");
            response.erase("error");
            framing::write_message(std::cout, envelope::serialize(response));
            continue;
        }
        if (mode == "--duplicate-replies") {
            framing::write_message(std::cout, envelope::serialize(response));
            framing::write_message(std::cout, envelope::serialize(response));
            continue;
        }
        held.push_back(response);
        if (held.size() == 2) {
            framing::write_message(std::cout, envelope::serialize(held[1]));
            framing::write_message(std::cout, envelope::serialize(held[0]));
            held.clear();
        }
    }
}

int main(int argc, char **argv) {
    logging::set_component("fixture-server");
    server_loop::install_signal_handlers();

    tool_registry::ToolRegistry registry;
    register_fixture_tools(registry);
    tool_dispatch::Dispatcher dispatcher(registry, tool_dispatch::ServerInfo{"toolwire-fixture", "test"});

    std::string mode = argc > 1 ? argv[1] : "";
    if (mode == "--reverse-pairs" || mode == "--malformed-replies" || mode == "--duplicate-replies") {
        run_scripted(dispatcher, mode);
        return 0;
    }
    if (!mode.empty()) {
        logging::error("Unknown fixture mode: " + mode);
        return 2;
    }

    server_loop::run(dispatcher, STDIN_FILENO, std::cout);
    return 0;
}
