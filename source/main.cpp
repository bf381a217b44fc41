// toolwire_server – tool server entry point: stdio loop.
//
// Reads request envelopes from stdin, dispatches them to the registered tools,
// writes response envelopes to stdout. Diagnostics go to stderr only.

#include <iostream>
#include <string>
#include <unistd.h>

#include "server/server_loop.hpp"
#include "server/tool_dispatch.hpp"
#include "server/tool_registry.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/logging.hpp"

int main() {
    logging::set_component("server");
    std::ios::sync_with_stdio(false);

    server_loop::install_signal_handlers();

    tool_registry::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    tool_dispatch::Dispatcher dispatcher(registry);
    logging::info("toolwire server started with " + std::to_string(registry.size()) +
                  " tools. Waiting for requests on stdin.");

    server_loop::LoopStatistics statistics = server_loop::run(dispatcher, STDIN_FILENO, std::cout);

    logging::info("toolwire server shut down (" + std::to_string(statistics.messages_received) + " received, " +
                  std::to_string(statistics.responses_written) + " answered, " +
                  std::to_string(statistics.requests_dropped) + " dropped).");
    return 0;
}
