// toolwire_invoke – call one tool through the shared tool client.
//
// Usage: toolwire_invoke <tool> [json-arguments]
//        toolwire_invoke --list
// The server to launch and the timeouts come from TOOLWIRE_* environment variables.

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

#include "client/tool_client.hpp"
#include "utils/logging.hpp"

using json = nlohmann::json;

static int usage() {
    std::cerr << "Usage: toolwire_invoke <tool> [json-arguments]\n"
              << "       toolwire_invoke --list" << std::endl;
    return 2;
}

int main(int argc, char **argv) {
    logging::set_component("client");

    if (argc < 2 || argc > 3) {
        return usage();
    }
    std::string tool_name = argv[1];

    json arguments = json::object();
    if (argc == 3) {
        arguments = json::parse(argv[2], nullptr, false);
        if (arguments.is_discarded()) {
            std::cerr << "Arguments are not valid JSON: " << argv[2] << std::endl;
            return 2;
        }
    }

    auto client = tool_client::shared_client();
    tool_client::InvokeResult result =
        (tool_name == "--list") ? client->list_tools() : client->invoke(tool_name, arguments);
    tool_client::reset_shared_client();

    if (!result.success) {
        std::cerr << tool_connection::failure_kind_name(result.failure);
        if (result.error_code != 0) {
            std::cerr << " (" << result.error_code << ")";
        }
        std::cerr << ": " << result.error_message << " [attempts=" << result.attempts << "]" << std::endl;
        return 1;
    }

    std::cout << result.result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}
