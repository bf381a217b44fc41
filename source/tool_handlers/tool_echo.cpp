#include "server/tool_registry.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "echo".
// Returns its arguments unchanged; used to check that the channel works end to end.

static json handle_echo(const json &arguments) {
    return arguments;
}

namespace tool_echo {

bool register_tool(tool_registry::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["additionalProperties"] = true;

    return registry.register_tool({
        "echo",
        "Return the given arguments unchanged. Useful as a connectivity check.",
        input_schema,
        handle_echo
    });
}

} // namespace tool_echo
