#ifndef TOOLWIRE_TOOL_REGISTRY_HPP
#define TOOLWIRE_TOOL_REGISTRY_HPP

// Tool registry: name -> handler mapping, built once at startup and read-only
// afterwards. The discovery listing is generated from the same entries, so the
// advertised names and the callable names cannot drift apart.

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tool_registry {

using json = nlohmann::json;

// A tool handler: receives the arguments payload, returns the result payload.
// Failures are signaled by throwing (see handler_wrapping::ToolError).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Register a tool. Returns false (and logs) for an empty name, a missing
    // handler, a duplicate name, or after freeze().
    bool register_tool(ToolDefinition definition);

    // Disallow further registration. Called once the server starts reading.
    void freeze();
    bool is_frozen() const;

    // Returns nullptr if no tool has this name.
    const ToolDefinition *find(const std::string &tool_name) const;

    // Registered names in sorted order.
    std::vector<std::string> names() const;
    size_t size() const;

    // Result payload for the "list" operation.
    json build_tools_list_response() const;

private:
    std::map<std::string, ToolDefinition> tools_;
    bool frozen_ = false;
};

} // namespace tool_registry

#endif // TOOLWIRE_TOOL_REGISTRY_HPP
