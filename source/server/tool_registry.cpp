#include "server/tool_registry.hpp"
#include "utils/logging.hpp"

#include <utility>

namespace tool_registry {

bool ToolRegistry::register_tool(ToolDefinition definition) {
    if (frozen_) {
        logging::error("Refusing to register '" + definition.name + "': registry is frozen");
        return false;
    }
    if (definition.name.empty()) {
        logging::error("Refusing to register a tool with an empty name");
        return false;
    }
    if (!definition.handler) {
        logging::error("Refusing to register '" + definition.name + "': no handler");
        return false;
    }
    if (tools_.count(definition.name) != 0) {
        logging::error("Refusing to register '" + definition.name + "': name already registered");
        return false;
    }
    if (definition.input_schema.is_null()) {
        definition.input_schema = json{{"type", "object"}, {"properties", json::object()}};
    }

    std::string name = definition.name;
    tools_.emplace(std::move(name), std::move(definition));
    return true;
}

void ToolRegistry::freeze() {
    frozen_ = true;
}

bool ToolRegistry::is_frozen() const {
    return frozen_;
}

const ToolDefinition *ToolRegistry::find(const std::string &tool_name) const {
    auto iterator = tools_.find(tool_name);
    if (iterator == tools_.end()) {
        return nullptr;
    }
    return &iterator->second;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto &entry : tools_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t ToolRegistry::size() const {
    return tools_.size();
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &entry : tools_) {
        const ToolDefinition &tool = entry.second;
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace tool_registry
