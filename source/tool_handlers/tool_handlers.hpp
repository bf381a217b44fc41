#ifndef TOOLWIRE_TOOL_HANDLERS_HPP
#define TOOLWIRE_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "server/tool_registry.hpp"

namespace tool_handlers {

// Register all available tool handlers with the given registry.
void register_all_tools(tool_registry::ToolRegistry &registry);

} // namespace tool_handlers

#endif // TOOLWIRE_TOOL_HANDLERS_HPP
