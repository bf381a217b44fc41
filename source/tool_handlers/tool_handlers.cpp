#include "tool_handlers/tool_handlers.hpp"
#include "utils/logging.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_scan { bool register_tool(tool_registry::ToolRegistry &registry); }
namespace tool_file_stats { bool register_tool(tool_registry::ToolRegistry &registry); }
namespace tool_echo { bool register_tool(tool_registry::ToolRegistry &registry); }

namespace tool_handlers {

void register_all_tools(tool_registry::ToolRegistry &registry) {
    bool registered = true;
    registered &= tool_scan::register_tool(registry);
    registered &= tool_file_stats::register_tool(registry);
    registered &= tool_echo::register_tool(registry);
    if (!registered) {
        logging::error("One or more tools failed to register");
    }
}

} // namespace tool_handlers
