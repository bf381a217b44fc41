#ifndef TOOLWIRE_TOOL_DISPATCH_HPP
#define TOOLWIRE_TOOL_DISPATCH_HPP

// Server-side routing of request envelopes to registered tool handlers.
//
// Per request: received -> parsed -> routed -> executing -> responded, or
// rejected straight from received (unparseable) or parsed (unknown operation
// or tool). Handler failures become error responses; nothing thrown by a
// handler leaves dispatch().

#include <nlohmann/json.hpp>

#include <map>
#include <string>

#include "server/handler_wrapping.hpp"
#include "server/tool_registry.hpp"

namespace tool_dispatch {

using json = nlohmann::json;

enum class DispatchStage {
    Received,
    Parsed,
    Routed,
    Executing,
    Responded,
    Rejected
};

const char *stage_name(DispatchStage stage);

struct DispatchResult {
    DispatchStage stage = DispatchStage::Received;
    // False when the request was dropped because no id could be recovered.
    bool has_response = false;
    json response;
};

struct ServerInfo {
    std::string name = "toolwire";
    std::string version = "0.1.0";
};

class Dispatcher {
public:
    // Freezes the registry and wraps every handler once. The registry must
    // outlive the dispatcher.
    explicit Dispatcher(tool_registry::ToolRegistry &registry, ServerInfo server_info = ServerInfo());

    // Handle one raw inbound message.
    DispatchResult dispatch(const std::string &raw_message) const;

    const tool_registry::ToolRegistry &registry() const;

private:
    DispatchResult reject(int64_t id, int error_code, const std::string &message) const;
    DispatchResult handle_invoke(int64_t id, const std::string &tool_name, const json &arguments) const;

    const tool_registry::ToolRegistry &registry_;
    ServerInfo server_info_;
    std::map<std::string, handler_wrapping::WrappedHandler> wrapped_handlers_;
};

} // namespace tool_dispatch

#endif // TOOLWIRE_TOOL_DISPATCH_HPP
