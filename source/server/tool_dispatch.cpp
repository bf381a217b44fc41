#include "server/tool_dispatch.hpp"
#include "protocol/envelope.hpp"
#include "utils/logging.hpp"

#include <utility>

namespace tool_dispatch {

const char *stage_name(DispatchStage stage) {
    switch (stage) {
    case DispatchStage::Received:
        return "received";
    case DispatchStage::Parsed:
        return "parsed";
    case DispatchStage::Routed:
        return "routed";
    case DispatchStage::Executing:
        return "executing";
    case DispatchStage::Responded:
        return "responded";
    case DispatchStage::Rejected:
        return "rejected";
    }
    return "unknown";
}

Dispatcher::Dispatcher(tool_registry::ToolRegistry &registry, ServerInfo server_info)
    : registry_(registry), server_info_(std::move(server_info)) {
    registry.freeze();
    for (const auto &name : registry.names()) {
        wrapped_handlers_.emplace(name, handler_wrapping::wrap(*registry.find(name)));
    }
}

const tool_registry::ToolRegistry &Dispatcher::registry() const {
    return registry_;
}

DispatchResult Dispatcher::reject(int64_t id, int error_code, const std::string &message) const {
    DispatchResult result;
    result.stage = DispatchStage::Rejected;
    if (id == envelope::NO_ID) {
        logging::warning("Dropping request with no usable id: " + message);
        return result;
    }
    result.has_response = true;
    result.response = envelope::build_error_response(id, error_code, message);
    return result;
}

DispatchResult Dispatcher::handle_invoke(int64_t id, const std::string &tool_name, const json &arguments) const {
    auto handler = wrapped_handlers_.find(tool_name);
    if (handler == wrapped_handlers_.end()) {
        logging::error("Unknown tool requested: " + tool_name);
        return reject(id, envelope::METHOD_NOT_FOUND, "Unknown tool: " + tool_name);
    }

    // Routed -> executing. The wrapped handler never throws.
    handler_wrapping::HandlerOutcome outcome = handler->second(arguments);

    DispatchResult result;
    result.stage = DispatchStage::Responded;
    result.has_response = true;
    if (outcome.success) {
        result.response = envelope::build_response(id, outcome.result);
    } else {
        json error_data;
        error_data["tool"] = tool_name;
        if (!outcome.hint.empty()) {
            error_data["hint"] = outcome.hint;
        }
        result.response =
            envelope::build_error_response(id, outcome.error_code, outcome.error_message, error_data);
    }
    return result;
}

DispatchResult Dispatcher::dispatch(const std::string &raw_message) const {
    envelope::ParsedRequest parsed = envelope::parse_request(raw_message);

    switch (parsed.status) {
    case envelope::RequestStatus::MalformedJson:
        logging::error("Failed to parse incoming request: " + raw_message.substr(0, 200));
        return reject(parsed.id, envelope::PARSE_ERROR, "Parse error");
    case envelope::RequestStatus::InvalidRequest:
    case envelope::RequestStatus::MissingId:
        return reject(parsed.id, envelope::INVALID_REQUEST, "Invalid request: " + parsed.problem);
    case envelope::RequestStatus::Ok:
        break;
    }

    const envelope::Request &request = parsed.request;
    logging::debug("Request id=" + std::to_string(request.id) + " op=" + request.operation +
                   (request.tool_name.empty() ? "" : " tool=" + request.tool_name));

    if (request.operation == envelope::OP_INVOKE) {
        return handle_invoke(request.id, request.tool_name, request.arguments);
    }

    DispatchResult result;
    result.stage = DispatchStage::Responded;
    result.has_response = true;
    if (request.operation == envelope::OP_LIST) {
        result.response = envelope::build_response(request.id, registry_.build_tools_list_response());
        return result;
    }
    if (request.operation == envelope::OP_PING) {
        json status;
        status["status"] = "ok";
        status["server"] = server_info_.name;
        status["version"] = server_info_.version;
        status["tools"] = registry_.size();
        result.response = envelope::build_response(request.id, status);
        return result;
    }

    return reject(request.id, envelope::METHOD_NOT_FOUND, "Unknown operation: " + request.operation);
}

} // namespace tool_dispatch
