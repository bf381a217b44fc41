#ifndef TOOLWIRE_HANDLER_WRAPPING_HPP
#define TOOLWIRE_HANDLER_WRAPPING_HPP

// Cross-cutting behavior applied to every tool handler, in a fixed order:
//   1. invocation logging (outermost): records the tool name and a redacted
//      argument summary before anything runs;
//   2. failure normalization: any exception thrown by the handler becomes a
//      typed error outcome and never escapes.

#include <nlohmann/json.hpp>

#include <functional>
#include <stdexcept>
#include <string>

#include "server/tool_registry.hpp"

namespace handler_wrapping {

using json = nlohmann::json;

// Typed failure a handler may throw to choose the error code sent back.
class ToolError : public std::runtime_error {
public:
    ToolError(int error_code, const std::string &message);
    int code() const noexcept;

private:
    int code_;
};

// What a wrapped handler produces: a result payload or an error descriptor.
struct HandlerOutcome {
    bool success = false;
    json result;
    int error_code = 0;
    std::string error_message;
    // Remediation hint for the caller; empty when the code has none.
    std::string hint;
};

using WrappedHandler = std::function<HandlerOutcome(const json &arguments)>;

// Called by the logging layer for each invocation (tool name, argument summary).
using InvocationObserver = std::function<void(const std::string &tool_name, const std::string &summary)>;

// Install an extra observer next to the log line (nullptr to remove).
void set_invocation_observer(InvocationObserver observer);

// One-line summary of an arguments payload: key names with short values;
// values of sensitive keys (password, token, secret, ...) are replaced.
std::string summarize_arguments(const json &arguments);

// Hint attached to failures with this error code ("" if none).
const char *remediation_hint(int error_code);

// Catch-and-convert layer around a raw handler. Each failure is logged with
// the redacted argument summary.
WrappedHandler with_failure_normalization(const std::string &tool_name, tool_registry::ToolHandler handler);

// Logging layer around an already wrapped handler.
WrappedHandler with_invocation_logging(const std::string &tool_name, WrappedHandler inner);

// Both layers in the required order.
WrappedHandler wrap(const tool_registry::ToolDefinition &definition);

} // namespace handler_wrapping

#endif // TOOLWIRE_HANDLER_WRAPPING_HPP
