#ifndef TOOLWIRE_ENVELOPE_HPP
#define TOOLWIRE_ENVELOPE_HPP

// Request/response envelopes exchanged between the tool client and the tool
// server. Uses nlohmann/json for parsing and serialization.
//
// Request:  {"version", "id", "op", "tool", "args"}
// Response: {"version", "id", "result"} or {"version", "id", "error": {"code", "message"}}

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace envelope {

using json = nlohmann::json;

constexpr const char *PROTOCOL_VERSION = "1.0";

// Id 0 is reserved: never assigned to a request, and means "no id" in parsed results.
constexpr int64_t NO_ID = 0;

// Operations.
constexpr const char *OP_INVOKE = "invoke";
constexpr const char *OP_LIST = "list";
constexpr const char *OP_PING = "ping";

// Error codes (JSON-RPC numbering).
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int TOOL_ERROR = -32000;
constexpr int PERMISSION_DENIED = -32003;
constexpr int NOT_FOUND = -32004;
constexpr int IO_ERROR = -32005;

// Build an "invoke" request for the given tool.
json build_invoke_request(int64_t id, const std::string &tool_name, const json &arguments);

// Build a request for an operation that takes no tool (list, ping).
json build_operation_request(int64_t id, const std::string &operation);

// Build a success response.
json build_response(int64_t id, const json &result_payload);

// Build an error response.
json build_error_response(int64_t id, int error_code, const std::string &error_message);

// Build an error response with additional data.
json build_error_response(int64_t id, int error_code, const std::string &error_message,
                          const json &error_data);

// Serialize an envelope to compact single-line text. Invalid UTF-8 in strings is
// replaced rather than raising.
std::string serialize(const json &message);

// --- Inbound requests (server side) ---

enum class RequestStatus {
    Ok,
    MalformedJson,   // bytes are not JSON
    InvalidRequest,  // JSON, but not a well-formed request envelope
    MissingId        // well-formed otherwise, but no id to correlate with
};

struct Request {
    int64_t id = NO_ID;
    std::string operation;
    std::string tool_name;
    json arguments = json::object();
};

struct ParsedRequest {
    RequestStatus status = RequestStatus::InvalidRequest;
    // Best-effort id; NO_ID when none could be recovered.
    int64_t id = NO_ID;
    Request request;
    std::string problem;
};

ParsedRequest parse_request(const std::string &raw_message);

// --- Inbound responses (client side) ---

enum class ResponseKind {
    Result,
    Error,
    Malformed // correlatable (has an id) but not a valid response
};

struct ParsedResponse {
    int64_t id = NO_ID;
    ResponseKind kind = ResponseKind::Malformed;
    json result;
    int error_code = 0;
    std::string error_message;
    std::string problem;
};

// Returns false if the message cannot be correlated at all (not JSON, not an
// object, or no usable id). Otherwise fills output_response.
bool parse_response(const std::string &raw_message, ParsedResponse &output_response);

// Extract a usable id (positive integer) from a parsed message. Returns NO_ID otherwise.
int64_t get_id(const json &message);

// Scan raw text that failed to parse for an "id": <digits> pair. Returns NO_ID if none.
int64_t recover_id(const std::string &raw_message);

} // namespace envelope

#endif // TOOLWIRE_ENVELOPE_HPP
