#include "protocol/envelope.hpp"

#include <cctype>
#include <limits>

namespace envelope {

json build_invoke_request(int64_t id, const std::string &tool_name, const json &arguments) {
    json request;
    request["version"] = PROTOCOL_VERSION;
    request["id"] = id;
    request["op"] = OP_INVOKE;
    request["tool"] = tool_name;
    request["args"] = arguments;
    return request;
}

json build_operation_request(int64_t id, const std::string &operation) {
    json request;
    request["version"] = PROTOCOL_VERSION;
    request["id"] = id;
    request["op"] = operation;
    return request;
}

json build_response(int64_t id, const json &result_payload) {
    json response;
    response["version"] = PROTOCOL_VERSION;
    response["id"] = id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(int64_t id, int error_code, const std::string &error_message) {
    json response;
    response["version"] = PROTOCOL_VERSION;
    response["id"] = id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(int64_t id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response = build_error_response(id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

std::string serialize(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

int64_t get_id(const json &message) {
    if (!message.is_object() || !message.contains("id")) {
        return NO_ID;
    }
    const json &id_value = message["id"];
    if (id_value.is_number_unsigned()) {
        uint64_t unsigned_id = id_value.get<uint64_t>();
        if (unsigned_id == 0 || unsigned_id > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return NO_ID;
        }
        return static_cast<int64_t>(unsigned_id);
    }
    if (id_value.is_number_integer()) {
        int64_t signed_id = id_value.get<int64_t>();
        return signed_id > 0 ? signed_id : NO_ID;
    }
    return NO_ID;
}

int64_t recover_id(const std::string &raw_message) {
    const std::string key = "\"id\"";
    size_t search_from = 0;
    while (true) {
        size_t key_position = raw_message.find(key, search_from);
        if (key_position == std::string::npos) {
            return NO_ID;
        }
        size_t position = key_position + key.size();
        search_from = position;

        while (position < raw_message.size() && std::isspace(static_cast<unsigned char>(raw_message[position]))) {
            position++;
        }
        if (position >= raw_message.size() || raw_message[position] != ':') {
            continue;
        }
        position++;
        while (position < raw_message.size() && std::isspace(static_cast<unsigned char>(raw_message[position]))) {
            position++;
        }

        int64_t value = 0;
        size_t digit_count = 0;
        while (position < raw_message.size() && std::isdigit(static_cast<unsigned char>(raw_message[position]))) {
            int digit = raw_message[position] - '0';
            if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
                return NO_ID;
            }
            value = value * 10 + digit;
            digit_count++;
            position++;
        }
        if (digit_count > 0 && value > 0) {
            return value;
        }
    }
}

ParsedRequest parse_request(const std::string &raw_message) {
    ParsedRequest parsed;

    json message = json::parse(raw_message, nullptr, false);
    if (message.is_discarded()) {
        parsed.status = RequestStatus::MalformedJson;
        parsed.id = recover_id(raw_message);
        parsed.problem = "Parse error";
        return parsed;
    }

    if (!message.is_object()) {
        parsed.status = RequestStatus::InvalidRequest;
        parsed.problem = "Request must be a JSON object";
        return parsed;
    }

    parsed.id = get_id(message);
    if (parsed.id == NO_ID) {
        parsed.status = message.contains("id") ? RequestStatus::InvalidRequest : RequestStatus::MissingId;
        parsed.problem = message.contains("id") ? "Request id must be a positive integer"
                                                : "Request has no id";
        return parsed;
    }

    if (!message.contains("version") || !message["version"].is_string() ||
        message["version"].get<std::string>() != PROTOCOL_VERSION) {
        parsed.status = RequestStatus::InvalidRequest;
        parsed.problem = std::string("Unsupported or missing protocol version (expected ") +
                         PROTOCOL_VERSION + ")";
        return parsed;
    }

    if (!message.contains("op") || !message["op"].is_string() || message["op"].get<std::string>().empty()) {
        parsed.status = RequestStatus::InvalidRequest;
        parsed.problem = "Missing or invalid 'op'";
        return parsed;
    }

    parsed.request.id = parsed.id;
    parsed.request.operation = message["op"].get<std::string>();

    if (parsed.request.operation == OP_INVOKE) {
        if (!message.contains("tool") || !message["tool"].is_string() ||
            message["tool"].get<std::string>().empty()) {
            parsed.status = RequestStatus::InvalidRequest;
            parsed.problem = "Missing or invalid 'tool' in invoke request";
            return parsed;
        }
        parsed.request.tool_name = message["tool"].get<std::string>();
        if (message.contains("args")) {
            parsed.request.arguments = message["args"];
        }
    }

    parsed.status = RequestStatus::Ok;
    return parsed;
}

bool parse_response(const std::string &raw_message, ParsedResponse &output_response) {
    json message = json::parse(raw_message, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return false;
    }

    output_response = ParsedResponse();
    output_response.id = get_id(message);
    if (output_response.id == NO_ID) {
        return false;
    }

    if (!message.contains("version") || !message["version"].is_string() ||
        message["version"].get<std::string>() != PROTOCOL_VERSION) {
        output_response.kind = ResponseKind::Malformed;
        output_response.problem = "Response has unsupported or missing protocol version";
        return true;
    }

    bool has_result = message.contains("result");
    bool has_error = message.contains("error");
    if (has_result == has_error) {
        output_response.kind = ResponseKind::Malformed;
        output_response.problem = "Response must carry exactly one of 'result' or 'error'";
        return true;
    }

    if (has_result) {
        output_response.kind = ResponseKind::Result;
        output_response.result = message["result"];
        return true;
    }

    const json &error_value = message["error"];
    if (!error_value.is_object()) {
        output_response.kind = ResponseKind::Malformed;
        output_response.problem = "Response 'error' must be an object";
        return true;
    }
    output_response.kind = ResponseKind::Error;
    if (error_value.contains("code") && error_value["code"].is_number_integer()) {
        output_response.error_code = error_value["code"].get<int>();
    } else {
        output_response.error_code = INTERNAL_ERROR;
    }
    if (error_value.contains("message") && error_value["message"].is_string()) {
        output_response.error_message = error_value["message"].get<std::string>();
    }
    if (output_response.error_message.empty()) {
        output_response.error_message = "Unknown error";
    }
    return true;
}

} // namespace envelope
