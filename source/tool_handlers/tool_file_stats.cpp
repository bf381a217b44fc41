#include "server/handler_wrapping.hpp"
#include "server/tool_registry.hpp"
#include "protocol/envelope.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// Tool handler for "file_stats".
// Counts lines, blank lines and bytes of a single text file.

static bool is_blank(const std::string &line) {
    for (char character : line) {
        if (!std::isspace(static_cast<unsigned char>(character))) {
            return false;
        }
    }
    return true;
}

static json handle_file_stats(const json &arguments) {
    if (!arguments.is_object() || !arguments.contains("path") || !arguments["path"].is_string()) {
        throw std::invalid_argument("Missing required parameter 'path' (string).");
    }
    std::string path = arguments["path"].get<std::string>();

    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        throw handler_wrapping::ToolError(envelope::NOT_FOUND, "Not a regular file: " + path);
    }

    std::ifstream file_stream(path, std::ios::binary);
    if (!file_stream.is_open()) {
        throw handler_wrapping::ToolError(envelope::IO_ERROR, "Could not open file: " + path);
    }

    size_t line_count = 0;
    size_t blank_line_count = 0;
    size_t longest_line = 0;
    std::string line;
    while (std::getline(file_stream, line)) {
        line_count++;
        if (is_blank(line)) {
            blank_line_count++;
        }
        if (line.size() > longest_line) {
            longest_line = line.size();
        }
    }

    json result;
    result["path"] = path;
    result["bytes"] = std::filesystem::file_size(path);
    result["lines"] = line_count;
    result["blank_lines"] = blank_line_count;
    result["longest_line"] = longest_line;
    return result;
}

namespace tool_file_stats {

bool register_tool(tool_registry::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Path of the file to measure"}
    };
    input_schema["required"] = json::array({"path"});

    return registry.register_tool({
        "file_stats",
        "Report byte, line and blank-line counts for one file.",
        input_schema,
        handle_file_stats
    });
}

} // namespace tool_file_stats
