#include "server/handler_wrapping.hpp"
#include "server/tool_registry.hpp"
#include "protocol/envelope.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
namespace fs = std::filesystem;

// Tool handler for "scan".
// Walks a directory tree and lists the source files in it, optionally filtered
// by extension. Generated and vendored directories are skipped.

static const int DEFAULT_MAX_ELEMENTS = 10000;

static const std::set<std::string> SKIPPED_DIRECTORIES = {
    ".git", ".hg", ".svn", "node_modules", "__pycache__", ".venv", "venv", "build", "dist", ".cache",
};

static std::string normalize_extension(std::string extension) {
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (!extension.empty() && extension[0] != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension;
}

static json describe_file(const fs::path &file_path, const fs::path &root) {
    std::error_code error;
    json element;
    fs::path relative = file_path.lexically_relative(root);
    element["path"] = utf8_sanitize::sanitize((relative.empty() ? file_path.filename() : relative).generic_string());
    uintmax_t size = fs::file_size(file_path, error);
    element["size"] = error ? 0 : size;
    element["extension"] = utf8_sanitize::sanitize(normalize_extension(file_path.extension().string()));
    return element;
}

static json handle_scan(const json &arguments) {
    if (!arguments.is_object() || !arguments.contains("path") || !arguments["path"].is_string()) {
        throw std::invalid_argument("Missing required parameter 'path' (string).");
    }
    fs::path root = arguments["path"].get<std::string>();

    std::set<std::string> extensions;
    if (arguments.contains("extensions")) {
        if (!arguments["extensions"].is_array()) {
            throw std::invalid_argument("Parameter 'extensions' must be an array of strings.");
        }
        for (const auto &extension : arguments["extensions"]) {
            extensions.insert(normalize_extension(extension.get<std::string>()));
        }
    }

    int max_elements = DEFAULT_MAX_ELEMENTS;
    if (arguments.contains("max_elements")) {
        max_elements = arguments["max_elements"].get<int>();
        if (max_elements <= 0) {
            throw std::invalid_argument("Parameter 'max_elements' must be positive.");
        }
    }

    std::error_code error;
    if (!fs::exists(root, error)) {
        throw handler_wrapping::ToolError(envelope::NOT_FOUND, "Path not found: " + root.string());
    }

    json elements = json::array();
    bool truncated = false;

    if (fs::is_regular_file(root, error)) {
        elements.push_back(describe_file(root, root.parent_path()));
    } else {
        fs::recursive_directory_iterator iterator(root, fs::directory_options::skip_permission_denied);
        for (; iterator != fs::recursive_directory_iterator(); iterator.increment(error)) {
            if (error) {
                logging::warning("scan: " + error.message());
                error.clear();
                continue;
            }
            const fs::directory_entry &entry = *iterator;
            if (entry.is_directory(error)) {
                if (SKIPPED_DIRECTORIES.count(entry.path().filename().string()) != 0) {
                    iterator.disable_recursion_pending();
                }
                continue;
            }
            if (!entry.is_regular_file(error)) {
                continue;
            }
            if (!extensions.empty() &&
                extensions.count(normalize_extension(entry.path().extension().string())) == 0) {
                continue;
            }
            if (static_cast<int>(elements.size()) >= max_elements) {
                truncated = true;
                break;
            }
            elements.push_back(describe_file(entry.path(), root));
        }
    }

    std::sort(elements.begin(), elements.end(), [](const json &left, const json &right) {
        return left["path"].get<std::string>() < right["path"].get<std::string>();
    });

    json result;
    result["elements"] = elements;
    result["truncated"] = truncated;
    return result;
}

namespace tool_scan {

bool register_tool(tool_registry::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["path"] = {
        {"type", "string"},
        {"description", "Directory (or single file) to scan"}
    };
    input_schema["properties"]["extensions"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Only list files with these extensions (e.g. [\".cpp\", \".hpp\"])"}
    };
    input_schema["properties"]["max_elements"] = {
        {"type", "integer"},
        {"description", "Stop after this many files (default 10000)"}
    };
    input_schema["required"] = json::array({"path"});

    return registry.register_tool({
        "scan",
        "List the files of a codebase with their sizes and extensions. "
        "Skips VCS, dependency and build output directories.",
        input_schema,
        handle_scan
    });
}

} // namespace tool_scan
