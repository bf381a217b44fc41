// Tests for the business tools (scan, file_stats, echo), run through the
// dispatcher so argument errors and filesystem failures arrive as error envelopes.

#include "protocol/envelope.hpp"
#include "server/tool_dispatch.hpp"
#include "server/tool_registry.hpp"
#include "tool_handlers/tool_handlers.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace test_tool_handlers {

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static void write_file(const fs::path &path, const std::string &content) {
    fs::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream << content;
}

// Temporary project tree, removed when the test finishes.
class ScratchProject {
public:
    ScratchProject() {
        root_ = fs::temp_directory_path() / ("toolwire_test_" + std::to_string(getpid()));
        fs::remove_all(root_);
        write_file(root_ / "a.cpp", "int main() { return 0; }\n");
        write_file(root_ / "b.hpp", "#pragma once\n");
        write_file(root_ / "notes.txt", "one\n\n  \nfour longest\n");
        write_file(root_ / "sub" / "c.CPP", "// c\n");
        write_file(root_ / "node_modules" / "dep.cpp", "// vendored\n");
        write_file(root_ / ".git" / "HEAD", "ref: refs/heads/main\n");
    }
    ~ScratchProject() {
        std::error_code error;
        fs::remove_all(root_, error);
    }
    const fs::path &root() const { return root_; }

private:
    fs::path root_;
};

static json invoke(const tool_dispatch::Dispatcher &dispatcher, const std::string &tool, const json &arguments) {
    static int64_t next_id = 1;
    tool_dispatch::DispatchResult result =
        dispatcher.dispatch(envelope::serialize(envelope::build_invoke_request(next_id++, tool, arguments)));
    return result.response;
}

static std::vector<std::string> element_paths(const json &response) {
    std::vector<std::string> paths;
    for (const auto &element : response["result"]["elements"]) {
        paths.push_back(element["path"].get<std::string>());
    }
    return paths;
}

// Test: scan lists project files and skips vendored and VCS directories.
static bool test_scan_lists_files() {
    ScratchProject project;
    tool_registry::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);
    tool_dispatch::Dispatcher dispatcher(registry);

    json all = invoke(dispatcher, "scan", json{{"path", project.root().string()}});
    json only_cpp =
        invoke(dispatcher, "scan", json{{"path", project.root().string()}, {"extensions", json::array({"cpp"})}});

    std::vector<std::string> expected_all = {"a.cpp", "b.hpp", "notes.txt", "sub/c.CPP"};
    std::vector<std::string> expected_cpp = {"a.cpp", "sub/c.CPP"};
    return check(element_paths(all) == expected_all && all["result"]["truncated"] == false &&
                     all["result"]["elements"][0]["extension"] == ".cpp" &&
                     all["result"]["elements"][0]["size"] == 25 && element_paths(only_cpp) == expected_cpp,
                 "scan lists files, filters by extension, skips node_modules and .git");
}

// Test: scan stops at max_elements and reports truncation.
static bool test_scan_truncates() {
    ScratchProject project;
    tool_registry::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);
    tool_dispatch::Dispatcher dispatcher(registry);

    json response = invoke(dispatcher, "scan", json{{"path", project.root().string()}, {"max_elements", 1}});
    return check(response["result"]["elements"].size() == 1 && response["result"]["truncated"] == true,
                 "scan honors max_elements");
}

// Test: bad arguments and missing paths come back as classified errors.
static bool test_scan_errors() {
    tool_registry::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);
    tool_dispatch::Dispatcher dispatcher(registry);

    json missing_argument = invoke(dispatcher, "scan", json::object());
    json missing_path = invoke(dispatcher, "scan", json{{"path", "/nonexistent/toolwire/project"}});
    json bad_limit = invoke(dispatcher, "scan", json{{"path", "/"}, {"max_elements", 0}});
    return check(missing_argument["error"]["code"] == envelope::INVALID_PARAMS &&
                     missing_path["error"]["code"] == envelope::NOT_FOUND &&
                     missing_path["error"]["data"]["tool"] == "scan" &&
                     missing_path["error"]["data"]["hint"] == "Verify the resource exists and path is correct" &&
                     bad_limit["error"]["code"] == envelope::INVALID_PARAMS,
                 "scan reports invalid parameters and missing paths");
}

// Test: file_stats counts lines, blank lines and bytes.
static bool test_file_stats() {
    ScratchProject project;
    tool_registry::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);
    tool_dispatch::Dispatcher dispatcher(registry);

    json stats = invoke(dispatcher, "file_stats", json{{"path", (project.root() / "notes.txt").string()}});
    json directory = invoke(dispatcher, "file_stats", json{{"path", project.root().string()}});
    return check(stats["result"]["lines"] == 4 && stats["result"]["blank_lines"] == 2 &&
                     stats["result"]["longest_line"] == 12 && stats["result"]["bytes"] == 21 &&
                     directory["error"]["code"] == envelope::NOT_FOUND,
                 "file_stats measures a text file and refuses directories");
}

// Test: echo returns any argument value unchanged.
static bool test_echo() {
    tool_registry::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);
    tool_dispatch::Dispatcher dispatcher(registry);

    json arguments = {{"nested", {{"list", {1, 2, 3}}}}, {"text", "h\xC3\xA9llo"}};
    json response = invoke(dispatcher, "echo", arguments);
    return check(response["result"] == arguments && registry.size() == 3, "echo returns its arguments");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_scan_lists_files();
    all_passed &= test_scan_truncates();
    all_passed &= test_scan_errors();
    all_passed &= test_file_stats();
    all_passed &= test_echo();
    return all_passed;
}

} // namespace test_tool_handlers
