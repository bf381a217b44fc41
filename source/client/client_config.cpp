#include "client/client_config.hpp"
#include "utils/logging.hpp"

#include <cstdlib>
#include <sstream>

namespace client_config {

namespace {

// Reads a strictly positive integer (zero allowed when allow_zero) from the
// environment. Leaves target untouched if unset or malformed.
void apply_integer(const char *variable_name, int &target, bool allow_zero) {
    const char *value = std::getenv(variable_name);
    if (value == nullptr || value[0] == '\0') {
        return;
    }
    std::string text(value);
    try {
        size_t consumed = 0;
        long parsed = std::stol(text, &consumed);
        if (consumed != text.size() || parsed < (allow_zero ? 0 : 1) || parsed > 86400000L) {
            logging::warning(std::string("Ignoring out-of-range ") + variable_name + "=" + text);
            return;
        }
        target = static_cast<int>(parsed);
    } catch (const std::exception &) {
        logging::warning(std::string("Ignoring non-numeric ") + variable_name + "=" + text);
    }
}

std::vector<std::string> split_arguments(const std::string &text) {
    std::vector<std::string> arguments;
    std::istringstream stream(text);
    std::string argument;
    while (stream >> argument) {
        arguments.push_back(argument);
    }
    return arguments;
}

} // namespace

ClientConfig load_from_environment(const ClientConfig &base) {
    ClientConfig config = base;

    const char *server = std::getenv("TOOLWIRE_SERVER");
    if (server != nullptr && server[0] != '\0') {
        config.server_executable = server;
    }
    const char *server_arguments = std::getenv("TOOLWIRE_SERVER_ARGS");
    if (server_arguments != nullptr) {
        config.server_arguments = split_arguments(server_arguments);
    }

    apply_integer("TOOLWIRE_TIMEOUT_MS", config.timeout_milliseconds, false);
    apply_integer("TOOLWIRE_MAX_ATTEMPTS", config.max_attempts, false);
    apply_integer("TOOLWIRE_RETRY_BACKOFF_MS", config.retry_backoff_milliseconds, true);
    apply_integer("TOOLWIRE_SETTLE_MS", config.settle_milliseconds, true);
    apply_integer("TOOLWIRE_SHUTDOWN_GRACE_MS", config.shutdown_grace_milliseconds, true);
    return config;
}

bool validate(const ClientConfig &config, std::string &error_message) {
    if (config.server_executable.empty()) {
        error_message = "No tool server executable configured";
        return false;
    }
    if (config.timeout_milliseconds <= 0) {
        error_message = "timeout_milliseconds must be positive";
        return false;
    }
    if (config.max_attempts < 1) {
        error_message = "max_attempts must be at least 1";
        return false;
    }
    if (config.retry_backoff_milliseconds < 0 || config.settle_milliseconds < 0 ||
        config.shutdown_grace_milliseconds < 0) {
        error_message = "Intervals must not be negative";
        return false;
    }
    return true;
}

} // namespace client_config
