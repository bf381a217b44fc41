#ifndef TOOLWIRE_CLIENT_CONFIG_HPP
#define TOOLWIRE_CLIENT_CONFIG_HPP

// Settings consumed by the tool client. Plain scalars with fixed defaults,
// overridable by the embedding application or by TOOLWIRE_* environment variables.

#include <string>
#include <vector>

namespace client_config {

constexpr int DEFAULT_TIMEOUT_MILLISECONDS = 120000;
constexpr int DEFAULT_MAX_ATTEMPTS = 3;
constexpr int DEFAULT_RETRY_BACKOFF_MILLISECONDS = 500;
constexpr int DEFAULT_SETTLE_MILLISECONDS = 500;
constexpr int DEFAULT_SHUTDOWN_GRACE_MILLISECONDS = 5000;

struct ClientConfig {
    // How to launch the tool server. Bare names are resolved on PATH.
    std::string server_executable = "toolwire_server";
    std::vector<std::string> server_arguments;

    // Ceiling for one attempt, from send to matching response.
    int timeout_milliseconds = DEFAULT_TIMEOUT_MILLISECONDS;
    // Total attempts including the first (transient remote failures only).
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    int retry_backoff_milliseconds = DEFAULT_RETRY_BACKOFF_MILLISECONDS;
    // Time given to a freshly spawned server before the connection is used.
    int settle_milliseconds = DEFAULT_SETTLE_MILLISECONDS;
    // Time the server gets to exit after end-of-input before it is killed.
    int shutdown_grace_milliseconds = DEFAULT_SHUTDOWN_GRACE_MILLISECONDS;
};

// Apply TOOLWIRE_SERVER, TOOLWIRE_SERVER_ARGS, TOOLWIRE_TIMEOUT_MS,
// TOOLWIRE_MAX_ATTEMPTS, TOOLWIRE_RETRY_BACKOFF_MS, TOOLWIRE_SETTLE_MS and
// TOOLWIRE_SHUTDOWN_GRACE_MS on top of base. Malformed values are logged and ignored.
ClientConfig load_from_environment(const ClientConfig &base = ClientConfig());

// Returns false (with a reason) if the config cannot be used to connect.
bool validate(const ClientConfig &config, std::string &error_message);

} // namespace client_config

#endif // TOOLWIRE_CLIENT_CONFIG_HPP
