#ifndef TOOLWIRE_TOOL_CLIENT_HPP
#define TOOLWIRE_TOOL_CLIENT_HPP

// Caller-side entry point: invoke a named tool on the tool server and get back
// a result or exactly one failure classification. Hides process lifecycle,
// id correlation, timeouts and transient-failure retries.

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client/client_config.hpp"
#include "client/tool_connection.hpp"

namespace tool_client {

using json = nlohmann::json;
using tool_connection::FailureKind;

// Result of one logical invocation (all attempts).
struct InvokeResult {
    bool success = false;
    FailureKind failure = FailureKind::None;
    json result;
    int error_code = 0;
    std::string error_message;
    int attempts = 0;
    // Id used by each attempt, in order. Never reused across attempts.
    std::vector<int64_t> request_ids;
};

class ToolClient {
public:
    explicit ToolClient(client_config::ClientConfig config);
    ~ToolClient();

    ToolClient(const ToolClient &) = delete;
    ToolClient &operator=(const ToolClient &) = delete;

    // Invoke tool_name with arguments. Transient remote failures are resent
    // with a fresh id up to config.max_attempts total attempts; connection
    // failures and timeouts are surfaced immediately.
    InvokeResult invoke(const std::string &tool_name, const json &arguments);

    // Discovery: {"tools": [...]} as advertised by the server. Single attempt.
    InvokeResult list_tools();

    // Health check. Single attempt.
    InvokeResult ping();

    // Tear down the connection (if any). Idempotent. A later invoke reconnects.
    void close();

    const client_config::ClientConfig &config() const;

    // Diagnostics. spawn_count() counts servers that started and survived the
    // settle interval.
    int spawn_count() const;
    bool is_connected() const;
    size_t pending_calls() const;
    size_t orphan_responses() const;

private:
    std::shared_ptr<tool_connection::Connection> ensure_connection(std::string &error_message);
    InvokeResult single_operation(const std::string &operation);

    client_config::ClientConfig config_;
    mutable std::mutex connection_mutex_;
    std::shared_ptr<tool_connection::Connection> connection_;
    std::atomic<int> spawn_count_{0};
};

// Process-wide client, constructed once under a lock on first access. Later
// calls return the same instance and ignore config.
std::shared_ptr<ToolClient> shared_client(const client_config::ClientConfig &config);
std::shared_ptr<ToolClient> shared_client();

// Close and drop the process-wide client (next access constructs a new one).
void reset_shared_client();

} // namespace tool_client

#endif // TOOLWIRE_TOOL_CLIENT_HPP
