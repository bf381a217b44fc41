#ifndef TOOLWIRE_TOOL_CONNECTION_HPP
#define TOOLWIRE_TOOL_CONNECTION_HPP

// One channel to a spawned tool server: the child process, its stdin/stdout
// pipes, the request id counter and the pending call table.
//
// Any number of threads may call concurrently. A single reader thread drains
// the server's stdout and hands each response to the caller waiting on its id.

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "client/client_config.hpp"
#include "protocol/envelope.hpp"

namespace tool_connection {

using json = nlohmann::json;

enum class FailureKind {
    None,
    ConnectionFailure,  // could not establish or keep the channel
    Timeout,            // no response within the ceiling
    RemoteFailure,      // server answered with an error descriptor
    ProtocolViolation   // answer for our id was not a valid response
};

const char *failure_kind_name(FailureKind kind);

// Outcome of one request/response exchange.
struct CallOutcome {
    bool success = false;
    FailureKind failure = FailureKind::None;
    json result;
    int error_code = 0;
    std::string error_message;
    int64_t request_id = envelope::NO_ID;
};

class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Spawn the server described by config, start the reader and wait the
    // settle interval. Returns false (with a reason) if the channel is not usable.
    bool open(const client_config::ClientConfig &config, std::string &error_message);

    // Signal end-of-input, wait the grace period, then kill. Idempotent; safe
    // on a connection that was never opened.
    void close();

    bool is_alive() const;

    // Send an invoke request and wait up to timeout_milliseconds for its response.
    CallOutcome call_tool(const std::string &tool_name, const json &arguments, int timeout_milliseconds);

    // Send a tool-less operation (list, ping).
    CallOutcome call_operation(const std::string &operation, int timeout_milliseconds);

    // Diagnostics.
    size_t pending_calls() const;
    size_t orphan_responses() const;

private:
    struct PendingSlot {
        bool ready = false;
        envelope::ParsedResponse response;
    };

    template <typename BuildRequest>
    CallOutcome send_and_wait(BuildRequest build_request, const std::string &label, int timeout_milliseconds);

    void reader_loop();
    void route_response(const std::string &raw_message);
    void mark_dead(const std::string &reason);

    // Serializes open/close.
    std::mutex lifecycle_mutex_;
    bool opened_ = false;
    int process_id_ = -1;
    int shutdown_grace_milliseconds_ = client_config::DEFAULT_SHUTDOWN_GRACE_MILLISECONDS;
    std::thread reader_thread_;

    // Guards stdin_fd_ and keeps frames from interleaving.
    std::mutex write_mutex_;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;

    // Guards everything below.
    mutable std::mutex state_mutex_;
    std::condition_variable pending_condition_;
    bool alive_ = false;
    int64_t next_request_id_ = 1;
    std::map<int64_t, PendingSlot> pending_;
    size_t orphan_responses_ = 0;
};

} // namespace tool_connection

#endif // TOOLWIRE_TOOL_CONNECTION_HPP
