#include "client/tool_connection.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/framing.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <thread>
#include <vector>

namespace tool_connection {

const char *failure_kind_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::ConnectionFailure:
        return "connection_failure";
    case FailureKind::Timeout:
        return "timeout";
    case FailureKind::RemoteFailure:
        return "remote_failure";
    case FailureKind::ProtocolViolation:
        return "protocol_violation";
    }
    return "unknown";
}

Connection::Connection() = default;

Connection::~Connection() {
    close();
}

bool Connection::open(const client_config::ClientConfig &config, std::string &error_message) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    if (opened_) {
        return is_alive();
    }

    std::string executable_path = platform::find_executable(config.server_executable);
    if (executable_path.empty()) {
        error_message = "Tool server executable not found: " + config.server_executable;
        return false;
    }

    platform::ignore_broken_pipe_signal();

    platform::SpawnResult spawn_result = platform::spawn_with_pipes(executable_path, config.server_arguments);
    if (!spawn_result.success) {
        error_message = "Failed to spawn tool server: " + spawn_result.error_message;
        return false;
    }

    process_id_ = spawn_result.process_id;
    shutdown_grace_milliseconds_ = config.shutdown_grace_milliseconds;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        stdin_fd_ = spawn_result.stdin_write_fd;
    }
    stdout_fd_ = spawn_result.stdout_read_fd;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        alive_ = true;
    }
    opened_ = true;
    reader_thread_ = std::thread(&Connection::reader_loop, this);

    logging::info("Started tool server " + executable_path + " (pid=" + std::to_string(process_id_) + ")");

    // The server needs time to finish its own startup before it reads input reliably.
    if (config.settle_milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config.settle_milliseconds));
    }

    if (!is_alive()) {
        error_message = "Tool server exited during startup (pid=" + std::to_string(process_id_) + ")";
        return false;
    }
    return true;
}

void Connection::close() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    if (!opened_) {
        return;
    }

    logging::debug("Closing tool server connection (pid=" + std::to_string(process_id_) + ")");

    // End-of-input asks the server to exit on its own.
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        platform::close_descriptor(stdin_fd_);
    }

    if (!platform::wait_for_exit(process_id_, shutdown_grace_milliseconds_)) {
        logging::warning("Tool server did not exit within " + std::to_string(shutdown_grace_milliseconds_) +
                         " ms, killing pid=" + std::to_string(process_id_));
        platform::kill_process(process_id_, true);
        if (!platform::wait_for_exit(process_id_, 2000)) {
            logging::error("Tool server pid=" + std::to_string(process_id_) + " could not be reaped");
        }
    }

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    platform::close_descriptor(stdout_fd_);

    mark_dead("connection closed");
    process_id_ = -1;
    opened_ = false;
    logging::info("Tool server connection closed");
}

bool Connection::is_alive() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return alive_;
}

size_t Connection::pending_calls() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return pending_.size();
}

size_t Connection::orphan_responses() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return orphan_responses_;
}

CallOutcome Connection::call_tool(const std::string &tool_name, const json &arguments, int timeout_milliseconds) {
    return send_and_wait(
        [&](int64_t request_id) { return envelope::build_invoke_request(request_id, tool_name, arguments); },
        tool_name, timeout_milliseconds);
}

CallOutcome Connection::call_operation(const std::string &operation, int timeout_milliseconds) {
    return send_and_wait(
        [&](int64_t request_id) { return envelope::build_operation_request(request_id, operation); },
        operation, timeout_milliseconds);
}

template <typename BuildRequest>
CallOutcome Connection::send_and_wait(BuildRequest build_request, const std::string &label,
                                      int timeout_milliseconds) {
    CallOutcome outcome;

    // Id assignment and slot registration are atomic, and happen before the
    // write, so a fast response always finds its waiter.
    int64_t request_id = envelope::NO_ID;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        if (!alive_) {
            outcome.failure = FailureKind::ConnectionFailure;
            outcome.error_message = "Tool server connection is not alive";
            return outcome;
        }
        request_id = next_request_id_++;
        pending_.emplace(request_id, PendingSlot());
    }
    outcome.request_id = request_id;

    std::string frame = framing::encode_frame(envelope::serialize(build_request(request_id)));
    if (logging::is_debug_enabled()) {
        logging::debug("Sending request id=" + std::to_string(request_id) + " (" + label + ", " +
                       std::to_string(frame.size()) + " bytes)");
    }

    bool written = false;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        written = platform::write_all(stdin_fd_, frame);
    }
    if (!written) {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        pending_.erase(request_id);
        outcome.failure = FailureKind::ConnectionFailure;
        outcome.error_message = "Failed to write request to tool server";
        return outcome;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    std::unique_lock<std::mutex> state_lock(state_mutex_);
    auto slot = pending_.find(request_id);
    bool finished = pending_condition_.wait_until(state_lock, deadline, [&]() {
        return slot->second.ready || !alive_;
    });

    if (!finished) {
        pending_.erase(slot);
        outcome.failure = FailureKind::Timeout;
        outcome.error_message = "Tool call '" + label + "' exceeded " + std::to_string(timeout_milliseconds) +
                                " ms timeout";
        return outcome;
    }

    if (!slot->second.ready) {
        pending_.erase(slot);
        outcome.failure = FailureKind::ConnectionFailure;
        outcome.error_message = "Tool server closed the connection while '" + label + "' was in flight";
        return outcome;
    }

    envelope::ParsedResponse response = std::move(slot->second.response);
    pending_.erase(slot);
    state_lock.unlock();

    switch (response.kind) {
    case envelope::ResponseKind::Result:
        outcome.success = true;
        outcome.result = std::move(response.result);
        break;
    case envelope::ResponseKind::Error:
        outcome.failure = FailureKind::RemoteFailure;
        outcome.error_code = response.error_code;
        outcome.error_message = response.error_message;
        break;
    case envelope::ResponseKind::Malformed:
        outcome.failure = FailureKind::ProtocolViolation;
        outcome.error_message = response.problem;
        break;
    }
    return outcome;
}

void Connection::reader_loop() {
    framing::FrameDecoder decoder;
    std::vector<char> buffer(65536);
    std::vector<std::string> frames;
    std::string end_reason = "tool server closed its output";

    while (true) {
        ssize_t count = platform::read_some(stdout_fd_, buffer.data(), buffer.size());
        if (count == 0) {
            break;
        }
        if (count < 0) {
            end_reason = "read from tool server failed";
            break;
        }
        frames.clear();
        decoder.feed(buffer.data(), static_cast<size_t>(count), frames);
        for (const auto &frame : frames) {
            route_response(frame);
        }
    }

    if (decoder.has_partial_frame()) {
        logging::warning("Tool server output ended inside a message; partial frame dropped");
    }
    mark_dead(end_reason);
}

void Connection::route_response(const std::string &raw_message) {
    envelope::ParsedResponse response;
    if (!envelope::parse_response(raw_message, response)) {
        logging::warning("Discarding uncorrelatable message from tool server: " + raw_message.substr(0, 200));
        return;
    }

    std::lock_guard<std::mutex> state_lock(state_mutex_);
    auto slot = pending_.find(response.id);
    if (slot == pending_.end()) {
        // Expected after a timeout: the server finished after we stopped waiting.
        orphan_responses_++;
        logging::warning("Discarding response id=" + std::to_string(response.id) + " with no live waiter");
        return;
    }
    if (slot->second.ready) {
        // The first response for this id wins.
        orphan_responses_++;
        logging::warning("Discarding duplicate response id=" + std::to_string(response.id));
        return;
    }
    slot->second.ready = true;
    slot->second.response = std::move(response);
    pending_condition_.notify_all();
}

void Connection::mark_dead(const std::string &reason) {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    if (alive_) {
        logging::info("Tool server connection is down: " + reason);
    }
    alive_ = false;
    pending_condition_.notify_all();
}

} // namespace tool_connection
