#include "client/tool_client.hpp"
#include "client/retry_policy.hpp"
#include "protocol/envelope.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace tool_client {

namespace {

std::mutex shared_client_mutex;
std::shared_ptr<ToolClient> shared_client_instance;

void apply_outcome(const tool_connection::CallOutcome &outcome, InvokeResult &result) {
    result.success = outcome.success;
    result.failure = outcome.failure;
    result.result = outcome.result;
    result.error_code = outcome.error_code;
    result.error_message = outcome.error_message;
    if (outcome.request_id != envelope::NO_ID) {
        result.request_ids.push_back(outcome.request_id);
    }
}

} // namespace

ToolClient::ToolClient(client_config::ClientConfig config) : config_(std::move(config)) {}

ToolClient::~ToolClient() {
    close();
}

const client_config::ClientConfig &ToolClient::config() const {
    return config_;
}

int ToolClient::spawn_count() const {
    return spawn_count_.load();
}

bool ToolClient::is_connected() const {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return connection_ != nullptr && connection_->is_alive();
}

size_t ToolClient::pending_calls() const {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return connection_ ? connection_->pending_calls() : 0;
}

size_t ToolClient::orphan_responses() const {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return connection_ ? connection_->orphan_responses() : 0;
}

std::shared_ptr<tool_connection::Connection> ToolClient::ensure_connection(std::string &error_message) {
    // Held across spawn + settle so concurrent first callers share one server.
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (connection_ && connection_->is_alive()) {
        return connection_;
    }

    if (connection_) {
        logging::warning("Tool server connection lost, reconnecting");
        connection_->close();
        connection_.reset();
    }

    if (!client_config::validate(config_, error_message)) {
        return nullptr;
    }

    auto connection = std::make_shared<tool_connection::Connection>();
    if (!connection->open(config_, error_message)) {
        logging::error("Failed to connect to tool server: " + error_message);
        connection->close();
        return nullptr;
    }
    spawn_count_++;
    connection_ = connection;
    return connection_;
}

InvokeResult ToolClient::invoke(const std::string &tool_name, const json &arguments) {
    InvokeResult result;
    if (tool_name.empty()) {
        result.failure = FailureKind::ProtocolViolation;
        result.error_message = "Tool name must not be empty";
        return result;
    }

    for (int attempt = 1; attempt <= config_.max_attempts; attempt++) {
        std::string error_message;
        std::shared_ptr<tool_connection::Connection> connection = ensure_connection(error_message);
        if (!connection) {
            result.success = false;
            result.failure = FailureKind::ConnectionFailure;
            result.error_message = error_message;
            result.attempts = attempt;
            return result;
        }

        tool_connection::CallOutcome outcome =
            connection->call_tool(tool_name, arguments, config_.timeout_milliseconds);
        result.attempts = attempt;
        apply_outcome(outcome, result);

        if (outcome.success) {
            logging::debug("Tool '" + tool_name + "' completed (attempt " + std::to_string(attempt) + ")");
            return result;
        }

        if (outcome.failure != FailureKind::RemoteFailure) {
            logging::warning("Tool '" + tool_name + "' failed (" +
                             tool_connection::failure_kind_name(outcome.failure) + "): " + outcome.error_message);
            return result;
        }

        logging::warning("Tool '" + tool_name + "' returned error " + std::to_string(outcome.error_code) + ": " +
                         outcome.error_message);
        if (!retry_policy::is_transient_message(outcome.error_message)) {
            return result;
        }
        if (attempt == config_.max_attempts) {
            logging::warning("Tool '" + tool_name + "' exhausted " + std::to_string(config_.max_attempts) +
                             " attempts");
            return result;
        }

        logging::info("Retrying tool call '" + tool_name + "' (" + std::to_string(attempt + 1) + "/" +
                      std::to_string(config_.max_attempts) + ")");
        int delay = retry_policy::backoff_milliseconds(config_.retry_backoff_milliseconds, attempt + 1);
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
    return result;
}

InvokeResult ToolClient::single_operation(const std::string &operation) {
    InvokeResult result;
    std::string error_message;
    std::shared_ptr<tool_connection::Connection> connection = ensure_connection(error_message);
    result.attempts = 1;
    if (!connection) {
        result.failure = FailureKind::ConnectionFailure;
        result.error_message = error_message;
        return result;
    }
    apply_outcome(connection->call_operation(operation, config_.timeout_milliseconds), result);
    return result;
}

InvokeResult ToolClient::list_tools() {
    return single_operation(envelope::OP_LIST);
}

InvokeResult ToolClient::ping() {
    return single_operation(envelope::OP_PING);
}

void ToolClient::close() {
    std::shared_ptr<tool_connection::Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        connection = std::move(connection_);
        connection_.reset();
    }
    if (connection) {
        connection->close();
    }
}

std::shared_ptr<ToolClient> shared_client(const client_config::ClientConfig &config) {
    std::lock_guard<std::mutex> lock(shared_client_mutex);
    if (!shared_client_instance) {
        shared_client_instance = std::make_shared<ToolClient>(config);
    }
    return shared_client_instance;
}

std::shared_ptr<ToolClient> shared_client() {
    {
        std::lock_guard<std::mutex> lock(shared_client_mutex);
        if (shared_client_instance) {
            return shared_client_instance;
        }
    }
    return shared_client(client_config::load_from_environment());
}

void reset_shared_client() {
    std::shared_ptr<ToolClient> previous;
    {
        std::lock_guard<std::mutex> lock(shared_client_mutex);
        previous = std::move(shared_client_instance);
        shared_client_instance.reset();
    }
    if (previous) {
        previous->close();
    }
}

} // namespace tool_client
