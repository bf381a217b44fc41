#include "server/handler_wrapping.hpp"
#include "protocol/envelope.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_sanitize.hpp"

#include <algorithm>
#include <cctype>
#include <ios>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace handler_wrapping {

namespace {

constexpr size_t kSummaryValueBytes = 80;
constexpr size_t kSummaryMaxKeys = 16;

std::mutex observer_mutex;
InvocationObserver invocation_observer;

const std::vector<std::string> &sensitive_key_fragments() {
    static const std::vector<std::string> fragments = {
        "password", "passwd", "token", "secret", "api_key", "apikey", "authorization", "credential", "cookie",
    };
    return fragments;
}

bool is_sensitive_key(const std::string &key) {
    std::string lowered = key;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    for (const auto &fragment : sensitive_key_fragments()) {
        if (lowered.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string summarize_value(const json &value) {
    if (value.is_object()) {
        return "{" + std::to_string(value.size()) + " keys}";
    }
    if (value.is_array()) {
        return "[" + std::to_string(value.size()) + " items]";
    }
    if (value.is_string()) {
        return "\"" + utf8_sanitize::truncate(value.get<std::string>(), kSummaryValueBytes) + "\"";
    }
    return utf8_sanitize::truncate(envelope::serialize(value), kSummaryValueBytes);
}

HandlerOutcome failure(int error_code, const std::string &message) {
    HandlerOutcome outcome;
    outcome.success = false;
    outcome.error_code = error_code;
    outcome.error_message = utf8_sanitize::sanitize(message);
    outcome.hint = remediation_hint(error_code);
    return outcome;
}

int code_for_system_error(const std::system_error &error) {
    const std::error_code &code = error.code();
    if (code == std::errc::no_such_file_or_directory || code == std::errc::not_a_directory) {
        return envelope::NOT_FOUND;
    }
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
        return envelope::PERMISSION_DENIED;
    }
    return envelope::IO_ERROR;
}

} // namespace

const char *remediation_hint(int error_code) {
    switch (error_code) {
    case envelope::INVALID_PARAMS:
        return "Check input parameters and try again";
    case envelope::PERMISSION_DENIED:
        return "Check file and directory permissions";
    case envelope::NOT_FOUND:
        return "Verify the resource exists and path is correct";
    case envelope::IO_ERROR:
        return "Check disk space and file system permissions";
    default:
        return "";
    }
}

ToolError::ToolError(int error_code, const std::string &message)
    : std::runtime_error(message), code_(error_code) {}

int ToolError::code() const noexcept {
    return code_;
}

void set_invocation_observer(InvocationObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex);
    invocation_observer = std::move(observer);
}

std::string summarize_arguments(const json &arguments) {
    if (!arguments.is_object()) {
        return "(" + std::string(arguments.type_name()) + ") " + summarize_value(arguments);
    }

    std::string summary = "{";
    size_t emitted = 0;
    for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
        if (emitted == kSummaryMaxKeys) {
            summary += ", ...";
            break;
        }
        if (emitted > 0) {
            summary += ", ";
        }
        summary += utf8_sanitize::truncate(iterator.key(), kSummaryValueBytes) + "=";
        summary += is_sensitive_key(iterator.key()) ? "<redacted>" : summarize_value(iterator.value());
        emitted++;
    }
    summary += "}";
    return summary;
}

WrappedHandler with_failure_normalization(const std::string &tool_name, tool_registry::ToolHandler handler) {
    return [tool_name, handler](const json &arguments) -> HandlerOutcome {
        auto log_failure = [&](const std::string &event, const std::string &detail) {
            logging::error(tool_name + event + ": " + detail + " args=" + summarize_arguments(arguments));
        };
        try {
            HandlerOutcome outcome;
            outcome.success = true;
            outcome.result = handler(arguments);
            return outcome;
        } catch (const ToolError &error) {
            log_failure("_tool_error (" + std::to_string(error.code()) + ")", error.what());
            return failure(error.code(), error.what());
        } catch (const json::exception &error) {
            log_failure("_json_error", error.what());
            return failure(envelope::INVALID_PARAMS, "Invalid arguments for " + tool_name + ": " + error.what());
        } catch (const std::invalid_argument &error) {
            log_failure("_validation_error", error.what());
            return failure(envelope::INVALID_PARAMS, error.what());
        } catch (const std::out_of_range &error) {
            log_failure("_validation_error", error.what());
            return failure(envelope::INVALID_PARAMS, error.what());
        } catch (const std::system_error &error) {
            // Also covers std::filesystem::filesystem_error and std::ios_base::failure.
            int code = code_for_system_error(error);
            if (code == envelope::PERMISSION_DENIED) {
                logging::warning("Security event - permission_denied in " + tool_name + ": " + error.what() +
                                 " args=" + summarize_arguments(arguments));
            } else {
                log_failure(code == envelope::NOT_FOUND ? "_not_found" : "_io_error", error.what());
            }
            return failure(code, error.what());
        } catch (const std::exception &error) {
            log_failure("_error", error.what());
            return failure(envelope::INTERNAL_ERROR, "Failed to execute " + tool_name + ": " + error.what());
        } catch (...) {
            log_failure("_error", "non-standard exception");
            return failure(envelope::INTERNAL_ERROR, "Failed to execute " + tool_name + ": unknown exception");
        }
    };
}

WrappedHandler with_invocation_logging(const std::string &tool_name, WrappedHandler inner) {
    return [tool_name, inner](const json &arguments) -> HandlerOutcome {
        std::string summary = summarize_arguments(arguments);
        logging::info("Tool called: " + tool_name + " " + summary);
        InvocationObserver observer;
        {
            std::lock_guard<std::mutex> lock(observer_mutex);
            observer = invocation_observer;
        }
        if (observer) {
            observer(tool_name, summary);
        }
        return inner(arguments);
    };
}

WrappedHandler wrap(const tool_registry::ToolDefinition &definition) {
    return with_invocation_logging(definition.name,
                                   with_failure_normalization(definition.name, definition.handler));
}

} // namespace handler_wrapping
