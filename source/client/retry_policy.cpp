#include "client/retry_policy.hpp"

#include <algorithm>
#include <cctype>

namespace retry_policy {

const std::vector<std::string> &transient_markers() {
    static const std::vector<std::string> markers = {
        "timeout",
        "timed out",
        "temporary",
        "temporarily unavailable",
        "busy",
        "try again",
        "connection reset",
        "reset by peer",
        "contention",
        "unavailable",
    };
    return markers;
}

bool is_transient_message(const std::string &error_message) {
    std::string lowered = error_message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    for (const auto &marker : transient_markers()) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

int backoff_milliseconds(int configured_backoff_milliseconds, int attempt_number) {
    (void)attempt_number;
    return std::max(0, configured_backoff_milliseconds);
}

} // namespace retry_policy
