#ifndef TOOLWIRE_RETRY_POLICY_HPP
#define TOOLWIRE_RETRY_POLICY_HPP

// Classification of remote failures as transient (worth resending) or permanent.

#include <string>
#include <vector>

namespace retry_policy {

// Fixed, lower-case substrings that mark a remote error message as transient.
const std::vector<std::string> &transient_markers();

// True if error_message contains any transient marker (case-insensitive).
bool is_transient_message(const std::string &error_message);

// Delay before the given retry (attempt_number is the attempt about to be sent, >= 2).
// Fixed interval: every retry waits the configured backoff.
int backoff_milliseconds(int configured_backoff_milliseconds, int attempt_number);

} // namespace retry_policy

#endif // TOOLWIRE_RETRY_POLICY_HPP
