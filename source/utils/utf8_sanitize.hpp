#ifndef TOOLWIRE_UTF8_SANITIZE_HPP
#define TOOLWIRE_UTF8_SANITIZE_HPP

// UTF-8 helpers for text that leaves the process: log summaries and tool
// results built from file system paths or file contents.

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// True if text is entirely well-formed UTF-8.
bool is_valid(const std::string &text);

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// In-place version.
void sanitize(std::string &text);

// Replaces invalid UTF-8 sequences with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

// Cuts text to at most max_bytes without splitting a multibyte sequence and
// appends "..." when anything was removed. The result is sanitized.
std::string truncate(const std::string &text, size_t max_bytes);

} // namespace utf8_sanitize

#endif // TOOLWIRE_UTF8_SANITIZE_HPP
