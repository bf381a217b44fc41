#ifndef TOOLWIRE_LOGGING_HPP
#define TOOLWIRE_LOGGING_HPP

// Diagnostic logging to stderr.
// stdout is reserved for protocol frames on the server side, so nothing here
// ever writes to it.

#include <string>

namespace logging {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Returns true if TOOLWIRE_DEBUG env is set to a truthy value (1, true, yes)
// or TOOLWIRE_LOG_LEVEL is "debug".
bool is_debug_enabled();

// Minimum level written. Read from TOOLWIRE_LOG_LEVEL on first use (default info).
Level minimum_level();
void set_minimum_level(Level level);

// Parse "debug" | "info" | "warning" | "error" (case-insensitive). Returns false if unknown.
bool parse_level(const std::string &text, Level &out_level);

// Name printed after the level on every line, e.g. "server" or "client".
void set_component(const std::string &component);

void debug(const std::string &message);
void info(const std::string &message);
void warning(const std::string &message);
void error(const std::string &message);

// Writes one line: [toolwire] <LEVEL> <component>: <message>
void write(Level level, const std::string &message);

} // namespace logging

#endif // TOOLWIRE_LOGGING_HPP
