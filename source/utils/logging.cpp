#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace logging {

namespace {

std::mutex output_mutex;
std::string component_name = "toolwire";
std::atomic<int> configured_level{-1};

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool is_truthy(const char *value) {
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

Level level_from_environment() {
    if (is_truthy(std::getenv("TOOLWIRE_DEBUG"))) {
        return Level::Debug;
    }
    const char *value = std::getenv("TOOLWIRE_LOG_LEVEL");
    Level level = Level::Info;
    if (value != nullptr && value[0] != '\0' && !parse_level(value, level)) {
        return Level::Info;
    }
    return level;
}

const char *level_name(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

} // namespace

bool parse_level(const std::string &text, Level &out_level) {
    std::string normalized = to_lower(text);
    if (normalized == "debug") {
        out_level = Level::Debug;
    } else if (normalized == "info") {
        out_level = Level::Info;
    } else if (normalized == "warning" || normalized == "warn") {
        out_level = Level::Warning;
    } else if (normalized == "error") {
        out_level = Level::Error;
    } else {
        return false;
    }
    return true;
}

Level minimum_level() {
    int current = configured_level.load();
    if (current < 0) {
        Level from_environment = level_from_environment();
        configured_level.compare_exchange_strong(current, static_cast<int>(from_environment));
        return static_cast<Level>(configured_level.load());
    }
    return static_cast<Level>(current);
}

void set_minimum_level(Level level) {
    configured_level.store(static_cast<int>(level));
}

bool is_debug_enabled() {
    return minimum_level() == Level::Debug;
}

void set_component(const std::string &component) {
    std::lock_guard<std::mutex> lock(output_mutex);
    component_name = component;
}

void write(Level level, const std::string &message) {
    if (static_cast<int>(level) < static_cast<int>(minimum_level())) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[toolwire] " << level_name(level) << " " << component_name << ": " << message << std::endl;
}

void debug(const std::string &message) {
    write(Level::Debug, message);
}

void info(const std::string &message) {
    write(Level::Info, message);
}

void warning(const std::string &message) {
    write(Level::Warning, message);
}

void error(const std::string &message) {
    write(Level::Error, message);
}

} // namespace logging
