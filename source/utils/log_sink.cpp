#include "utils/log_sink.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace log_sink {

static std::mutex sink_mutex;
static SinkFunction active_sink;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static void write_to_stderr(const LogRecord &record) {
    if (record.level == LogLevel::Debug && !is_debug_enabled()) {
        return;
    }
    std::cerr << "[capbridge] " << level_name(record.level) << ": " << record.message << std::endl;
}

bool is_debug_enabled() {
    const char *value = std::getenv("CAPBRIDGE_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

const char *level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

void set_sink(SinkFunction sink) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    active_sink = std::move(sink);
}

void reset_sink() {
    std::lock_guard<std::mutex> lock(sink_mutex);
    active_sink = nullptr;
}

void log(LogLevel level, const std::string &message) {
    LogRecord record;
    record.level = level;
    record.message = message;

    // Records arrive from OS callback threads as well as the host thread.
    std::lock_guard<std::mutex> lock(sink_mutex);
    if (active_sink) {
        active_sink(record);
        return;
    }
    write_to_stderr(record);
}

void debug(const std::string &message) {
    log(LogLevel::Debug, message);
}

void info(const std::string &message) {
    log(LogLevel::Info, message);
}

void warning(const std::string &message) {
    log(LogLevel::Warning, message);
}

void error(const std::string &message) {
    log(LogLevel::Error, message);
}

} // namespace log_sink
