#ifndef CAPBRIDGE_LOG_SINK_HPP
#define CAPBRIDGE_LOG_SINK_HPP

// Logging sink for the bridge.
// Records are {level, message}. The default sink writes to stderr (stdout is
// reserved for the stdio transport); hosts and tests may install their own.

#include <functional>
#include <string>

namespace log_sink {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string message;
};

using SinkFunction = std::function<void(const LogRecord &record)>;

// Returns true if CAPBRIDGE_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Lowercase level name ("debug", "info", "warning", "error").
const char *level_name(LogLevel level);

// Replace the active sink. Installed sinks receive every record, debug included.
void set_sink(SinkFunction sink);

// Restore the default stderr sink.
void reset_sink();

// Send one record to the active sink. The default sink drops debug records
// unless is_debug_enabled().
void log(LogLevel level, const std::string &message);

void debug(const std::string &message);
void info(const std::string &message);
void warning(const std::string &message);
void error(const std::string &message);

} // namespace log_sink

#endif // CAPBRIDGE_LOG_SINK_HPP
