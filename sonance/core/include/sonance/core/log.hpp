#pragma once

#include <string>

namespace sonance::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers (debug overlays, test capture)
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void log(LogLevel level, const std::string& message);

// Categorised variant, the category is forwarded to sinks and prefixed on stdout
void log(LogLevel level, const char* category, const std::string& message);

void set_log_level(LogLevel level);
LogLevel get_log_level();

const char* to_string(LogLevel level);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace sonance::core
