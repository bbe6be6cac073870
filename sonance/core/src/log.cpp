#include <sonance/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace sonance::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

void log(LogLevel level, const char* message) {
    log(level, "", std::string(message ? message : ""));
}

void log(LogLevel level, const std::string& message) {
    log(level, "", message);
}

void log(LogLevel level, const char* category, const std::string& message) {
    if (level < s_log_level) return;

    const char* cat = category ? category : "";
    if (*cat) {
        std::printf("[%s] [%s] %s\n", to_string(level), cat, message.c_str());
    } else {
        std::printf("[%s] %s\n", to_string(level), message.c_str());
    }
#ifdef _WIN32
    OutputDebugStringA(message.c_str());
    OutputDebugStringA("\n");
#endif

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, cat, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace sonance::core
