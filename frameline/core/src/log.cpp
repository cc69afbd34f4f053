#include <frameline/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>

namespace frameline::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        default: return "unknown";
    }
}

void log(LogLevel level, const char* message) {
    log(level, "", message ? message : "");
}

void log(LogLevel level, const std::string& category, const std::string& message) {
    if (level < s_log_level) return;

    if (category.empty()) {
        std::printf("[%s] %s\n", to_string(level), message.c_str());
    } else {
        std::printf("[%s] [%s] %s\n", to_string(level), category.c_str(), message.c_str());
    }

    // Sinks see every message that passes the level filter
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
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

} // namespace frameline::core
