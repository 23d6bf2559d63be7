// ============================================================================
// Vulkan RenderCore - vk_log.cpp
// Process-wide log sink; stderr unless a user callback is installed.
// ============================================================================
#include "vk_log.h"

#include <cstdio>

namespace vrc {

namespace {

struct LogSink {
    LogFn fn{nullptr};          // Optional user callback
    void* user_data{nullptr};   // Passed back to fn
    LogLevel level{LogLevel::Info};
};

LogSink& sink() {
    static LogSink s;
    return s;
}

// Error < Warn < Info < Debug in verbosity order.
int verbosity(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return 0;
    case LogLevel::Warn: return 1;
    case LogLevel::Info: return 2;
    case LogLevel::Debug: return 3;
    }
    return 3;
}

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Debug: return "debug";
    }
    return "?";
}

} // namespace

void set_log_callback(LogFn fn, void* user_data) {
    sink().fn        = fn;
    sink().user_data = user_data;
}

void set_log_level(LogLevel level) { sink().level = level; }
LogLevel log_level() { return sink().level; }
bool log_enabled(LogLevel level) { return verbosity(level) <= verbosity(sink().level); }

void log_message(LogLevel level, const std::string& message) {
    const LogSink& s = sink();
    if (s.fn) {
        s.fn(level, message.c_str(), s.user_data);
        return;
    }
    std::fprintf(stderr, "[vrc][%s] %s\n", level_name(level), message.c_str());
}

} // namespace vrc
