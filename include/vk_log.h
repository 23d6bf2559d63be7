// ============================================================================
// Vulkan RenderCore - Logging
// Process-wide log sink. Embedders install a callback to route messages into
// their own logger; without one, messages go to stderr.
// ============================================================================
#ifndef VULKAN_RENDERCORE_VK_LOG_H
#define VULKAN_RENDERCORE_VK_LOG_H

#include <format>
#include <string>
#include <utility>

namespace vrc {

enum class LogLevel {
    Info  = 0,
    Warn  = 1,
    Error = 2,
    Debug = 3
};

using LogFn = void (*)(LogLevel level, const char* message, void* user_data);

// Install (or clear with nullptr) the log callback.
void set_log_callback(LogFn fn, void* user_data);

// Messages less severe than 'level' are dropped. Debug is the most verbose.
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] bool log_enabled(LogLevel level);

void log_message(LogLevel level, const std::string& message);

template <typename... Args> void log_info(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Info)) log_message(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
}
template <typename... Args> void log_warn(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Warn)) log_message(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
}
template <typename... Args> void log_error(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Error)) log_message(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
}
template <typename... Args> void log_debug(std::format_string<Args...> fmt, Args&&... args) {
    if (log_enabled(LogLevel::Debug)) log_message(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace vrc

#endif // VULKAN_RENDERCORE_VK_LOG_H
