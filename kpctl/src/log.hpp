#pragma once

#include <cstdarg>
#include <optional>
#include <string>

namespace kpctl {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

void log_init(const char* tag);
void log_set_level(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);
void log_v(const char* fmt, ...);
void log_d(const char* fmt, ...);
void log_i(const char* fmt, ...);
void log_w(const char* fmt, ...);
void log_e(const char* fmt, ...);

// Helper macros
#define LOGV(...) kpctl::log_v(__VA_ARGS__)
#define LOGD(...) kpctl::log_d(__VA_ARGS__)
#define LOGI(...) kpctl::log_i(__VA_ARGS__)
#define LOGW(...) kpctl::log_w(__VA_ARGS__)
#define LOGE(...) kpctl::log_e(__VA_ARGS__)

}  // namespace kpctl
