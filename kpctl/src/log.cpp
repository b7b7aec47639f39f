#include "log.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>

namespace kpctl {

static LogLevel g_log_level = LogLevel::WARN;
static char g_log_tag[32] = "kpctl";

void log_init(const char* tag) {
    strncpy(g_log_tag, tag, sizeof(g_log_tag) - 1);
    g_log_tag[sizeof(g_log_tag) - 1] = '\0';
}

void log_set_level(LogLevel level) {
    g_log_level = level;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name.empty())
        return std::nullopt;

    switch (name[0]) {
    case 'v':
    case 'V':
        return LogLevel::VERBOSE;
    case 'd':
    case 'D':
        return LogLevel::DEBUG;
    case 'i':
    case 'I':
        return LogLevel::INFO;
    case 'w':
    case 'W':
        return LogLevel::WARN;
    case 'e':
    case 'E':
        return LogLevel::ERROR;
    default:
        return std::nullopt;
    }
}

static void log_write(LogLevel level, const char* fmt, va_list args) {
    if (level < g_log_level)
        return;

    const char* level_str;
    switch (level) {
    case LogLevel::VERBOSE:
        level_str = "V";
        break;
    case LogLevel::DEBUG:
        level_str = "D";
        break;
    case LogLevel::INFO:
        level_str = "I";
        break;
    case LogLevel::WARN:
        level_str = "W";
        break;
    case LogLevel::ERROR:
        level_str = "E";
        break;
    default:
        level_str = "?";
        break;
    }

    char msg[1024];
    vsnprintf(msg, sizeof(msg), fmt, args);

    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    char time_buf[32];
    strftime(time_buf, sizeof(time_buf), "%m-%d %H:%M:%S", &tm_info);

    fprintf(stderr, "%s %s/%s: %s\n", time_buf, level_str, g_log_tag, msg);
}

void log_v(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::VERBOSE, fmt, args);
    va_end(args);
}

void log_d(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void log_i(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::INFO, fmt, args);
    va_end(args);
}

void log_w(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::WARN, fmt, args);
    va_end(args);
}

void log_e(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::ERROR, fmt, args);
    va_end(args);
}

}  // namespace kpctl
