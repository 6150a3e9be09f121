#pragma once

#include <cstdio>
#include <cstdint>

namespace pomo {

enum class LogLevel : uint8_t {
    None,
    Error,
    Warn,
    Info,
    Debug,
    Verbose,
};

void log_set_level(LogLevel level);
LogLevel log_get_level();

// Redirects log output. Passing nullptr restores stdout.
void log_set_output(std::FILE* stream);

// Parses "error", "warn", "info", "debug", "verbose" or "none".
// Unknown strings yield `fallback`.
LogLevel log_level_from_string(const char* name, LogLevel fallback);

void log_write(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace pomo

#define POMO_LOGE(tag, fmt, ...) ::pomo::log_write(::pomo::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define POMO_LOGW(tag, fmt, ...) ::pomo::log_write(::pomo::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define POMO_LOGI(tag, fmt, ...) ::pomo::log_write(::pomo::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define POMO_LOGD(tag, fmt, ...) ::pomo::log_write(::pomo::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)
#define POMO_LOGV(tag, fmt, ...) ::pomo::log_write(::pomo::LogLevel::Verbose, tag, fmt, ##__VA_ARGS__)
