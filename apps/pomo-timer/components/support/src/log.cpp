#include "support/log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <mutex>

namespace pomo {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::atomic<std::FILE*> g_output{nullptr};
std::mutex g_write_mutex;

const auto g_start = std::chrono::steady_clock::now();

char level_letter(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return 'E';
        case LogLevel::Warn:
            return 'W';
        case LogLevel::Info:
            return 'I';
        case LogLevel::Debug:
            return 'D';
        case LogLevel::Verbose:
            return 'V';
        case LogLevel::None:
        default:
            return '?';
    }
}

uint32_t millis_since_start() {
    const auto elapsed = std::chrono::steady_clock::now() - g_start;
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

}  // namespace

void log_set_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_get_level() {
    return g_level.load();
}

void log_set_output(std::FILE* stream) {
    g_output.store(stream);
}

LogLevel log_level_from_string(const char* name, LogLevel fallback) {
    if (name == nullptr) {
        return fallback;
    }
    struct Entry {
        const char* name;
        LogLevel level;
    };
    static constexpr Entry kEntries[] = {
        {"none", LogLevel::None},   {"error", LogLevel::Error}, {"warn", LogLevel::Warn},
        {"info", LogLevel::Info},   {"debug", LogLevel::Debug}, {"verbose", LogLevel::Verbose},
    };
    for (const Entry& entry : kEntries) {
        if (std::strcmp(name, entry.name) == 0) {
            return entry.level;
        }
    }
    return fallback;
}

void log_write(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::None || static_cast<uint8_t>(level) > static_cast<uint8_t>(g_level.load())) {
        return;
    }

    std::FILE* out = g_output.load();
    if (out == nullptr) {
        out = stdout;
    }

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(out, "%c (%u) %s: ", level_letter(level), static_cast<unsigned int>(millis_since_start()),
                 tag ? tag : "");
    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(out, fmt, args);
    va_end(args);
    std::fprintf(out, "\n");
    std::fflush(out);
}

}  // namespace pomo
