// ============================================================================
// coalesce/core/logging.hpp - Leveled Library Logging
// ============================================================================
//
// A process-wide logger for the library's own diagnostics. Messages are
// formatted with {fmt} and handed to a pluggable sink together with their
// level and source location.
//
// Logging is OFF by default: a library must stay silent until the host
// application opts in.
//
// USAGE:
// ------
//   coalesce::SetLogLevel(coalesce::LogLevel::Debug);
//   coalesce::SetLogSink([](void*, const coalesce::LogRecord& rec) {
//       MyLogger::Write(rec.message);
//   });
//
//   COALESCE_LOG_DEBUG("transfer {} created", key);
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace coalesce {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

const char* LogLevelToString(LogLevel level) noexcept;

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view file;
    int line;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = void (*)(void* user_data, const LogRecord& record);

// ============================================================================
// Logger
// ============================================================================
class Logger {
   public:
    static Logger& Instance();

    // Install a sink. nullptr restores the default stderr sink.
    // Must be called before logging starts on other threads.
    void SetSink(LogSink sink, void* user_data = nullptr);

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool IsEnabled(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load(std::memory_order_relaxed);
    }

    void Write(LogLevel level, std::string_view message, std::string_view file, int line);

    template <typename... Args>
    void Write(LogLevel level, std::string_view file, int line, fmt::format_string<Args...> format,
               Args&&... args) {
        if (!IsEnabled(level)) {
            return;
        }
        std::string message = fmt::format(format, std::forward<Args>(args)...);
        Write(level, message, file, line);
    }

   private:
    Logger();

    static void DefaultSink(void* user_data, const LogRecord& record);

    LogSink sink_;
    void* user_data_;
    std::atomic<LogLevel> level_;
};

inline void SetLogLevel(LogLevel level) {
    Logger::Instance().SetLevel(level);
}

inline void SetLogSink(LogSink sink, void* user_data = nullptr) {
    Logger::Instance().SetSink(sink, user_data);
}

}  // namespace coalesce

#define COALESCE_LOG_DEBUG(fmt_str, ...) \
    ::coalesce::Logger::Instance().Write(::coalesce::LogLevel::Debug, __FILE__, __LINE__, fmt_str __VA_OPT__(, ) __VA_ARGS__)

#define COALESCE_LOG_INFO(fmt_str, ...) \
    ::coalesce::Logger::Instance().Write(::coalesce::LogLevel::Info, __FILE__, __LINE__, fmt_str __VA_OPT__(, ) __VA_ARGS__)

#define COALESCE_LOG_WARNING(fmt_str, ...) \
    ::coalesce::Logger::Instance().Write(::coalesce::LogLevel::Warning, __FILE__, __LINE__, fmt_str __VA_OPT__(, ) __VA_ARGS__)

#define COALESCE_LOG_ERROR(fmt_str, ...) \
    ::coalesce::Logger::Instance().Write(::coalesce::LogLevel::Error, __FILE__, __LINE__, fmt_str __VA_OPT__(, ) __VA_ARGS__)
