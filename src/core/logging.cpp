// ============================================================================
// coalesce/core/logging.cpp - Logger Implementation
// ============================================================================

#include "coalesce/core/logging.hpp"

#include <cstdio>
#include <ctime>

namespace coalesce {

const char* LogLevelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Error:
            return "error";
        case LogLevel::Off:
            return "off";
    }
    return "unknown";
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : sink_(&Logger::DefaultSink), user_data_(nullptr), level_(LogLevel::Off) {}

void Logger::SetSink(LogSink sink, void* user_data) {
    if (sink == nullptr) {
        sink_ = &Logger::DefaultSink;
        user_data_ = nullptr;
        return;
    }
    sink_ = sink;
    user_data_ = user_data;
}

void Logger::Write(LogLevel level, std::string_view message, std::string_view file, int line) {
    if (!IsEnabled(level)) {
        return;
    }
    LogRecord record{level, message, file, line, std::chrono::system_clock::now()};
    sink_(user_data_, record);
}

void Logger::DefaultSink(void*, const LogRecord& record) {
    std::time_t time = std::chrono::system_clock::to_time_t(record.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;

    // Basename only
    std::string_view file = record.file;
    if (auto pos = file.find_last_of('/'); pos != std::string_view::npos) {
        file = file.substr(pos + 1);
    }

    std::string line = fmt::format("[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] [coalesce] [{}] [{}:{}] {}\n",
                                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                                   static_cast<int>(ms.count()), LogLevelToString(record.level), file, record.line,
                                   record.message);
    std::fputs(line.c_str(), stderr);
}

}  // namespace coalesce
