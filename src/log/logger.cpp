#include "mcps/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace mcps {

namespace {

std::string_view color_of(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m\033[1m";
        case LogLevel::Error: return "\033[31m\033[1m";
        case LogLevel::Fatal: return "\033[1m\033[41m";
        case LogLevel::Off:   return "";
    }
    return "";
}

constexpr std::string_view kReset = "\033[m";

std::string timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    const auto n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    char with_millis[40];
    std::snprintf(with_millis, sizeof(with_millis), "%.*s.%03d",
                  static_cast<int>(n), buffer, static_cast<int>(millis));
    return with_millis;
}

std::string_view basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// Serialises whole lines from concurrent connection threads
std::mutex& stream_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

void ILogger::write(LogLevel level, std::string_view message, std::source_location location) {
    if (should_log(level) == false) {
        return;
    }
    log(LogRecord{level, std::string(message), std::chrono::system_clock::now(), location});
}

std::optional<LogLevel> log_level_from_string(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "warn") return LogLevel::Warn;
    if (key == "fatal") return LogLevel::Fatal;
    for (const auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                             LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        if (key == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

std::string format_record(const LogRecord& record, bool colors) {
    std::string line = timestamp(record.timestamp);
    line += " [";
    if (colors) {
        line += color_of(record.level);
    }
    line += to_string(record.level);
    if (colors) {
        line += kReset;
    }
    line += "] [";
    line += basename(record.location.file_name());
    line += ':';
    line += std::to_string(record.location.line());
    line += "] ";
    line += record.message;
    return line;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

ConsoleLogger::ConsoleLogger(LogLevel threshold)
    : ILogger(threshold)
    , out_(&std::cerr)
    , colors_(true)
{}

ConsoleLogger::ConsoleLogger(std::ostream& out, LogLevel threshold)
    : ILogger(threshold)
    , out_(&out)
    , colors_(false)
{}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    const std::string line = format_record(record, colors_) + '\n';

    std::lock_guard<std::mutex> lock(stream_mutex());
    out_->write(line.data(), static_cast<std::streamsize>(line.size()));
    out_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Process logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct ProcessLogger {
    std::mutex mutex;
    std::shared_ptr<ILogger> current = std::make_shared<NullLogger>();
};

ProcessLogger& process_logger() {
    static ProcessLogger instance;
    return instance;
}

}  // namespace

std::shared_ptr<ILogger> get_logger() {
    auto& slot = process_logger();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.current;
}

void set_logger(std::shared_ptr<ILogger> logger) {
    if (!logger) {
        logger = std::make_shared<NullLogger>();
    }
    auto& slot = process_logger();
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.current.swap(logger);
    // The previous logger is released outside the lock by `logger`'s destructor
}

}  // namespace mcps
