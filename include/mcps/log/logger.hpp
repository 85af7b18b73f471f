#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────
// Process log levels. The per-session MCP levels (debug..emergency) are
// folded onto these by to_log_level() in server_config.hpp.

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

/// Same names spdlog prints for %l, so both backends agree on the text.
[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "critical";
        case LogLevel::Off:   return "off";
    }
    return "off";
}

/// Accepts the to_string() names plus "warn" and "fatal", in any case.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name);

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - backend interface
// ─────────────────────────────────────────────────────────────────────────────
// Connection threads log concurrently, so log() must be thread-safe. The
// threshold lives here so every backend filters the same way before a
// record is built.

class ILogger {
public:
    virtual ~ILogger() = default;

    ILogger(const ILogger&) = delete;
    ILogger& operator=(const ILogger&) = delete;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= threshold_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel level() const noexcept { return threshold_.load(std::memory_order_relaxed); }

    virtual void set_level(LogLevel level) noexcept { threshold_.store(level, std::memory_order_relaxed); }

    void write(LogLevel level, std::string_view message,
               std::source_location location = std::source_location::current());

protected:
    explicit ILogger(LogLevel threshold) noexcept : threshold_(threshold) {}

private:
    std::atomic<LogLevel> threshold_;
};

class NullLogger final : public ILogger {
public:
    NullLogger() noexcept : ILogger(LogLevel::Off) {}

    void log(const LogRecord&) override {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────
// Dependency-free fallback for tools and tests. Writes to stderr unless given
// a stream; stdout is left alone. Line format:
//   2026-01-31 12:00:00.123 [warning] [tcp_server.cpp:88] message

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel threshold = LogLevel::Info);
    ConsoleLogger(std::ostream& out, LogLevel threshold);

    void log(const LogRecord& record) override;

    void set_colors_enabled(bool enabled) noexcept { colors_ = enabled; }

private:
    std::ostream* out_;
    bool colors_;
};

/// One console line for `record`, without the trailing newline.
[[nodiscard]] std::string format_record(const LogRecord& record, bool colors = false);

// ─────────────────────────────────────────────────────────────────────────────
// Process logger
// ─────────────────────────────────────────────────────────────────────────────
// get_logger() hands out shared ownership, so a record being written on a
// connection thread keeps its logger alive across a concurrent set_logger().

[[nodiscard]] std::shared_ptr<ILogger> get_logger();

/// nullptr restores the NullLogger.
void set_logger(std::shared_ptr<ILogger> logger);

}  // namespace mcps

#define MCPS_LOG(level, msg)                                        \
    do {                                                            \
        const auto mcps_logger_ = ::mcps::get_logger();             \
        if (mcps_logger_->should_log(level)) {                      \
            mcps_logger_->write((level), (msg));                    \
        }                                                           \
    } while (false)

#define MCPS_LOG_TRACE(msg) MCPS_LOG(::mcps::LogLevel::Trace, msg)
#define MCPS_LOG_DEBUG(msg) MCPS_LOG(::mcps::LogLevel::Debug, msg)
#define MCPS_LOG_INFO(msg)  MCPS_LOG(::mcps::LogLevel::Info, msg)
#define MCPS_LOG_WARN(msg)  MCPS_LOG(::mcps::LogLevel::Warn, msg)
#define MCPS_LOG_ERROR(msg) MCPS_LOG(::mcps::LogLevel::Error, msg)
#define MCPS_LOG_FATAL(msg) MCPS_LOG(::mcps::LogLevel::Fatal, msg)
