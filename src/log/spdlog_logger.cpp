#include "mcps/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <stdexcept>
#include <vector>

namespace mcps {

namespace {

// Same layout as format_record() in logger.cpp
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%s:%#] %v";

std::string next_logger_name() {
    static std::atomic<unsigned> counter{0};
    return "mcps-" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::off;
}

LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        default:                      return LogLevel::Off;
    }
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : ILogger(logger ? from_spdlog_level(logger->level()) : LogLevel::Off)
    , logger_(std::move(logger))
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
}

SpdlogLogger::SpdlogLogger(
    std::shared_ptr<spdlog::details::thread_pool> pool,
    std::shared_ptr<spdlog::logger> logger,
    LogLevel threshold
)
    : ILogger(threshold)
    , pool_(std::move(pool))
    , logger_(std::move(logger))
{
    logger_->set_level(to_spdlog_level(threshold));
    logger_->set_pattern(kPattern);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(spdlog::log_clock::time_point(record.timestamp), where,
                 to_spdlog_level(record.level), record.message);

    // Errors reach the file even if the process dies right after
    if (record.level >= LogLevel::Error) {
        logger_->flush();
    }
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    ILogger::set_level(level);
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::shared_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (options.file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.file));
    }

    std::shared_ptr<spdlog::details::thread_pool> pool;
    std::shared_ptr<spdlog::logger> logger;
    if (options.async) {
        pool = std::make_shared<spdlog::details::thread_pool>(options.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            next_logger_name(), sinks.begin(), sinks.end(), pool, spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end());
    }

    return std::shared_ptr<SpdlogLogger>(new SpdlogLogger(std::move(pool), std::move(logger), options.threshold));
}

}  // namespace mcps
