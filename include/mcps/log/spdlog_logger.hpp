#pragma once

#include "mcps/log/logger.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace spdlog::details {
class thread_pool;
}

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - the server's production logging backend
// ─────────────────────────────────────────────────────────────────────────────
// Loggers are never registered in spdlog's global registry, so several
// servers (or tests) can each own one.

struct SpdlogOptions {
    LogLevel threshold{LogLevel::Info};

    // Coloured stderr sink.
    bool console{true};

    // Appended to when set. An unwritable path throws spdlog::spdlog_ex.
    std::optional<std::string> file;

    // Format and write on a dedicated thread. A full queue blocks the
    // caller instead of dropping records.
    bool async{false};
    std::size_t queue_size{8192};
};

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger; its current level becomes the threshold.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    void log(const LogRecord& record) override;

    void set_level(LogLevel level) noexcept override;

    void flush();

    [[nodiscard]] spdlog::logger& backend() const noexcept { return *logger_; }

private:
    friend std::shared_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogOptions& options);

    SpdlogLogger(std::shared_ptr<spdlog::details::thread_pool> pool,
                 std::shared_ptr<spdlog::logger> logger,
                 LogLevel threshold);

    // async_logger only holds a weak reference to its pool
    std::shared_ptr<spdlog::details::thread_pool> pool_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Console and/or file logger as described by `options`. With neither sink
/// enabled the logger accepts records and writes nothing.
[[nodiscard]] std::shared_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogOptions& options);

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

}  // namespace mcps
