#pragma once

#include "mcps/log/logger.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcps::testing {

// ─────────────────────────────────────────────────────────────────────────────
// RecordingLogger - keeps every record for later inspection
// ─────────────────────────────────────────────────────────────────────────────
// Connection threads log concurrently, so access is locked and records()
// returns a copy.

class RecordingLogger final : public ILogger {
public:
    explicit RecordingLogger(LogLevel threshold = LogLevel::Trace)
        : ILogger(threshold)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] bool contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& r) {
            return r.message.find(needle) != std::string::npos;
        });
    }

    [[nodiscard]] std::size_t count(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(), [&](const LogRecord& r) {
            return r.message.find(needle) != std::string::npos;
        }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// Installs a RecordingLogger as the process logger for the lifetime of the scope
class ScopedRecordingLogger {
public:
    explicit ScopedRecordingLogger(LogLevel threshold = LogLevel::Trace)
        : logger_(std::make_shared<RecordingLogger>(threshold))
    {
        set_logger(logger_);
    }

    ~ScopedRecordingLogger() {
        set_logger(nullptr);
    }

    ScopedRecordingLogger(const ScopedRecordingLogger&) = delete;
    ScopedRecordingLogger& operator=(const ScopedRecordingLogger&) = delete;

    RecordingLogger& operator*() const noexcept { return *logger_; }
    RecordingLogger* operator->() const noexcept { return logger_.get(); }

private:
    std::shared_ptr<RecordingLogger> logger_;
};

}  // namespace mcps::testing
