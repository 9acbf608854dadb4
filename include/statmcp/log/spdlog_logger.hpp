#pragma once

#include "statmcp/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace statmcp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Console output always goes to stderr: in stdio mode stdout is the protocol
// channel and a single stray log line corrupts the stream.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stderr sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger (tests use this with an ostream sink)
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Append to a file
    SpdlogLogger(const std::string& filename, LogLevel min_level = LogLevel::Info);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_stderr_logger(
    LogLevel min_level = LogLevel::Info
);

/// stderr plus a log file, for long-running deployments
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_stderr_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace statmcp
