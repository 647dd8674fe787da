#pragma once

#include "relaypp/log/logger.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace spdlog::details {
class thread_pool;
}

namespace relaypp {

// ─────────────────────────────────────────────────────────────────────────────
// Sink options
// ─────────────────────────────────────────────────────────────────────────────

/// Console layout: time, padded level, then "scope | message"
inline constexpr const char* kSpdlogConsolePattern = "%H:%M:%S.%e %^%-5l%$ %v";

/// File layout: full date and the emitting source line
inline constexpr const char* kSpdlogFilePattern = "%Y-%m-%d %H:%M:%S.%e %-5l %v  (%s:%#)";

struct SpdlogOptions {
    LogLevel level = LogLevel::Info;
    std::string pattern = kSpdlogConsolePattern;
    bool flush_on_error = true;

    [[nodiscard]] static SpdlogOptions for_file(LogLevel lvl = LogLevel::Info) {
        return SpdlogOptions{lvl, kSpdlogFilePattern, true};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// The spdlog backend stays at trace; thresholds, including scope overrides,
// are applied by ILogger::enabled() before a record reaches it.

class SpdlogLogger final : public ILogger {
public:
    /// `pool` keeps an async logger's worker alive for the logger's lifetime.
    explicit SpdlogLogger(
        std::shared_ptr<spdlog::logger> backend,
        LogLevel threshold = LogLevel::Info,
        std::shared_ptr<spdlog::details::thread_pool> pool = nullptr
    );

    ~SpdlogLogger() override;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return at_least(level, threshold_.load(std::memory_order_relaxed));
    }

    void flush() override;

    void set_level(LogLevel level) noexcept { threshold_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] LogLevel level() const noexcept { return threshold_.load(std::memory_order_relaxed); }

    [[nodiscard]] spdlog::logger& backend() noexcept { return *backend_; }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

private:
    std::shared_ptr<spdlog::details::thread_pool> pool_;
    std::shared_ptr<spdlog::logger> backend_;
    std::atomic<LogLevel> threshold_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(
    std::vector<spdlog::sink_ptr> sinks,
    const SpdlogOptions& options = {}
);

/// Colored stderr
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    const SpdlogOptions& options = {}
);

/// Appends to `path`
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& path,
    const SpdlogOptions& options = SpdlogOptions::for_file()
);

/// Rolls `path` over at `max_bytes`, keeping `max_files` old files
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_rotating_logger(
    const std::string& path,
    std::size_t max_bytes,
    std::size_t max_files,
    const SpdlogOptions& options = SpdlogOptions::for_file()
);

/// Colored stderr written from a background thread, so the relay executor
/// never blocks on the terminal. Overflow blocks the caller.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    const SpdlogOptions& options = {},
    std::size_t queue_size = 8192
);

}  // namespace relaypp
