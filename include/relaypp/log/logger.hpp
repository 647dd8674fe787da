#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// Every record carries a scope naming its emitter: "socket", "manager",
// "reconnect", "transport" or a channel topic such as "user:0ab1".
//
// A logger has one threshold plus optional per-scope overrides matched by
// longest prefix, so a single noisy room can be traced without drowning in
// heartbeat chatter:
//
//   logger->scopes().set("room:", LogLevel::Trace);
//   logger->scopes().set("socket", LogLevel::Warn);

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relaypp {

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Every frame in and out
    Debug = 1,  // State transitions, refs
    Info  = 2,  // Connect, join, close
    Warn  = 3,  // Dropped frames, stale replies, retries
    Error = 4,  // Failed operations
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool at_least(LogLevel level, LogLevel threshold) noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

/// "trace", "INFO", "warning", ... Unknown names map to Info.
[[nodiscard]] LogLevel log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// ScopeLevels - per-scope threshold overrides
// ─────────────────────────────────────────────────────────────────────────────

class ScopeLevels {
public:
    /// Parse "socket=trace,room:=debug". Whitespace around entries is ignored.
    [[nodiscard]] static tl::expected<std::vector<std::pair<std::string, LogLevel>>, std::string>
    parse(std::string_view spec);

    void set(std::string prefix, LogLevel level);
    void clear();

    /// Threshold for the longest prefix of `scope`, if any
    [[nodiscard]] std::optional<LogLevel> match(std::string_view scope) const;

    [[nodiscard]] bool empty() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::pair<std::string, LogLevel>> entries_;
};

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string scope;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string scp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , scope(std::move(scp))
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Global threshold, before scope overrides
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    virtual void flush() {}

    /// Threshold check including scope overrides
    [[nodiscard]] bool enabled(LogLevel level, std::string_view scope) const {
        if (level == LogLevel::Off) {
            return false;
        }
        if (!scope.empty() && !scopes_.empty()) {
            if (auto threshold = scopes_.match(scope)) {
                return at_least(level, *threshold);
            }
        }
        return should_log(level);
    }

    void write(
        LogLevel level,
        std::string_view scope,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (enabled(level, scope)) {
            log(LogRecord(level, std::string(scope), std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(LogLevel level, std::string_view scope, std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level, scope)) {
            log(LogRecord(level, std::string(scope), std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    [[nodiscard]] ScopeLevels& scopes() noexcept { return scopes_; }
    [[nodiscard]] const ScopeLevels& scopes() const noexcept { return scopes_; }

private:
    ScopeLevels scopes_;
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}
    [[nodiscard]] bool should_log(LogLevel) const noexcept override { return false; }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, one aligned line per record
// ─────────────────────────────────────────────────────────────────────────────
//   14:02:11.382 INFO  socket       | open
//   14:02:11.391 DEBUG user:0ab1    | join sent (ref 1)   socket_session.cpp:214

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel threshold = LogLevel::Info)
        : threshold_(threshold)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return at_least(level, threshold_);
    }

    void set_level(LogLevel level) noexcept { threshold_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return threshold_; }

    void set_colors_enabled(bool enabled) noexcept { colors_ = enabled; }

    /// Render one record without writing it
    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    LogLevel threshold_;
    bool colors_{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────
// Defaults to NullLogger. Install once at startup; the reference returned by
// get_logger() is invalidated by the next set_logger().

[[nodiscard]] ILogger& get_logger() noexcept;

/// Takes ownership; nullptr restores the NullLogger. The previous logger is
/// flushed before it is destroyed.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define RELAYPP_SLOG(level, scope, msg) \
    do { auto& relaypp_logger_ = ::relaypp::get_logger(); \
         if (relaypp_logger_.enabled(level, scope)) \
             relaypp_logger_.write(level, scope, msg); } while(false)

#define RELAYPP_SLOG_TRACE(scope, msg) RELAYPP_SLOG(::relaypp::LogLevel::Trace, scope, msg)
#define RELAYPP_SLOG_DEBUG(scope, msg) RELAYPP_SLOG(::relaypp::LogLevel::Debug, scope, msg)
#define RELAYPP_SLOG_INFO(scope, msg)  RELAYPP_SLOG(::relaypp::LogLevel::Info, scope, msg)
#define RELAYPP_SLOG_WARN(scope, msg)  RELAYPP_SLOG(::relaypp::LogLevel::Warn, scope, msg)
#define RELAYPP_SLOG_ERROR(scope, msg) RELAYPP_SLOG(::relaypp::LogLevel::Error, scope, msg)

}  // namespace relaypp
