#include "relaypp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace relaypp {

namespace {

constexpr std::size_t kScopeWidth = 12;

struct Palette {
    std::string_view dim;
    std::string_view level;
    std::string_view scope;
    std::string_view reset;
};

Palette palette_for(LogLevel level, bool colors) noexcept {
    if (!colors) {
        return {};
    }
    std::string_view level_color;
    switch (level) {
        case LogLevel::Trace: level_color = "\033[90m"; break;
        case LogLevel::Debug: level_color = "\033[36m"; break;
        case LogLevel::Info:  level_color = "\033[32m"; break;
        case LogLevel::Warn:  level_color = "\033[33m"; break;
        case LogLevel::Error: level_color = "\033[1;31m"; break;
        case LogLevel::Off:   level_color = ""; break;
    }
    return {"\033[90m", level_color, "\033[34m", "\033[0m"};
}

std::string clock_time(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

std::string_view basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<LogLevel> level_named(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info")  return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off")   return LogLevel::Off;
    return std::nullopt;
}

}  // namespace

LogLevel log_level_from_string(std::string_view name) noexcept {
    return level_named(name).value_or(LogLevel::Info);
}

// ═══════════════════════════════════════════════════════════════════════════
// ScopeLevels
// ═══════════════════════════════════════════════════════════════════════════

tl::expected<std::vector<std::pair<std::string, LogLevel>>, std::string>
ScopeLevels::parse(std::string_view spec) {
    std::vector<std::pair<std::string, LogLevel>> out;

    while (!spec.empty()) {
        const auto comma = spec.find(',');
        const std::string_view entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return tl::unexpected("Expected scope=level, got '" + std::string(entry) + "'");
        }

        const std::string_view level_name = trim(entry.substr(eq + 1));
        const auto level = level_named(level_name);
        if (!level) {
            return tl::unexpected("Unknown log level '" + std::string(level_name) + "'");
        }
        out.emplace_back(std::string(trim(entry.substr(0, eq))), *level);
    }
    return out;
}

void ScopeLevels::set(std::string prefix, LogLevel level) {
    std::unique_lock lock(mutex_);
    for (auto& [existing, existing_level] : entries_) {
        if (existing == prefix) {
            existing_level = level;
            return;
        }
    }
    entries_.emplace_back(std::move(prefix), level);
}

void ScopeLevels::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::optional<LogLevel> ScopeLevels::match(std::string_view scope) const {
    std::shared_lock lock(mutex_);

    std::optional<LogLevel> best;
    std::size_t best_length = 0;
    for (const auto& [prefix, level] : entries_) {
        if (scope.starts_with(prefix) && (!best || prefix.size() > best_length)) {
            best = level;
            best_length = prefix.size();
        }
    }
    return best;
}

bool ScopeLevels::empty() const {
    std::shared_lock lock(mutex_);
    return entries_.empty();
}

// ═══════════════════════════════════════════════════════════════════════════
// ConsoleLogger
// ═══════════════════════════════════════════════════════════════════════════

std::string ConsoleLogger::format(const LogRecord& record) const {
    const Palette p = palette_for(record.level, colors_);

    std::string line = std::format("{}{}{} {}{:<5}{} {}{:<{}}{} | {}",
        p.dim, clock_time(record.timestamp), p.reset,
        p.level, to_string(record.level), p.reset,
        p.scope, record.scope, kScopeWidth, p.reset,
        record.message);

    // Source location only helps at the chatty levels
    if (!at_least(record.level, LogLevel::Info)) {
        line += std::format("   {}{}:{}{}",
            p.dim, basename(record.location.file_name()), record.location.line(), p.reset);
    }
    return line;
}

void ConsoleLogger::log(const LogRecord& record) {
    const std::string line = format(record);

    static std::mutex stderr_mutex;
    std::lock_guard lock(stderr_mutex);
    std::cerr << line << '\n';
}

// ═══════════════════════════════════════════════════════════════════════════
// Global Logger
// ═══════════════════════════════════════════════════════════════════════════

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> logger = std::make_unique<NullLogger>();
};

GlobalLogger& global() {
    static GlobalLogger instance;
    return instance;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& g = global();
    std::lock_guard lock(g.mutex);
    return *g.logger;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& g = global();
    std::unique_ptr<ILogger> previous;
    {
        std::lock_guard lock(g.mutex);
        previous = std::exchange(g.logger, logger ? std::move(logger) : std::make_unique<NullLogger>());
    }
    previous->flush();
}

}  // namespace relaypp
