#include "relaypp/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace relaypp {

namespace {

constexpr const char* kBackendName = "relaypp";
constexpr int kScopeWidth = 12;

void apply(spdlog::logger& backend, const SpdlogOptions& options) {
    backend.set_level(spdlog::level::trace);
    backend.set_pattern(options.pattern);
    if (options.flush_on_error) {
        backend.flush_on(spdlog::level::err);
    }
}

std::unique_ptr<SpdlogLogger> wrap(spdlog::sink_ptr sink, const SpdlogOptions& options) {
    auto backend = std::make_shared<spdlog::logger>(kBackendName, std::move(sink));
    apply(*backend, options);
    return std::make_unique<SpdlogLogger>(std::move(backend), options.level);
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

SpdlogLogger::SpdlogLogger(
    std::shared_ptr<spdlog::logger> backend,
    LogLevel threshold,
    std::shared_ptr<spdlog::details::thread_pool> pool
)
    : pool_(std::move(pool))
    , backend_(std::move(backend))
    , threshold_(threshold)
{
    if (!backend_) {
        throw std::invalid_argument("SpdlogLogger requires a backend");
    }
}

SpdlogLogger::~SpdlogLogger() {
    // Async records still queued must drain before the pool joins
    backend_->flush();
    backend_.reset();
}

void SpdlogLogger::log(const LogRecord& record) {
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    const auto level = to_spdlog_level(record.level);

    if (record.scope.empty()) {
        backend_->log(where, level, "{}", record.message);
    } else {
        backend_->log(where, level, "{:<{}} | {}", record.scope, kScopeWidth, record.message);
    }
}

void SpdlogLogger::flush() {
    backend_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_logger(
    std::vector<spdlog::sink_ptr> sinks,
    const SpdlogOptions& options
) {
    auto backend = std::make_shared<spdlog::logger>(kBackendName, sinks.begin(), sinks.end());
    apply(*backend, options);
    return std::make_unique<SpdlogLogger>(std::move(backend), options.level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(const SpdlogOptions& options) {
    return wrap(std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), options);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& path,
    const SpdlogOptions& options
) {
    return wrap(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path), options);
}

std::unique_ptr<SpdlogLogger> make_spdlog_rotating_logger(
    const std::string& path,
    std::size_t max_bytes,
    std::size_t max_files,
    const SpdlogOptions& options
) {
    return wrap(
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, max_bytes, max_files),
        options
    );
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    const SpdlogOptions& options,
    std::size_t queue_size
) {
    auto pool = std::make_shared<spdlog::details::thread_pool>(queue_size, 1);
    auto backend = std::make_shared<spdlog::async_logger>(
        kBackendName,
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
        pool,
        spdlog::async_overflow_policy::block
    );
    apply(*backend, options);
    return std::make_unique<SpdlogLogger>(std::move(backend), options.level, std::move(pool));
}

}  // namespace relaypp
