#include "relaypp/relay/reconnect_supervisor.hpp"
#include "relaypp/log/logger.hpp"

#include <stdexcept>

namespace relaypp {

namespace {
constexpr std::string_view kScope = "reconnect";
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ReconnectSupervisor::ReconnectSupervisor(
    asio::any_io_executor executor,
    std::shared_ptr<IBackoffPolicy> backoff,
    std::size_t max_attempts
)
    : backoff_(std::move(backoff))
    , max_attempts_(max_attempts)
    , pending_(std::make_shared<Pending>(std::move(executor)))
{
    if (!backoff_) {
        throw std::invalid_argument("ReconnectSupervisor: backoff policy cannot be null");
    }
}

ReconnectSupervisor::~ReconnectSupervisor() {
    cancel();
}

// ─────────────────────────────────────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────────────────────────────────────

bool ReconnectSupervisor::schedule(Attempt attempt) {
    if (pending_->armed) {
        RELAYPP_SLOG_DEBUG(kScope, "attempt already pending");
        return false;
    }
    if (is_exhausted()) {
        RELAYPP_SLOG_WARN(kScope, "giving up after " + std::to_string(attempts_) + " attempts");
        return false;
    }

    last_delay_ = backoff_->next_delay(attempts_);
    ++attempts_;

    pending_->armed = true;
    pending_->attempt = std::move(attempt);
    const std::uint64_t generation = ++pending_->generation;

    RELAYPP_SLOG_INFO(kScope, "attempt " + std::to_string(attempts_) + " in " +
                                  std::to_string(last_delay_.count()) + "ms");

    pending_->timer.expires_after(last_delay_);
    pending_->timer.async_wait([state = pending_, generation](asio::error_code ec) {
        // A cancel() after expiry still bumps the generation
        if (ec || !state->armed || state->generation != generation) {
            return;
        }
        state->armed = false;
        auto attempt = std::move(state->attempt);
        state->attempt = nullptr;
        if (attempt) {
            attempt();
        }
    });
    return true;
}

void ReconnectSupervisor::reset() {
    attempts_ = 0;
    last_delay_ = std::chrono::milliseconds{0};
    backoff_->reset();
}

void ReconnectSupervisor::cancel() {
    if (!pending_->armed) {
        return;
    }
    pending_->armed = false;
    ++pending_->generation;
    pending_->attempt = nullptr;
    pending_->timer.cancel();
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

bool ReconnectSupervisor::is_pending() const noexcept {
    return pending_->armed;
}

bool ReconnectSupervisor::is_exhausted() const noexcept {
    return max_attempts_ > 0 && attempts_ >= max_attempts_;
}

}  // namespace relaypp
