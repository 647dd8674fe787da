#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Reconnect Supervisor
// ═══════════════════════════════════════════════════════════════════════════
// Schedules reconnect attempts after an unrequested socket close.
//
//   ┌────────┐  schedule()   ┌─────────┐  delay elapsed   ┌──────────┐
//   │  IDLE  │ ─────────────▶│ PENDING │ ────────────────▶│ ATTEMPT  │
//   └────────┘               └────┬────┘                  └────┬─────┘
//        ▲                        │ cancel()                   │
//        └────────────────────────┴────────────────────────────┘
//
// Each schedule() consumes one attempt and asks the backoff policy for the
// delay of that attempt. reset() (after a successful join) starts the count
// over. Once max_attempts is reached, schedule() refuses until reset().
//
// Usage:
//   ReconnectSupervisor supervisor(executor, std::make_shared<SteppedBackoff>());
//   socket.on_close([&](const CloseInfo&) {
//       supervisor.schedule([&] { start_connect(); });
//   });

#include "relaypp/transport/backoff_policy.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace relaypp {

class ReconnectSupervisor {
public:
    using Attempt = std::function<void()>;

    /// max_attempts: 0 = unlimited
    ReconnectSupervisor(
        asio::any_io_executor executor,
        std::shared_ptr<IBackoffPolicy> backoff,
        std::size_t max_attempts = 0
    );

    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Arm the timer; `attempt` runs on the executor once the delay elapses.
    /// Returns false (and does nothing) when an attempt is already pending or
    /// the attempt limit is exhausted.
    bool schedule(Attempt attempt);

    /// Clear the attempt counter and the backoff policy's state
    void reset();

    /// Disarm a pending attempt. The counter is kept.
    void cancel();

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_pending() const noexcept;
    [[nodiscard]] bool is_exhausted() const noexcept;
    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] std::chrono::milliseconds last_delay() const noexcept { return last_delay_; }

private:
    // Outlives the supervisor while a timer wait is outstanding
    struct Pending {
        explicit Pending(asio::any_io_executor executor) : timer(std::move(executor)) {}

        asio::steady_timer timer;
        bool armed{false};
        std::uint64_t generation{0};
        Attempt attempt;
    };

    std::shared_ptr<IBackoffPolicy> backoff_;
    std::size_t max_attempts_;
    std::size_t attempts_{0};
    std::chrono::milliseconds last_delay_{0};
    std::shared_ptr<Pending> pending_;
};

}  // namespace relaypp
