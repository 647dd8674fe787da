#ifndef RELAYPP_TRANSPORT_BACKOFF_POLICY_HPP
#define RELAYPP_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <vector>

namespace relaypp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before reconnect attempt N. The reconnect supervisor asks for a delay
// each time the socket drops and calls reset() once a join succeeds again.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: 0-indexed (0 = first reconnect after the drop)
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// SteppedBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Explicit delay table indexed by attempt; the last entry repeats. The default
// table ramps quickly through short delays and settles at five seconds:
//
//   10, 50, 100, 150, 200, 250, 500, 1000, 2000, 5000, 5000, ...  (ms)

class SteppedBackoff : public IBackoffPolicy {
public:
    SteppedBackoff()
        : SteppedBackoff({
              std::chrono::milliseconds{10},
              std::chrono::milliseconds{50},
              std::chrono::milliseconds{100},
              std::chrono::milliseconds{150},
              std::chrono::milliseconds{200},
              std::chrono::milliseconds{250},
              std::chrono::milliseconds{500},
              std::chrono::milliseconds{1000},
              std::chrono::milliseconds{2000},
              std::chrono::milliseconds{5000},
          }) {}

    explicit SteppedBackoff(std::vector<std::chrono::milliseconds> steps)
        : steps_(std::move(steps))
    {
        if (steps_.empty()) {
            throw std::invalid_argument("SteppedBackoff requires at least one step");
        }
    }

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        return steps_[std::min(attempt, steps_.size() - 1)];
    }

    void reset() override {}

    [[nodiscard]] const std::vector<std::chrono::milliseconds>& steps() const noexcept {
        return steps_;
    }

private:
    std::vector<std::chrono::milliseconds> steps_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Grows by `multiplier` per attempt until `cap`, then spreads each delay
// uniformly over +/- `jitter` of itself so a relay restart is not met by every
// client at once. 100ms x2 capped at 5s gives 100, 200, 400, ... 5000.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{100}, 2.0, std::chrono::seconds{30}, 0.25) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds cap,
        double jitter
    )
        : base_(base)
        , multiplier_(std::max(1.0, multiplier))
        , cap_(cap)
        , jitter_(std::clamp(jitter, 0.0, 1.0))
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        double ms = static_cast<double>(base_.count());
        const double cap_ms = static_cast<double>(cap_.count());
        for (std::size_t i = 0; i < attempt && ms < cap_ms; ++i) {
            ms *= multiplier_;
        }
        ms = std::min(ms, cap_ms);

        if (jitter_ > 0.0) {
            std::uniform_real_distribution<double> spread(-jitter_, jitter_);
            ms += ms * spread(rng_);
        }
        return std::chrono::milliseconds(std::llround(std::max(ms, 0.0)));
    }

    void reset() override {}

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds cap_;
    double jitter_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff / NoBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t) override { return delay_; }
    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

/// Retry immediately
class NoBackoff : public ConstantBackoff {
public:
    NoBackoff() : ConstantBackoff(std::chrono::milliseconds{0}) {}
};

}  // namespace relaypp

#endif  // RELAYPP_TRANSPORT_BACKOFF_POLICY_HPP
