#pragma once

#include "relaypp/client/client_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace relaypp {

using PushResult = ClientResult<Json>;

// ═══════════════════════════════════════════════════════════════════════════
// Push - one correlated request on a channel
// ═══════════════════════════════════════════════════════════════════════════
// Settles exactly once: ok(response), ServerError(response), Timeout or
// ChannelClosed. The first settle() wins; later calls are ignored and return
// false. The timeout runs from start_timeout() until settlement, whether or
// not the frame has been written yet.
//
// Any number of coroutines may await async_result(); each sees the same
// result. All members must be used from the owning executor.

class Push : public std::enable_shared_from_this<Push> {
public:
    using SettledCallback = std::function<void(Push&)>;

    Push(
        asio::any_io_executor executor,
        std::string event,
        Json payload,
        std::chrono::milliseconds timeout
    );

    Push(const Push&) = delete;
    Push& operator=(const Push&) = delete;

    [[nodiscard]] const std::string& event() const noexcept { return event_; }
    [[nodiscard]] const Json& payload() const noexcept { return payload_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    /// Ref assigned when the frame is handed to the socket
    [[nodiscard]] const std::optional<std::string>& ref() const noexcept { return ref_; }
    void assign_ref(std::string ref) { ref_ = std::move(ref); }

    /// Arm the timeout; a second call is a no-op. Zero timeout never expires.
    void start_timeout();

    bool settle(PushResult result);

    [[nodiscard]] bool is_settled() const noexcept { return result_.has_value(); }

    /// Settled result, if any
    [[nodiscard]] const std::optional<PushResult>& result() const noexcept { return result_; }

    /// Suspend until settled
    [[nodiscard]] asio::awaitable<PushResult> async_result();

    /// Invoked once, synchronously, from settle(). Used by the owning channel
    /// to drop its bookkeeping.
    void on_settled(SettledCallback callback) { on_settled_ = std::move(callback); }

private:
    using SignalChannel = asio::experimental::channel<void(asio::error_code)>;

    std::string event_;
    Json payload_;
    std::chrono::milliseconds timeout_;
    std::optional<std::string> ref_;

    asio::steady_timer timer_;
    bool timer_armed_{false};
    std::shared_ptr<SignalChannel> signal_;

    std::optional<PushResult> result_;
    SettledCallback on_settled_;
};

}  // namespace relaypp
