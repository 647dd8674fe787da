#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Channel Subscription
// ═══════════════════════════════════════════════════════════════════════════
// One joined topic multiplexed over a SocketSession.
//
//   Closed ──join()──▶ Joining ──ok reply──▶ Joined
//                         │                    │
//                         └── error reply ──▶ Errored ◀── phx_error / socket error
//
//   any ── phx_close ──▶ Closed
//
// Pushes issued while Joining are buffered and written once the join is
// confirmed. A torn-down channel (server close, server error, rejected join,
// socket loss, session disconnect) fails every pending push with
// ChannelClosed and refuses new ones. A rejected join fires no error hooks;
// the join push carries the rejection.

#include "relaypp/protocol/phoenix.hpp"
#include "relaypp/relay/push.hpp"

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relaypp {

class SocketSession;

class ChannelSubscription : public std::enable_shared_from_this<ChannelSubscription> {
public:
    enum class State { Closed, Joining, Joined, Errored };

    using EventHandler = std::function<void(const Json& payload)>;
    using ErrorHandler = std::function<void(const Json& reason)>;
    using CloseHandler = std::function<void()>;
    using JoinedHandler = std::function<void()>;

    ChannelSubscription(
        std::weak_ptr<SocketSession> socket,
        asio::any_io_executor executor,
        std::string topic,
        Json params,
        std::chrono::milliseconds timeout
    );

    ChannelSubscription(const ChannelSubscription&) = delete;
    ChannelSubscription& operator=(const ChannelSubscription&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Send phx_join. Joining twice returns the existing join push.
    std::shared_ptr<Push> join();

    /// Push an event; buffered until joined
    std::shared_ptr<Push> push(std::string event, Json payload);

    /// Durable listener for a server event. Returns an id for off(event, id).
    std::size_t on(std::string event, EventHandler handler);
    void off(const std::string& event);
    void off(const std::string& event, std::size_t id);

    void on_error(ErrorHandler handler);
    void on_close(CloseHandler handler);

    /// Fires on every transition into Joined, including a late ok reply
    /// after the join push timed out
    void on_joined(JoinedHandler handler);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& topic() const noexcept { return topic_; }
    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool is_joined() const noexcept { return state_ == State::Joined; }
    [[nodiscard]] bool is_torn_down() const noexcept { return torn_down_; }
    [[nodiscard]] const std::optional<std::string>& join_ref() const noexcept { return join_ref_; }
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t buffered_count() const noexcept { return buffer_.size(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Called by SocketSession
    // ─────────────────────────────────────────────────────────────────────────

    /// Whether an inbound frame belongs to this channel. Lifecycle events
    /// carrying another join ref are stale and rejected.
    [[nodiscard]] bool is_member(const phoenix::Message& message) const;

    void handle_message(const phoenix::Message& message);

    /// Socket lost: error hooks fire, pending pushes fail
    void handle_socket_error(const std::string& reason);

    /// Session disconnect: pending pushes fail, no hooks fire
    void close_silently();

private:
    void send_join();
    void send_push(const std::shared_ptr<Push>& push);
    void flush_buffer();
    void handle_reply(const phoenix::Message& message);
    void handle_join_reply(const phoenix::Message& message);
    void tear_down(State next, const std::string& reason);
    void track(const std::shared_ptr<Push>& push);

    std::weak_ptr<SocketSession> socket_;
    asio::any_io_executor executor_;
    std::string topic_;
    Json params_;
    std::chrono::milliseconds timeout_;

    State state_{State::Closed};
    bool torn_down_{false};
    std::optional<std::string> join_ref_;
    std::shared_ptr<Push> join_push_;

    std::unordered_map<std::string, std::shared_ptr<Push>> pending_;  // ref -> push
    std::vector<std::shared_ptr<Push>> buffer_;                       // awaiting join

    struct Binding {
        std::size_t id;
        std::string event;
        EventHandler handler;
    };
    std::vector<Binding> bindings_;
    std::size_t next_binding_id_{1};

    std::vector<ErrorHandler> error_hooks_;
    std::vector<CloseHandler> close_hooks_;
    std::vector<JoinedHandler> joined_hooks_;
};

[[nodiscard]] constexpr std::string_view to_string(ChannelSubscription::State state) noexcept {
    switch (state) {
        case ChannelSubscription::State::Closed:  return "closed";
        case ChannelSubscription::State::Joining: return "joining";
        case ChannelSubscription::State::Joined:  return "joined";
        case ChannelSubscription::State::Errored: return "errored";
    }
    return "unknown";
}

}  // namespace relaypp
