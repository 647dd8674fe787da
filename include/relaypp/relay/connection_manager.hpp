#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns the single relay connection of a client: one SocketSession, the
// primary channel (user:<hex key>) and any room channels joined over it.
//
// Usage:
//   asio::io_context io;
//   ConnectionManager manager(io.get_executor(), services, config);
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       if (auto r = co_await manager.connect(); !r) {
//           co_return;
//       }
//       auto reply = co_await manager.send(peer_hex, ciphertext);
//   }, asio::detached);
//
//   io.run();
//
// State machine:
//
//   ┌──────────────┐  connect()   ┌─────────┐  join ok   ┌─────────┐
//   │ DISCONNECTED │ ────────────▶│ JOINING │ ──────────▶│  READY  │
//   └──────────────┘              └────┬────┘            └────┬────┘
//          ▲                           │                      │
//          └───────────────────────────┴──────────────────────┘
//            socket close, channel error or close, disconnect()
//
// Any channel error or close tears down the whole socket. Sends issued while
// JOINING are buffered by the channel and written once the join is confirmed.
//
// Every member must be called from the manager's strand (in practice: from
// coroutines and handlers running on the executor passed in). The manager
// must outlive the coroutines awaiting it.

#include "relaypp/client/client_error.hpp"
#include "relaypp/relay/channel_subscription.hpp"
#include "relaypp/relay/connection_config.hpp"
#include "relaypp/relay/reconnect_supervisor.hpp"
#include "relaypp/relay/relay_endpoint.hpp"
#include "relaypp/relay/services.hpp"
#include "relaypp/relay/socket_session.hpp"
#include "relaypp/transport/websocket_transport.hpp"

#include <tl/expected.hpp>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relaypp {

enum class ConnectionState {
    Disconnected,  ///< No socket
    Joining,       ///< Socket started, primary join not yet confirmed
    Ready          ///< Primary channel joined
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Joining:      return "Joining";
        case ConnectionState::Ready:        return "Ready";
    }
    return "Unknown";
}

class ConnectionManager {
public:
    using StateChangeCallback = std::function<void(ConnectionState from, ConnectionState to)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    /// Throws std::invalid_argument when a required service is missing or a
    /// configured timeout is negative.
    /// An empty factory selects the Beast transport built from config.transport.
    ConnectionManager(
        asio::any_io_executor executor,
        RelayServices services,
        ConnectionConfig config = {},
        WebSocketTransportFactory transport_factory = {}
    );

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    ConnectionManager(ConnectionManager&&) = delete;
    ConnectionManager& operator=(ConnectionManager&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// True iff the identity provider reports an identity
    [[nodiscard]] asio::awaitable<bool> can_connect();

    /// Open the socket and join the primary channel. Returns once the join
    /// has been issued; readiness arrives later through on_state_change.
    /// A second call while JOINING or READY succeeds without a new socket.
    [[nodiscard]] asio::awaitable<ClientResult<void>> connect();

    /// Tear down the socket and every channel. Never triggers a reconnect.
    void disconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Channels
    // ─────────────────────────────────────────────────────────────────────────

    /// Join `channel_name` over the current socket. Joining a channel that is
    /// already live is a no-op.
    ClientResult<void> subscribe_to_channel(const std::string& channel_name);

    /// Join room:<room>,user:<hex key>
    ClientResult<void> join_room(std::string_view room);

    // ─────────────────────────────────────────────────────────────────────────
    // Messaging
    // ─────────────────────────────────────────────────────────────────────────

    /// Push "chat" {to, message} on the primary channel and await the reply
    [[nodiscard]] asio::awaitable<ClientResult<Json>> send(std::string to, Json data);

    /// Same as send() on a named (room) channel
    [[nodiscard]] asio::awaitable<ClientResult<Json>> send_to_channel(
        std::string channel_name,
        std::string to,
        Json data
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] bool is_connected() const noexcept { return state_ == ConnectionState::Ready; }

    /// Live (not torn down) channel with this name
    [[nodiscard]] bool has_channel(const std::string& channel_name) const;

    /// user:<hex key> once connect() has read the key, empty before
    [[nodiscard]] const std::string& user_channel_id() const noexcept { return primary_topic_; }

    [[nodiscard]] std::shared_ptr<SocketSession> session() const noexcept { return session_; }
    [[nodiscard]] const ReconnectSupervisor* reconnect() const noexcept { return reconnect_.get(); }
    [[nodiscard]] const ConnectionConfig& config() const noexcept { return config_; }
    [[nodiscard]] asio::any_io_executor get_executor() const { return strand_; }

    void on_state_change(StateChangeCallback callback);

private:
    ClientResult<void> establish();
    asio::awaitable<ClientResult<Json>> push_chat(const std::string& channel_name, std::string to, Json data);

    void on_socket_error(const TransportError& error);
    void on_socket_close(const CloseInfo& info);
    void on_channel_fault(const std::string& channel_name, const std::string& reason);
    void on_channel_joined(const std::string& channel_name);
    void on_join_rejected(const std::string& channel_name, const std::shared_ptr<ChannelSubscription>& channel);

    void schedule_reconnect();
    void release();
    void set_state(ConnectionState next);

    asio::strand<asio::any_io_executor> strand_;
    RelayServices services_;
    ConnectionConfig config_;
    WebSocketTransportFactory transport_factory_;
    RelayEndpointResolver resolver_;
    std::unique_ptr<ReconnectSupervisor> reconnect_;

    ConnectionState state_{ConnectionState::Disconnected};
    bool user_disconnect_{false};

    // Incremented per socket; hooks from an older socket are ignored
    std::uint64_t generation_{0};

    // Expires with the manager; detached coroutines and hooks check it
    std::shared_ptr<int> lifetime_{std::make_shared<int>(0)};

    std::shared_ptr<SocketSession> session_;
    std::string primary_topic_;
    std::unordered_map<std::string, std::shared_ptr<ChannelSubscription>> channels_;

    std::vector<StateChangeCallback> state_callbacks_;
};

}  // namespace relaypp
