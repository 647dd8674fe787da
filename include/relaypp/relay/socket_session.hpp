#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Socket Session
// ═══════════════════════════════════════════════════════════════════════════
// One websocket connection to a relay, shared by every channel joined over it.
//
// - connect() starts the transport and returns immediately; the outcome is
//   reported through on_open / on_error / on_close
// - Frames sent before the socket opens wait in the outbox and are written in
//   order once it does
// - A session is single-use: after it closes, build a new one
//
// Close paths:
//   disconnect()        channels closed silently, close hooks (clean)
//   transport failure   error hooks (unclean only), channel errors, close hooks
//   missed heartbeat    treated as an unclean transport failure

#include "relaypp/protocol/phoenix.hpp"
#include "relaypp/relay/channel_subscription.hpp"
#include "relaypp/relay/relay_endpoint.hpp"
#include "relaypp/transport/websocket_transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relaypp {

struct SocketSessionConfig {
    phoenix::SerializerVersion serializer{phoenix::SerializerVersion::V2};

    /// Default push / join timeout for channels on this session
    std::chrono::milliseconds push_timeout{std::chrono::seconds(10)};

    /// 0 disables heartbeats
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};

    /// Frames buffered before the socket opens
    std::size_t outbox_capacity{256};
};

struct CloseInfo {
    bool clean{true};
    int code{1000};
    std::string reason;
};

class SocketSession : public std::enable_shared_from_this<SocketSession> {
public:
    enum class State { Closed, Connecting, Open, Closing };

    using OpenHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const TransportError&)>;
    using CloseHandler = std::function<void(const CloseInfo&)>;

    SocketSession(
        asio::any_io_executor executor,
        std::unique_ptr<IWebSocketTransport> transport,
        RelayEndpoint endpoint,
        SocketSessionConfig config = {}
    );
    ~SocketSession();

    SocketSession(const SocketSession&) = delete;
    SocketSession& operator=(const SocketSession&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Non-blocking. A second call, or a call after close, does nothing.
    void connect();

    /// Idempotent
    void disconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Channels
    // ─────────────────────────────────────────────────────────────────────────

    /// New channel on this socket. The session keeps it until teardown.
    std::shared_ptr<ChannelSubscription> channel(std::string topic, Json params = Json::object());

    void remove_channel(const std::shared_ptr<ChannelSubscription>& channel);

    [[nodiscard]] std::size_t channel_count() const noexcept { return channels_.size(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Hooks
    // ─────────────────────────────────────────────────────────────────────────

    void on_open(OpenHandler handler) { open_hooks_.push_back(std::move(handler)); }
    void on_error(ErrorHandler handler) { error_hooks_.push_back(std::move(handler)); }
    void on_close(CloseHandler handler) { close_hooks_.push_back(std::move(handler)); }

    // ─────────────────────────────────────────────────────────────────────────
    // Used by channels
    // ─────────────────────────────────────────────────────────────────────────

    /// Queue a frame; false once the session is closed
    bool send(const phoenix::Message& message);

    /// Socket-wide monotonically increasing ref
    [[nodiscard]] std::string make_ref();

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool is_open() const noexcept { return state_ == State::Open; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }
    [[nodiscard]] const RelayEndpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const SocketSessionConfig& config() const noexcept { return config_; }
    [[nodiscard]] asio::any_io_executor get_executor() const { return executor_; }

private:
    using Outbox = asio::experimental::channel<void(asio::error_code, std::string)>;

    asio::awaitable<void> run();
    asio::awaitable<void> reader_loop();
    asio::awaitable<void> writer_loop();
    asio::awaitable<void> heartbeat_loop();

    void dispatch(const phoenix::Message& message);
    void handle_transport_close(const TransportError& error);
    void stop_transport();

    asio::any_io_executor executor_;
    std::shared_ptr<IWebSocketTransport> transport_;
    RelayEndpoint endpoint_;
    SocketSessionConfig config_;
    phoenix::Serializer serializer_;

    State state_{State::Closed};
    bool started_{false};
    bool closed_{false};
    bool transport_stopping_{false};

    std::shared_ptr<Outbox> outbox_;
    asio::steady_timer heartbeat_timer_;
    std::optional<std::string> pending_heartbeat_;
    std::uint64_t ref_counter_{0};

    std::vector<std::shared_ptr<ChannelSubscription>> channels_;

    std::vector<OpenHandler> open_hooks_;
    std::vector<ErrorHandler> error_hooks_;
    std::vector<CloseHandler> close_hooks_;
};

[[nodiscard]] constexpr std::string_view to_string(SocketSession::State state) noexcept {
    switch (state) {
        case SocketSession::State::Closed:     return "closed";
        case SocketSession::State::Connecting: return "connecting";
        case SocketSession::State::Open:       return "open";
        case SocketSession::State::Closing:    return "closing";
    }
    return "unknown";
}

}  // namespace relaypp
