#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine-based text-frame transport used by the relay socket session.
//
// - One transport instance per connection attempt; it is not restartable
// - Frames are opaque strings; encoding belongs to the protocol layer
// - async_receive() yields frames in arrival order and reports the end of
//   the connection as an error (Category::Closed for a close handshake)

#include "relaypp/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relaypp {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Target
// ═══════════════════════════════════════════════════════════════════════════

struct WebSocketTarget {
    std::string host;
    std::uint16_t port{443};
    std::string target{"/"};    // Request target: path plus query string
    bool secure{true};          // wss (TLS) or ws
};

// ═══════════════════════════════════════════════════════════════════════════
// Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct TlsConfig {
    // CA bundle for server verification. Empty = system default store.
    std::string ca_cert_path;

    // Disabling verification is for test relays with self-signed certificates
    bool verify_peer{true};
};

struct WebSocketTransportConfig {
    /// Resolve + TCP connect + TLS + upgrade must finish within this window
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};

    /// Frames larger than this close the connection (protocol error)
    std::size_t max_message_size{1 << 20};

    /// Buffered inbound frames before the reader applies backpressure
    std::size_t receive_buffer_size{64};

    std::string user_agent{"relaypp"};

    TlsConfig tls;

    WebSocketTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    WebSocketTransportConfig& with_ca_cert(std::string path) {
        tls.ca_cert_path = std::move(path);
        return *this;
    }

    WebSocketTransportConfig& with_peer_verification(bool enabled) {
        tls.verify_peer = enabled;
        return *this;
    }

    WebSocketTransportConfig& with_user_agent(std::string agent) {
        user_agent = std::move(agent);
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// IWebSocketTransport
// ═══════════════════════════════════════════════════════════════════════════

class IWebSocketTransport {
public:
    virtual ~IWebSocketTransport() = default;

    /// Executor on which every operation below completes
    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Connect and perform the websocket upgrade
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Close handshake (best effort) and release the connection
    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Queue one text frame; completes once it has been written
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(std::string frame) = 0;

    /// Next inbound text frame
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::string>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

/// Builds a fresh transport for each socket session
using WebSocketTransportFactory = std::function<
    std::unique_ptr<IWebSocketTransport>(asio::any_io_executor, const WebSocketTarget&)
>;

/// Factory producing BeastWebSocketTransport instances with the given config
[[nodiscard]] WebSocketTransportFactory make_beast_transport_factory(WebSocketTransportConfig config = {});

}  // namespace relaypp
