#ifndef RELAYPP_RELAY_CONNECTION_CONFIG_HPP
#define RELAYPP_RELAY_CONNECTION_CONFIG_HPP

#include "relaypp/protocol/phoenix.hpp"
#include "relaypp/security/url_validator.hpp"
#include "relaypp/transport/backoff_policy.hpp"
#include "relaypp/transport/websocket_transport.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace relaypp {

// ─────────────────────────────────────────────────────────────────────────────
// Reconnect Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Reconnection is opt-in. When enabled, a socket close that the caller did not
// request through disconnect() schedules a new connect() after a backoff delay.

struct ReconnectConfig {
    bool enabled{false};

    // 0 = keep trying
    std::size_t max_attempts{0};

    // Delay table per attempt. If null, SteppedBackoff with its default table.
    std::shared_ptr<IBackoffPolicy> backoff;
};

// ─────────────────────────────────────────────────────────────────────────────
// Connection Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ConnectionConfig {
    // Appended to the selected relay address unless already present.
    // "wss://relay.example.com/socket" -> ".../socket/websocket"
    std::string transport_suffix{"/websocket"};

    // Wire encoding; also sent as the vsn connection parameter
    phoenix::SerializerVersion serializer{phoenix::SerializerVersion::V2};

    // How long join and chat pushes wait for a phx_reply
    std::chrono::milliseconds push_timeout{std::chrono::seconds(10)};

    // Keepalive on the "phoenix" topic. 0 disables it.
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};

    // Which relay addresses are acceptable
    security::UrlValidationConfig url_validation;

    // Passed to the default Beast transport factory
    WebSocketTransportConfig transport;

    ReconnectConfig reconnect;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder helpers
    // ─────────────────────────────────────────────────────────────────────────

    ConnectionConfig& with_push_timeout(std::chrono::milliseconds timeout) {
        push_timeout = timeout;
        return *this;
    }

    ConnectionConfig& with_heartbeat_interval(std::chrono::milliseconds interval) {
        heartbeat_interval = interval;
        return *this;
    }

    ConnectionConfig& with_serializer(phoenix::SerializerVersion version) {
        serializer = version;
        return *this;
    }

    ConnectionConfig& with_transport_suffix(std::string suffix) {
        transport_suffix = std::move(suffix);
        return *this;
    }

    ConnectionConfig& with_url_validation(security::UrlValidationConfig validation) {
        url_validation = std::move(validation);
        return *this;
    }

    ConnectionConfig& with_transport(WebSocketTransportConfig config) {
        transport = std::move(config);
        return *this;
    }

    ConnectionConfig& with_reconnect(
        std::shared_ptr<IBackoffPolicy> backoff = nullptr,
        std::size_t max_attempts = 0
    ) {
        reconnect.enabled = true;
        reconnect.backoff = std::move(backoff);
        reconnect.max_attempts = max_attempts;
        return *this;
    }

    ConnectionConfig& without_reconnect() {
        reconnect.enabled = false;
        return *this;
    }

    // For local development relays on ws://localhost
    ConnectionConfig& allow_local_relay() {
        url_validation.allow_insecure = true;
        url_validation.allow_localhost = true;
        url_validation.allow_private_ips = true;
        return *this;
    }
};

}  // namespace relaypp

#endif  // RELAYPP_RELAY_CONNECTION_CONFIG_HPP
