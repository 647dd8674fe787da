#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Relay Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Error type returned by ConnectionManager, ChannelSubscription pushes and
// the reconnect supervisor.

#include "relaypp/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace relaypp {

enum class ClientErrorCode {
    NotConnected,     ///< No channel or socket to send through
    NoIdentity,       ///< Identity missing or has no public key
    InvalidRelay,     ///< Relay address failed validation
    TransportError,   ///< Socket could not be opened or written
    ServerError,      ///< Relay answered a push with status "error"
    Timeout,          ///< No reply within the push timeout
    ChannelClosed     ///< Channel torn down before the push settled
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::NotConnected:   return "NotConnected";
        case ClientErrorCode::NoIdentity:     return "NoIdentity";
        case ClientErrorCode::InvalidRelay:   return "InvalidRelay";
        case ClientErrorCode::TransportError: return "TransportError";
        case ClientErrorCode::ServerError:    return "ServerError";
        case ClientErrorCode::Timeout:        return "Timeout";
        case ClientErrorCode::ChannelClosed:  return "ChannelClosed";
        default:                              return "Unknown";
    }
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<Json> reply;  ///< Server reply body for ServerError

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError not_connected(std::string msg = "Not connected to a relay") {
        return {ClientErrorCode::NotConnected, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError no_identity(std::string msg = "No identity available") {
        return {ClientErrorCode::NoIdentity, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError invalid_relay(std::string msg) {
        return {ClientErrorCode::InvalidRelay, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError server_error(Json reply) {
        std::string msg = "Relay rejected the request";
        if (reply.is_object()) {
            if (auto it = reply.find("reason"); it != reply.end() && it->is_string()) {
                msg += ": " + it->get<std::string>();
            }
        } else if (reply.is_string()) {
            msg += ": " + reply.get<std::string>();
        }
        return {ClientErrorCode::ServerError, std::move(msg), std::move(reply)};
    }

    [[nodiscard]] static ClientError timeout(std::string msg = "Request timed out") {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError channel_closed(std::string msg = "Channel closed") {
        return {ClientErrorCode::ChannelClosed, std::move(msg), std::nullopt};
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace relaypp
