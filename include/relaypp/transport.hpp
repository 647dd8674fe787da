#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the websocket transports and the relay session.
//
// For the transport interface, use: #include "relaypp/transport/websocket_transport.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace relaypp {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Network, Timeout, Protocol, Closed };

    Category category{};
    std::string message;
    std::optional<int> close_code{};  // Websocket close code if the peer sent one

    [[nodiscard]] static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError closed(std::string msg, std::optional<int> code = std::nullopt) {
        return {Category::Closed, std::move(msg), code};
    }

    /// A clean close is a peer-initiated close handshake, not a fault
    [[nodiscard]] bool is_clean_close() const noexcept {
        return category == Category::Closed;
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Closed:   return "Closed";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace relaypp
