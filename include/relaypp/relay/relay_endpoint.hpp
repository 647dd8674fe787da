#pragma once

#include "relaypp/client/client_error.hpp"
#include "relaypp/protocol/phoenix.hpp"
#include "relaypp/relay/services.hpp"
#include "relaypp/security/url_validator.hpp"
#include "relaypp/transport/websocket_transport.hpp"

#include <string>
#include <string_view>

namespace relaypp {

// ═══════════════════════════════════════════════════════════════════════════
// Relay Endpoint
// ═══════════════════════════════════════════════════════════════════════════
// A relay address as selected ("wss://relay.example.com/socket") and the
// concrete websocket URL the session connects to:
//
//   wss://relay.example.com/socket/websocket?uid=0ab1&vsn=2.0.0

struct RelayEndpoint {
    std::string address;       // As returned by the relay selector
    std::string url;           // Full websocket URL including query
    WebSocketTarget target;    // Host / port / request target for the transport
};

class RelayEndpointResolver {
public:
    RelayEndpointResolver(
        security::UrlValidationConfig validation = {},
        std::string transport_suffix = "/websocket",
        phoenix::SerializerVersion version = phoenix::SerializerVersion::V2
    );

    /// Validate the selected relay and attach the connection parameters.
    /// Fails with InvalidRelay when the address is unusable.
    [[nodiscard]] ClientResult<RelayEndpoint> resolve(const RelayInfo& relay, std::string_view uid) const;

    [[nodiscard]] const security::UrlValidationConfig& validation() const noexcept { return validation_; }

private:
    security::UrlValidationConfig validation_;
    std::string transport_suffix_;
    phoenix::SerializerVersion version_;
};

}  // namespace relaypp
