#include <catch2/catch_test_macros.hpp>

#include "relaypp/relay/relay_endpoint.hpp"
#include "relaypp/relay/services.hpp"

using namespace relaypp;

// ─────────────────────────────────────────────────────────────────────────────
// RelayEndpointResolver
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Resolver appends the transport suffix and connection params", "[relay][endpoint]") {
    RelayEndpointResolver resolver;

    auto endpoint = resolver.resolve(RelayInfo{"wss://relay.example.com/socket"}, "0ab1");

    REQUIRE(endpoint.has_value());
    REQUIRE(endpoint->address == "wss://relay.example.com/socket");
    REQUIRE(endpoint->url == "wss://relay.example.com/socket/websocket?uid=0ab1&vsn=2.0.0");
    REQUIRE(endpoint->target.host == "relay.example.com");
    REQUIRE(endpoint->target.port == 443);
    REQUIRE(endpoint->target.secure);
    REQUIRE(endpoint->target.target == "/socket/websocket?uid=0ab1&vsn=2.0.0");
}

TEST_CASE("Resolver does not duplicate an existing suffix", "[relay][endpoint]") {
    RelayEndpointResolver resolver;

    auto endpoint = resolver.resolve(RelayInfo{"wss://relay.example.com/socket/websocket/"}, "ff");

    REQUIRE(endpoint.has_value());
    REQUIRE(endpoint->target.target == "/socket/websocket?uid=ff&vsn=2.0.0");
}

TEST_CASE("Resolver handles a bare host", "[relay][endpoint]") {
    RelayEndpointResolver resolver;

    auto endpoint = resolver.resolve(RelayInfo{"wss://relay.example.com"}, "ff");

    REQUIRE(endpoint.has_value());
    REQUIRE(endpoint->target.target == "/websocket?uid=ff&vsn=2.0.0");
}

TEST_CASE("Resolver keeps existing query parameters and explicit ports", "[relay][endpoint]") {
    security::UrlValidationConfig validation;
    validation.allow_insecure = true;
    validation.allow_localhost = true;
    RelayEndpointResolver resolver(validation, "/websocket", phoenix::SerializerVersion::V1);

    auto endpoint = resolver.resolve(RelayInfo{"ws://localhost:4000/socket?token=abc"}, "0ab1");

    REQUIRE(endpoint.has_value());
    REQUIRE(endpoint->url == "ws://localhost:4000/socket/websocket?token=abc&uid=0ab1&vsn=1.0.0");
    REQUIRE(endpoint->target.port == 4000);
    REQUIRE_FALSE(endpoint->target.secure);
}

TEST_CASE("Resolver rejects unusable relays", "[relay][endpoint]") {
    RelayEndpointResolver resolver;

    SECTION("Unencrypted") {
        auto endpoint = resolver.resolve(RelayInfo{"ws://relay.example.com/socket"}, "ff");
        REQUIRE_FALSE(endpoint.has_value());
        REQUIRE(endpoint.error().code == ClientErrorCode::InvalidRelay);
    }

    SECTION("Not a URL") {
        auto endpoint = resolver.resolve(RelayInfo{""}, "ff");
        REQUIRE_FALSE(endpoint.has_value());
        REQUIRE(endpoint.error().code == ClientErrorCode::InvalidRelay);
    }

    SECTION("Private network") {
        auto endpoint = resolver.resolve(RelayInfo{"wss://10.1.2.3/socket"}, "ff");
        REQUIRE_FALSE(endpoint.has_value());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Services
// ─────────────────────────────────────────────────────────────────────────────

namespace {

class NullProcessor final : public IMessageProcessor {
public:
    void receive(const Json&) override {}
};

}  // namespace

TEST_CASE("RelayServices fills optional collaborators", "[relay][services]") {
    RelayServices services;
    services.identity = std::make_shared<StaticIdentityProvider>(PublicKey{0x01});
    services.relays = std::make_shared<StaticRelaySelector>("wss://relay.example.com/socket");
    services.processor = std::make_shared<NullProcessor>();

    services.complete();

    REQUIRE(services.dispatcher != nullptr);
    REQUIRE(services.notifier != nullptr);
    REQUIRE(services.translator != nullptr);
}

TEST_CASE("RelayServices requires identity, relays and processor", "[relay][services]") {
    RelayServices services;
    REQUIRE_THROWS_AS(services.complete(), std::invalid_argument);

    services.identity = std::make_shared<StaticIdentityProvider>();
    services.relays = std::make_shared<StaticRelaySelector>("wss://relay.example.com/socket");
    REQUIRE_THROWS_AS(services.complete(), std::invalid_argument);
}

TEST_CASE("DefaultTranslator falls back to the key", "[relay][services]") {
    DefaultTranslator translator;

    REQUIRE(translator.translate(i18n::kMessageTimeout) == "Message timed out");
    REQUIRE(translator.translate("unknown.key") == "unknown.key");

    translator.set("unknown.key", "Now known");
    REQUIRE(translator.translate("unknown.key") == "Now known");
}
