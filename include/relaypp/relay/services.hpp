#pragma once

#include "relaypp/transport.hpp"

#include <asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relaypp {

using PublicKey = std::vector<std::uint8_t>;

// ═══════════════════════════════════════════════════════════════════════════
// Identity
// ═══════════════════════════════════════════════════════════════════════════
// Supplies the local key pair's public half. The check may hit storage, so it
// is a coroutine; the key itself is read synchronously once known to exist.

class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;

    [[nodiscard]] virtual asio::awaitable<bool> exists() = 0;

    /// nullopt (or empty) when no key pair has been generated
    [[nodiscard]] virtual std::optional<PublicKey> public_key() const = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Relay Selection
// ═══════════════════════════════════════════════════════════════════════════

struct RelayInfo {
    std::string socket;  // e.g. "wss://relay.example.com/socket"
};

class IRelaySelector {
public:
    virtual ~IRelaySelector() = default;

    [[nodiscard]] virtual RelayInfo get_relay() = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Message Processing / Dispatch
// ═══════════════════════════════════════════════════════════════════════════

/// Receives every inbound "chat" payload verbatim (still encrypted)
class IMessageProcessor {
public:
    virtual ~IMessageProcessor() = default;

    virtual void receive(const Json& payload) = 0;
};

/// Outbound application messages; only the presence ping is driven from here
class IMessageDispatcher {
public:
    virtual ~IMessageDispatcher() = default;

    virtual void ping_all() = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// User Feedback
// ═══════════════════════════════════════════════════════════════════════════

class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void info(const std::string& message) = 0;
    virtual void success(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

class ITranslator {
public:
    virtual ~ITranslator() = default;

    [[nodiscard]] virtual std::string translate(std::string_view key) const = 0;
};

/// Translation keys used by the connection manager
namespace i18n {
inline constexpr std::string_view kConnecting           = "connection.connecting";
inline constexpr std::string_view kConnected            = "connection.connected";
inline constexpr std::string_view kSendNotConnected     = "connection.errors.send.notConnected";
inline constexpr std::string_view kSubscribeNotConnected = "connection.errors.subscribe.notConnected";
inline constexpr std::string_view kJoinTimeout          = "connection.status.timeout";
inline constexpr std::string_view kSocketError          = "connection.status.socket.error";
inline constexpr std::string_view kSocketClose          = "connection.status.socket.close";
inline constexpr std::string_view kMessageTimeout       = "models.message.errors.timeout";
}  // namespace i18n

// ═══════════════════════════════════════════════════════════════════════════
// Default Implementations
// ═══════════════════════════════════════════════════════════════════════════

/// English strings for the keys above; unknown keys are returned unchanged
class DefaultTranslator final : public ITranslator {
public:
    DefaultTranslator();

    [[nodiscard]] std::string translate(std::string_view key) const override;

    /// Override or add a string
    void set(std::string key, std::string text);

private:
    std::unordered_map<std::string, std::string> strings_;
};

/// Writes notifications to the global logger under the "notify" scope
class LoggingNotifier final : public INotifier {
public:
    void info(const std::string& message) override;
    void success(const std::string& message) override;
    void error(const std::string& message) override;
};

/// Fixed key, e.g. loaded from a file or the command line
class StaticIdentityProvider final : public IIdentityProvider {
public:
    explicit StaticIdentityProvider(std::optional<PublicKey> key = std::nullopt)
        : key_(std::move(key))
    {}

    [[nodiscard]] asio::awaitable<bool> exists() override;
    [[nodiscard]] std::optional<PublicKey> public_key() const override { return key_; }

private:
    std::optional<PublicKey> key_;
};

class StaticRelaySelector final : public IRelaySelector {
public:
    explicit StaticRelaySelector(std::string socket_url)
        : relay_{std::move(socket_url)}
    {}

    [[nodiscard]] RelayInfo get_relay() override { return relay_; }

private:
    RelayInfo relay_;
};

class NullMessageDispatcher final : public IMessageDispatcher {
public:
    void ping_all() override {}
};

// ═══════════════════════════════════════════════════════════════════════════
// RelayServices - collaborators injected into ConnectionManager
// ═══════════════════════════════════════════════════════════════════════════
// identity, relays and processor are required. dispatcher, notifier and
// translator fall back to NullMessageDispatcher, LoggingNotifier and
// DefaultTranslator when left empty.

struct RelayServices {
    std::shared_ptr<IIdentityProvider> identity;
    std::shared_ptr<IRelaySelector> relays;
    std::shared_ptr<IMessageProcessor> processor;
    std::shared_ptr<IMessageDispatcher> dispatcher;
    std::shared_ptr<INotifier> notifier;
    std::shared_ptr<ITranslator> translator;

    /// Fill optional collaborators with defaults; throws std::invalid_argument
    /// when a required one is missing
    void complete();
};

}  // namespace relaypp
