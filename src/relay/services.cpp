#include "relaypp/relay/services.hpp"
#include "relaypp/log/logger.hpp"

#include <stdexcept>

namespace relaypp {

DefaultTranslator::DefaultTranslator()
    : strings_{
          {std::string(i18n::kConnecting), "Connecting..."},
          {std::string(i18n::kConnected), "Connected"},
          {std::string(i18n::kSendNotConnected), "Cannot send: not connected to a relay"},
          {std::string(i18n::kSubscribeNotConnected), "Cannot subscribe: not connected to a relay"},
          {std::string(i18n::kJoinTimeout), "Connection timed out"},
          {std::string(i18n::kSocketError), "There was an error with the relay connection"},
          {std::string(i18n::kSocketClose), "Relay connection closed"},
          {std::string(i18n::kMessageTimeout), "Message timed out"},
      }
{}

std::string DefaultTranslator::translate(std::string_view key) const {
    auto it = strings_.find(std::string(key));
    if (it == strings_.end()) {
        return std::string(key);
    }
    return it->second;
}

void DefaultTranslator::set(std::string key, std::string text) {
    strings_[std::move(key)] = std::move(text);
}

void LoggingNotifier::info(const std::string& message) {
    RELAYPP_SLOG_INFO("notify", message);
}

void LoggingNotifier::success(const std::string& message) {
    RELAYPP_SLOG_INFO("notify", message);
}

void LoggingNotifier::error(const std::string& message) {
    RELAYPP_SLOG_ERROR("notify", message);
}

asio::awaitable<bool> StaticIdentityProvider::exists() {
    co_return key_.has_value() && !key_->empty();
}

void RelayServices::complete() {
    if (!identity) {
        throw std::invalid_argument("RelayServices: identity provider is required");
    }
    if (!relays) {
        throw std::invalid_argument("RelayServices: relay selector is required");
    }
    if (!processor) {
        throw std::invalid_argument("RelayServices: message processor is required");
    }
    if (!dispatcher) {
        dispatcher = std::make_shared<NullMessageDispatcher>();
    }
    if (!notifier) {
        notifier = std::make_shared<LoggingNotifier>();
    }
    if (!translator) {
        translator = std::make_shared<DefaultTranslator>();
    }
}

}  // namespace relaypp
