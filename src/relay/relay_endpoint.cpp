#include "relaypp/relay/relay_endpoint.hpp"
#include "relaypp/log/logger.hpp"

#include <cctype>

namespace relaypp {

namespace {

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// uid is hex and vsn is a dotted version, so only separators need escaping
std::string escape_param(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[u >> 4]);
            out.push_back(kHex[u & 0x0f]);
        }
    }
    return out;
}

}  // namespace

RelayEndpointResolver::RelayEndpointResolver(
    security::UrlValidationConfig validation,
    std::string transport_suffix,
    phoenix::SerializerVersion version
)
    : validation_(std::move(validation))
    , transport_suffix_(std::move(transport_suffix))
    , version_(version)
{}

ClientResult<RelayEndpoint> RelayEndpointResolver::resolve(const RelayInfo& relay, std::string_view uid) const {
    const auto checked = security::validate_relay_url(relay.socket, validation_);
    if (!checked.is_safe) {
        const std::string reason = checked.error.value_or("Relay address rejected");
        RELAYPP_SLOG_ERROR("endpoint", "Relay '" + relay.socket + "': " + reason);
        return tl::unexpected(ClientError::invalid_relay(reason));
    }
    if (checked.warning) {
        RELAYPP_SLOG_WARN("endpoint", *checked.warning);
    }

    std::string path = checked.path;
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    if (!transport_suffix_.empty() && !ends_with(path, transport_suffix_)) {
        if (path == "/") {
            path.clear();
        }
        path += transport_suffix_;
    }

    std::string query = checked.query;
    auto add_param = [&query](std::string_view key, std::string_view value) {
        if (!query.empty()) {
            query += '&';
        }
        query.append(key);
        query += '=';
        query += escape_param(value);
    };
    add_param("uid", uid);
    add_param("vsn", phoenix::vsn(version_));

    RelayEndpoint endpoint;
    endpoint.address = relay.socket;
    endpoint.target.host = checked.host;
    endpoint.target.port = checked.port;
    endpoint.target.secure = checked.secure;
    endpoint.target.target = path + "?" + query;

    const bool default_port = (checked.secure && checked.port == 443) ||
                              (!checked.secure && checked.port == 80);
    endpoint.url = std::string(checked.secure ? "wss://" : "ws://") + checked.host +
                   (default_port ? "" : ":" + std::to_string(checked.port)) +
                   endpoint.target.target;

    return endpoint;
}

}  // namespace relaypp
