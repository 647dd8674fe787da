#include "relaypp/security/url_validator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace relaypp::security {

namespace detail {

bool parse_ipv4(std::string_view host, std::array<std::uint8_t, 4>& octets) {
    std::size_t pos = 0;

    for (std::size_t i = 0; i < octets.size(); ++i) {
        const std::size_t end = (i == 3) ? host.size() : host.find('.', pos);
        if (end == std::string_view::npos || pos >= end) {
            return false;
        }

        // The last octet runs to the end, so "1.2.3.4.5" fails the digit check
        const std::string_view part = host.substr(pos, end - pos);
        if (part.size() > 3) {
            return false;
        }
        if (!std::all_of(part.begin(), part.end(),
                [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return false;
        }

        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || value > 255) {
            return false;
        }

        octets[i] = static_cast<std::uint8_t>(value);
        pos = end + 1;
    }

    return true;
}

std::string_view strip_brackets(std::string_view host) noexcept {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

bool is_ipv6_literal(std::string_view host) {
    return host.find(':') != std::string_view::npos;
}

}  // namespace detail

namespace {

[[nodiscard]] char lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

HostKind classify_ipv6(std::string_view addr) {
    if (addr == "::1" || addr == "0:0:0:0:0:0:0:1") {
        return HostKind::Loopback;
    }
    if (addr.size() >= 4 && lower(addr[0]) == 'f' && lower(addr[1]) == 'e') {
        const char c = lower(addr[2]);
        if (c == '8' || c == '9' || c == 'a' || c == 'b') {
            return HostKind::LinkLocal;
        }
    }
    if (addr.size() >= 2 && lower(addr[0]) == 'f' && (lower(addr[1]) == 'c' || lower(addr[1]) == 'd')) {
        return HostKind::Private;
    }
    return HostKind::PublicIp;
}

HostKind classify_ipv4(const std::array<std::uint8_t, 4>& o) {
    if (o[0] == 127 || (o[0] == 0 && o[1] == 0 && o[2] == 0 && o[3] == 0)) {
        return HostKind::Loopback;
    }
    if (o[0] == 10 ||
        (o[0] == 172 && o[1] >= 16 && o[1] <= 31) ||
        (o[0] == 192 && o[1] == 168)) {
        return HostKind::Private;
    }
    if (o[0] == 169 && o[1] == 254) {
        return HostKind::LinkLocal;
    }
    return HostKind::PublicIp;
}

bool contains(const std::vector<std::string>& hosts, const std::string& host) {
    return std::find(hosts.begin(), hosts.end(), host) != hosts.end();
}

}  // namespace

std::string_view to_string(HostKind kind) noexcept {
    switch (kind) {
        case HostKind::Name:      return "name";
        case HostKind::Loopback:  return "loopback";
        case HostKind::Private:   return "private";
        case HostKind::LinkLocal: return "link-local";
        case HostKind::PublicIp:  return "public-ip";
    }
    return "unknown";
}

HostKind classify_host(std::string_view host) {
    host = detail::strip_brackets(host);

    if (host == "localhost" || host == "localhost.localdomain") {
        return HostKind::Loopback;
    }
    if (detail::is_ipv6_literal(host)) {
        return classify_ipv6(host);
    }

    std::array<std::uint8_t, 4> octets{};
    if (detail::parse_ipv4(host, octets)) {
        return classify_ipv4(octets);
    }
    return HostKind::Name;
}

// ═══════════════════════════════════════════════════════════════════════════
// validate_relay_url
// ═══════════════════════════════════════════════════════════════════════════

UrlValidationResult validate_relay_url(const std::string& url, const UrlValidationConfig& config) {
    UrlValidationResult result;

    if (url.empty()) {
        result.error = "Relay URL is empty";
        return result;
    }
    if (url.size() > config.max_url_length) {
        result.error = "Relay URL exceeds " + std::to_string(config.max_url_length) + " characters";
        return result;
    }

    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        result.error = "Invalid URL format";
        return result;
    }
    const auto& ada_url = *parsed;

    std::string scheme(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }
    if (scheme != "ws" && scheme != "wss") {
        result.error = "Relay URL must use ws:// or wss://";
        return result;
    }

    result.is_valid = true;
    result.secure = (scheme == "wss");
    result.normalized_url = std::string(ada_url.get_href());

    result.host = std::string(ada_url.get_hostname());
    if (result.host.empty()) {
        result.error = "Relay URL has no host";
        return result;
    }

    if (!ada_url.get_username().empty() || !ada_url.get_password().empty()) {
        result.error = "Relay URLs with embedded credentials are not allowed";
        return result;
    }

    // ada drops default ports, so an empty port means the scheme default
    const std::string_view port_str = ada_url.get_port();
    if (port_str.empty()) {
        result.port = result.secure ? 443 : 80;
    } else {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
        if (ec != std::errc{} || value == 0 || value > 65535) {
            result.error = "Relay URL has an invalid port";
            return result;
        }
        result.port = static_cast<std::uint16_t>(value);
    }

    result.path = std::string(ada_url.get_pathname());
    if (result.path.empty()) {
        result.path = "/";
    }

    result.query = std::string(ada_url.get_search());
    if (!result.query.empty() && result.query.front() == '?') {
        result.query.erase(0, 1);
    }

    if (!result.secure) {
        if (!config.allow_insecure) {
            result.error = "Unencrypted ws:// relays are not allowed";
            return result;
        }
        result.warning = "Relay connection is not encrypted";
    }

    switch (classify_host(result.host)) {
        case HostKind::Loopback:
            if (!config.allow_localhost) {
                result.error = "Loopback relays are not allowed";
                return result;
            }
            break;
        case HostKind::Private:
        case HostKind::LinkLocal:
            if (!config.allow_private_ips) {
                result.error = "Private and link-local relay addresses are not allowed";
                return result;
            }
            break;
        case HostKind::PublicIp:
            if (!config.allow_ip_addresses) {
                result.error = "IP address relays are not allowed, use a host name";
                return result;
            }
            if (!result.warning) {
                result.warning = "Relay uses an IP address instead of a host name";
            }
            break;
        case HostKind::Name:
            break;
    }

    if (!config.allowed_hosts.empty() && !contains(config.allowed_hosts, result.host)) {
        result.error = "Host '" + result.host + "' is not in the allowed hosts list";
        return result;
    }
    if (contains(config.blocked_hosts, result.host)) {
        result.error = "Host '" + result.host + "' is blocked";
        return result;
    }

    result.is_safe = true;
    return result;
}

}  // namespace relaypp::security
