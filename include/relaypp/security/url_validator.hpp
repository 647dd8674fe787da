#ifndef RELAYPP_SECURITY_URL_VALIDATOR_HPP
#define RELAYPP_SECURITY_URL_VALIDATOR_HPP

#include <ada.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relaypp::security {

// ═══════════════════════════════════════════════════════════════════════════
// Relay URL Validation Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Which relay socket addresses the client may connect to. The defaults accept
// only wss:// relays on public host names.

struct UrlValidationConfig {
    bool allow_insecure = false;       // Accept ws:// (unencrypted)
    bool allow_localhost = false;      // Accept loopback relays (development)
    bool allow_private_ips = false;    // Accept RFC 1918 / link-local / fc00::/7
    bool allow_ip_addresses = true;    // Accept public IP literals

    std::vector<std::string> allowed_hosts;  // Whitelist (empty = allow all)
    std::vector<std::string> blocked_hosts;  // Blacklist

    std::size_t max_url_length = 2048;
};

// ═══════════════════════════════════════════════════════════════════════════
// Relay URL Validation Result
// ═══════════════════════════════════════════════════════════════════════════
// On success the URL is split into the parts the websocket transport needs.

struct UrlValidationResult {
    bool is_valid{false};              // URL is well-formed with a ws/wss scheme
    bool is_safe{false};               // URL passes every policy check
    bool secure{false};                // wss://
    std::string normalized_url;
    std::string host;
    std::uint16_t port{0};             // Explicit port or the scheme default
    std::string path;                  // Path without query, "/" if empty
    std::string query;                 // Query string without the leading '?'
    std::optional<std::string> warning;
    std::optional<std::string> error;
};

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════
// Checks, in order:
// - Scheme: ws or wss; ws only when allow_insecure
// - Credentials: always rejected (user:pass@host)
// - Host class: loopback, private and link-local gated by the config
// - Whitelist / blacklist
//
// Host names are checked as written. A name that later resolves to a private
// address is not caught here.

[[nodiscard]] UrlValidationResult validate_relay_url(
    const std::string& url,
    const UrlValidationConfig& config = {}
);

// ═══════════════════════════════════════════════════════════════════════════
// Host Classification (exposed for testing)
// ═══════════════════════════════════════════════════════════════════════════

enum class HostKind {
    Name,        // DNS name
    Loopback,    // localhost, 127/8, ::1
    Private,     // 10/8, 172.16/12, 192.168/16, fc00::/7
    LinkLocal,   // 169.254/16, fe80::/10
    PublicIp     // Any other IP literal
};

[[nodiscard]] std::string_view to_string(HostKind kind) noexcept;

[[nodiscard]] HostKind classify_host(std::string_view host);

namespace detail {

[[nodiscard]] bool parse_ipv4(std::string_view host, std::array<std::uint8_t, 4>& octets);

[[nodiscard]] bool is_ipv6_literal(std::string_view host);

[[nodiscard]] std::string_view strip_brackets(std::string_view host) noexcept;

}  // namespace detail

}  // namespace relaypp::security

#endif  // RELAYPP_SECURITY_URL_VALIDATOR_HPP
