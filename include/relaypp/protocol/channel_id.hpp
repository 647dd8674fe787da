#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace relaypp {

// ─────────────────────────────────────────────────────────────────────────────
// Channel Identifiers
// ─────────────────────────────────────────────────────────────────────────────
// Every client joins its own channel for direct messages and one channel per
// chat room. Both names embed the client's public key:
//
//   user:<hex key>
//   room:<room name>,user:<hex key>
//
// Hex is lower-case, two digits per byte. An empty key yields an empty
// identifier, which callers treat as "no identity".

/// Lower-case hex, two digits per byte
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/// Inverse of to_hex; either case accepted. nullopt on odd length or a
/// non-hex digit.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex);

[[nodiscard]] std::string user_channel_id(std::span<const std::uint8_t> public_key);

[[nodiscard]] std::string room_channel_id(std::string_view room, std::span<const std::uint8_t> public_key);

}  // namespace relaypp
