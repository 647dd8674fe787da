#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Phoenix Channels Wire Protocol
// ═══════════════════════════════════════════════════════════════════════════
// Message model and serializers for the relay's channel protocol.
//
// V1 (vsn=1.0.0) frames are JSON objects:
//   {"join_ref": "1", "ref": "2", "topic": "user:0ab1", "event": "chat", "payload": {...}}
//
// V2 (vsn=2.0.0) frames are JSON arrays:
//   ["1", "2", "user:0ab1", "chat", {...}]
//
// Absent refs are encoded as null in both versions.

#include "relaypp/transport.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace relaypp::phoenix {

// ─────────────────────────────────────────────────────────────────────────────
// Reserved events and topics
// ─────────────────────────────────────────────────────────────────────────────

namespace event {
inline constexpr std::string_view kJoin      = "phx_join";
inline constexpr std::string_view kLeave     = "phx_leave";
inline constexpr std::string_view kReply     = "phx_reply";
inline constexpr std::string_view kError     = "phx_error";
inline constexpr std::string_view kClose     = "phx_close";
inline constexpr std::string_view kHeartbeat = "heartbeat";
inline constexpr std::string_view kChat      = "chat";
}  // namespace event

inline constexpr std::string_view kSocketTopic = "phoenix";

/// Reply status values inside a phx_reply payload
namespace status {
inline constexpr std::string_view kOk    = "ok";
inline constexpr std::string_view kError = "error";
}  // namespace status

[[nodiscard]] bool is_lifecycle_event(std::string_view event) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Message
// ─────────────────────────────────────────────────────────────────────────────

struct Message {
    std::optional<std::string> join_ref;
    std::optional<std::string> ref;
    std::string topic;
    std::string event;
    Json payload = Json::object();

    [[nodiscard]] bool is_reply() const noexcept { return event == event::kReply; }

    /// "ok" / "error" for replies, empty otherwise
    [[nodiscard]] std::string reply_status() const;

    /// Reply body (payload.response), null if absent
    [[nodiscard]] Json reply_response() const;

    /// Build a server reply (used by tests and loopback tooling)
    [[nodiscard]] static Message reply(
        std::optional<std::string> join_ref,
        std::string ref,
        std::string topic,
        std::string_view status,
        Json response = Json::object()
    );
};

// ─────────────────────────────────────────────────────────────────────────────
// Serializer
// ─────────────────────────────────────────────────────────────────────────────

enum class SerializerVersion { V1, V2 };

[[nodiscard]] constexpr std::string_view vsn(SerializerVersion version) noexcept {
    return version == SerializerVersion::V1 ? "1.0.0" : "2.0.0";
}

class Serializer {
public:
    explicit Serializer(SerializerVersion version = SerializerVersion::V2) noexcept
        : version_(version)
    {}

    [[nodiscard]] std::string encode(const Message& message) const;

    /// Parse and validate one inbound frame
    [[nodiscard]] TransportResult<Message> decode(std::string_view frame) const;

    [[nodiscard]] SerializerVersion version() const noexcept { return version_; }
    [[nodiscard]] std::string_view vsn() const noexcept { return phoenix::vsn(version_); }

private:
    [[nodiscard]] TransportResult<Message> decode_object(const Json& doc) const;
    [[nodiscard]] TransportResult<Message> decode_array(const Json& doc) const;

    SerializerVersion version_;
};

}  // namespace relaypp::phoenix
