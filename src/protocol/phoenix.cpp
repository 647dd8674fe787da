#include "relaypp/protocol/phoenix.hpp"
#include "relaypp/json/frame_json.hpp"

namespace relaypp::phoenix {

namespace {

Json ref_to_json(const std::optional<std::string>& ref) {
    return ref ? Json(*ref) : Json(nullptr);
}

// Servers emit refs as strings; some older ones send integers
TransportResult<std::optional<std::string>> ref_from_json(const Json& value, std::string_view field) {
    if (value.is_null()) {
        return std::optional<std::string>{};
    }
    if (value.is_string()) {
        return std::optional<std::string>{value.get<std::string>()};
    }
    if (value.is_number_integer()) {
        return std::optional<std::string>{value.dump()};
    }
    return tl::unexpected(TransportError::protocol(
        "Field '" + std::string(field) + "' must be a string or null"
    ));
}

TransportResult<std::string> string_field(const Json& value, std::string_view field) {
    if (!value.is_string()) {
        return tl::unexpected(TransportError::protocol(
            "Field '" + std::string(field) + "' must be a string"
        ));
    }
    return value.get<std::string>();
}

TransportResult<Message> assemble(
    const Json& join_ref,
    const Json& ref,
    const Json& topic,
    const Json& event,
    const Json& payload
) {
    Message message;

    auto jr = ref_from_json(join_ref, "join_ref");
    if (!jr) return tl::unexpected(jr.error());
    message.join_ref = std::move(*jr);

    auto r = ref_from_json(ref, "ref");
    if (!r) return tl::unexpected(r.error());
    message.ref = std::move(*r);

    auto t = string_field(topic, "topic");
    if (!t) return tl::unexpected(t.error());
    message.topic = std::move(*t);

    auto e = string_field(event, "event");
    if (!e) return tl::unexpected(e.error());
    message.event = std::move(*e);

    message.payload = payload.is_null() ? Json::object() : payload;
    return message;
}

}  // namespace

bool is_lifecycle_event(std::string_view name) noexcept {
    return name == event::kJoin || name == event::kLeave || name == event::kReply ||
           name == event::kError || name == event::kClose;
}

// ═══════════════════════════════════════════════════════════════════════════
// Message
// ═══════════════════════════════════════════════════════════════════════════

std::string Message::reply_status() const {
    if (!is_reply() || !payload.is_object()) {
        return {};
    }
    auto it = payload.find("status");
    if (it == payload.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

Json Message::reply_response() const {
    if (!payload.is_object()) {
        return nullptr;
    }
    return payload.value("response", Json(nullptr));
}

Message Message::reply(
    std::optional<std::string> join_ref,
    std::string ref,
    std::string topic,
    std::string_view status,
    Json response
) {
    Message message;
    message.join_ref = std::move(join_ref);
    message.ref = std::move(ref);
    message.topic = std::move(topic);
    message.event = std::string(event::kReply);
    message.payload = Json{{"status", std::string(status)}, {"response", std::move(response)}};
    return message;
}

// ═══════════════════════════════════════════════════════════════════════════
// Serializer
// ═══════════════════════════════════════════════════════════════════════════

std::string Serializer::encode(const Message& message) const {
    if (version_ == SerializerVersion::V1) {
        return Json{
            {"join_ref", ref_to_json(message.join_ref)},
            {"ref", ref_to_json(message.ref)},
            {"topic", message.topic},
            {"event", message.event},
            {"payload", message.payload},
        }.dump();
    }

    return Json::array({
        ref_to_json(message.join_ref),
        ref_to_json(message.ref),
        message.topic,
        message.event,
        message.payload,
    }).dump();
}

TransportResult<Message> Serializer::decode(std::string_view frame) const {
    auto parsed = decode_frame(frame);
    if (!parsed) {
        return tl::unexpected(TransportError::protocol("Malformed frame: " + parsed.error().message));
    }

    if (version_ == SerializerVersion::V1) {
        return decode_object(*parsed);
    }
    return decode_array(*parsed);
}

TransportResult<Message> Serializer::decode_object(const Json& doc) const {
    if (!doc.is_object()) {
        return tl::unexpected(TransportError::protocol("Expected a JSON object frame"));
    }
    const Json null_value;
    auto field = [&](const char* key) -> const Json& {
        auto it = doc.find(key);
        return it == doc.end() ? null_value : *it;
    };
    return assemble(field("join_ref"), field("ref"), field("topic"), field("event"), field("payload"));
}

TransportResult<Message> Serializer::decode_array(const Json& doc) const {
    if (!doc.is_array() || doc.size() != 5) {
        return tl::unexpected(TransportError::protocol("Expected a 5-element array frame"));
    }
    return assemble(doc[0], doc[1], doc[2], doc[3], doc[4]);
}

}  // namespace relaypp::phoenix
