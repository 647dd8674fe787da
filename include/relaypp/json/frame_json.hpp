#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Frame JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
// Inbound socket frames are parsed by simdjson's DOM parser and copied into
// nlohmann::json, which the protocol layer uses for field access. Outbound
// frames are built with nlohmann directly.
//
//   auto doc = relaypp::decode_frame(text);
//   if (!doc) { /* doc.error().message */ }

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace relaypp {

struct JsonError {
    std::string message;
};

using JsonResult = tl::expected<nlohmann::json, JsonError>;

struct JsonLimits {
    /// Larger documents are refused unparsed; 0 disables the check
    std::size_t max_bytes{1 << 20};

    /// Frames nest two or three levels; payloads carry opaque strings
    std::size_t max_depth{32};
};

class FrameDecoder {
public:
    explicit FrameDecoder(JsonLimits limits = {})
        : limits_(limits)
    {}

    /// The parser's buffers are reused across calls; not thread-safe.
    [[nodiscard]] JsonResult decode(std::string_view text);

    [[nodiscard]] const JsonLimits& limits() const noexcept { return limits_; }

private:
    simdjson::dom::parser parser_;
    JsonLimits limits_;
};

/// Decode with this thread's FrameDecoder and default limits
[[nodiscard]] JsonResult decode_frame(std::string_view text);

/// Active simdjson kernel, e.g. "haswell" or "fallback"
[[nodiscard]] std::string_view simd_kernel_name();

}  // namespace relaypp
