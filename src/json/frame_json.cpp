#include "relaypp/json/frame_json.hpp"

namespace relaypp {

namespace {

using simdjson::dom::element_type;

tl::unexpected<JsonError> failure(simdjson::error_code code) {
    return tl::unexpected(JsonError{simdjson::error_message(code)});
}

JsonResult to_json(simdjson::dom::element el, std::size_t depth, std::size_t max_depth) {
    if (depth > max_depth) {
        return tl::unexpected(JsonError{
            "Nesting depth exceeds " + std::to_string(max_depth)
        });
    }

    switch (el.type()) {
        case element_type::OBJECT: {
            simdjson::dom::object obj;
            if (auto ec = el.get_object().get(obj)) {
                return failure(ec);
            }
            nlohmann::json out = nlohmann::json::object();
            for (auto [key, value] : obj) {
                auto child = to_json(value, depth + 1, max_depth);
                if (!child) {
                    return child;
                }
                out[std::string(key)] = std::move(*child);
            }
            return out;
        }

        case element_type::ARRAY: {
            simdjson::dom::array arr;
            if (auto ec = el.get_array().get(arr)) {
                return failure(ec);
            }
            nlohmann::json out = nlohmann::json::array();
            for (simdjson::dom::element item : arr) {
                auto child = to_json(item, depth + 1, max_depth);
                if (!child) {
                    return child;
                }
                out.push_back(std::move(*child));
            }
            return out;
        }

        case element_type::STRING: {
            std::string_view text;
            if (auto ec = el.get_string().get(text)) {
                return failure(ec);
            }
            return nlohmann::json(std::string(text));
        }

        case element_type::INT64: {
            std::int64_t n = 0;
            if (auto ec = el.get_int64().get(n)) {
                return failure(ec);
            }
            return nlohmann::json(n);
        }

        case element_type::UINT64: {
            std::uint64_t n = 0;
            if (auto ec = el.get_uint64().get(n)) {
                return failure(ec);
            }
            return nlohmann::json(n);
        }

        case element_type::DOUBLE: {
            double n = 0;
            if (auto ec = el.get_double().get(n)) {
                return failure(ec);
            }
            return nlohmann::json(n);
        }

        case element_type::BOOL: {
            bool b = false;
            if (auto ec = el.get_bool().get(b)) {
                return failure(ec);
            }
            return nlohmann::json(b);
        }

        case element_type::NULL_VALUE:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonError{"Unrecognized JSON element"});
}

}  // namespace

JsonResult FrameDecoder::decode(std::string_view text) {
    if (limits_.max_bytes != 0 && text.size() > limits_.max_bytes) {
        return tl::unexpected(JsonError{
            "Frame of " + std::to_string(text.size()) + " bytes exceeds the "
            + std::to_string(limits_.max_bytes) + " byte limit"
        });
    }

    simdjson::dom::element root;
    if (auto ec = parser_.parse(text.data(), text.size()).get(root)) {
        return failure(ec);
    }
    return to_json(root, 0, limits_.max_depth);
}

JsonResult decode_frame(std::string_view text) {
    thread_local FrameDecoder decoder;
    return decoder.decode(text);
}

std::string_view simd_kernel_name() {
    return simdjson::get_active_implementation()->name();
}

}  // namespace relaypp
