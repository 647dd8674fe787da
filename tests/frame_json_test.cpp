#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "relaypp/json/frame_json.hpp"

#include <string>

using namespace relaypp;

// ═══════════════════════════════════════════════════════════════════════════
// Socket frames
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("decode_frame reads an array frame", "[json]") {
    auto doc = decode_frame(R"(["1","2","user:0ab1","phx_reply",{"status":"ok","response":{}}])");

    REQUIRE(doc.has_value());
    REQUIRE(doc->is_array());
    REQUIRE(doc->size() == 5);
    CHECK((*doc)[2] == "user:0ab1");
    CHECK((*doc)[4]["status"] == "ok");
    CHECK((*doc)[4]["response"].is_object());
}

TEST_CASE("decode_frame keeps null refs of an object frame", "[json]") {
    auto doc = decode_frame(
        R"({"topic":"phoenix","event":"heartbeat","payload":{},"ref":null,"join_ref":null})");

    REQUIRE(doc.has_value());
    CHECK((*doc)["topic"] == "phoenix");
    CHECK((*doc)["ref"].is_null());
    CHECK((*doc)["join_ref"].is_null());
}

TEST_CASE("decode_frame preserves payload value types", "[json]") {
    auto doc = decode_frame(R"({
        "message": "ciphertext",
        "count": 42,
        "offset": -17,
        "ratio": 0.25,
        "seen": false,
        "big": 18446744073709551615,
        "from": null,
        "tags": [1, "two", true]
    })");

    REQUIRE(doc.has_value());
    const auto& p = *doc;
    CHECK(p["message"] == "ciphertext");
    CHECK(p["count"] == 42);
    CHECK(p["offset"] == -17);
    CHECK_THAT(p["ratio"].get<double>(), Catch::Matchers::WithinAbs(0.25, 1e-9));
    CHECK(p["seen"] == false);
    CHECK(p["big"].get<std::uint64_t>() == 18446744073709551615ULL);
    CHECK(p["from"].is_null());
    CHECK(p["tags"][2] == true);
}

TEST_CASE("decode_frame unescapes strings", "[json]") {
    auto doc = decode_frame(R"({"body":"line1\nline2","name":"café"})");

    REQUIRE(doc.has_value());
    CHECK((*doc)["body"] == "line1\nline2");
    CHECK((*doc)["name"] == "caf\xC3\xA9");
}

TEST_CASE("decode_frame accepts a scalar document", "[json]") {
    auto doc = decode_frame(R"("pong")");

    REQUIRE(doc.has_value());
    CHECK(*doc == "pong");
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures and limits
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("decode_frame rejects truncated and empty input", "[json]") {
    CHECK_FALSE(decode_frame(R"(["1","2","user:0ab1")").has_value());
    CHECK_FALSE(decode_frame(R"({"payload": })").has_value());
    CHECK_FALSE(decode_frame("").has_value());

    auto bad = decode_frame("[1,");
    REQUIRE_FALSE(bad.has_value());
    CHECK_FALSE(bad.error().message.empty());
}

TEST_CASE("FrameDecoder refuses oversized frames before parsing", "[json]") {
    FrameDecoder decoder(JsonLimits{16, 32});

    auto doc = decoder.decode(R"({"message":"more than sixteen bytes"})");

    REQUIRE_FALSE(doc.has_value());
    CHECK(doc.error().message.find("byte limit") != std::string::npos);
}

TEST_CASE("FrameDecoder bounds nesting depth", "[json]") {
    FrameDecoder decoder(JsonLimits{0, 3});

    CHECK(decoder.decode("[[1]]").has_value());

    auto deep = decoder.decode("[[[[[1]]]]]");
    REQUIRE_FALSE(deep.has_value());
    CHECK(deep.error().message.find("depth") != std::string::npos);
}

TEST_CASE("FrameDecoder results outlive the next decode", "[json]") {
    FrameDecoder decoder;

    auto first = decoder.decode(R"([null,"1","phoenix","phx_reply",{}])");
    auto second = decoder.decode(R"([null,"2","phoenix","phx_reply",{}])");

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK((*first)[1] == "1");
    CHECK((*second)[1] == "2");
}

TEST_CASE("simd_kernel_name reports the active kernel", "[json]") {
    CHECK_FALSE(simd_kernel_name().empty());
}
