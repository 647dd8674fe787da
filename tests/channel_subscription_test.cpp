// ─────────────────────────────────────────────────────────────────────────────
// Push / ChannelSubscription Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "relaypp/relay/channel_subscription.hpp"
#include "relaypp/relay/push.hpp"
#include "relaypp/relay/socket_session.hpp"

#include "mocks/session_fixture.hpp"

using namespace relaypp;
using namespace relaypp::testing;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Push
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Push settles exactly once", "[push]") {
    asio::io_context io;
    auto push = std::make_shared<Push>(io.get_executor(), "chat", Json::object(), 1s);

    int settled_callbacks = 0;
    push->on_settled([&](Push&) { ++settled_callbacks; });

    REQUIRE(push->settle(Json{{"status", "delivered"}}));
    REQUIRE_FALSE(push->settle(tl::unexpected(ClientError::timeout())));

    REQUIRE(push->is_settled());
    REQUIRE(push->result()->has_value());
    REQUIRE((**push->result())["status"] == "delivered");
    REQUIRE(settled_callbacks == 1);
}

TEST_CASE("Push times out when no reply arrives", "[push]") {
    asio::io_context io;
    auto push = std::make_shared<Push>(io.get_executor(), "chat", Json::object(), 20ms);
    push->start_timeout();

    auto result = run_coro(io, push->async_result());

    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->has_value());
    REQUIRE(result->error().code == ClientErrorCode::Timeout);
}

TEST_CASE("Push with zero timeout never expires", "[push]") {
    asio::io_context io;
    auto push = std::make_shared<Push>(io.get_executor(), "chat", Json::object(), 0ms);
    push->start_timeout();

    run_for(io, 30ms);
    REQUIRE_FALSE(push->is_settled());
}

TEST_CASE("Push result is delivered to every waiter", "[push]") {
    asio::io_context io;
    auto push = std::make_shared<Push>(io.get_executor(), "chat", Json::object(), 1s);

    auto first = std::make_shared<std::optional<PushResult>>();
    auto second = std::make_shared<std::optional<PushResult>>();
    asio::co_spawn(io, [push, first]() -> asio::awaitable<void> {
        *first = co_await push->async_result();
    }, asio::detached);
    asio::co_spawn(io, [push, second]() -> asio::awaitable<void> {
        *second = co_await push->async_result();
    }, asio::detached);

    run_for(io, 5ms);
    push->settle(Json{{"ok", true}});

    REQUIRE(run_until(io, [&] { return first->has_value() && second->has_value(); }));
    REQUIRE((**first)->at("ok") == true);
    REQUIRE((**second)->at("ok") == true);
}

// ═══════════════════════════════════════════════════════════════════════════
// Join
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Channel join confirms on an ok reply", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");

    int joined = 0;
    channel->on_joined([&] { ++joined; });

    auto join = channel->join();
    REQUIRE(channel->state() == ChannelSubscription::State::Joining);

    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));
    REQUIRE(join->is_settled());
    REQUIRE(join->result()->has_value());
    REQUIRE(joined == 1);

    auto joins = fx.script->sent_with_event(phoenix::event::kJoin);
    REQUIRE(joins.size() == 1);
    REQUIRE(joins[0].topic == "user:0ab1");
    REQUIRE(joins[0].join_ref == joins[0].ref);
    REQUIRE(channel->join_ref() == joins[0].join_ref);
}

TEST_CASE("Joining twice returns the same push", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");

    auto first = channel->join();
    auto second = channel->join();

    REQUIRE(first == second);
    fx.settle();
    REQUIRE(fx.script->sent_with_event(phoenix::event::kJoin).size() == 1);
}

TEST_CASE("Join error reply tears the channel down as errored", "[channel]") {
    SessionFixture fx;
    fx.script->join_status = std::string(phoenix::status::kError);
    fx.script->join_response = {{"reason", "unauthorized"}};
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");

    auto join = channel->join();
    auto buffered = channel->push("chat", {{"to", "ff"}, {"message", "early"}});
    auto result = run_coro(fx.io, join->async_result());

    REQUIRE_FALSE(result->has_value());
    REQUIRE(result->error().code == ClientErrorCode::ServerError);
    REQUIRE(result->error().reply->at("reason") == "unauthorized");
    REQUIRE(channel->state() == ChannelSubscription::State::Errored);
    REQUIRE(channel->is_torn_down());

    // The buffered push fails now instead of waiting out its timeout
    auto early = run_coro(fx.io, buffered->async_result());
    REQUIRE(early->error().code == ClientErrorCode::ChannelClosed);
    REQUIRE(fx.script->sent_with_event(phoenix::event::kChat).empty());
}

TEST_CASE("A late join reply after a timeout still joins", "[channel]") {
    SessionFixture fx;
    fx.script->auto_join = false;
    SocketSessionConfig config;
    config.push_timeout = 20ms;
    auto session = fx.open_session(config);
    auto channel = session->channel("user:0ab1");

    int joined = 0;
    channel->on_joined([&] { ++joined; });

    auto join = channel->join();
    auto result = run_coro(fx.io, join->async_result());
    REQUIRE(result->error().code == ClientErrorCode::Timeout);
    REQUIRE(channel->state() == ChannelSubscription::State::Joining);

    auto sent_join = fx.script->sent_with_event(phoenix::event::kJoin).at(0);
    fx.script->reply(sent_join, phoenix::status::kOk);

    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));
    REQUIRE(joined == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Pushes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Pushes before the join are buffered and flushed in order", "[channel]") {
    SessionFixture fx;
    fx.script->auto_join = false;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();

    auto a = channel->push("chat", {{"to", "aa"}, {"message", "1"}});
    auto b = channel->push("chat", {{"to", "bb"}, {"message", "2"}});
    fx.settle();

    REQUIRE(channel->buffered_count() == 2);
    REQUIRE(fx.script->sent_with_event("chat").empty());

    fx.script->reply(fx.script->sent_with_event(phoenix::event::kJoin).at(0), phoenix::status::kOk);
    REQUIRE(run_until(fx.io, [&] { return a->is_settled() && b->is_settled(); }));

    auto chats = fx.script->sent_with_event("chat");
    REQUIRE(chats.size() == 2);
    REQUIRE(chats[0].payload["message"] == "1");
    REQUIRE(chats[1].payload["message"] == "2");
    REQUIRE(chats[0].join_ref == channel->join_ref());
    REQUIRE(channel->buffered_count() == 0);
    REQUIRE(channel->pending_count() == 0);
}

TEST_CASE("Push resolves with the ok reply", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();

    auto push = channel->push("chat", {{"to", "ff"}, {"message", "x"}});
    auto result = run_coro(fx.io, push->async_result());

    REQUIRE(result->has_value());
    REQUIRE((**result)["status"] == "delivered");
}

TEST_CASE("Push rejects with the error reply attached", "[channel]") {
    SessionFixture fx;
    fx.script->chat_status = std::string(phoenix::status::kError);
    fx.script->chat_response = {{"reason", "recipient offline"}};
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();

    auto push = channel->push("chat", {{"to", "ff"}, {"message", "x"}});
    auto result = run_coro(fx.io, push->async_result());

    REQUIRE_FALSE(result->has_value());
    REQUIRE(result->error().code == ClientErrorCode::ServerError);
    REQUIRE(result->error().message.find("recipient offline") != std::string::npos);
    REQUIRE(result->error().reply->at("reason") == "recipient offline");
}

TEST_CASE("Pushes settle independently", "[channel]") {
    SessionFixture fx;
    fx.script->chat_status.reset();
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();
    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));

    auto a = channel->push("chat", {{"message", "a"}});
    auto b = channel->push("chat", {{"message", "b"}});
    REQUIRE(run_until(fx.io, [&] { return fx.script->sent_with_event("chat").size() == 2; }));

    auto chats = fx.script->sent_with_event("chat");
    REQUIRE(chats[0].ref != chats[1].ref);
    fx.script->reply(chats[1], phoenix::status::kOk, {{"n", 2}});

    REQUIRE(run_until(fx.io, [&] { return b->is_settled(); }));
    REQUIRE_FALSE(a->is_settled());
    REQUIRE(channel->pending_count() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Teardown
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Server error tears the channel down", "[channel]") {
    SessionFixture fx;
    fx.script->chat_status.reset();
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();
    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));

    int errors = 0;
    channel->on_error([&](const Json&) { ++errors; });
    auto pending = channel->push("chat", {{"message", "a"}});
    fx.settle();

    phoenix::Message error;
    error.join_ref = channel->join_ref();
    error.topic = "user:0ab1";
    error.event = std::string(phoenix::event::kError);
    fx.script->push_message(error);

    REQUIRE(run_until(fx.io, [&] { return channel->is_torn_down(); }));
    REQUIRE(channel->state() == ChannelSubscription::State::Errored);
    REQUIRE(errors == 1);
    REQUIRE(pending->result()->error().code == ClientErrorCode::ChannelClosed);
    REQUIRE(channel->pending_count() == 0);
}

TEST_CASE("Server close fires close hooks", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();
    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));

    int closes = 0;
    channel->on_close([&] { ++closes; });

    phoenix::Message close;
    close.join_ref = channel->join_ref();
    close.topic = "user:0ab1";
    close.event = std::string(phoenix::event::kClose);
    fx.script->push_message(close);

    REQUIRE(run_until(fx.io, [&] { return closes == 1; }));
    REQUIRE(channel->state() == ChannelSubscription::State::Closed);
}

TEST_CASE("Push on a torn-down channel fails without I/O", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();
    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));

    channel->close_silently();
    const auto frames_before = fx.script->sent_frames().size();

    auto push = channel->push("chat", {{"message", "late"}});

    REQUIRE(push->is_settled());
    REQUIRE(push->result()->error().code == ClientErrorCode::ChannelClosed);
    fx.settle();
    REQUIRE(fx.script->sent_frames().size() == frames_before);
}

TEST_CASE("Lifecycle messages for an older join are ignored", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();
    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));

    phoenix::Message stale;
    stale.join_ref = "999";
    stale.topic = "user:0ab1";
    stale.event = std::string(phoenix::event::kClose);

    REQUIRE_FALSE(channel->is_member(stale));

    fx.script->push_message(stale);
    fx.settle();
    REQUIRE(channel->is_joined());
}

// ═══════════════════════════════════════════════════════════════════════════
// Bindings
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("on() receives every matching event until off()", "[channel]") {
    SessionFixture fx;
    auto session = fx.open_session();
    auto channel = session->channel("user:0ab1");
    channel->join();
    REQUIRE(run_until(fx.io, [&] { return channel->is_joined(); }));

    std::vector<Json> chats;
    int others = 0;
    const auto id = channel->on("chat", [&](const Json& payload) { chats.push_back(payload); });
    channel->on("presence", [&](const Json&) { ++others; });

    fx.script->broadcast("user:0ab1", "chat", {{"message", "one"}});
    fx.script->broadcast("user:0ab1", "chat", {{"message", "two"}});
    fx.script->broadcast("user:ffff", "chat", {{"message", "other topic"}});
    REQUIRE(run_until(fx.io, [&] { return chats.size() == 2; }));
    fx.settle();

    REQUIRE(chats.size() == 2);
    REQUIRE(chats[1]["message"] == "two");
    REQUIRE(others == 0);

    channel->off("chat", id);
    fx.script->broadcast("user:0ab1", "chat", {{"message", "three"}});
    fx.settle();
    REQUIRE(chats.size() == 2);
}
