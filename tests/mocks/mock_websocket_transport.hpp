#ifndef RELAYPP_TESTS_MOCKS_MOCK_WEBSOCKET_TRANSPORT_HPP
#define RELAYPP_TESTS_MOCKS_MOCK_WEBSOCKET_TRANSPORT_HPP

#include "relaypp/protocol/phoenix.hpp"
#include "relaypp/transport/websocket_transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relaypp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockSocketScript - Relay behaviour shared by every mock transport it builds
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Fail the handshake
// - Auto-answer joins, chat pushes and heartbeats, or leave them unanswered
// - Inject inbound frames, server closes and network failures
// - Inspect every frame the client wrote

class MockSocketScript {
public:
    explicit MockSocketScript(asio::any_io_executor executor)
        : wake_(executor, asio::steady_timer::time_point::max())
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup
    // ─────────────────────────────────────────────────────────────────────────

    std::optional<TransportError> start_error;

    bool auto_join = true;
    std::string join_status{phoenix::status::kOk};
    Json join_response = Json::object();

    // nullopt = chat pushes go unanswered
    std::optional<std::string> chat_status{std::string(phoenix::status::kOk)};
    Json chat_response = {{"status", "delivered"}};

    bool auto_heartbeat = true;

    phoenix::Serializer serializer{phoenix::SerializerVersion::V2};

    // ─────────────────────────────────────────────────────────────────────────
    // Inbound
    // ─────────────────────────────────────────────────────────────────────────

    void push_frame(std::string frame) {
        inbound_.push_back(std::move(frame));
        wake_.cancel();
    }

    void push_message(const phoenix::Message& message) {
        push_frame(serializer.encode(message));
    }

    void reply(const phoenix::Message& to, std::string_view status, Json response = Json::object()) {
        push_message(phoenix::Message::reply(to.join_ref, to.ref.value_or(""), to.topic, status, std::move(response)));
    }

    /// Server event on a topic (no refs)
    void broadcast(std::string topic, std::string event, Json payload) {
        phoenix::Message message;
        message.topic = std::move(topic);
        message.event = std::move(event);
        message.payload = std::move(payload);
        push_message(message);
    }

    /// Peer close handshake
    void close(int code = 1000, std::string reason = "server closed") {
        inbound_.push_back(tl::unexpected(TransportError::closed(std::move(reason), code)));
        wake_.cancel();
    }

    /// Connection lost
    void fail(std::string reason = "connection reset") {
        inbound_.push_back(tl::unexpected(TransportError::network(std::move(reason))));
        wake_.cancel();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<std::string>& sent_frames() const noexcept { return sent_frames_; }
    [[nodiscard]] const std::vector<phoenix::Message>& sent() const noexcept { return sent_; }

    [[nodiscard]] std::vector<phoenix::Message> sent_with_event(std::string_view event) const {
        std::vector<phoenix::Message> out;
        for (const auto& message : sent_) {
            if (message.event == event) {
                out.push_back(message);
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t transports_created() const noexcept { return targets_.size(); }
    [[nodiscard]] const std::vector<WebSocketTarget>& targets() const noexcept { return targets_; }
    [[nodiscard]] std::size_t starts() const noexcept { return starts_; }
    [[nodiscard]] std::size_t stops() const noexcept { return stops_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Used by MockWebSocketTransport
    // ─────────────────────────────────────────────────────────────────────────

    void record_target(const WebSocketTarget& target) { targets_.push_back(target); }
    void record_start() { ++starts_; }
    void record_stop() {
        ++stops_;
        wake_.cancel();
    }

    void record_sent(std::string frame) {
        auto decoded = serializer.decode(frame);
        sent_frames_.push_back(std::move(frame));
        if (!decoded) {
            return;
        }
        sent_.push_back(*decoded);
        answer(*decoded);
    }

    [[nodiscard]] bool has_inbound() const noexcept { return !inbound_.empty(); }

    TransportResult<std::string> pop_inbound() {
        auto next = std::move(inbound_.front());
        inbound_.pop_front();
        return next;
    }

    asio::awaitable<void> wait_inbound() {
        asio::error_code ec;
        co_await wake_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

private:
    void answer(const phoenix::Message& message) {
        if (message.event == phoenix::event::kJoin && auto_join) {
            reply(message, join_status, join_response);
        } else if (message.event == phoenix::event::kChat && chat_status) {
            reply(message, *chat_status, chat_response);
        } else if (message.event == phoenix::event::kHeartbeat && auto_heartbeat) {
            reply(message, phoenix::status::kOk);
        }
    }

    asio::steady_timer wake_;
    std::deque<TransportResult<std::string>> inbound_;
    std::vector<std::string> sent_frames_;
    std::vector<phoenix::Message> sent_;
    std::vector<WebSocketTarget> targets_;
    std::size_t starts_{0};
    std::size_t stops_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// MockWebSocketTransport - IWebSocketTransport driven by a MockSocketScript
// ─────────────────────────────────────────────────────────────────────────────

class MockWebSocketTransport final : public IWebSocketTransport {
public:
    MockWebSocketTransport(asio::any_io_executor executor, std::shared_ptr<MockSocketScript> script)
        : executor_(std::move(executor))
        , script_(std::move(script))
    {}

    asio::any_io_executor get_executor() override { return executor_; }

    asio::awaitable<TransportResult<void>> async_start() override {
        script_->record_start();
        if (script_->start_error) {
            co_return tl::unexpected(*script_->start_error);
        }
        running_ = true;
        co_return TransportResult<void>{};
    }

    asio::awaitable<void> async_stop() override {
        if (stopped_) {
            co_return;
        }
        stopped_ = true;
        running_ = false;
        script_->record_stop();
    }

    asio::awaitable<TransportResult<void>> async_send(std::string frame) override {
        if (!running_) {
            co_return tl::unexpected(TransportError::closed("not running"));
        }
        script_->record_sent(std::move(frame));
        co_return TransportResult<void>{};
    }

    asio::awaitable<TransportResult<std::string>> async_receive() override {
        while (!stopped_ && !script_->has_inbound()) {
            co_await script_->wait_inbound();
        }
        if (stopped_) {
            co_return tl::unexpected(TransportError::closed("stopped", 1000));
        }
        auto next = script_->pop_inbound();
        if (!next) {
            running_ = false;
        }
        co_return next;
    }

    bool is_running() const override { return running_; }

private:
    asio::any_io_executor executor_;
    std::shared_ptr<MockSocketScript> script_;
    bool running_{false};
    bool stopped_{false};
};

/// Factory handing out transports bound to `script`
inline WebSocketTransportFactory make_mock_transport_factory(std::shared_ptr<MockSocketScript> script) {
    return [script](asio::any_io_executor executor, const WebSocketTarget& target)
               -> std::unique_ptr<IWebSocketTransport> {
        script->record_target(target);
        return std::make_unique<MockWebSocketTransport>(std::move(executor), script);
    };
}

}  // namespace relaypp::testing

#endif  // RELAYPP_TESTS_MOCKS_MOCK_WEBSOCKET_TRANSPORT_HPP
