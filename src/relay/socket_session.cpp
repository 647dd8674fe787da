#include "relaypp/relay/socket_session.hpp"
#include "relaypp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace relaypp {

namespace {

constexpr std::string_view kScope = "socket";

// RFC 6455: 1000 normal closure, 1006 abnormal (no close frame)
constexpr int kNormalClosure = 1000;
constexpr int kAbnormalClosure = 1006;

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

SocketSession::SocketSession(
    asio::any_io_executor executor,
    std::unique_ptr<IWebSocketTransport> transport,
    RelayEndpoint endpoint,
    SocketSessionConfig config
)
    : executor_(std::move(executor))
    , transport_(std::move(transport))
    , endpoint_(std::move(endpoint))
    , config_(config)
    , serializer_(config.serializer)
    , outbox_(std::make_shared<Outbox>(executor_, config.outbox_capacity))
    , heartbeat_timer_(executor_)
{
    if (!transport_) {
        throw std::invalid_argument("SocketSession: transport cannot be null");
    }
}

SocketSession::~SocketSession() {
    // Coroutines hold a reference, so reaching here means none are running
    heartbeat_timer_.cancel();
    outbox_->close();
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void SocketSession::connect() {
    if (started_ || closed_) {
        return;
    }
    started_ = true;
    state_ = State::Connecting;

    RELAYPP_SLOG_INFO(kScope, "connecting to " + endpoint_.url);

    asio::co_spawn(executor_,
        [self = shared_from_this()]() { return self->run(); },
        asio::detached);
}

void SocketSession::disconnect() {
    if (closed_) {
        return;
    }
    auto self = shared_from_this();

    closed_ = true;
    state_ = State::Closing;
    heartbeat_timer_.cancel();
    outbox_->close();

    auto channels = std::move(channels_);
    channels_.clear();
    for (auto& channel : channels) {
        channel->close_silently();
    }

    stop_transport();
    state_ = State::Closed;

    RELAYPP_SLOG_INFO(kScope, "disconnected");

    const CloseInfo info{true, kNormalClosure, "disconnect"};
    for (auto hooks = close_hooks_; auto& hook : hooks) {
        hook(info);
    }
}

void SocketSession::stop_transport() {
    if (transport_stopping_) {
        return;
    }
    transport_stopping_ = true;

    // Until async_start completes there is nothing to stop; run() handles
    // that case once the start result arrives
    if (!transport_->is_running()) {
        return;
    }
    asio::co_spawn(executor_,
        [transport = transport_]() -> asio::awaitable<void> {
            co_await transport->async_stop();
        },
        asio::detached);
}

// ═══════════════════════════════════════════════════════════════════════════
// Channels
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<ChannelSubscription> SocketSession::channel(std::string topic, Json params) {
    auto channel = std::make_shared<ChannelSubscription>(
        weak_from_this(), executor_, std::move(topic), std::move(params), config_.push_timeout
    );
    if (closed_) {
        channel->close_silently();
        return channel;
    }
    channels_.push_back(channel);
    return channel;
}

void SocketSession::remove_channel(const std::shared_ptr<ChannelSubscription>& channel) {
    std::erase(channels_, channel);
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

bool SocketSession::send(const phoenix::Message& message) {
    if (closed_) {
        return false;
    }
    RELAYPP_SLOG_TRACE(kScope, "-> " + message.topic + " " + message.event);

    // Buffered in the outbox until writer_loop starts after open
    outbox_->async_send(asio::error_code{}, serializer_.encode(message), asio::detached);
    return true;
}

std::string SocketSession::make_ref() {
    return std::to_string(++ref_counter_);
}

// ═══════════════════════════════════════════════════════════════════════════
// Coroutines
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> SocketSession::run() {
    auto self = shared_from_this();

    auto started = co_await transport_->async_start();

    if (closed_) {
        // disconnect() raced the handshake
        if (started) {
            co_await transport_->async_stop();
        }
        co_return;
    }
    if (!started) {
        handle_transport_close(started.error());
        co_return;
    }

    state_ = State::Open;
    RELAYPP_SLOG_INFO(kScope, "open");

    for (auto hooks = open_hooks_; auto& hook : hooks) {
        hook();
        if (closed_) {
            co_return;
        }
    }

    asio::co_spawn(executor_, [self]() { return self->writer_loop(); }, asio::detached);
    if (config_.heartbeat_interval.count() > 0) {
        asio::co_spawn(executor_, [self]() { return self->heartbeat_loop(); }, asio::detached);
    }

    co_await reader_loop();
}

asio::awaitable<void> SocketSession::reader_loop() {
    while (!closed_) {
        auto frame = co_await transport_->async_receive();
        if (closed_) {
            break;
        }
        if (!frame) {
            handle_transport_close(frame.error());
            break;
        }

        auto message = serializer_.decode(*frame);
        if (!message) {
            RELAYPP_SLOG_WARN(kScope, "dropping frame: " + message.error().message);
            continue;
        }
        dispatch(*message);
    }
}

asio::awaitable<void> SocketSession::writer_loop() {
    auto outbox = outbox_;

    while (!closed_) {
        std::string frame;
        try {
            frame = co_await outbox->async_receive(asio::use_awaitable);
        } catch (const std::system_error&) {
            break;  // Outbox closed by disconnect or teardown
        }

        auto sent = co_await transport_->async_send(std::move(frame));
        if (!sent) {
            // The reader observes the same failure and drives the close
            RELAYPP_SLOG_WARN(kScope, "write failed: " + sent.error().message);
            break;
        }
    }
}

asio::awaitable<void> SocketSession::heartbeat_loop() {
    while (!closed_) {
        heartbeat_timer_.expires_after(config_.heartbeat_interval);
        try {
            co_await heartbeat_timer_.async_wait(asio::use_awaitable);
        } catch (const std::system_error&) {
            break;  // Cancelled
        }
        if (closed_) {
            break;
        }

        if (pending_heartbeat_) {
            RELAYPP_SLOG_WARN(kScope, "heartbeat " + *pending_heartbeat_ + " unanswered");
            handle_transport_close(TransportError::timeout("Heartbeat timeout"));
            break;
        }

        pending_heartbeat_ = make_ref();

        phoenix::Message beat;
        beat.ref = pending_heartbeat_;
        beat.topic = std::string(phoenix::kSocketTopic);
        beat.event = std::string(phoenix::event::kHeartbeat);
        send(beat);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound
// ═══════════════════════════════════════════════════════════════════════════

void SocketSession::dispatch(const phoenix::Message& message) {
    RELAYPP_SLOG_TRACE(kScope, "<- " + message.topic + " " + message.event);

    if (message.topic == phoenix::kSocketTopic) {
        if (message.is_reply() && pending_heartbeat_ && message.ref == pending_heartbeat_) {
            pending_heartbeat_.reset();
        }
        return;
    }

    // Copy: handlers may disconnect the session and clear channels_
    auto channels = channels_;
    for (auto& channel : channels) {
        if (closed_) {
            break;
        }
        if (channel->is_member(message)) {
            channel->handle_message(message);
        }
    }
}

void SocketSession::handle_transport_close(const TransportError& error) {
    if (closed_) {
        return;
    }
    auto self = shared_from_this();

    closed_ = true;
    state_ = State::Closed;
    heartbeat_timer_.cancel();
    outbox_->close();

    const CloseInfo info{
        error.is_clean_close(),
        error.close_code.value_or(error.is_clean_close() ? kNormalClosure : kAbnormalClosure),
        error.message
    };

    if (info.clean) {
        RELAYPP_SLOG_INFO(kScope, "closed by relay (" + std::to_string(info.code) + ")");
    } else {
        RELAYPP_SLOG_ERROR(kScope, std::string(to_string(error.category)) + ": " + error.message);
        for (auto hooks = error_hooks_; auto& hook : hooks) {
            hook(error);
        }
    }

    auto channels = std::move(channels_);
    channels_.clear();
    for (auto& channel : channels) {
        channel->handle_socket_error(error.message);
    }

    stop_transport();

    for (auto hooks = close_hooks_; auto& hook : hooks) {
        hook(info);
    }
}

}  // namespace relaypp
