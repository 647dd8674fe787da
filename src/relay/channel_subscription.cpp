#include "relaypp/relay/channel_subscription.hpp"
#include "relaypp/log/logger.hpp"
#include "relaypp/relay/socket_session.hpp"

#include <algorithm>

namespace relaypp {

ChannelSubscription::ChannelSubscription(
    std::weak_ptr<SocketSession> socket,
    asio::any_io_executor executor,
    std::string topic,
    Json params,
    std::chrono::milliseconds timeout
)
    : socket_(std::move(socket))
    , executor_(std::move(executor))
    , topic_(std::move(topic))
    , params_(std::move(params))
    , timeout_(timeout)
{}

// ═══════════════════════════════════════════════════════════════════════════
// Operations
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<Push> ChannelSubscription::join() {
    if (join_push_) {
        return join_push_;
    }

    join_push_ = std::make_shared<Push>(executor_, std::string(phoenix::event::kJoin), params_, timeout_);
    if (torn_down_) {
        join_push_->settle(tl::unexpected(ClientError::channel_closed()));
        return join_push_;
    }

    state_ = State::Joining;
    send_join();
    return join_push_;
}

std::shared_ptr<Push> ChannelSubscription::push(std::string event, Json payload) {
    auto push = std::make_shared<Push>(executor_, std::move(event), std::move(payload), timeout_);

    if (torn_down_) {
        push->settle(tl::unexpected(ClientError::channel_closed(
            "Channel " + topic_ + " is closed"
        )));
        return push;
    }

    push->start_timeout();
    track(push);

    if (state_ == State::Joined) {
        send_push(push);
    } else {
        buffer_.push_back(push);
    }
    return push;
}

std::size_t ChannelSubscription::on(std::string event, EventHandler handler) {
    const std::size_t id = next_binding_id_++;
    bindings_.push_back(Binding{id, std::move(event), std::move(handler)});
    return id;
}

void ChannelSubscription::off(const std::string& event) {
    std::erase_if(bindings_, [&](const Binding& b) { return b.event == event; });
}

void ChannelSubscription::off(const std::string& event, std::size_t id) {
    std::erase_if(bindings_, [&](const Binding& b) { return b.event == event && b.id == id; });
}

void ChannelSubscription::on_error(ErrorHandler handler) {
    error_hooks_.push_back(std::move(handler));
}

void ChannelSubscription::on_close(CloseHandler handler) {
    close_hooks_.push_back(std::move(handler));
}

void ChannelSubscription::on_joined(JoinedHandler handler) {
    joined_hooks_.push_back(std::move(handler));
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

void ChannelSubscription::send_join() {
    auto socket = socket_.lock();
    if (!socket) {
        tear_down(State::Errored, "socket released");
        return;
    }

    join_ref_ = socket->make_ref();
    join_push_->assign_ref(*join_ref_);
    join_push_->start_timeout();

    phoenix::Message message;
    message.join_ref = join_ref_;
    message.ref = join_ref_;
    message.topic = topic_;
    message.event = std::string(phoenix::event::kJoin);
    message.payload = params_;
    socket->send(message);

    RELAYPP_SLOG_DEBUG(topic_, "join sent (ref " + *join_ref_ + ")");
}

void ChannelSubscription::send_push(const std::shared_ptr<Push>& push) {
    auto socket = socket_.lock();
    if (!socket) {
        push->settle(tl::unexpected(ClientError::channel_closed()));
        return;
    }

    const std::string ref = socket->make_ref();
    push->assign_ref(ref);
    pending_[ref] = push;

    phoenix::Message message;
    message.join_ref = join_ref_;
    message.ref = ref;
    message.topic = topic_;
    message.event = push->event();
    message.payload = push->payload();

    if (!socket->send(message)) {
        push->settle(tl::unexpected(ClientError::channel_closed("Socket closed")));
    }
}

void ChannelSubscription::flush_buffer() {
    auto buffered = std::move(buffer_);
    buffer_.clear();
    for (auto& push : buffered) {
        if (!push->is_settled()) {
            send_push(push);
        }
    }
}

// Drop bookkeeping once the push settles, whichever way it settles
void ChannelSubscription::track(const std::shared_ptr<Push>& push) {
    push->on_settled([weak = weak_from_this()](Push& settled) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (settled.ref()) {
            self->pending_.erase(*settled.ref());
        }
        std::erase_if(self->buffer_, [&](const std::shared_ptr<Push>& p) { return p.get() == &settled; });
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound
// ═══════════════════════════════════════════════════════════════════════════

bool ChannelSubscription::is_member(const phoenix::Message& message) const {
    if (message.topic != topic_) {
        return false;
    }
    if (message.join_ref && join_ref_ && *message.join_ref != *join_ref_ &&
        phoenix::is_lifecycle_event(message.event)) {
        RELAYPP_SLOG_DEBUG(topic_, "dropping stale " + message.event + " for join ref " + *message.join_ref);
        return false;
    }
    return true;
}

void ChannelSubscription::handle_message(const phoenix::Message& message) {
    // Hooks may release the last outside reference to this channel
    auto self = shared_from_this();

    if (message.event == phoenix::event::kReply) {
        handle_reply(message);
        return;
    }
    if (message.event == phoenix::event::kError) {
        RELAYPP_SLOG_WARN(topic_, "errored by relay");
        tear_down(State::Errored, "Channel " + topic_ + " errored");
        for (auto hooks = error_hooks_; auto& hook : hooks) {
            hook(message.payload);
        }
        return;
    }
    if (message.event == phoenix::event::kClose) {
        RELAYPP_SLOG_INFO(topic_, "closed by relay");
        tear_down(State::Closed, "Channel " + topic_ + " closed");
        for (auto hooks = close_hooks_; auto& hook : hooks) {
            hook();
        }
        return;
    }

    // Copy: a handler may call on()/off()
    auto bindings = bindings_;
    for (const auto& binding : bindings) {
        if (binding.event == message.event) {
            binding.handler(message.payload);
        }
    }
}

void ChannelSubscription::handle_reply(const phoenix::Message& message) {
    if (!message.ref) {
        return;
    }
    if (join_ref_ && *message.ref == *join_ref_) {
        handle_join_reply(message);
        return;
    }

    auto it = pending_.find(*message.ref);
    if (it == pending_.end()) {
        RELAYPP_SLOG_DEBUG(topic_, "reply for unknown ref " + *message.ref);
        return;
    }
    auto push = it->second;

    if (message.reply_status() == phoenix::status::kOk) {
        push->settle(message.reply_response());
    } else {
        push->settle(tl::unexpected(ClientError::server_error(message.reply_response())));
    }
}

void ChannelSubscription::handle_join_reply(const phoenix::Message& message) {
    if (torn_down_) {
        return;
    }

    if (message.reply_status() == phoenix::status::kOk) {
        if (state_ == State::Joined) {
            return;
        }
        state_ = State::Joined;
        RELAYPP_SLOG_INFO(topic_, "joined");

        join_push_->settle(message.reply_response());
        flush_buffer();

        for (auto hooks = joined_hooks_; auto& hook : hooks) {
            hook();
        }
        return;
    }

    auto self = shared_from_this();
    RELAYPP_SLOG_WARN(topic_, "join rejected: " + message.reply_response().dump());
    join_push_->settle(tl::unexpected(ClientError::server_error(message.reply_response())));

    // Buffered pushes would otherwise wait out their timeouts
    tear_down(State::Errored, "Channel " + topic_ + " join rejected");
}

// ═══════════════════════════════════════════════════════════════════════════
// Teardown
// ═══════════════════════════════════════════════════════════════════════════

void ChannelSubscription::handle_socket_error(const std::string& reason) {
    if (torn_down_) {
        return;
    }
    auto self = shared_from_this();

    tear_down(State::Errored, reason);

    const Json payload = {{"reason", reason}};
    for (auto hooks = error_hooks_; auto& hook : hooks) {
        hook(payload);
    }
}

void ChannelSubscription::close_silently() {
    if (torn_down_) {
        return;
    }
    auto self = shared_from_this();
    tear_down(State::Closed, "Channel " + topic_ + " closed");
}

void ChannelSubscription::tear_down(State next, const std::string& reason) {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;
    state_ = next;

    // settle() erases from pending_/buffer_, so work on copies
    std::vector<std::shared_ptr<Push>> doomed;
    doomed.reserve(pending_.size() + buffer_.size() + 1);
    for (auto& [ref, push] : pending_) {
        doomed.push_back(push);
    }
    doomed.insert(doomed.end(), buffer_.begin(), buffer_.end());
    if (join_push_) {
        doomed.push_back(join_push_);
    }

    for (auto& push : doomed) {
        push->settle(tl::unexpected(ClientError::channel_closed(reason)));
    }
    pending_.clear();
    buffer_.clear();
}

}  // namespace relaypp
