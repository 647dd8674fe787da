#include "relaypp/relay/push.hpp"

#include <asio/use_awaitable.hpp>

namespace relaypp {

Push::Push(
    asio::any_io_executor executor,
    std::string event,
    Json payload,
    std::chrono::milliseconds timeout
)
    : event_(std::move(event))
    , payload_(std::move(payload))
    , timeout_(timeout)
    , timer_(executor)
    , signal_(std::make_shared<SignalChannel>(executor, 1))
{}

void Push::start_timeout() {
    if (timer_armed_ || is_settled() || timeout_.count() <= 0) {
        return;
    }
    timer_armed_ = true;

    timer_.expires_after(timeout_);
    timer_.async_wait([weak = weak_from_this()](asio::error_code ec) {
        if (ec) {
            return;  // Cancelled by settlement or destruction
        }
        if (auto self = weak.lock()) {
            self->settle(tl::unexpected(ClientError::timeout()));
        }
    });
}

bool Push::settle(PushResult result) {
    if (result_) {
        return false;
    }
    result_ = std::move(result);
    timer_.cancel();

    // Wake one waiter; each waiter passes the signal on to the next
    signal_->try_send(asio::error_code{});

    if (on_settled_) {
        auto callback = std::move(on_settled_);
        on_settled_ = nullptr;
        callback(*this);
    }
    return true;
}

asio::awaitable<PushResult> Push::async_result() {
    if (result_) {
        co_return *result_;
    }

    // Keep the push alive while suspended
    auto self = shared_from_this();
    auto signal = signal_;
    try {
        co_await signal->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(ClientError::channel_closed(
            "Push abandoned: " + std::string(e.what())
        ));
    }
    signal->try_send(asio::error_code{});

    co_return *result_;
}

}  // namespace relaypp
