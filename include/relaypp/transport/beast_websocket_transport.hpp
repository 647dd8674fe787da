#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Beast WebSocket Transport
// ═══════════════════════════════════════════════════════════════════════════
// ws:// and wss:// client built on Boost.Beast.
//
// Socket I/O runs on a private Boost.Asio io_context with its own thread.
// Results cross back to the client executor through asio channels, so every
// public coroutine completes on get_executor() and callers never touch
// Beast objects directly.
//
//   client executor                     io thread
//   ───────────────                     ─────────
//   async_start()  ── co_spawn ──────▶  resolve, connect, TLS, upgrade
//                  ◀── status channel ─
//   async_send()   ── post ──────────▶  write queue ─▶ write_loop
//   async_receive() ◀── frame channel ─ read_loop

#include "relaypp/transport/websocket_transport.hpp"

#include <asio/experimental/channel.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace relaypp {

class BeastWebSocketTransport final : public IWebSocketTransport {
public:
    BeastWebSocketTransport(
        asio::any_io_executor executor,
        WebSocketTarget target,
        WebSocketTransportConfig config = {}
    );
    ~BeastWebSocketTransport() override;

    BeastWebSocketTransport(const BeastWebSocketTransport&) = delete;
    BeastWebSocketTransport& operator=(const BeastWebSocketTransport&) = delete;
    BeastWebSocketTransport(BeastWebSocketTransport&&) = delete;
    BeastWebSocketTransport& operator=(BeastWebSocketTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // IWebSocketTransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string frame) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] bool is_running() const override;

    [[nodiscard]] const WebSocketTarget& target() const noexcept { return target_; }

private:
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using TlsStream = boost::beast::websocket::stream<
        boost::beast::ssl_stream<boost::beast::tcp_stream>
    >;

    using StatusChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<void>)
    >;
    using FrameChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<std::string>)
    >;

    struct OutboundFrame {
        std::string data;
        std::shared_ptr<StatusChannel> done;
    };

    // io thread coroutines
    boost::asio::awaitable<TransportResult<void>> connect_on_io();
    boost::asio::awaitable<void> read_loop();
    boost::asio::awaitable<void> write_loop();
    boost::asio::awaitable<void> close_on_io();

    // Dispatch to whichever stream is active
    template <typename Fn>
    decltype(auto) with_stream(Fn&& fn);

    TransportError read_error(const boost::system::error_code& ec);

    // io thread -> client executor
    void deliver_frame(TransportResult<std::string> frame);
    void complete(std::shared_ptr<StatusChannel> done, TransportResult<void> result);

    void fail_queued_writes(const TransportError& error);

    asio::any_io_executor executor_;
    WebSocketTarget target_;
    WebSocketTransportConfig config_;
    std::optional<TransportError> setup_error_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::steady_timer write_signal_;

    // Touched on the io thread only
    std::unique_ptr<PlainStream> plain_ws_;
    std::unique_ptr<TlsStream> tls_ws_;
    std::deque<OutboundFrame> write_queue_;

    // Touched on the client executor only
    std::shared_ptr<FrameChannel> frames_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::thread io_thread_;
};

}  // namespace relaypp
