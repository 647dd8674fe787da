#include "relaypp/transport/beast_websocket_transport.hpp"
#include "relaypp/log/logger.hpp"

#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <exception>

namespace relaypp {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::string_view kScope = "transport";

// Timeouts, user agent and frame limits for a freshly connected stream, then
// the HTTP upgrade
template <typename Stream>
net::awaitable<void> upgrade(
    Stream& ws,
    const WebSocketTarget& target,
    const WebSocketTransportConfig& config
) {
    // The websocket stream manages its own timeouts from here on
    beast::get_lowest_layer(ws).expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = config.connect_timeout;
    ws.set_option(timeouts);

    ws.set_option(websocket::stream_base::decorator(
        [agent = config.user_agent](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, agent);
        }
    ));
    ws.read_message_max(config.max_message_size);
    ws.text(true);

    const bool default_port = (target.secure && target.port == 443) ||
                              (!target.secure && target.port == 80);
    const std::string host = default_port
        ? target.host
        : target.host + ":" + std::to_string(target.port);

    co_await ws.async_handshake(host, target.target, net::use_awaitable);
}

TransportError connect_error(const boost::system::error_code& ec, std::string_view stage) {
    if (ec == beast::error::timeout) {
        return TransportError::timeout(std::string(stage) + " timed out");
    }
    return TransportError::network(std::string(stage) + " failed: " + ec.message());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

BeastWebSocketTransport::BeastWebSocketTransport(
    asio::any_io_executor executor,
    WebSocketTarget target,
    WebSocketTransportConfig config
)
    : executor_(std::move(executor))
    , target_(std::move(target))
    , config_(std::move(config))
    , ioc_(1)
    , work_(net::make_work_guard(ioc_))
    , ssl_ctx_(net::ssl::context::tlsv12_client)
    , write_signal_(ioc_, net::steady_timer::time_point::max())
    , frames_(std::make_shared<FrameChannel>(executor_, config_.receive_buffer_size))
{
    if (config_.tls.verify_peer) {
        boost::system::error_code ec;
        ssl_ctx_.set_verify_mode(net::ssl::verify_peer, ec);
        if (!ec) {
            if (config_.tls.ca_cert_path.empty()) {
                ssl_ctx_.set_default_verify_paths(ec);
            } else {
                ssl_ctx_.load_verify_file(config_.tls.ca_cert_path, ec);
            }
        }
        if (ec) {
            setup_error_ = TransportError::protocol("TLS setup failed: " + ec.message());
        }
    } else {
        ssl_ctx_.set_verify_mode(net::ssl::verify_none);
        RELAYPP_SLOG_WARN(kScope, "TLS peer verification disabled");
    }

    io_thread_ = std::thread([this]() { ioc_.run(); });
}

BeastWebSocketTransport::~BeastWebSocketTransport() {
    running_ = false;
    work_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// IWebSocketTransport
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor BeastWebSocketTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> BeastWebSocketTransport::async_start() {
    if (started_.exchange(true)) {
        co_return tl::unexpected(TransportError::protocol("Transport already started"));
    }
    if (setup_error_) {
        co_return tl::unexpected(*setup_error_);
    }

    RELAYPP_SLOG_DEBUG(kScope, std::string(target_.secure ? "wss://" : "ws://") +
                               target_.host + ":" + std::to_string(target_.port));

    auto done = std::make_shared<StatusChannel>(executor_, 1);
    net::co_spawn(ioc_, connect_on_io(),
        [this, done](std::exception_ptr ep, TransportResult<void> result) {
            if (ep) {
                result = tl::unexpected(TransportError::network("Connect aborted"));
            }
            complete(done, std::move(result));
        });

    TransportResult<void> result;
    try {
        result = co_await done->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError::network(
            "Connect interrupted: " + std::string(e.what())
        ));
    }

    if (!result) {
        RELAYPP_SLOG_WARN(kScope, result.error().message);
        co_return result;
    }

    running_ = true;
    net::co_spawn(ioc_, read_loop(), net::detached);
    net::co_spawn(ioc_, write_loop(), net::detached);

    RELAYPP_SLOG_INFO(kScope, "Connected to " + target_.host);
    co_return result;
}

asio::awaitable<void> BeastWebSocketTransport::async_stop() {
    if (!running_.exchange(false)) {
        co_return;
    }
    stopping_ = true;

    auto done = std::make_shared<StatusChannel>(executor_, 1);
    net::co_spawn(ioc_, close_on_io(),
        [this, done](std::exception_ptr) {
            complete(done, TransportResult<void>{});
        });

    try {
        co_await done->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        RELAYPP_SLOG_DEBUG(kScope, "Stop interrupted: " + std::string(e.what()));
    }

    RELAYPP_SLOG_INFO(kScope, "Stopped");
}

asio::awaitable<TransportResult<void>> BeastWebSocketTransport::async_send(std::string frame) {
    if (!running_) {
        co_return tl::unexpected(TransportError::network("Transport not running"));
    }

    auto done = std::make_shared<StatusChannel>(executor_, 1);
    net::post(ioc_, [this, done, frame = std::move(frame)]() mutable {
        if (!running_) {
            complete(done, tl::unexpected(TransportError::network("Transport not running")));
            return;
        }
        write_queue_.push_back(OutboundFrame{std::move(frame), std::move(done)});
        write_signal_.cancel_one();
    });

    try {
        co_return co_await done->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError::network(
            "Send interrupted: " + std::string(e.what())
        ));
    }
}

asio::awaitable<TransportResult<std::string>> BeastWebSocketTransport::async_receive() {
    // Keep the channel alive across the suspension
    auto frames = frames_;
    try {
        co_return co_await frames->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError::network(
            "Receive failed: " + std::string(e.what())
        ));
    }
}

bool BeastWebSocketTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// io thread
// ═══════════════════════════════════════════════════════════════════════════

template <typename Fn>
decltype(auto) BeastWebSocketTransport::with_stream(Fn&& fn) {
    if (tls_ws_) {
        return fn(*tls_ws_);
    }
    return fn(*plain_ws_);
}

net::awaitable<TransportResult<void>> BeastWebSocketTransport::connect_on_io() {
    std::string_view stage = "Resolve";
    try {
        tcp::resolver resolver(ioc_);
        const auto endpoints = co_await resolver.async_resolve(
            target_.host, std::to_string(target_.port), net::use_awaitable
        );

        if (target_.secure) {
            tls_ws_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);
            auto& tcp_layer = beast::get_lowest_layer(*tls_ws_);

            stage = "Connect";
            tcp_layer.expires_after(config_.connect_timeout);
            co_await tcp_layer.async_connect(endpoints, net::use_awaitable);

            // SNI; most relays sit behind shared TLS frontends
            if (!SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), target_.host.c_str())) {
                co_return tl::unexpected(TransportError::protocol("Failed to set SNI host name"));
            }
            if (config_.tls.verify_peer) {
                tls_ws_->next_layer().set_verify_callback(
                    net::ssl::host_name_verification(target_.host)
                );
            }

            stage = "TLS handshake";
            tcp_layer.expires_after(config_.connect_timeout);
            co_await tls_ws_->next_layer().async_handshake(
                net::ssl::stream_base::client, net::use_awaitable
            );

            stage = "WebSocket upgrade";
            co_await upgrade(*tls_ws_, target_, config_);
        } else {
            plain_ws_ = std::make_unique<PlainStream>(ioc_);
            auto& tcp_layer = beast::get_lowest_layer(*plain_ws_);

            stage = "Connect";
            tcp_layer.expires_after(config_.connect_timeout);
            co_await tcp_layer.async_connect(endpoints, net::use_awaitable);

            stage = "WebSocket upgrade";
            co_await upgrade(*plain_ws_, target_, config_);
        }
    } catch (const boost::system::system_error& e) {
        co_return tl::unexpected(connect_error(e.code(), stage));
    }

    co_return TransportResult<void>{};
}

TransportError BeastWebSocketTransport::read_error(const boost::system::error_code& ec) {
    if (ec == websocket::error::closed) {
        const auto reason = with_stream([](auto& ws) { return ws.reason(); });
        std::string message = "Closed by relay";
        if (!reason.reason.empty()) {
            message += ": " + std::string(reason.reason.c_str());
        }
        return TransportError::closed(std::move(message), static_cast<int>(reason.code));
    }
    if (stopping_) {
        return TransportError::closed("Closed locally");
    }
    if (ec == websocket::error::message_too_big) {
        return TransportError::protocol("Inbound frame exceeds " +
                                        std::to_string(config_.max_message_size) + " bytes");
    }
    if (ec == beast::error::timeout) {
        return TransportError::timeout("Relay stopped responding");
    }
    return TransportError::network("Read failed: " + ec.message());
}

net::awaitable<void> BeastWebSocketTransport::read_loop() {
    beast::flat_buffer buffer;

    for (;;) {
        boost::system::error_code ec;
        co_await with_stream([&](auto& ws) {
            return ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        });

        if (ec) {
            running_ = false;
            write_signal_.cancel();
            deliver_frame(tl::unexpected(read_error(ec)));
            break;
        }

        deliver_frame(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
    }
}

net::awaitable<void> BeastWebSocketTransport::write_loop() {
    while (running_) {
        if (write_queue_.empty()) {
            boost::system::error_code ignored;
            co_await write_signal_.async_wait(net::redirect_error(net::use_awaitable, ignored));
            continue;
        }

        OutboundFrame frame = std::move(write_queue_.front());
        write_queue_.pop_front();

        boost::system::error_code ec;
        co_await with_stream([&](auto& ws) {
            return ws.async_write(net::buffer(frame.data), net::redirect_error(net::use_awaitable, ec));
        });

        if (ec) {
            complete(frame.done, tl::unexpected(TransportError::network("Write failed: " + ec.message())));
        } else {
            complete(frame.done, TransportResult<void>{});
        }
    }

    fail_queued_writes(TransportError::closed("Transport stopped"));
}

net::awaitable<void> BeastWebSocketTransport::close_on_io() {
    write_signal_.cancel();
    fail_queued_writes(TransportError::closed("Transport stopped"));

    if (!tls_ws_ && !plain_ws_) {
        co_return;
    }

    const bool open = with_stream([](auto& ws) { return ws.is_open(); });
    if (!open) {
        co_return;
    }

    boost::system::error_code ec;
    co_await with_stream([&](auto& ws) {
        return ws.async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
    });
    if (ec) {
        RELAYPP_SLOG_DEBUG(kScope, "Close handshake failed: " + ec.message());
        with_stream([](auto& ws) {
            boost::system::error_code ignored;
            beast::get_lowest_layer(ws).socket().close(ignored);
        });
    }
}

void BeastWebSocketTransport::deliver_frame(TransportResult<std::string> frame) {
    asio::post(executor_, [frames = frames_, frame = std::move(frame)]() mutable {
        frames->async_send(asio::error_code{}, std::move(frame), asio::detached);
    });
}

void BeastWebSocketTransport::complete(std::shared_ptr<StatusChannel> done, TransportResult<void> result) {
    asio::post(executor_, [done = std::move(done), result = std::move(result)]() mutable {
        done->try_send(asio::error_code{}, std::move(result));
    });
}

void BeastWebSocketTransport::fail_queued_writes(const TransportError& error) {
    while (!write_queue_.empty()) {
        complete(std::move(write_queue_.front().done), tl::unexpected(error));
        write_queue_.pop_front();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════════════════════

WebSocketTransportFactory make_beast_transport_factory(WebSocketTransportConfig config) {
    return [config = std::move(config)](asio::any_io_executor executor, const WebSocketTarget& target)
        -> std::unique_ptr<IWebSocketTransport> {
        return std::make_unique<BeastWebSocketTransport>(std::move(executor), target, config);
    };
}

}  // namespace relaypp
