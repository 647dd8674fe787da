#include "relaypp/relay/connection_manager.hpp"
#include "relaypp/log/logger.hpp"
#include "relaypp/protocol/channel_id.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/use_awaitable.hpp>

#include <stdexcept>

namespace relaypp {

namespace {

constexpr std::string_view kScope = "manager";
constexpr std::string_view kChatEvent = phoenix::event::kChat;

SocketSessionConfig session_config_from(const ConnectionConfig& config) {
    SocketSessionConfig session;
    session.serializer = config.serializer;
    session.push_timeout = config.push_timeout;
    session.heartbeat_interval = config.heartbeat_interval;
    return session;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ConnectionManager::ConnectionManager(
    asio::any_io_executor executor,
    RelayServices services,
    ConnectionConfig config,
    WebSocketTransportFactory transport_factory
)
    : strand_(asio::make_strand(std::move(executor)))
    , services_(std::move(services))
    , config_(std::move(config))
    , transport_factory_(std::move(transport_factory))
    , resolver_(config_.url_validation, config_.transport_suffix, config_.serializer)
{
    services_.complete();

    if (config_.push_timeout.count() < 0 || config_.heartbeat_interval.count() < 0) {
        throw std::invalid_argument("ConnectionManager: push timeout and heartbeat must not be negative");
    }

    if (!transport_factory_) {
        transport_factory_ = make_beast_transport_factory(config_.transport);
    }

    if (config_.reconnect.enabled) {
        auto backoff = config_.reconnect.backoff
            ? config_.reconnect.backoff
            : std::make_shared<SteppedBackoff>();
        reconnect_ = std::make_unique<ReconnectSupervisor>(
            strand_, std::move(backoff), config_.reconnect.max_attempts
        );
    }
}

ConnectionManager::~ConnectionManager() {
    // Hooks check the token and skip once it is gone
    lifetime_.reset();
    if (reconnect_) {
        reconnect_->cancel();
    }
    if (auto session = std::move(session_)) {
        session->disconnect();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<bool> ConnectionManager::can_connect() {
    auto identity = services_.identity;
    co_return co_await identity->exists();
}

asio::awaitable<ClientResult<void>> ConnectionManager::connect() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (!co_await can_connect()) {
        RELAYPP_SLOG_WARN(kScope, "connect refused: no identity");
        co_return tl::unexpected(ClientError::no_identity());
    }

    // Re-checked after the await: a concurrent connect() may have won
    if (session_ || state_ != ConnectionState::Disconnected) {
        RELAYPP_SLOG_DEBUG(kScope, "connect ignored: already " + std::string(to_string(state_)));
        co_return ClientResult<void>{};
    }

    user_disconnect_ = false;
    co_return establish();
}

ClientResult<void> ConnectionManager::establish() {
    services_.notifier->info(services_.translator->translate(i18n::kConnecting));

    auto key = services_.identity->public_key();
    if (!key || key->empty()) {
        RELAYPP_SLOG_ERROR(kScope, "identity has no public key");
        return tl::unexpected(ClientError::no_identity("Public key is not available"));
    }

    const std::string uid = to_hex(*key);
    auto endpoint = resolver_.resolve(services_.relays->get_relay(), uid);
    if (!endpoint) {
        return tl::unexpected(endpoint.error());
    }

    auto transport = transport_factory_(strand_, endpoint->target);
    if (!transport) {
        return tl::unexpected(ClientError::transport_error("Transport factory returned no transport"));
    }

    auto session = std::make_shared<SocketSession>(
        strand_, std::move(transport), *endpoint, session_config_from(config_)
    );

    const std::uint64_t generation = ++generation_;
    std::weak_ptr<int> token = lifetime_;

    session->on_open([this, token, generation]() {
        if (token.expired() || generation != generation_) {
            return;
        }
        RELAYPP_SLOG_INFO(kScope, "socket open");
    });
    session->on_error([this, token, generation](const TransportError& error) {
        if (token.expired() || generation != generation_) {
            return;
        }
        on_socket_error(error);
    });
    session->on_close([this, token, generation](const CloseInfo& info) {
        if (token.expired() || generation != generation_) {
            return;
        }
        on_socket_close(info);
    });

    session_ = session;
    session->connect();

    primary_topic_ = user_channel_id(*key);
    if (auto subscribed = subscribe_to_channel(primary_topic_); !subscribed) {
        return subscribed;
    }

    services_.dispatcher->ping_all();
    return {};
}

void ConnectionManager::disconnect() {
    user_disconnect_ = true;
    if (reconnect_) {
        reconnect_->cancel();
    }

    // Fires on_socket_close synchronously
    if (auto session = session_) {
        session->disconnect();
    }

    release();
    set_state(ConnectionState::Disconnected);
}

// ═══════════════════════════════════════════════════════════════════════════
// Channels
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<void> ConnectionManager::subscribe_to_channel(const std::string& channel_name) {
    if (!session_) {
        const std::string message = services_.translator->translate(i18n::kSubscribeNotConnected);
        services_.notifier->error(message);
        return tl::unexpected(ClientError::not_connected(message));
    }

    if (auto it = channels_.find(channel_name); it != channels_.end() && !it->second->is_torn_down()) {
        return {};
    }

    auto channel = session_->channel(channel_name);
    const std::uint64_t generation = generation_;
    std::weak_ptr<int> token = lifetime_;

    channel->on_error([this, token, generation, channel_name](const Json& reason) {
        if (token.expired() || generation != generation_) {
            return;
        }
        on_channel_fault(channel_name, "errored: " + reason.dump());
    });
    channel->on_close([this, token, generation, channel_name]() {
        if (token.expired() || generation != generation_) {
            return;
        }
        on_channel_fault(channel_name, "closed");
    });
    channel->on_joined([this, token, generation, channel_name]() {
        if (token.expired() || generation != generation_) {
            return;
        }
        on_channel_joined(channel_name);
    });

    // Inbound chat goes to the processor untouched
    channel->on(std::string(kChatEvent), [processor = services_.processor](const Json& payload) {
        processor->receive(payload);
    });

    channels_[channel_name] = channel;
    auto join = channel->join();

    if (channel_name == primary_topic_) {
        set_state(ConnectionState::Joining);
    }

    // Join failures are never retried; a late ok reply after a timeout still
    // lands through on_joined
    asio::co_spawn(strand_,
        [this, token, generation, join, channel_name, joined = std::weak_ptr<ChannelSubscription>(channel),
         notifier = services_.notifier, translator = services_.translator]()
            -> asio::awaitable<void> {
            auto result = co_await join->async_result();
            if (result) {
                co_return;
            }
            switch (result.error().code) {
                case ClientErrorCode::Timeout:
                    RELAYPP_SLOG_INFO(kScope, "join of " + channel_name + " timed out");
                    notifier->info(translator->translate(i18n::kJoinTimeout));
                    break;
                case ClientErrorCode::ServerError:
                    RELAYPP_SLOG_ERROR(kScope, "join of " + channel_name + " failed: " + result.error().message);
                    if (!token.expired() && generation == generation_) {
                        on_join_rejected(channel_name, joined.lock());
                    }
                    break;
                default:
                    RELAYPP_SLOG_DEBUG(kScope, "join of " + channel_name + " abandoned: " + result.error().message);
                    break;
            }
        },
        asio::detached);

    return {};
}

ClientResult<void> ConnectionManager::join_room(std::string_view room) {
    auto key = services_.identity->public_key();
    if (!key || key->empty()) {
        return tl::unexpected(ClientError::no_identity("Public key is not available"));
    }
    return subscribe_to_channel(room_channel_id(room, *key));
}

bool ConnectionManager::has_channel(const std::string& channel_name) const {
    auto it = channels_.find(channel_name);
    return it != channels_.end() && !it->second->is_torn_down();
}

// ═══════════════════════════════════════════════════════════════════════════
// Messaging
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> ConnectionManager::send(std::string to, Json data) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));
    co_return co_await push_chat(primary_topic_, std::move(to), std::move(data));
}

asio::awaitable<ClientResult<Json>> ConnectionManager::send_to_channel(
    std::string channel_name,
    std::string to,
    Json data
) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));
    co_return co_await push_chat(channel_name, std::move(to), std::move(data));
}

asio::awaitable<ClientResult<Json>> ConnectionManager::push_chat(
    const std::string& channel_name,
    std::string to,
    Json data
) {
    // Copied before suspending; `this` is not touched after the await
    auto translator = services_.translator;

    auto it = channels_.find(channel_name);
    if (channel_name.empty() || it == channels_.end()) {
        const std::string message = translator->translate(i18n::kSendNotConnected);
        RELAYPP_SLOG_ERROR(kScope, message);
        co_return tl::unexpected(ClientError::not_connected(message));
    }

    auto push = it->second->push(std::string(kChatEvent), Json{{"to", std::move(to)}, {"message", std::move(data)}});
    auto result = co_await push->async_result();

    if (!result && result.error().code == ClientErrorCode::Timeout) {
        result.error().message = translator->translate(i18n::kMessageTimeout);
    }
    co_return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Handlers
// ═══════════════════════════════════════════════════════════════════════════

void ConnectionManager::on_socket_error(const TransportError& error) {
    RELAYPP_SLOG_ERROR(kScope, "socket error: " + error.message);
    services_.notifier->error(services_.translator->translate(i18n::kSocketError));
}

void ConnectionManager::on_socket_close(const CloseInfo& info) {
    RELAYPP_SLOG_INFO(kScope, "socket closed (" + std::to_string(info.code) + " " + info.reason + ")");
    services_.notifier->info(services_.translator->translate(i18n::kSocketClose));

    release();
    set_state(ConnectionState::Disconnected);

    if (reconnect_ && !user_disconnect_) {
        schedule_reconnect();
    }
}

void ConnectionManager::on_channel_fault(const std::string& channel_name, const std::string& reason) {
    RELAYPP_SLOG_WARN(kScope, "channel " + channel_name + " " + reason + "; closing socket");

    // A still-open socket reports its own close through on_socket_close
    if (auto session = session_) {
        session->disconnect();
    }

    release();
    set_state(ConnectionState::Disconnected);
}

void ConnectionManager::on_join_rejected(
    const std::string& channel_name,
    const std::shared_ptr<ChannelSubscription>& channel
) {
    auto it = channels_.find(channel_name);
    if (!channel || it == channels_.end() || it->second != channel) {
        return;
    }

    // Without its user channel the socket is useless
    if (channel_name == primary_topic_) {
        on_channel_fault(channel_name, "join rejected");
        return;
    }
    channels_.erase(it);
}

void ConnectionManager::on_channel_joined(const std::string& channel_name) {
    services_.notifier->success(services_.translator->translate(i18n::kConnected));

    if (channel_name == primary_topic_) {
        set_state(ConnectionState::Ready);
        if (reconnect_) {
            reconnect_->reset();
        }
    }
}

void ConnectionManager::on_state_change(StateChangeCallback callback) {
    state_callbacks_.push_back(std::move(callback));
}

// ═══════════════════════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════════════════════

void ConnectionManager::schedule_reconnect() {
    std::weak_ptr<int> token = lifetime_;

    reconnect_->schedule([this, token]() {
        if (token.expired()) {
            return;
        }
        asio::co_spawn(strand_,
            [this, token]() -> asio::awaitable<void> {
                if (token.expired() || user_disconnect_) {
                    co_return;
                }
                auto result = co_await connect();
                if (!result && !token.expired()) {
                    RELAYPP_SLOG_WARN(kScope, "reconnect failed: " + result.error().message);
                }
            },
            asio::detached);
    });
}

void ConnectionManager::release() {
    session_.reset();
    channels_.clear();
}

void ConnectionManager::set_state(ConnectionState next) {
    if (state_ == next) {
        return;
    }
    const ConnectionState previous = state_;
    state_ = next;

    RELAYPP_SLOG_DEBUG(kScope, std::string(to_string(previous)) + " -> " + std::string(to_string(next)));

    for (auto callbacks = state_callbacks_; auto& callback : callbacks) {
        callback(previous, next);
    }
}

}  // namespace relaypp
