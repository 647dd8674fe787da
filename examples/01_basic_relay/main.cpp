// Example 01: Basic Relay Connection
//
// Demonstrates connecting a ConnectionManager to a relay with C++20
// coroutines, waiting for the user channel, joining a room and sending a
// chat payload.
//
// Usage:
//   basic_relay <relay-url> <public-key-hex> <peer-key-hex>

#include <relaypp/log/spdlog_logger.hpp>
#include <relaypp/protocol/channel_id.hpp>
#include <relaypp/relay/connection_manager.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace relaypp;
using Json = nlohmann::json;

// Prints whatever arrives on our channels
class PrintingProcessor final : public IMessageProcessor {
public:
    void receive(const Json& payload) override {
        std::cout << "[chat] " << payload.dump() << "\n";
    }
};

// Main client coroutine
asio::awaitable<int> run_client(ConnectionManager& manager, std::string peer) {
    std::cout << "=== Basic Relay Example ===\n\n";

    // 1. Open the socket and join user:<key>
    auto connected = co_await manager.connect();
    if (!connected) {
        std::cerr << "ERROR: Failed to connect: " << connected.error().message << "\n";
        co_return 1;
    }

    // 2. Wait for the join reply (readiness is reported asynchronously)
    asio::steady_timer timer(co_await asio::this_coro::executor);
    for (int i = 0; i < 100 && !manager.is_connected(); ++i) {
        timer.expires_after(std::chrono::milliseconds(100));
        co_await timer.async_wait(asio::use_awaitable);
    }
    if (!manager.is_connected()) {
        std::cerr << "ERROR: Relay did not confirm the join\n";
        manager.disconnect();
        co_return 1;
    }
    std::cout << "Joined " << manager.user_channel_id() << "\n\n";

    // 3. Join a room alongside the user channel
    if (auto joined = manager.join_room("lobby"); !joined) {
        std::cerr << "WARNING: Could not join lobby: " << joined.error().message << "\n";
    }

    // 4. Send a payload and await the relay's reply
    auto reply = co_await manager.send(peer, Json{{"body", "hello from relaypp"}});
    if (reply) {
        std::cout << "Relay replied: " << reply->dump() << "\n";
    } else {
        std::cerr << "Send failed (" << to_string(reply.error().code) << "): "
                  << reply.error().message << "\n";
    }

    // 5. Stay around briefly for inbound messages
    timer.expires_after(std::chrono::seconds(5));
    co_await timer.async_wait(asio::use_awaitable);

    manager.disconnect();
    std::cout << "\n=== Example Complete ===\n";
    co_return reply ? 0 : 1;
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <relay-url> <public-key-hex> <peer-key-hex>\n";
        return 1;
    }

    auto key = from_hex(argv[2]);
    if (!key || key->empty()) {
        std::cerr << "ERROR: public key must be hex\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(SpdlogOptions{LogLevel::Info}));

    RelayServices services;
    services.identity = std::make_shared<StaticIdentityProvider>(*key);
    services.relays = std::make_shared<StaticRelaySelector>(argv[1]);
    services.processor = std::make_shared<PrintingProcessor>();

    ConnectionConfig config;
    config.with_push_timeout(std::chrono::seconds(5))
          .with_reconnect();

    asio::io_context io;
    ConnectionManager manager(io.get_executor(), services, config);

    int exit_code = 0;
    asio::co_spawn(
        manager.get_executor(),
        run_client(manager, argv[3]),
        [&exit_code](std::exception_ptr e, int code) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    std::cerr << "Exception: " << ex.what() << "\n";
                }
                exit_code = 1;
                return;
            }
            exit_code = code;
        }
    );

    io.run();
    return exit_code;
}
