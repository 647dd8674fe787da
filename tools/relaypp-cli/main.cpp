// ─────────────────────────────────────────────────────────────────────────────
// relaypp-cli - Relay Connection Testing Tool
// ─────────────────────────────────────────────────────────────────────────────
// A command-line interface for connecting to a relay, joining channels and
// exchanging chat payloads.
//
// Usage:
//   # Connect, wait for the user channel and print inbound chat
//   relaypp-cli --relay wss://relay.example.com/socket --key 0ab1 --listen 60
//
//   # Send one payload to a peer and exit
//   relaypp-cli --relay wss://relay.example.com/socket --key 0ab1 \
//               --to ff01 --message '{"body":"hello"}'
//
//   # Local development relay
//   relaypp-cli --relay ws://localhost:4000/socket --key 0ab1 --local -i
//
// Features:
//   - Join the user channel and any number of rooms
//   - Send chat payloads (raw strings or JSON) and print the relay's reply
//   - Print inbound chat as it arrives
//   - Optional automatic reconnection
//   - Interactive REPL mode
//   - JSON output for scripting

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "relaypp/log/spdlog_logger.hpp"
#include "relaypp/protocol/channel_id.hpp"
#include "relaypp/relay/connection_manager.hpp"

#include <asio/co_spawn.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace relaypp;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// Inbound chat and notifications arrive on the io thread while the REPL
// writes from main
std::mutex g_output_mutex;

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::lock_guard lock(g_output_mutex);
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::lock_guard lock(g_output_mutex);
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_status(const std::string& msg) {
    std::lock_guard lock(g_output_mutex);
    std::cout << color::c(color::dim) << msg << color::c(color::reset) << "\n";
}

void print_json(const Json& j, bool pretty = true) {
    std::lock_guard lock(g_output_mutex);
    if (pretty) {
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << j.dump() << "\n";
    }
}

// Accept JSON, fall back to sending the text as a string
Json parse_payload(const std::string& text) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error&) {
        return Json(text);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CLI Services
// ═══════════════════════════════════════════════════════════════════════════

class PrintingProcessor final : public IMessageProcessor {
public:
    explicit PrintingProcessor(bool json_output)
        : json_output_(json_output)
    {}

    void receive(const Json& payload) override {
        if (json_output_) {
            print_json(Json{{"event", "chat"}, {"payload", payload}}, false);
            return;
        }
        std::lock_guard lock(g_output_mutex);
        std::cout << "\n" << color::c(color::cyan) << "◀ chat" << color::c(color::reset);
        if (payload.contains("from") && payload["from"].is_string()) {
            std::cout << " from " << color::c(color::bold) << payload["from"].get<std::string>()
                      << color::c(color::reset);
        }
        std::cout << "\n  " << payload.dump() << "\n";
    }

private:
    bool json_output_;
};

class ConsoleNotifier final : public INotifier {
public:
    explicit ConsoleNotifier(bool quiet)
        : quiet_(quiet)
    {}

    void info(const std::string& message) override {
        if (!quiet_) {
            print_status(message);
        }
    }

    void success(const std::string& message) override {
        if (!quiet_) {
            print_success(message);
        }
    }

    void error(const std::string& message) override { print_error(message); }

private:
    bool quiet_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Manager Access
// ═══════════════════════════════════════════════════════════════════════════
// The manager lives on the io thread. These helpers hop onto its strand and
// block main until the result is back.

template <typename Fn>
auto on_manager(ConnectionManager& manager, Fn fn) {
    using Result = decltype(fn());
    return asio::co_spawn(
        manager.get_executor(),
        [fn = std::move(fn)]() mutable -> asio::awaitable<Result> { co_return fn(); },
        asio::use_future
    ).get();
}

ClientResult<void> connect_blocking(ConnectionManager& manager) {
    return asio::co_spawn(manager.get_executor(), manager.connect(), asio::use_future).get();
}

ClientResult<Json> send_blocking(ConnectionManager& manager, const std::optional<std::string>& channel,
                                 std::string to, Json data) {
    if (channel) {
        return asio::co_spawn(manager.get_executor(),
            manager.send_to_channel(*channel, std::move(to), std::move(data)),
            asio::use_future).get();
    }
    return asio::co_spawn(manager.get_executor(),
        manager.send(std::move(to), std::move(data)),
        asio::use_future).get();
}

bool wait_ready(ConnectionManager& manager, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (on_manager(manager, [&] { return manager.is_connected(); })) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_send(ConnectionManager& manager, const std::optional<std::string>& channel,
             const std::string& to, const std::string& message, bool json_output) {
    auto result = send_blocking(manager, channel, to, parse_payload(message));

    if (!result) {
        if (json_output) {
            print_json({
                {"error", std::string(to_string(result.error().code))},
                {"message", result.error().message},
                {"reply", result.error().reply.value_or(Json())}
            });
        } else {
            print_error(result.error().message);
        }
        return 1;
    }

    if (json_output) {
        print_json(*result);
    } else {
        print_success("Delivered to " + to);
        if (!result->empty()) {
            print_json(*result);
        }
    }
    return 0;
}

int cmd_join_room(ConnectionManager& manager, const std::string& room, bool json_output) {
    auto result = on_manager(manager, [&] { return manager.join_room(room); });
    if (!result) {
        print_error("Failed to join " + room + ": " + result.error().message);
        return 1;
    }
    if (!json_output) {
        print_status("Joining room " + room);
    }
    return 0;
}

int cmd_status(ConnectionManager& manager, bool json_output) {
    struct Snapshot {
        ConnectionState state;
        std::string user_channel;
        std::string relay;
        std::size_t reconnect_attempts;
    };

    auto snapshot = on_manager(manager, [&] {
        auto session = manager.session();
        return Snapshot{
            manager.state(),
            manager.user_channel_id(),
            session ? session->endpoint().url : std::string{},
            manager.reconnect() ? manager.reconnect()->attempts() : 0
        };
    });

    if (json_output) {
        print_json({
            {"state", std::string(to_string(snapshot.state))},
            {"user_channel", snapshot.user_channel},
            {"relay", snapshot.relay},
            {"reconnect_attempts", snapshot.reconnect_attempts}
        });
        return 0;
    }

    std::lock_guard lock(g_output_mutex);
    std::cout << color::c(color::bold) << "State: " << color::c(color::reset) << to_string(snapshot.state) << "\n";
    if (!snapshot.user_channel.empty()) {
        std::cout << color::c(color::bold) << "Channel: " << color::c(color::reset) << snapshot.user_channel << "\n";
    }
    if (!snapshot.relay.empty()) {
        std::cout << color::c(color::bold) << "Relay: " << color::c(color::reset) << snapshot.relay << "\n";
    }
    if (snapshot.reconnect_attempts > 0) {
        std::cout << color::c(color::bold) << "Reconnect attempts: " << color::c(color::reset)
                  << snapshot.reconnect_attempts << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive REPL
// ═══════════════════════════════════════════════════════════════════════════

void print_repl_help() {
    std::lock_guard lock(g_output_mutex);
    std::cout << "\n" << color::c(color::bold) << "Available commands:" << color::c(color::reset) << "\n";
    std::cout << "  " << color::c(color::yellow) << "send <to> <message>" << color::c(color::reset) << "         - Send on the user channel\n";
    std::cout << "  " << color::c(color::yellow) << "room <name>" << color::c(color::reset) << "                 - Join a room\n";
    std::cout << "  " << color::c(color::yellow) << "say <room> <to> <message>" << color::c(color::reset) << "   - Send on a room channel\n";
    std::cout << "  " << color::c(color::yellow) << "status" << color::c(color::reset) << "                      - Show connection state\n";
    std::cout << "  " << color::c(color::yellow) << "connect" << color::c(color::reset) << "                     - Connect again after a disconnect\n";
    std::cout << "  " << color::c(color::yellow) << "disconnect" << color::c(color::reset) << "                  - Close the socket\n";
    std::cout << "  " << color::c(color::yellow) << "help" << color::c(color::reset) << "                        - Show this help\n";
    std::cout << "  " << color::c(color::yellow) << "quit" << color::c(color::reset) << "                        - Exit\n\n";
}

std::string rest_of(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    const auto start = rest.find_first_not_of(" \t");
    return start == std::string::npos ? std::string{} : rest.substr(start);
}

int run_repl(ConnectionManager& manager, const std::vector<std::uint8_t>& key) {
    print_repl_help();

    std::string line;
    while (true) {
        {
            std::lock_guard lock(g_output_mutex);
            std::cout << color::c(color::cyan) << "relay> " << color::c(color::reset) << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;
        if (cmd.empty()) continue;

        if (cmd == "quit" || cmd == "exit" || cmd == "q") {
            break;
        } else if (cmd == "help" || cmd == "?") {
            print_repl_help();
        } else if (cmd == "status") {
            cmd_status(manager, false);
        } else if (cmd == "send") {
            std::string to;
            iss >> to;
            const std::string message = rest_of(iss);
            if (to.empty() || message.empty()) {
                print_error("Usage: send <to> <message>");
                continue;
            }
            cmd_send(manager, std::nullopt, to, message, false);
        } else if (cmd == "room") {
            std::string room;
            iss >> room;
            if (room.empty()) {
                print_error("Usage: room <name>");
                continue;
            }
            cmd_join_room(manager, room, false);
        } else if (cmd == "say") {
            std::string room;
            std::string to;
            iss >> room >> to;
            const std::string message = rest_of(iss);
            if (room.empty() || to.empty() || message.empty()) {
                print_error("Usage: say <room> <to> <message>");
                continue;
            }
            cmd_send(manager, room_channel_id(room, key), to, message, false);
        } else if (cmd == "connect") {
            if (auto result = connect_blocking(manager); !result) {
                print_error(result.error().message);
            }
        } else if (cmd == "disconnect") {
            on_manager(manager, [&] {
                manager.disconnect();
                return true;
            });
        } else {
            print_error("Unknown command: " + cmd + ". Type 'help' for available commands.");
        }
    }

    print_status("Goodbye!");
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Get environment variable with fallback
std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

bool configure_logging(const cxxopts::ParseResult& result) {
    LogLevel level = LogLevel::Warn;
    if (result.count("verbose")) {
        level = LogLevel::Debug;
    }
    if (result.count("log-level")) {
        level = log_level_from_string(result["log-level"].as<std::string>());
    }

    std::unique_ptr<SpdlogLogger> logger;
    if (result.count("log-file")) {
        logger = make_spdlog_rotating_logger(
            result["log-file"].as<std::string>(),
            5 * 1024 * 1024, 3,
            SpdlogOptions::for_file(level)
        );
    } else {
        logger = make_spdlog_async_console_logger(SpdlogOptions{level});
    }

    if (result.count("log-scope")) {
        auto overrides = ScopeLevels::parse(result["log-scope"].as<std::string>());
        if (!overrides) {
            print_error("--log-scope: " + overrides.error());
            return false;
        }
        for (auto& [prefix, scope_level] : *overrides) {
            logger->scopes().set(std::move(prefix), scope_level);
        }
    }

    set_logger(std::move(logger));
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("relaypp-cli", "Relay Connection Testing Tool");

    options.add_options()
        // Connection
        ("u,relay", "Relay socket URL (or RELAYPP_RELAY env var)", cxxopts::value<std::string>())
        ("k,key", "Public key as hex (or RELAYPP_PUBLIC_KEY env var)", cxxopts::value<std::string>())
        ("r,room", "Room to join (can be repeated)", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("local", "Allow ws:// and local relay addresses")
        ("v1", "Use the V1 (object) frame encoding")
        ("timeout", "Push timeout in milliseconds", cxxopts::value<int>()->default_value("10000"))
        ("heartbeat", "Heartbeat interval in milliseconds (0 disables)", cxxopts::value<int>()->default_value("30000"))
        ("reconnect", "Reconnect automatically after an unexpected close")
        ("insecure-tls", "Skip TLS certificate verification")

        // Commands
        ("t,to", "Recipient public key (hex) for --message", cxxopts::value<std::string>())
        ("m,message", "Payload to send (JSON or text)", cxxopts::value<std::string>())
        ("channel", "Channel for --message (default: the user channel)", cxxopts::value<std::string>())
        ("listen", "Print inbound chat for N seconds", cxxopts::value<int>())
        ("status", "Show connection state")
        ("i,interactive", "Start interactive REPL mode")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("log-file", "Write logs to a rotating file instead of the console", cxxopts::value<std::string>())
        ("log-scope", "Per-scope levels, e.g. socket=trace,room:=debug", cxxopts::value<std::string>())
        ("verbose", "Enable verbose logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    relaypp-cli -u wss://relay.example.com/socket -k 0ab1 --listen 60\n";
            std::cout << "    relaypp-cli -u wss://relay.example.com/socket -k 0ab1 -t ff01 -m '{\"body\":\"hi\"}'\n";
            std::cout << "    relaypp-cli -u ws://localhost:4000/socket -k 0ab1 --local -r lobby -i\n";
            std::cout << "    # Or with environment variables:\n";
            std::cout << "    export RELAYPP_RELAY=wss://relay.example.com/socket RELAYPP_PUBLIC_KEY=0ab1\n";
            std::cout << "    relaypp-cli --status\n";
            return 0;
        }

        // Setup
        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;
        if (!configure_logging(result)) {
            return 1;
        }

        const std::string relay = result.count("relay")
            ? result["relay"].as<std::string>()
            : get_env("RELAYPP_RELAY");
        const std::string key_hex = result.count("key")
            ? result["key"].as<std::string>()
            : get_env("RELAYPP_PUBLIC_KEY");

        if (relay.empty()) {
            print_error("Relay URL required. Use --relay or set RELAYPP_RELAY environment variable");
            return 1;
        }
        auto key = from_hex(key_hex);
        if (!key || key->empty()) {
            print_error("Public key required as hex. Use --key or set RELAYPP_PUBLIC_KEY environment variable");
            return 1;
        }

        const int timeout_ms = result["timeout"].as<int>();
        const int heartbeat_ms = result["heartbeat"].as<int>();
        if (timeout_ms < 0) {
            print_error("--timeout must not be negative");
            return 1;
        }
        if (heartbeat_ms < 0) {
            print_error("--heartbeat must not be negative");
            return 1;
        }

        // Configuration
        ConnectionConfig config;
        config.with_push_timeout(std::chrono::milliseconds(timeout_ms))
              .with_heartbeat_interval(std::chrono::milliseconds(heartbeat_ms));
        if (result.count("local")) {
            config.allow_local_relay();
        }
        if (result.count("v1")) {
            config.with_serializer(phoenix::SerializerVersion::V1);
        }
        if (result.count("reconnect")) {
            config.with_reconnect();
        }
        if (result.count("insecure-tls")) {
            config.transport.tls.verify_peer = false;
        }

        RelayServices services;
        services.identity = std::make_shared<StaticIdentityProvider>(*key);
        services.relays = std::make_shared<StaticRelaySelector>(relay);
        services.processor = std::make_shared<PrintingProcessor>(json_output);
        services.notifier = std::make_shared<ConsoleNotifier>(json_output);

        asio::io_context io;
        auto work = asio::make_work_guard(io);
        std::thread io_thread([&io] { io.run(); });

        int exit_code = 0;
        auto owned = std::make_unique<ConnectionManager>(io.get_executor(), services, config);
        {
            ConnectionManager& manager = *owned;

            auto connected = connect_blocking(manager);
            if (!connected) {
                print_error("Failed to connect: " + connected.error().message);
                exit_code = 1;
            } else if (!wait_ready(manager, config.push_timeout + std::chrono::seconds(1))) {
                print_error("Relay did not confirm the join");
                exit_code = 1;
            }

            if (exit_code == 0) {
                for (const auto& room : result["room"].as<std::vector<std::string>>()) {
                    if (!room.empty()) {
                        exit_code |= cmd_join_room(manager, room, json_output);
                    }
                }
            }

            // Execute requested command
            if (exit_code == 0) {
                if (result.count("interactive")) {
                    exit_code = run_repl(manager, *key);
                } else if (result.count("message")) {
                    if (!result.count("to")) {
                        print_error("--message requires --to");
                        exit_code = 1;
                    } else {
                        std::optional<std::string> channel;
                        if (result.count("channel")) {
                            channel = result["channel"].as<std::string>();
                        }
                        exit_code = cmd_send(manager, channel, result["to"].as<std::string>(),
                                             result["message"].as<std::string>(), json_output);
                    }
                } else if (result.count("listen")) {
                    print_status("Listening for " + std::to_string(result["listen"].as<int>()) + "s");
                    std::this_thread::sleep_for(std::chrono::seconds(result["listen"].as<int>()));
                } else {
                    // Default: show status
                    exit_code = cmd_status(manager, json_output);
                }
            }

            on_manager(manager, [&] {
                manager.disconnect();
                return true;
            });

            // Let the transport finish its close handshake
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        work.reset();
        io.stop();
        io_thread.join();

        // Destroyed with no io thread running
        owned.reset();

        // Drops the async logger, draining its queue
        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
