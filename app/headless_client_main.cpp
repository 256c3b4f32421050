// Tessel headless client
// Connects over ENet, streams the world around the player and keeps the
// connection alive without a renderer.

#include "../client/core/config.hpp"
#include "../client/core/logger.hpp"
#include "../client/game/client_world.hpp"
#include "../client/net/client_session.hpp"
#include "../client/net/network_receiver.hpp"
#include "../shared/transport/enet_common.hpp"
#include "../shared/transport/enet_session.hpp"

#include <raylib.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>        Config file (default: tessel.conf)\n";
    std::cout << "  --connect <host:port>  Server address (overrides [network])\n";
    std::cout << "  --name <name>          Player name (overrides [network])\n";
    std::cout << "  --help                 Show this help message\n";
}

struct Args {
    std::string configPath = "tessel.conf";
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> name;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--connect") == 0 && i + 1 < argc) {
            std::string addr = argv[++i];

            auto colon = addr.find(':');
            if (colon != std::string::npos) {
                args.host = addr.substr(0, colon);
                const int port = std::atoi(addr.substr(colon + 1).c_str());
                if (port > 0 && port <= 0xFFFF) {
                    args.port = static_cast<std::uint16_t>(port);
                }
            } else {
                args.host = addr;
            }
        }
        else if (std::strcmp(arg, "--name") == 0 && i + 1 < argc) {
            args.name = argv[++i];
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& config = core::Config::instance();
    const bool cfg_ok = config.load_from_file(args.configPath);

    core::Logger::instance().init(config.logging());
    TraceLog(LOG_INFO, "[config] %s: %s", args.configPath.c_str(), cfg_ok ? "ok" : "missing (defaults)");

    core::ClientConfig cfg = config.get();
    if (args.host) cfg.network.host = *args.host;
    if (args.port) cfg.network.port = *args.port;
    if (args.name) cfg.network.player_name = *args.name;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    shared::transport::ENetInitializer enetInit;
    if (!enetInit.is_initialized()) {
        TraceLog(LOG_ERROR, "[net] failed to initialize ENet");
        return 1;
    }

    auto transport = std::make_shared<shared::transport::ENetSession>();
    if (!transport->connect(cfg.network.host, cfg.network.port,
                            static_cast<std::uint32_t>(cfg.network.connect_timeout_ms))) {
        TraceLog(LOG_ERROR, "[net] could not connect to %s:%u", cfg.network.host.c_str(), cfg.network.port);
        return 1;
    }
    TraceLog(LOG_INFO, "[net] connected to %s:%u", cfg.network.host.c_str(), cfg.network.port);

    auto session = std::make_shared<client::net::ClientSession>(transport);

    shared::proto::Welcome welcome;
    try {
        welcome = session->handshake(cfg.network.player_name);
    } catch (const client::net::Kicked& e) {
        TraceLog(LOG_ERROR, "[session] server refused us: %s", e.reason().c_str());
        transport->close();
        return 2;
    } catch (const client::net::IncompatibleServer& e) {
        TraceLog(LOG_ERROR, "[session] %s", e.what());
        transport->close();
        return 1;
    } catch (const shared::transport::TransportClosed& e) {
        TraceLog(LOG_ERROR, "[session] connection closed during handshake: %s", e.what());
        return 1;
    }

    auto channels = std::make_shared<client::net::SyncChannels>();
    client::game::ClientWorld world(session, channels, client::game::ClientWorld::Options::from_config(cfg));
    world.apply_welcome(welcome);

    client::net::NetworkReceiver receiver(session, channels, welcome.playerId,
                                          std::chrono::milliseconds(cfg.network.poll_interval_ms));
    receiver.start();

    using clock = std::chrono::steady_clock;
    const auto tickInterval = std::chrono::microseconds(1'000'000 / cfg.world.tick_rate);
    auto nextTick = clock::now();

    while (g_running && world.is_connected()) {
        world.tick();

        nextTick += tickInterval;
        std::this_thread::sleep_until(nextTick);
    }

    int exitCode = 0;
    if (auto reason = channels->status.kick_reason()) {
        TraceLog(LOG_WARNING, "[session] kicked: %s", reason->c_str());
        exitCode = 2;
    } else if (channels->status.is_disconnected()) {
        TraceLog(LOG_WARNING, "[session] connection lost");
        exitCode = 1;
    } else {
        TraceLog(LOG_INFO, "[net] round trip at shutdown: %u ms", transport->ping_ms());
        try {
            session->send_goodbye();
        } catch (const shared::transport::TransportClosed& e) {
            TraceLog(LOG_WARNING, "[session] goodbye not sent: %s", e.what());
        }
    }

    receiver.stop();
    transport->close();

    TraceLog(LOG_INFO, "[session] shut down (chunks loaded: %zu)", world.chunks().size());
    core::Logger::instance().shutdown();
    return exitCode;
}
