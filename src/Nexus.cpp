#include "common/Log.hpp"
#include "config/Config.h"
#include "hub/HeartbeatMonitor.h"
#include "hub/Hub.h"
#include "networking/HttpRoutes.h"
#include "networking/WebSocketServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

void usage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [--config <file.yaml>] [--port <n>]\n"
              << "environment: PORT, NEXUS_CONFIG, NEXUS_PORT, NEXUS_ROOM_WIDTH, NEXUS_ROOM_HEIGHT,\n"
              << "  NEXUS_MOVE_RATE_LIMIT_MS, NEXUS_CHAT_RATE_LIMIT_MS, NEXUS_MAX_CHAT_LENGTH,\n"
              << "  NEXUS_MAX_NAME_LENGTH, NEXUS_HEARTBEAT_INTERVAL_MS, NEXUS_CONNECTION_TTL_MS,\n"
              << "  NEXUS_PROXIMITY_RADIUS, NEXUS_THREADS, NEXUS_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace nexus;

    std::string config_path;
    if (const char* env = std::getenv("NEXUS_CONFIG")) config_path = env;
    std::string port_override;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--port" && i + 1 < argc) {
            port_override = argv[++i];
        } else if (a == "--help" || a == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::cerr << "unknown argument: " << a << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    config::Config cfg;
    try {
        cfg = config::load(config_path);
        if (!port_override.empty()) {
            int port = std::stoi(port_override);
            if (port < 0 || port > 65535) throw config::ConfigError("--port out of range");
            cfg.port = static_cast<unsigned short>(port);
        }
    } catch (const config::ConfigError& e) {
        log::error("nexus", "config: ", e.what());
        return 1;
    } catch (const YAML::Exception& e) {
        log::error("nexus", "config file ", config_path, ": ", e.what());
        return 1;
    } catch (const std::logic_error& e) {
        // std::stoi
        log::error("nexus", "invalid --port '", port_override, "': ", e.what());
        return 1;
    }
    log::set_level(cfg.log_level);

    boost::asio::io_context ioc;

    try {
        networking::WebSocketServer server(ioc, cfg.port);
        hub::Hub hub(cfg, server);
        hub::HeartbeatMonitor heartbeat(ioc, hub, cfg.heartbeat_interval);

        server.set_on_connect([&](networking::ClientId id) { hub.on_connect(id); });
        server.set_on_disconnect([&](networking::ClientId id) { hub.on_disconnect(id); });
        server.set_on_message([&](networking::ClientId id, const std::string& msg) { hub.on_message(id, msg); });
        server.set_on_pong([&](networking::ClientId id) { hub.on_pong(id); });

        const room::Room room{cfg.room_width, cfg.room_height};
        server.set_on_http([room](std::string_view method, std::string_view target) {
            return networking::route_http(method, target, room);
        });

        server.start();
        heartbeat.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            log::info("nexus", "shutting down...");
            heartbeat.stop();
            server.stop();
            ioc.stop();
        });

        log::info("nexus", "listening on port ", server.port(), "; room ", cfg.room_width, "x", cfg.room_height,
                  ", radius ", cfg.proximity_radius, ", ", cfg.threads, " thread(s), log level ",
                  log::level_name(log::level()));

        std::vector<std::thread> workers;
        workers.reserve(cfg.threads - 1);
        for (unsigned i = 1; i < cfg.threads; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();
    } catch (const boost::system::system_error& e) {
        log::error("nexus", "port ", cfg.port, ": ", e.what());
        return 1;
    }

    log::info("nexus", "exit.");
    return 0;
}
