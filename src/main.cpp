#include "cipher.hpp"
#include "config.hpp"
#include "csv_price_source.hpp"
#include "life_events.hpp"
#include "logging.hpp"
#include "message_router.hpp"
#include "random_source.hpp"
#include "room_keys.hpp"
#include "room_registry.hpp"
#include "session_coordinator.hpp"
#include "session_store.hpp"
#include "tcp_server.hpp"

#include <csignal>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

using namespace tr;

int main(int argc, char* argv[]) {
    CoordinatorConfig config;
    try {
        config = loadConfigFromEnv();
        if (argc > 1) {
            const int port = std::stoi(argv[1]);
            if (port < 1 || port > 65535) {
                throw std::invalid_argument(std::string("port is out of range: ") + argv[1]);
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        initLogging(config.logLevel);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    CipherSuite suite = CipherSuite::XChaCha20Poly1305;
    try {
        suite = resolveCipherSuite(config.cipher);
    } catch (const std::exception& ex) {
        spdlog::critical("Cipher selection failed: {}", ex.what());
        return 1;
    }

    try {
        boost::asio::io_context io;

        SodiumRandomSource rng;
        DefaultLifeEventGenerator lifeEvents(rng, config.totalYears);
        RoomRegistry rooms(rng, lifeEvents, config.startingCash, config.totalYears);
        RoomKeyRegistry keys(suite);
        CsvPriceSource prices(config.priceFile, config.priceCacheSize);
        JsonlSessionStore store(config.sessionLogFile);
        ConnectionHub hub;

        SessionCoordinator coordinator(io, rooms, keys, prices, store, hub, config);
        MessageRouter router(coordinator);
        TcpServer server(io, coordinator, router, hub, config.bindAddress, config.port);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signo);
            boost::asio::post(coordinator.strand(), [&]() {
                server.stop();
                coordinator.stop();
            });
        });

        spdlog::info("tickroomd starting: cipher {}, month {} ms, {} years, prices from {}",
                     cipherTag(suite),
                     config.monthDurationMs,
                     config.totalYears,
                     config.priceFile);

        boost::asio::post(coordinator.strand(), [&]() {
            coordinator.start();
            server.start();
        });
        io.run();

        keys.cleanupAll();
        spdlog::info("tickroomd stopped");
    } catch (const std::exception& ex) {
        spdlog::critical("Fatal: {}", ex.what());
        return 1;
    }
    return 0;
}
