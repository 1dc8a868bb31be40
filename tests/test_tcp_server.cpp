#include "errors.hpp"
#include "life_events.hpp"
#include "message_router.hpp"
#include "price_source.hpp"
#include "random_source.hpp"
#include "room_keys.hpp"
#include "room_registry.hpp"
#include "session_coordinator.hpp"
#include "session_store.hpp"
#include "tcp_server.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <istream>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "tcp_server_test failure: " << msg << std::endl;
    std::exit(1);
}

class NoLifeEvents : public tr::LifeEventGenerator {
public:
    std::vector<tr::LifeEvent> generate(int, const nlohmann::json&) override { return {}; }
};

class LineClient {
public:
    LineClient(boost::asio::io_context& io, std::uint16_t port) : socket_(io) {
        socket_.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const std::string& line) { boost::asio::write(socket_, boost::asio::buffer(line + "\n")); }

    nlohmann::json receive() {
        boost::asio::read_until(socket_, inbox_, '\n');
        std::istream in(&inbox_);
        std::string line;
        std::getline(in, line);
        return nlohmann::json::parse(line);
    }

    // Reads until the server closes the socket.
    boost::system::error_code drainToClose() {
        boost::system::error_code ec;
        std::array<char, 64 * 1024> chunk;
        while (!ec) {
            socket_.read_some(boost::asio::buffer(chunk), ec);
        }
        return ec;
    }

private:
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf inbox_;
};

template <typename Fn>
auto onStrand(tr::SessionCoordinator& coordinator, Fn fn) -> decltype(fn()) {
    std::promise<decltype(fn())> done;
    auto result = done.get_future();
    boost::asio::post(coordinator.strand(), [&]() { done.set_value(fn()); });
    return result.get();
}

} // namespace

int main() {
    using namespace tr;

    boost::asio::io_context io;
    InsecureTestRng rng(11);
    NoLifeEvents events;
    RoomRegistry rooms(rng, events);
    RoomKeyRegistry keys(CipherSuite::XChaCha20Poly1305);
    InMemoryPriceSource prices;
    InMemorySessionStore store;
    ConnectionHub hub;
    SessionCoordinator coordinator(io, rooms, keys, prices, store, hub, CoordinatorConfig{});
    MessageRouter router(coordinator);
    TcpServer server(io, coordinator, router, hub, "127.0.0.1", 0);

    auto work = boost::asio::make_work_guard(io);
    boost::asio::post(coordinator.strand(), [&]() { server.start(); });
    std::thread runner([&]() { io.run(); });

    boost::asio::io_context clientIo;
    LineClient client(clientIo, server.port());

    nlohmann::json hello = client.receive();
    if (hello.at("event") != "connected" || hello.at("data").at("playerId").get<std::string>().size() != 16) {
        fail("a new connection was not greeted with its player id");
    }
    const std::string playerId = hello.at("data").at("playerId").get<std::string>();

    client.send(R"({"event":"createRoom","id":7,"data":{"playerName":"Host"}})");
    nlohmann::json pushed = client.receive();
    nlohmann::json reply = client.receive();
    if (pushed.at("event") != "roomCreated" || reply.at("id") != 7 ||
        !reply.at("response").value("success", false)) {
        fail("createRoom over TCP did not push roomCreated and answer the request");
    }

    client.send("{oops");
    nlohmann::json rejected = client.receive();
    if (!rejected.at("id").is_null() || rejected.at("response").at("error") != describe(RoomError::InvalidRequest)) {
        fail("an unparseable line was not answered with an error");
    }

    // Close the connection while large writes are still queued and in flight.
    const std::string blob(256 * 1024, 'x');
    onStrand(coordinator, [&]() {
        for (int i = 0; i < 8; ++i) {
            hub.sendToPlayer(playerId, "bulk", { { "blob", blob } });
        }
        hub.closeAll();
        return true;
    });
    boost::system::error_code closed = client.drainToClose();
    if (closed != boost::asio::error::eof && closed != boost::asio::error::connection_reset) {
        fail("expected the server to close the socket, got: " + closed.message());
    }

    // The dropped connection leaves its room, which deletes a host's room.
    bool roomGone = false;
    for (int i = 0; i < 100 && !roomGone; ++i) {
        roomGone = onStrand(coordinator, [&]() { return rooms.roomCount() == 0 && hub.connectionCount() == 0; });
        if (!roomGone) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    if (!roomGone) {
        fail("a closed connection did not leave its room");
    }

    boost::asio::post(coordinator.strand(), [&]() {
        server.stop();
        coordinator.stop();
        work.reset();
    });
    runner.join();

    std::cout << "tcp_server_test passed" << std::endl;
    return 0;
}
