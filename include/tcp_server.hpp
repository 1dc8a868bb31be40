#pragma once

#include "message_router.hpp"
#include "message_sink.hpp"
#include "session_coordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>

namespace tr {

constexpr std::size_t kMaxLineBytes = 64 * 1024;
constexpr std::size_t kMaxQueuedMessages = 1024;

class ConnectionHub;

// One client socket. Reads and writes newline-delimited JSON; every
// completion handler runs on the coordinator's strand.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(boost::asio::ip::tcp::socket socket,
               SessionCoordinator::Strand& strand,
               MessageRouter& router,
               ConnectionHub& hub,
               std::string playerId);

    void start();
    void deliver(std::string line);
    void close();

    const std::string& playerId() const { return playerId_; }

private:
    void readLine();
    void writeNext();
    void handleLine(const std::string& line);

    boost::asio::ip::tcp::socket socket_;
    SessionCoordinator::Strand& strand_;
    MessageRouter& router_;
    ConnectionHub& hub_;
    std::string playerId_;
    boost::asio::streambuf buffer_;
    std::deque<std::string> outbox_;
    bool closed_ = false;
};

// Player id -> connection. Implements outbound delivery for the coordinator.
class ConnectionHub : public MessageSink {
public:
    void attach(const std::shared_ptr<Connection>& connection);
    void detach(const std::string& playerId);
    void closeAll();
    std::size_t connectionCount() const { return connections_.size(); }

    void sendToPlayer(const std::string& playerId, const std::string& event, const nlohmann::json& payload) override;

private:
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
};

class TcpServer {
public:
    TcpServer(boost::asio::io_context& io,
              SessionCoordinator& coordinator,
              MessageRouter& router,
              ConnectionHub& hub,
              const std::string& bindAddress,
              std::uint16_t port);

    void start();
    void stop();

    // Bound port; differs from the requested one when that was 0.
    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    void accept();

    SessionCoordinator& coordinator_;
    MessageRouter& router_;
    ConnectionHub& hub_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

// {"event": ..., "data": ...} as one line, newline included.
std::string encodeEventLine(const std::string& event, const nlohmann::json& payload);

} // namespace tr
