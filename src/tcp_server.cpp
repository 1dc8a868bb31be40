#include "tcp_server.hpp"

#include "cipher.hpp"
#include "secure_random.hpp"

#include <istream>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

namespace tr {

std::string encodeEventLine(const std::string& event, const nlohmann::json& payload) {
    std::string line = nlohmann::json{ { "event", event }, { "data", payload } }.dump();
    line.push_back('\n');
    return line;
}

Connection::Connection(boost::asio::ip::tcp::socket socket,
                       SessionCoordinator::Strand& strand,
                       MessageRouter& router,
                       ConnectionHub& hub,
                       std::string playerId)
    : socket_(std::move(socket))
    , strand_(strand)
    , router_(router)
    , hub_(hub)
    , playerId_(std::move(playerId))
    , buffer_(kMaxLineBytes) {}

void Connection::start() {
    deliver(encodeEventLine("connected", { { "playerId", playerId_ } }));
    readLine();
}

void Connection::readLine() {
    auto self = shared_from_this();
    boost::asio::async_read_until(
        socket_,
        buffer_,
        '\n',
        boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::not_found) {
                    spdlog::warn("Connection {} sent an oversized line, closing", hashForLogging(self->playerId_));
                } else if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                    spdlog::debug("Connection {} read failed: {}", hashForLogging(self->playerId_), ec.message());
                }
                self->hub_.detach(self->playerId_);
                self->router_.disconnect(self->playerId_);
                self->close();
                return;
            }

            std::istream input(&self->buffer_);
            std::string line;
            std::getline(input, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                self->handleLine(line);
            }
            if (!self->closed_) {
                self->readLine();
            }
        }));
}

void Connection::handleLine(const std::string& line) {
    auto reply = router_.dispatchText(playerId_, line);
    if (reply) {
        std::string out = reply->dump();
        out.push_back('\n');
        deliver(std::move(out));
    }
}

void Connection::deliver(std::string line) {
    if (closed_) {
        return;
    }
    if (outbox_.size() >= kMaxQueuedMessages) {
        spdlog::warn("Connection {} is not draining its queue, closing", hashForLogging(playerId_));
        close();
        return;
    }
    const bool idle = outbox_.empty();
    outbox_.push_back(std::move(line));
    if (idle) {
        writeNext();
    }
}

void Connection::writeNext() {
    auto self = shared_from_this();
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(outbox_.front()),
        boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec, std::size_t) {
            if (self->closed_) {
                return;
            }
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    spdlog::debug("Connection {} write failed: {}", hashForLogging(self->playerId_), ec.message());
                }
                self->close();
                return;
            }
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) {
                self->writeNext();
            }
        }));
}

void Connection::close() {
    if (closed_) {
        return;
    }
    // outbox_ stays intact: an in-flight async_write still points into its front.
    closed_ = true;
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Connection {} close: {}", hashForLogging(playerId_), ec.message());
    }
}

void ConnectionHub::attach(const std::shared_ptr<Connection>& connection) {
    connections_[connection->playerId()] = connection;
}

void ConnectionHub::detach(const std::string& playerId) {
    connections_.erase(playerId);
}

void ConnectionHub::closeAll() {
    auto connections = std::move(connections_);
    connections_.clear();
    for (auto& entry : connections) {
        entry.second->close();
    }
}

void ConnectionHub::sendToPlayer(const std::string& playerId, const std::string& event, const nlohmann::json& payload) {
    auto it = connections_.find(playerId);
    if (it == connections_.end()) {
        return;
    }
    it->second->deliver(encodeEventLine(event, payload));
}

TcpServer::TcpServer(boost::asio::io_context& io,
                     SessionCoordinator& coordinator,
                     MessageRouter& router,
                     ConnectionHub& hub,
                     const std::string& bindAddress,
                     std::uint16_t port)
    : coordinator_(coordinator)
    , router_(router)
    , hub_(hub)
    , acceptor_(io) {
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(bindAddress), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

void TcpServer::start() {
    const auto endpoint = acceptor_.local_endpoint();
    spdlog::info("Listening on {}:{}", endpoint.address().to_string(), endpoint.port());
    accept();
}

void TcpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing the acceptor failed: {}", ec.message());
    }
    hub_.closeAll();
}

void TcpServer::accept() {
    acceptor_.async_accept(boost::asio::bind_executor(
        coordinator_.strand(), [this](const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                spdlog::warn("Accept failed: {}", ec.message());
            } else {
                auto connection = std::make_shared<Connection>(
                    std::move(socket), coordinator_.strand(), router_, hub_, secureRandomHex(8));
                hub_.attach(connection);
                spdlog::debug("Accepted connection {}", hashForLogging(connection->playerId()));
                connection->start();
            }
            if (acceptor_.is_open()) {
                accept();
            }
        }));
}

} // namespace tr
