// server.cpp
#include "server.hpp"
#include "connection.hpp"
#include "logger.hpp"
#include <memory>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static tcp::acceptor make_acceptor(asio::io_context& ioc, unsigned short port) {
    tcp::endpoint endpoint(tcp::v4(), port);
    tcp::acceptor acceptor(ioc);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
    return acceptor;
}

Server::Server(asio::io_context& ioc, const ServerConfig& config)
    : ioc_(ioc),
      acceptor_(make_acceptor(ioc, config.port)),
      welcome_(config.welcome.to_json()),
      log_requests_(config.log_requests) {
    Logger::instance().info("Server constructed", { {"port", config.port}, {"welcome", welcome_} });
}

void Server::run_accept() {
    // each connection gets its own strand
    acceptor_.async_accept(asio::make_strand(ioc_), [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            Logger::instance().info("Accept loop stopped");
            return;
        }
        if (!ec) {
            std::uint64_t live = ++live_connections_;
            if (log_requests_) {
                boost::system::error_code peer_ec;
                auto endpoint = socket.remote_endpoint(peer_ec);
                std::string peer = peer_ec ? std::string("unknown") : endpoint.address().to_string();
                Logger::instance().info("ws client connecting", { {"peer", peer}, {"live", live} });
            } else {
                Logger::instance().debug("New connection accepted", { {"live", live} });
            }
            std::make_shared<Connection>(std::move(socket), *this)->start();
        } else {
            Logger::instance().error("Accept error", { {"what", ec.message()}, {"value", ec.value()} });
        }
        run_accept();
    });
}

void Server::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) Logger::instance().warn("Acceptor close failed", { {"what", ec.message()} });
}

void Server::on_disconnect(const std::string& peer) {
    std::uint64_t live = --live_connections_;
    Logger::instance().debug("Connection released", { {"peer", peer}, {"live", live} });
}
