// server.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "app_registry.hpp"
#include "config.hpp"

// Listens for WebSocket clients and owns everything they share.
class Server {
public:
    Server(boost::asio::io_context& ioc, const ServerConfig& config);
    void run_accept();
    void stop();

    void on_disconnect(const std::string& peer);

    AppRegistry& apps() { return apps_; }
    const nlohmann::json& welcome() const { return welcome_; }
    std::uint64_t live_connections() const { return live_connections_; }

private:
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    AppRegistry apps_;
    const nlohmann::json welcome_;
    const bool log_requests_;
    std::atomic<std::uint64_t> live_connections_{0};
};
