// connection.hpp
#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "session.hpp"

class Server; // forward

// One WebSocket client. Owns the Session for that client and writes its
// output in order; all handlers run on the connection's strand.
class Connection : public ResponseSink, public std::enable_shared_from_this<Connection> {
public:
    Connection(boost::asio::ip::tcp::socket socket, Server& server);
    void start();

    void send_text(std::string json_text) override;
    void request_close() override;

private:
    void on_handshake(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void enqueue(std::string json_text);
    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t bytes_transferred);
    void begin_close();
    void on_disconnect(const char* where, boost::beast::error_code ec);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    Server& server_;
    std::string peer_;
    std::shared_ptr<Session> session_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> outgoing_message_queue_;
    bool close_requested_ = false;
    bool closing_ = false;
    bool disconnected_ = false;
};
