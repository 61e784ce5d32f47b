// connection.cpp
#include "connection.hpp"
#include "server.hpp"
#include "logger.hpp"
#include "protocol.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

static std::string describe_peer(beast::tcp_stream& stream) {
    boost::system::error_code ec;
    auto endpoint = stream.socket().remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

Connection::Connection(asio::ip::tcp::socket socket, Server& server)
    : ws_(std::move(socket)), server_(server) {
    peer_ = describe_peer(ws_.next_layer());
    Logger::instance().debug("Connection constructed", { {"peer", peer_} });
}

void Connection::start() {
    // the socket was accepted onto a strand; run everything from there
    asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
        self->ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        self->ws_.async_accept(beast::bind_front_handler(&Connection::on_handshake, self));
    });
}

void Connection::on_handshake(beast::error_code ec) {
    if (ec) {
        Logger::instance().warn("WebSocket handshake failed", { {"peer", peer_}, {"ec", ec.message()} });
        on_disconnect("handshake", ec);
        return;
    }
    ws_.text(true);
    session_ = std::make_shared<Session>(server_.apps(), shared_from_this(), server_.welcome());
    Logger::instance().info("Session start", { {"peer", peer_} });
    session_->start();
    do_read();
}

void Connection::do_read() {
    ws_.async_read(read_buffer_, beast::bind_front_handler(&Connection::on_read, shared_from_this()));
}

void Connection::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        on_disconnect("read", ec);
        return;
    }
    const double server_rx = now_seconds();
    std::string payload = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    if (session_) session_->handle_text(payload, server_rx);
    do_read();
}

void Connection::send_text(std::string json_text) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(json_text)]() mutable {
        self->enqueue(std::move(text));
    });
}

void Connection::enqueue(std::string json_text) {
    if (closing_ || disconnected_) return;
    bool writing = !outgoing_message_queue_.empty();
    outgoing_message_queue_.push_back(std::move(json_text));
    if (!writing) do_write();
}

void Connection::do_write() {
    ws_.async_write(asio::buffer(outgoing_message_queue_.front()),
                    beast::bind_front_handler(&Connection::on_write, shared_from_this()));
}

void Connection::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        on_disconnect("write", ec);
        return;
    }
    outgoing_message_queue_.pop_front();
    if (!outgoing_message_queue_.empty()) {
        do_write();
    } else if (close_requested_) {
        begin_close();
    }
}

void Connection::request_close() {
    auto self = shared_from_this();
    // Two hops: output the session sends right after asking to close is
    // posted before the inner handler runs, so it is still written.
    asio::post(ws_.get_executor(), [self]() {
        asio::post(self->ws_.get_executor(), [self]() {
            self->close_requested_ = true;
            if (self->outgoing_message_queue_.empty()) self->begin_close();
        });
    });
}

void Connection::begin_close() {
    if (closing_ || disconnected_) return;
    closing_ = true;
    Logger::instance().info("Closing connection", { {"peer", peer_} });
    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec) Logger::instance().debug("WebSocket close failed", { {"peer", self->peer_}, {"ec", ec.message()} });
    });
}

void Connection::on_disconnect(const char* where, beast::error_code ec) {
    if (disconnected_) return;
    disconnected_ = true;

    if (ec == websocket::error::closed) {
        Logger::instance().info("Connection closed", { {"peer", peer_} });
    } else {
        Logger::instance().info("Connection error/disconnect", { {"peer", peer_}, {"where", where}, {"ec", ec.message()} });
    }

    if (session_) {
        session_->close();
        session_.reset();
    }
    if (std::string(where) == "write") {
        // wake up the pending read so this connection can go away
        beast::get_lowest_layer(ws_).close();
    }
    server_.on_disconnect(peer_);
}
