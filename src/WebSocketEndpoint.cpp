#include "WebSocketEndpoint.hpp"

#include <iostream>
#include <sstream>

WebSocketEndpoint::WebSocketEndpoint(tcp::socket socket)
    : ws(std::move(socket)) {
    boost::system::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
    if (!ec) {
        std::ostringstream out;
        out << endpoint;
        peer = out.str();
    }
}

void WebSocketEndpoint::accept(Handler on_open, Handler on_close) {
    this->on_open = std::move(on_open);
    this->on_close = std::move(on_close);

    ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.async_accept(beast::bind_front_handler(
        &WebSocketEndpoint::handle_handshake, shared_from_this()));
}

void WebSocketEndpoint::handle_handshake(const boost::system::error_code& error) {
    if (error) {
        fail(error);
        return;
    }
    if (closed) {
        return;
    }

    handshake_done = true;
    if (on_open) {
        on_open(shared_from_this());
    }
    start_read();
}

void WebSocketEndpoint::send(std::shared_ptr<const std::string> payload,
                             SendHandler handler) {
    if (closed || !handshake_done) {
        handler(boost::asio::error::not_connected);
        return;
    }
    if (outbox.size() >= kMaxQueuedWrites) {
        handler(boost::asio::error::no_buffer_space);
        return;
    }

    outbox.emplace_back(std::move(payload), std::move(handler));
    if (outbox.size() == 1) {
        start_write();
    }
}

void WebSocketEndpoint::close() {
    if (closed) {
        return;
    }
    closed = true;

    if (handshake_done && outbox.empty()) {
        ws.async_close(websocket::close_code::going_away,
                       [self = shared_from_this()](
                           const boost::system::error_code&) {});
    } else {
        boost::system::error_code ignored;
        beast::get_lowest_layer(ws).socket().close(ignored);
    }
}

void WebSocketEndpoint::start_read() {
    ws.async_read(buffer, beast::bind_front_handler(
                              &WebSocketEndpoint::handle_read,
                              shared_from_this()));
}

void WebSocketEndpoint::handle_read(const boost::system::error_code& error,
                                    std::size_t) {
    if (error) {
        fail(error);
        return;
    }
    buffer.consume(buffer.size());
    start_read();
}

void WebSocketEndpoint::start_write() {
    ws.text(true);
    ws.async_write(boost::asio::buffer(*outbox.front().first),
                   beast::bind_front_handler(&WebSocketEndpoint::handle_write,
                                             shared_from_this()));
}

void WebSocketEndpoint::handle_write(const boost::system::error_code& error,
                                     std::size_t) {
    SendHandler handler = std::move(outbox.front().second);
    outbox.pop_front();
    handler(error);

    if (error || closed) {
        boost::system::error_code reason =
            error ? error : boost::asio::error::operation_aborted;
        auto pending = std::move(outbox);
        outbox.clear();
        for (auto& item : pending) {
            item.second(reason);
        }
        if (error) {
            fail(error);
        }
        return;
    }

    if (!outbox.empty()) {
        start_write();
    }
}

void WebSocketEndpoint::fail(const boost::system::error_code& error) {
    if (closed) {
        return;
    }
    closed = true;

    if (!handshake_done) {
        std::cerr << "WebSocket handshake with " << peer
                  << " failed: " << error.message() << std::endl;
    } else if (error != websocket::error::closed) {
        std::cerr << "Subscriber " << peer << " transport error: "
                  << error.message() << std::endl;
    }
    boost::system::error_code ignored;
    beast::get_lowest_layer(ws).socket().close(ignored);

    if (on_close) {
        on_close(shared_from_this());
    }
}
