#include "RawFeedClient.hpp"

#include <boost/bind/bind.hpp>
#include <cctype>
#include <iostream>
#include <istream>
#include <utility>

#include "TimeUtils.hpp"

RawFeedClient::RawFeedClient(boost::asio::io_context& io_context,
                             std::string host, unsigned short port,
                             FrameHandler handler,
                             std::chrono::steady_clock::duration reconnect_delay)
    : host(std::move(host)),
      port(port),
      handler(std::move(handler)),
      reconnect_delay(reconnect_delay),
      resolver(io_context),
      socket(io_context),
      reconnect_timer(io_context) {}

void RawFeedClient::start() {
    closed = false;
    start_connect();
}

void RawFeedClient::close() {
    closed = true;
    resolver.cancel();
    reconnect_timer.cancel();
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

std::optional<std::string> RawFeedClient::parse_line(const std::string& line) {
    std::size_t begin = line.find('*');
    std::size_t end = line.find(';', begin == std::string::npos ? 0 : begin);
    if (begin == std::string::npos || end == std::string::npos) {
        return std::nullopt;
    }

    std::string frame = line.substr(begin + 1, end - begin - 1);
    for (char& c : frame) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (frame.empty()) {
        return std::nullopt;
    }
    return frame;
}

void RawFeedClient::start_connect() {
    resolver.async_resolve(
        host, std::to_string(port),
        [this](const boost::system::error_code& ec,
               tcp::resolver::results_type results) {
            if (ec) {
                handle_connect(ec);
                return;
            }
            boost::asio::async_connect(
                socket, results,
                [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                    handle_connect(ec);
                });
        });
}

void RawFeedClient::handle_connect(const boost::system::error_code& error) {
    if (closed) {
        return;
    }
    if (error) {
        std::cerr << "Unable to connect to raw feed " << host << ":" << port
                  << ": " << error.message() << std::endl;
        schedule_reconnect();
        return;
    }

    std::cout << "Connected to raw feed " << host << ":" << port << std::endl;
    start_receive();
}

void RawFeedClient::start_receive() {
    boost::asio::async_read_until(
        socket, data, '\n',
        boost::bind(&RawFeedClient::handle_receive, this,
                    boost::asio::placeholders::error,
                    boost::asio::placeholders::bytes_transferred));
}

void RawFeedClient::handle_receive(const boost::system::error_code& error,
                                   std::size_t bytes_received) {
    if (closed) {
        return;
    }
    if (error) {
        std::cerr << "Raw feed " << host << ":" << port
                  << " disconnected: " << error.message() << std::endl;
        boost::system::error_code ignored;
        socket.close(ignored);
        data.consume(data.size());
        schedule_reconnect();
        return;
    }

    std::istream stream(&data);
    std::string line;
    std::getline(stream, line);
    if (bytes_received > 0) {
        if (auto frame = parse_line(line)) {
            ++frames;
            handler(*frame, now_seconds());
        }
    }

    start_receive();
}

void RawFeedClient::schedule_reconnect() {
    reconnect_timer.expires_after(reconnect_delay);
    reconnect_timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec && !closed) {
            start_connect();
        }
    });
}
