#ifndef WEBSOCKETENDPOINT_HPP
#define WEBSOCKETENDPOINT_HPP

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "BroadcastPublisher.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;

// Server side of one WebSocket subscriber. Inbound frames are read only to
// notice the peer going away.
class WebSocketEndpoint
    : public SubscriberEndpoint,
      public std::enable_shared_from_this<WebSocketEndpoint> {
   public:
    using Handler = std::function<void(const std::shared_ptr<WebSocketEndpoint>&)>;

    static constexpr std::size_t kMaxQueuedWrites = 8;

    explicit WebSocketEndpoint(tcp::socket socket);

    void accept(Handler on_open, Handler on_close);
    void send(std::shared_ptr<const std::string> payload,
              SendHandler handler) override;
    void close() override;

    const std::string& remote() const { return peer; }

   private:
    void handle_handshake(const boost::system::error_code& error);
    void start_read();
    void handle_read(const boost::system::error_code& error,
                     std::size_t bytes_transferred);
    void start_write();
    void handle_write(const boost::system::error_code& error,
                      std::size_t bytes_transferred);
    void fail(const boost::system::error_code& error);

    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    std::deque<std::pair<std::shared_ptr<const std::string>, SendHandler>>
        outbox;
    Handler on_open;
    Handler on_close;
    std::string peer;
    bool handshake_done = false;
    bool closed = false;
};

#endif  // WEBSOCKETENDPOINT_HPP
