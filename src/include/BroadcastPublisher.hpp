#ifndef BROADCASTPUBLISHER_HPP
#define BROADCASTPUBLISHER_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>

#include "AircraftRecord.hpp"
#include "RawFeedClient.hpp"

using boost::asio::ip::tcp;

// One connected downstream consumer.
class SubscriberEndpoint {
   public:
    using SendHandler = std::function<void(const boost::system::error_code&)>;

    virtual ~SubscriberEndpoint() = default;

    // Queues the payload; the handler reports the outcome of this send.
    virtual void send(std::shared_ptr<const std::string> payload,
                      SendHandler handler) = 0;
    virtual void close() = 0;
};

struct PublisherOptions {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8443;
    std::chrono::steady_clock::duration interval = std::chrono::seconds(3);
};

class BroadcastPublisher {
   public:
    using SnapshotSource = std::function<Snapshot()>;
    using Serializer = std::function<std::string(const Snapshot&)>;

    BroadcastPublisher(boost::asio::io_context& io_context,
                       const PublisherOptions& options,
                       SnapshotSource snapshot_source,
                       Serializer serializer, MessageSource* source = nullptr);

    // Binds the listener and starts the broadcast timer.
    void start();
    void close();

    void add_endpoint(const std::shared_ptr<SubscriberEndpoint>& endpoint);
    void remove_endpoint(const std::shared_ptr<SubscriberEndpoint>& endpoint);

    // One broadcast cycle. Returns the number of endpoints the payload was
    // handed to.
    std::size_t broadcast();

    std::size_t endpoint_count() const { return endpoints.size(); }
    // Accepted connections still in the WebSocket handshake.
    std::size_t handshake_count() const { return handshaking.size(); }
    unsigned short bound_port() const { return port; }

   private:
    void start_accept();
    void handle_accept(const boost::system::error_code& error,
                       tcp::socket socket);
    void start_broadcast_timer();

    PublisherOptions options;
    SnapshotSource snapshot_source;
    Serializer serializer;
    MessageSource* source;

    tcp::acceptor acceptor;
    boost::asio::steady_timer timer;
    std::set<std::shared_ptr<SubscriberEndpoint>> endpoints;
    std::set<std::shared_ptr<SubscriberEndpoint>> handshaking;
    unsigned short port = 0;
    bool closing = false;
};

#endif  // BROADCASTPUBLISHER_HPP
