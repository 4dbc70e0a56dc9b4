#ifndef STREAMSUBSCRIBER_HPP
#define STREAMSUBSCRIBER_HPP

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/uuid/random_generator.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

#include "AircraftRecord.hpp"
#include "PersistenceTask.hpp"

using boost::asio::ip::tcp;

enum class ConnectionState { Disconnected, Connecting, Connected };

const char* to_string(ConnectionState state);

struct WsTarget {
    std::string host;
    std::string port;
    std::string path;
};

// Accepts "ws://host[:port][/path]". Throws std::invalid_argument.
WsTarget parse_ws_uri(const std::string& uri);

// Reconnect delay carried between attempts: doubles on each failed attempt
// up to the ceiling, back to base after a successful connection.
class Backoff {
   public:
    using Duration = std::chrono::milliseconds;

    Backoff(Duration base, Duration ceiling);

    Duration current() const { return delay; }
    // Delay to wait after a failed attempt; the next one will be doubled.
    Duration fail();
    void reset() { delay = base; }

   private:
    Duration base;
    Duration ceiling;
    Duration delay;
};

struct SubscriberOptions {
    std::string uri = "ws://127.0.0.1:8443";
    std::chrono::milliseconds base_backoff{5000};
    std::chrono::milliseconds max_backoff{60000};
    std::chrono::milliseconds persist_interval{10000};
    double session_inactivity_seconds = 300.0;
};

// Mirrors the publisher's snapshot and feeds the persistence queue on its
// own cadence.
class StreamSubscriber {
   public:
    StreamSubscriber(boost::asio::io_context& io_context,
                     const SubscriberOptions& options, TaskQueue& tasks);

    void start();
    void close();

    void handle_message(const std::string& payload);
    // One persistence pass over the current mirror.
    void persist();

    ConnectionState state() const { return connection; }
    Backoff::Duration next_delay() const { return backoff.current(); }
    const AircraftMap& mirror() const { return aircraft; }
    std::size_t messages_received() const { return received; }
    std::size_t messages_malformed() const { return malformed; }

   private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void start_connect();
    void handle_resolve(const boost::system::error_code& error,
                        const tcp::resolver::results_type& results);
    void handle_connect(const boost::system::error_code& error);
    void handle_handshake(const boost::system::error_code& error);
    void start_read();
    void handle_read(const boost::system::error_code& error,
                     std::size_t bytes_transferred);
    void attempt_failed(const boost::system::error_code& error);
    void connection_lost(const boost::system::error_code& error);
    void schedule_reconnect(Backoff::Duration delay);
    void start_persist_timer();

    boost::asio::io_context& io_context;
    SubscriberOptions options;
    WsTarget target;
    TaskQueue& tasks;

    tcp::resolver resolver;
    std::unique_ptr<Stream> ws;
    boost::beast::flat_buffer buffer;
    boost::asio::steady_timer reconnect_timer;
    boost::asio::steady_timer persist_timer;
    ConnectionState connection = ConnectionState::Disconnected;
    Backoff backoff;
    bool closed = false;

    AircraftMap aircraft;
    std::unordered_map<std::string, double> last_saved;
    std::unordered_map<std::string, std::string> active_sessions;
    boost::uuids::random_generator uuid_generator;

    std::size_t received = 0;
    std::size_t malformed = 0;
};

#endif  // STREAMSUBSCRIBER_HPP
