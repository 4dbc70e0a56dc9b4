#include "StreamSubscriber.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "SnapshotCodec.hpp"
#include "TimeUtils.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
    }
    return "unknown";
}

WsTarget parse_ws_uri(const std::string& uri) {
    const std::string scheme = "ws://";
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("unsupported WebSocket URI: " + uri);
    }

    std::string rest = uri.substr(scheme.size());
    WsTarget target;
    std::size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    target.path = slash == std::string::npos ? "/" : rest.substr(slash);

    std::size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        target.host = authority;
        target.port = "80";
    } else {
        target.host = authority.substr(0, colon);
        target.port = authority.substr(colon + 1);
    }

    if (target.host.empty() || target.port.empty() ||
        !std::all_of(target.port.begin(), target.port.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument("malformed WebSocket URI: " + uri);
    }
    return target;
}

Backoff::Backoff(Duration base, Duration ceiling)
    : base(base), ceiling(std::max(ceiling, base)), delay(base) {}

Backoff::Duration Backoff::fail() {
    Duration wait = delay;
    delay = std::min(delay * 2, ceiling);
    return wait;
}

StreamSubscriber::StreamSubscriber(boost::asio::io_context& io_context,
                                   const SubscriberOptions& options,
                                   TaskQueue& tasks)
    : io_context(io_context),
      options(options),
      target(parse_ws_uri(options.uri)),
      tasks(tasks),
      resolver(io_context),
      reconnect_timer(io_context),
      persist_timer(io_context),
      backoff(options.base_backoff, options.max_backoff) {}

void StreamSubscriber::start() {
    closed = false;
    start_connect();
    start_persist_timer();
}

void StreamSubscriber::close() {
    closed = true;
    resolver.cancel();
    reconnect_timer.cancel();
    persist_timer.cancel();
    if (ws) {
        boost::system::error_code ignored;
        beast::get_lowest_layer(*ws).socket().shutdown(
            tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(*ws).socket().close(ignored);
    }
    connection = ConnectionState::Disconnected;
}

void StreamSubscriber::handle_message(const std::string& payload) {
    ++received;
    try {
        aircraft = parse_snapshot(payload);
    } catch (const std::exception& e) {
        ++malformed;
        std::cerr << "Failed to decode message: " << e.what() << std::endl;
    }
}

void StreamSubscriber::persist() {
    for (const auto& entry : aircraft) {
        const std::string& address = entry.first;
        const AircraftRecord& record = *entry.second;

        tasks.enqueue(UpsertAircraft{address, record.callsign,
                                     record.first_seen, record.last_update,
                                     record.assembly_time_ms,
                                     record.stale_cpr_count});

        if (!record.position) {
            continue;
        }
        auto saved = last_saved.find(address);
        if (saved != last_saved.end() && record.last_update <= saved->second) {
            continue;
        }

        auto session = active_sessions.find(address);
        if (session != active_sessions.end() && saved != last_saved.end() &&
            record.last_update - saved->second >
                options.session_inactivity_seconds) {
            // The worker will have closed this one; start a fresh session.
            active_sessions.erase(session);
            session = active_sessions.end();
        }
        if (session == active_sessions.end()) {
            std::string id = boost::uuids::to_string(uuid_generator());
            tasks.enqueue(StartSession{id, address, record.last_update});
            session = active_sessions.emplace(address, id).first;
        }

        InsertPath point;
        point.session_id = session->second;
        point.address = address;
        point.ts = record.last_update;
        point.ts_iso = format_iso8601_utc(record.last_update);
        point.lat = record.position->lat;
        point.lon = record.position->lon;
        point.alt = record.altitude;
        if (record.velocity) {
            point.speed = record.velocity->speed;
            point.track = record.velocity->track;
            point.vertical_rate = record.velocity->vertical_rate;
            point.velocity_type = record.velocity->type;
        }
        tasks.enqueue(std::move(point));

        last_saved[address] = record.last_update;
    }
}

void StreamSubscriber::start_connect() {
    connection = ConnectionState::Connecting;
    ws = std::make_unique<Stream>(io_context);
    resolver.async_resolve(
        target.host, target.port,
        [this](const boost::system::error_code& ec,
               const tcp::resolver::results_type& results) {
            handle_resolve(ec, results);
        });
}

void StreamSubscriber::handle_resolve(
    const boost::system::error_code& error,
    const tcp::resolver::results_type& results) {
    if (closed) {
        return;
    }
    if (error) {
        attempt_failed(error);
        return;
    }
    beast::get_lowest_layer(*ws).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(*ws).async_connect(
        results, [this](const boost::system::error_code& ec,
                        const tcp::endpoint&) { handle_connect(ec); });
}

void StreamSubscriber::handle_connect(const boost::system::error_code& error) {
    if (closed) {
        return;
    }
    if (error) {
        attempt_failed(error);
        return;
    }
    beast::get_lowest_layer(*ws).expires_never();
    ws->set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws->async_handshake(target.host + ":" + target.port, target.path,
                        [this](const boost::system::error_code& ec) {
                            handle_handshake(ec);
                        });
}

void StreamSubscriber::handle_handshake(const boost::system::error_code& error) {
    if (closed) {
        return;
    }
    if (error) {
        attempt_failed(error);
        return;
    }
    connection = ConnectionState::Connected;
    backoff.reset();
    std::cout << "Connected to publisher at " << options.uri << std::endl;
    start_read();
}

void StreamSubscriber::start_read() {
    ws->async_read(buffer, [this](const boost::system::error_code& ec,
                                  std::size_t bytes) { handle_read(ec, bytes); });
}

void StreamSubscriber::handle_read(const boost::system::error_code& error,
                                   std::size_t) {
    if (closed) {
        return;
    }
    if (error) {
        connection_lost(error);
        return;
    }
    std::string payload = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    handle_message(payload);
    start_read();
}

void StreamSubscriber::attempt_failed(const boost::system::error_code& error) {
    connection = ConnectionState::Disconnected;
    Backoff::Duration delay = backoff.fail();
    std::cerr << "Unable to connect to publisher at " << options.uri << ": "
              << error.message() << "; retrying in " << delay.count() << "ms"
              << std::endl;
    schedule_reconnect(delay);
}

void StreamSubscriber::connection_lost(const boost::system::error_code& error) {
    connection = ConnectionState::Disconnected;
    Backoff::Duration delay = backoff.current();
    std::cerr << "Connection to " << options.uri << " closed ("
              << error.message() << "); retrying in " << delay.count() << "ms"
              << std::endl;
    buffer.consume(buffer.size());
    schedule_reconnect(delay);
}

void StreamSubscriber::schedule_reconnect(Backoff::Duration delay) {
    reconnect_timer.expires_after(delay);
    reconnect_timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec && !closed) {
            start_connect();
        }
    });
}

void StreamSubscriber::start_persist_timer() {
    persist_timer.expires_after(options.persist_interval);
    persist_timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec && !closed) {
            persist();
            start_persist_timer();
        }
    });
}
