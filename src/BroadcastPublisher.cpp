#include "BroadcastPublisher.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "WebSocketEndpoint.hpp"

BroadcastPublisher::BroadcastPublisher(boost::asio::io_context& io_context,
                                       const PublisherOptions& options,
                                       SnapshotSource snapshot_source,
                                       Serializer serializer,
                                       MessageSource* source)
    : options(options),
      snapshot_source(std::move(snapshot_source)),
      serializer(std::move(serializer)),
      source(source),
      acceptor(io_context),
      timer(io_context) {}

void BroadcastPublisher::start() {
    closing = false;
    tcp::endpoint endpoint(boost::asio::ip::make_address(options.bind_address),
                           options.port);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(boost::asio::socket_base::max_listen_connections);
    port = acceptor.local_endpoint().port();

    std::cout << "Publishing snapshots on ws://" << options.bind_address << ":"
              << port << std::endl;

    start_accept();
    start_broadcast_timer();
}

void BroadcastPublisher::close() {
    std::cout << "Shutting down publisher..." << std::endl;
    closing = true;
    timer.cancel();

    boost::system::error_code ec;
    acceptor.close(ec);

    auto remaining = std::move(endpoints);
    endpoints.clear();
    for (const auto& endpoint : remaining) {
        endpoint->close();
    }
    auto pending = std::move(handshaking);
    handshaking.clear();
    for (const auto& endpoint : pending) {
        endpoint->close();
    }

    if (source != nullptr) {
        source->close();
    }
}

void BroadcastPublisher::add_endpoint(
    const std::shared_ptr<SubscriberEndpoint>& endpoint) {
    if (closing) {
        endpoint->close();
        return;
    }
    endpoints.insert(endpoint);
}

void BroadcastPublisher::remove_endpoint(
    const std::shared_ptr<SubscriberEndpoint>& endpoint) {
    if (endpoints.erase(endpoint) > 0) {
        endpoint->close();
    }
}

std::size_t BroadcastPublisher::broadcast() {
    if (endpoints.empty()) {
        return 0;
    }

    auto payload =
        std::make_shared<const std::string>(serializer(snapshot_source()));

    // Send handlers may remove endpoints while we iterate.
    std::vector<std::shared_ptr<SubscriberEndpoint>> targets(endpoints.begin(),
                                                             endpoints.end());
    for (const auto& endpoint : targets) {
        std::weak_ptr<SubscriberEndpoint> weak = endpoint;
        try {
            endpoint->send(payload, [this, weak](
                                        const boost::system::error_code& ec) {
                if (!ec) {
                    return;
                }
                if (auto failed = weak.lock()) {
                    if (!closing) {
                        std::cerr << "Dropping subscriber after failed send: "
                                  << ec.message() << std::endl;
                    }
                    remove_endpoint(failed);
                }
            });
        } catch (const std::exception& e) {
            std::cerr << "Dropping subscriber after send error: " << e.what()
                      << std::endl;
            remove_endpoint(endpoint);
        }
    }
    return targets.size();
}

void BroadcastPublisher::start_accept() {
    acceptor.async_accept(
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            handle_accept(ec, std::move(socket));
        });
}

void BroadcastPublisher::handle_accept(const boost::system::error_code& error,
                                       tcp::socket socket) {
    if (closing || error == boost::asio::error::operation_aborted) {
        return;
    }
    if (error) {
        std::cerr << "Accept failed: " << error.message() << std::endl;
    } else {
        auto endpoint = std::make_shared<WebSocketEndpoint>(std::move(socket));
        handshaking.insert(endpoint);
        endpoint->accept(
            [this](const std::shared_ptr<WebSocketEndpoint>& opened) {
                handshaking.erase(opened);
                std::cout << "Subscriber connected: " << opened->remote()
                          << std::endl;
                add_endpoint(opened);
            },
            [this](const std::shared_ptr<WebSocketEndpoint>& closed) {
                if (handshaking.erase(closed) > 0) {
                    return;
                }
                std::cout << "Subscriber disconnected: " << closed->remote()
                          << std::endl;
                remove_endpoint(closed);
            });
    }
    start_accept();
}

void BroadcastPublisher::start_broadcast_timer() {
    timer.expires_after(options.interval);
    timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec && !closing) {
            broadcast();
            start_broadcast_timer();
        }
    });
}
