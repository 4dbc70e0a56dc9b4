#include <boost/asio.hpp>
#include <csignal>
#include <iostream>

#include "Aggregator.hpp"
#include "BroadcastPublisher.hpp"
#include "Config.hpp"
#include "ModesDecoder.hpp"
#include "RawFeedClient.hpp"
#include "SnapshotCodec.hpp"

int main() {
    try {
        Config config = load_config_from_env();

        boost::asio::io_context io_context;
        ModesDecoder decoder(config.receiver);
        Aggregator aggregator(io_context, decoder, config.aggregator_options());

        RawFeedClient feed(io_context, config.feed_host, config.feed_port,
                           [&aggregator](const std::string& frame,
                                         double timestamp) {
                               aggregator.process_frame(frame, timestamp);
                           });
        BroadcastPublisher publisher(
            io_context, config.publisher_options(),
            [&aggregator] { return aggregator.snapshot(); },
            serialize_snapshot, &feed);

        publisher.start();
        feed.start();
        std::cout << "Reading raw frames from " << config.feed_host << ":"
                  << config.feed_port << ", publishing on " << config.ws_host
                  << ":" << publisher.bound_port() << std::endl;

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            publisher.close();
            aggregator.stop();
        });

        io_context.run();

        const AggregatorStats& stats = aggregator.stats();
        std::cout << "Frames accepted: " << stats.frames_accepted
                  << ", dropped: " << stats.frames_dropped
                  << ", aircraft: " << aggregator.size() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
