#include <boost/asio.hpp>
#include <csignal>
#include <iostream>

#include "Config.hpp"
#include "PersistenceWorker.hpp"
#include "StreamSubscriber.hpp"

int main() {
    try {
        Config config = load_config_from_env();

        PersistenceWorker worker(config.worker_options());
        worker.start();

        boost::asio::io_context io_context;
        StreamSubscriber subscriber(io_context, config.subscriber_options(),
                                    worker);
        subscriber.start();
        std::cout << "Subscribing to " << config.ws_uri << std::endl;

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            std::cout << "Shutting down subscriber" << std::endl;
            subscriber.persist();
            subscriber.close();
        });

        io_context.run();
        worker.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
