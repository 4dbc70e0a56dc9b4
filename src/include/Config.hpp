#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <functional>
#include <optional>
#include <string>

#include "Aggregator.hpp"
#include "BroadcastPublisher.hpp"
#include "MessageDecoder.hpp"
#include "PersistenceWorker.hpp"
#include "StreamSubscriber.hpp"

// Runtime settings for both processes. Durations are in seconds.
struct Config {
    // Publisher
    std::string feed_host = "127.0.0.1";
    unsigned short feed_port = 30002;
    std::string ws_host = "0.0.0.0";
    unsigned short ws_port = 8443;
    double publish_interval = 3.0;
    std::optional<GeoPosition> receiver;
    double cpr_max_age = PositionResolver::kDefaultStalenessSeconds;
    double assembly_timeout = 120.0;

    // Subscriber
    std::string ws_uri = "ws://127.0.0.1:8443";
    double retry_delay = 5.0;
    double max_retry_delay = 60.0;
    double persist_interval = 10.0;
    std::string db_path = "adsb_data.db";
    double session_timeout = 300.0;
    double sweep_interval = 60.0;

    AggregatorOptions aggregator_options() const;
    PublisherOptions publisher_options() const;
    SubscriberOptions subscriber_options() const;
    WorkerOptions worker_options() const;
};

using EnvLookup = std::function<const char*(const char* name)>;

// Unset variables keep their defaults. Values that do not parse, or fall
// outside their range, are reported on stderr and ignored.
Config load_config(const EnvLookup& lookup);
Config load_config_from_env();

#endif  // CONFIG_HPP
