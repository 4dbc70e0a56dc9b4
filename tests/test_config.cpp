#include <gtest/gtest.h>

#include <map>
#include <string>

#include "Config.hpp"

namespace {

EnvLookup lookup_from(const std::map<std::string, std::string>& env) {
    return [env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

}  // namespace

TEST(Config, DefaultsWhenUnset) {
    Config config = load_config(lookup_from({}));
    EXPECT_EQ(config.feed_host, "127.0.0.1");
    EXPECT_EQ(config.feed_port, 30002);
    EXPECT_EQ(config.ws_host, "0.0.0.0");
    EXPECT_EQ(config.ws_port, 8443);
    EXPECT_DOUBLE_EQ(config.publish_interval, 3.0);
    EXPECT_FALSE(config.receiver.has_value());
    EXPECT_EQ(config.ws_uri, "ws://127.0.0.1:8443");
    EXPECT_EQ(config.db_path, "adsb_data.db");
    EXPECT_DOUBLE_EQ(config.session_timeout, 300.0);
}

TEST(Config, ReadsEnvironment) {
    Config config = load_config(lookup_from({
        {"DUMP1090_HOST", "192.168.1.20"},
        {"DUMP1090_RAW_PORT", "30005"},
        {"ADSB_WS_PORT", "9000"},
        {"ADSB_PUBLISH_INTERVAL", "1.5"},
        {"RECEIVER_LAT", "52.3"},
        {"RECEIVER_LON", "4.76"},
        {"ADSB_WS_URI", "ws://relay:9000"},
        {"ADSB_RETRY_DELAY", "2"},
        {"ADSB_DB_PATH", "/var/lib/adsb/flights.db"},
        {"ADSB_SESSION_TIMEOUT", "600"},
    }));

    EXPECT_EQ(config.feed_host, "192.168.1.20");
    EXPECT_EQ(config.feed_port, 30005);
    EXPECT_EQ(config.ws_port, 9000);
    ASSERT_TRUE(config.receiver.has_value());
    EXPECT_DOUBLE_EQ(config.receiver->lat, 52.3);
    EXPECT_DOUBLE_EQ(config.receiver->lon, 4.76);

    PublisherOptions publisher = config.publisher_options();
    EXPECT_EQ(publisher.interval, std::chrono::milliseconds(1500));

    SubscriberOptions subscriber = config.subscriber_options();
    EXPECT_EQ(subscriber.uri, "ws://relay:9000");
    EXPECT_EQ(subscriber.base_backoff, std::chrono::milliseconds(2000));
    EXPECT_EQ(subscriber.max_backoff, std::chrono::milliseconds(60000));
    EXPECT_DOUBLE_EQ(subscriber.session_inactivity_seconds, 600.0);

    WorkerOptions worker = config.worker_options();
    EXPECT_EQ(worker.db_path, "/var/lib/adsb/flights.db");
    EXPECT_DOUBLE_EQ(worker.session_inactivity_seconds, 600.0);

    AggregatorOptions aggregator = config.aggregator_options();
    ASSERT_TRUE(aggregator.reference.has_value());
    EXPECT_DOUBLE_EQ(aggregator.reference->lat, 52.3);
}

TEST(Config, InvalidValuesFallBackToDefaults) {
    Config config = load_config(lookup_from({
        {"DUMP1090_RAW_PORT", "not-a-port"},
        {"ADSB_WS_PORT", "70000"},
        {"ADSB_PUBLISH_INTERVAL", "-1"},
        {"ADSB_CPR_MAX_AGE", "10s"},
    }));

    EXPECT_EQ(config.feed_port, 30002);
    EXPECT_EQ(config.ws_port, 8443);
    EXPECT_DOUBLE_EQ(config.publish_interval, 3.0);
    EXPECT_DOUBLE_EQ(config.cpr_max_age, 10.0);
}

TEST(Config, ReferenceNeedsBothCoordinates) {
    EXPECT_FALSE(load_config(lookup_from({{"RECEIVER_LAT", "52.3"}}))
                     .receiver.has_value());
    EXPECT_FALSE(load_config(lookup_from({{"RECEIVER_LAT", "52.3"},
                                          {"RECEIVER_LON", "east"}}))
                     .receiver.has_value());
    EXPECT_FALSE(load_config(lookup_from({{"RECEIVER_LAT", "95"},
                                          {"RECEIVER_LON", "4.7"}}))
                     .receiver.has_value());
}
