#include "Config.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace {

std::optional<double> parse_double(const std::string& text) {
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void warn(const char* name, const char* value, const std::string& fallback) {
    std::cerr << "Invalid value for " << name << "=" << value
              << "; using default " << fallback << std::endl;
}

void read_string(const EnvLookup& lookup, const char* name, std::string& out) {
    const char* value = lookup(name);
    if (value != nullptr && *value != '\0') {
        out = value;
    }
}

void read_port(const EnvLookup& lookup, const char* name,
               unsigned short& out) {
    const char* value = lookup(name);
    if (value == nullptr) {
        return;
    }
    auto parsed = parse_double(value);
    if (!parsed || *parsed < 0 || *parsed > 65535 ||
        *parsed != static_cast<double>(static_cast<long>(*parsed))) {
        warn(name, value, std::to_string(out));
        return;
    }
    out = static_cast<unsigned short>(*parsed);
}

// Positive durations only.
void read_seconds(const EnvLookup& lookup, const char* name, double& out) {
    const char* value = lookup(name);
    if (value == nullptr) {
        return;
    }
    auto parsed = parse_double(value);
    if (!parsed || !(*parsed > 0)) {
        warn(name, value, std::to_string(out));
        return;
    }
    out = *parsed;
}

std::optional<double> read_coordinate(const EnvLookup& lookup,
                                      const char* name, double limit) {
    const char* value = lookup(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    auto parsed = parse_double(value);
    if (!parsed || *parsed < -limit || *parsed > limit) {
        warn(name, value, "none");
        return std::nullopt;
    }
    return parsed;
}

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::chrono::steady_clock::duration to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

}  // namespace

AggregatorOptions Config::aggregator_options() const {
    AggregatorOptions options;
    options.cpr_staleness_seconds = cpr_max_age;
    options.assembly_timeout_seconds = assembly_timeout;
    options.reference = receiver;
    return options;
}

PublisherOptions Config::publisher_options() const {
    PublisherOptions options;
    options.bind_address = ws_host;
    options.port = ws_port;
    options.interval = to_duration(publish_interval);
    return options;
}

SubscriberOptions Config::subscriber_options() const {
    SubscriberOptions options;
    options.uri = ws_uri;
    options.base_backoff = to_millis(retry_delay);
    options.max_backoff = to_millis(max_retry_delay);
    options.persist_interval = to_millis(persist_interval);
    options.session_inactivity_seconds = session_timeout;
    return options;
}

WorkerOptions Config::worker_options() const {
    WorkerOptions options;
    options.db_path = db_path;
    options.sweep_interval = to_millis(sweep_interval);
    options.session_inactivity_seconds = session_timeout;
    return options;
}

Config load_config(const EnvLookup& lookup) {
    Config config;

    read_string(lookup, "DUMP1090_HOST", config.feed_host);
    read_port(lookup, "DUMP1090_RAW_PORT", config.feed_port);
    read_string(lookup, "ADSB_WS_HOST", config.ws_host);
    read_port(lookup, "ADSB_WS_PORT", config.ws_port);
    read_seconds(lookup, "ADSB_PUBLISH_INTERVAL", config.publish_interval);
    read_seconds(lookup, "ADSB_CPR_MAX_AGE", config.cpr_max_age);
    read_seconds(lookup, "ADSB_ASSEMBLY_TIMEOUT", config.assembly_timeout);

    auto lat = read_coordinate(lookup, "RECEIVER_LAT", 90.0);
    auto lon = read_coordinate(lookup, "RECEIVER_LON", 180.0);
    if (lat && lon) {
        config.receiver = GeoPosition{*lat, *lon};
    }

    read_string(lookup, "ADSB_WS_URI", config.ws_uri);
    read_seconds(lookup, "ADSB_RETRY_DELAY", config.retry_delay);
    read_seconds(lookup, "ADSB_MAX_RETRY_DELAY", config.max_retry_delay);
    read_seconds(lookup, "ADSB_PERSIST_INTERVAL", config.persist_interval);
    read_string(lookup, "ADSB_DB_PATH", config.db_path);
    read_seconds(lookup, "ADSB_SESSION_TIMEOUT", config.session_timeout);
    read_seconds(lookup, "ADSB_SWEEP_INTERVAL", config.sweep_interval);

    return config;
}

Config load_config_from_env() {
    return load_config([](const char* name) { return std::getenv(name); });
}
