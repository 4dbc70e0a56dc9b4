#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "AircraftRecord.hpp"
#include "MessageDecoder.hpp"
#include "PositionResolver.hpp"

struct AggregatorOptions {
    double cpr_staleness_seconds = PositionResolver::kDefaultStalenessSeconds;
    double assembly_timeout_seconds = 120.0;
    std::chrono::steady_clock::duration assembly_check_interval =
        std::chrono::seconds(10);
    std::optional<GeoPosition> reference;
};

struct AggregatorStats {
    std::size_t frames_accepted = 0;
    std::size_t frames_dropped = 0;
    std::size_t assembly_completed = 0;
    std::size_t assembly_incomplete = 0;
    std::size_t stale_pairs = 0;
};

// Single writer: every ingest and snapshot call must come from the same
// thread (the io_context thread).
class Aggregator {
   public:
    Aggregator(boost::asio::io_context& io_context,
               const MessageDecoder& decoder,
               const AggregatorOptions& options = AggregatorOptions());

    // Validates a raw frame and forwards it to ingest(). Noise is dropped.
    void process_frame(const std::string& frame, double timestamp);
    void ingest(const std::string& address, const std::string& frame,
                double timestamp);

    Snapshot snapshot() const;

    // Counts aircraft whose assembly timed out. Runs periodically on the
    // timer but is callable directly.
    void check_assembly_timeouts(double now);
    void stop();

    const AggregatorStats& stats() const { return counters; }
    std::size_t size() const { return records.size(); }

   private:
    struct Tracked {
        std::shared_ptr<AircraftRecord> record;
        CprState cpr;
        bool assembly_done = false;
        bool assembly_timed_out = false;
    };

    void start_assembly_check();
    AircraftRecord& writable(Tracked& tracked);
    void update_position(Tracked& tracked, const std::string& frame,
                         double timestamp);
    void update_assembly(Tracked& tracked, double timestamp);

    const MessageDecoder& decoder;
    PositionResolver resolver;
    AggregatorOptions options;
    std::unordered_map<std::string, Tracked> records;
    boost::asio::steady_timer timer;
    AggregatorStats counters;
};

#endif  // AGGREGATOR_HPP
