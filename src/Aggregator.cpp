#include "Aggregator.hpp"

#include <iostream>
#include <stdexcept>

#include "TimeUtils.hpp"

namespace {

bool is_identification(int tc) { return tc >= 1 && tc <= 4; }
bool is_surface_position(int tc) { return tc >= 5 && tc <= 8; }
bool is_airborne_position(int tc) { return tc >= 9 && tc <= 18; }
bool is_airborne_velocity(int tc) { return tc == 19; }

}  // namespace

Aggregator::Aggregator(boost::asio::io_context& io_context,
                       const MessageDecoder& decoder,
                       const AggregatorOptions& options)
    : decoder(decoder),
      resolver(decoder, options.cpr_staleness_seconds),
      options(options),
      timer(io_context) {
    start_assembly_check();
}

void Aggregator::process_frame(const std::string& frame, double timestamp) {
    if (frame.size() != kExtendedSquitterHexLength) {
        ++counters.frames_dropped;
        return;
    }

    std::string address;
    try {
        if (!decoder.crc_valid(frame) || decoder.downlink_format(frame) != 17) {
            ++counters.frames_dropped;
            return;
        }
        address = decoder.address(frame);
    } catch (const std::invalid_argument&) {
        ++counters.frames_dropped;
        return;
    }

    ingest(address, frame, timestamp);
}

void Aggregator::ingest(const std::string& address, const std::string& frame,
                        double timestamp) {
    int tc = 0;
    try {
        tc = decoder.typecode(frame);
    } catch (const std::invalid_argument&) {
        ++counters.frames_dropped;
        return;
    }
    if (!is_identification(tc) && !is_surface_position(tc) &&
        !is_airborne_position(tc) && !is_airborne_velocity(tc)) {
        ++counters.frames_dropped;
        return;
    }

    auto it = records.find(address);
    if (it == records.end()) {
        Tracked tracked;
        tracked.record = std::make_shared<AircraftRecord>();
        tracked.record->address = address;
        tracked.record->first_seen = timestamp;
        tracked.record->last_update = timestamp;
        it = records.emplace(address, std::move(tracked)).first;
    }
    Tracked& tracked = it->second;

    AircraftRecord& record = writable(tracked);
    if (timestamp < record.first_seen) {
        record.first_seen = timestamp;
    }
    record.last_update = timestamp;

    try {
        if (is_identification(tc)) {
            if (auto callsign = decoder.callsign(frame)) {
                record.callsign = *callsign;
            }
        } else if (is_surface_position(tc)) {
            update_position(tracked, frame, timestamp);
            if (auto velocity = decoder.surface_velocity(frame)) {
                writable(tracked).velocity = *velocity;
            }
        } else if (is_airborne_position(tc)) {
            if (auto altitude = decoder.altitude(frame)) {
                record.altitude = *altitude;
            }
            update_position(tracked, frame, timestamp);
        } else {
            if (auto velocity = decoder.airborne_velocity(frame)) {
                record.velocity = *velocity;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Dropping undecodable frame " << frame << ": " << e.what()
                  << std::endl;
        ++counters.frames_dropped;
        return;
    }

    ++counters.frames_accepted;
    update_assembly(tracked, timestamp);
}

Snapshot Aggregator::snapshot() const {
    auto view = std::make_shared<AircraftMap>();
    for (const auto& entry : records) {
        view->emplace(entry.first, entry.second.record);
    }
    return view;
}

AircraftRecord& Aggregator::writable(Tracked& tracked) {
    // A snapshot still references this record; copy before writing.
    if (tracked.record.use_count() > 1) {
        tracked.record = std::make_shared<AircraftRecord>(*tracked.record);
    }
    return *tracked.record;
}

void Aggregator::update_position(Tracked& tracked, const std::string& frame,
                                 double timestamp) {
    auto odd = decoder.odd_parity(frame);
    if (!odd) {
        return;
    }

    AircraftRecord& record = writable(tracked);
    auto position =
        resolver.update(tracked.cpr, record.address, frame, *odd, timestamp);

    if (tracked.cpr.stale_pairs != record.stale_cpr_count) {
        counters.stale_pairs += static_cast<std::size_t>(
            tracked.cpr.stale_pairs - record.stale_cpr_count);
        record.stale_cpr_count = tracked.cpr.stale_pairs;
    }
    if (!position) {
        return;
    }

    record.position = *position;
    annotate_distance(record, options.reference);
}

void Aggregator::update_assembly(Tracked& tracked, double timestamp) {
    if (tracked.assembly_done || tracked.assembly_timed_out) {
        return;
    }

    const AircraftRecord& record = *tracked.record;
    if (record.callsign && record.position && record.altitude &&
        record.velocity) {
        tracked.assembly_done = true;
        writable(tracked).assembly_time_ms =
            (timestamp - record.first_seen) * 1000.0;
        ++counters.assembly_completed;
        return;
    }

    if (timestamp - record.first_seen > options.assembly_timeout_seconds) {
        tracked.assembly_timed_out = true;
        ++counters.assembly_incomplete;
    }
}

void Aggregator::check_assembly_timeouts(double now) {
    for (auto& entry : records) {
        Tracked& tracked = entry.second;
        if (tracked.assembly_done || tracked.assembly_timed_out) {
            continue;
        }
        if (now - tracked.record->first_seen >
            options.assembly_timeout_seconds) {
            tracked.assembly_timed_out = true;
            ++counters.assembly_incomplete;
            std::cout << "Assembly incomplete for " << entry.first
                      << " after " << options.assembly_timeout_seconds << "s"
                      << std::endl;
        }
    }
}

void Aggregator::stop() { timer.cancel(); }

void Aggregator::start_assembly_check() {
    timer.expires_after(options.assembly_check_interval);
    timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            check_assembly_timeouts(now_seconds());
            start_assembly_check();
        }
    });
}
