#ifndef AIRCRAFTRECORD_HPP
#define AIRCRAFTRECORD_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "MessageDecoder.hpp"

struct AircraftRecord {
    std::string address;
    std::optional<std::string> callsign;
    std::optional<GeoPosition> position;
    std::optional<double> altitude;
    std::optional<Velocity> velocity;
    double first_seen = 0.0;
    double last_update = 0.0;
    std::optional<double> distance_nm;
    std::optional<double> distance_km;
    std::optional<double> assembly_time_ms;
    int stale_cpr_count = 0;
};

// Immutable point-in-time view keyed by address. Records are shared with
// the aggregator, which clones a record before mutating it while a snapshot
// still holds it.
using AircraftMap = std::map<std::string, std::shared_ptr<const AircraftRecord>>;
using Snapshot = std::shared_ptr<const AircraftMap>;

#endif  // AIRCRAFTRECORD_HPP
