#ifndef SNAPSHOTCODEC_HPP
#define SNAPSHOTCODEC_HPP

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "AircraftRecord.hpp"

class MalformedSnapshot : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

nlohmann::json record_to_json(const AircraftRecord& record);
std::string serialize_snapshot(const Snapshot& snapshot);

// Throws nlohmann::json::exception on invalid JSON and MalformedSnapshot when
// the top level is not an object keyed by address. Entries that are not
// objects are skipped.
AircraftMap parse_snapshot(const std::string& payload);

#endif  // SNAPSHOTCODEC_HPP
