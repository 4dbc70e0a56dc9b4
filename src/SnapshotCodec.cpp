#include "SnapshotCodec.hpp"

#include <memory>

using json = nlohmann::json;

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

// A field of the wrong type reads as absent.
template <typename T>
std::optional<T> optional_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        return it->get<T>();
    } catch (const json::type_error&) {
        return std::nullopt;
    }
}

AircraftRecord record_from_json(const std::string& address, const json& j) {
    AircraftRecord record;
    record.address = address;
    record.callsign = optional_field<std::string>(j, "callsign");
    record.altitude = optional_field<double>(j, "altitude");
    record.first_seen = optional_field<double>(j, "first_seen").value_or(0.0);
    record.last_update = optional_field<double>(j, "last_update").value_or(0.0);
    record.distance_nm = optional_field<double>(j, "distance_nm");
    record.distance_km = optional_field<double>(j, "distance_km");
    record.assembly_time_ms = optional_field<double>(j, "assembly_time_ms");
    record.stale_cpr_count = optional_field<int>(j, "stale_cpr_count").value_or(0);

    auto position = j.find("position");
    if (position != j.end() && position->is_object()) {
        auto lat = optional_field<double>(*position, "lat");
        auto lon = optional_field<double>(*position, "lon");
        if (lat && lon) {
            record.position = GeoPosition{*lat, *lon};
        }
    }

    auto velocity = j.find("velocity");
    if (velocity != j.end() && velocity->is_object()) {
        Velocity v;
        v.speed = optional_field<double>(*velocity, "speed").value_or(0.0);
        v.track = optional_field<double>(*velocity, "track").value_or(0.0);
        v.vertical_rate =
            optional_field<double>(*velocity, "vertical_rate").value_or(0.0);
        v.type = optional_field<std::string>(*velocity, "type").value_or("");
        record.velocity = v;
    }
    return record;
}

}  // namespace

json record_to_json(const AircraftRecord& record) {
    json j;
    j["icao"] = record.address;
    j["callsign"] = optional_to_json(record.callsign);
    if (record.position) {
        j["position"] = {{"lat", record.position->lat},
                         {"lon", record.position->lon}};
    } else {
        j["position"] = nullptr;
    }
    j["altitude"] = optional_to_json(record.altitude);
    if (record.velocity) {
        j["velocity"] = {{"speed", record.velocity->speed},
                         {"track", record.velocity->track},
                         {"vertical_rate", record.velocity->vertical_rate},
                         {"type", record.velocity->type}};
    } else {
        j["velocity"] = nullptr;
    }
    j["last_update"] = record.last_update;
    j["first_seen"] = record.first_seen;
    j["distance_nm"] = optional_to_json(record.distance_nm);
    j["distance_km"] = optional_to_json(record.distance_km);
    j["assembly_time_ms"] = optional_to_json(record.assembly_time_ms);
    j["stale_cpr_count"] = record.stale_cpr_count;
    return j;
}

std::string serialize_snapshot(const Snapshot& snapshot) {
    json j = json::object();
    if (snapshot) {
        for (const auto& entry : *snapshot) {
            j[entry.first] = record_to_json(*entry.second);
        }
    }
    return j.dump();
}

AircraftMap parse_snapshot(const std::string& payload) {
    json j = json::parse(payload);
    if (!j.is_object()) {
        throw MalformedSnapshot(std::string("expected an object keyed by "
                                            "address, got ") +
                                j.type_name());
    }

    AircraftMap aircraft;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_object()) {
            continue;
        }
        aircraft.emplace(it.key(), std::make_shared<const AircraftRecord>(
                                       record_from_json(it.key(), it.value())));
    }
    return aircraft;
}
