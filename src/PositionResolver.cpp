#include "PositionResolver.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace {

constexpr double kEarthRadiusNm = 3440.065;
constexpr double kKmPerNm = 1.852;
constexpr double kPi = 3.14159265358979323846;

double radians(double degrees) { return degrees * kPi / 180.0; }

}  // namespace

PositionResolver::PositionResolver(const MessageDecoder& decoder,
                                   double staleness_seconds)
    : decoder(decoder), staleness(staleness_seconds) {}

std::optional<GeoPosition> PositionResolver::update(
    CprState& state, const std::string& address, const std::string& frame,
    bool odd, double timestamp) const {
    (odd ? state.odd : state.even) = ParitySlot{frame, timestamp};

    if (!state.even || !state.odd) {
        return std::nullopt;
    }

    double delta = std::fabs(state.even->timestamp - state.odd->timestamp);
    if (delta > staleness) {
        // Keep only the frame that just arrived.
        (odd ? state.even : state.odd).reset();
        ++state.stale_pairs;
        if (should_log(state, timestamp)) {
            std::cerr << "Ignoring stale CPR pair for " << address
                      << " (delta " << delta << "s)" << std::endl;
        }
        return std::nullopt;
    }

    std::optional<GeoPosition> position;
    try {
        position = decoder.resolve_position(state.even->frame, state.odd->frame,
                                            state.even->timestamp,
                                            state.odd->timestamp);
    } catch (const std::exception& e) {
        std::cerr << "CPR decode error for " << address << ": " << e.what()
                  << std::endl;
    }

    if (!position) {
        if (should_log(state, timestamp)) {
            std::cerr << "Failed to resolve CPR position for " << address
                      << std::endl;
        }
        return std::nullopt;
    }

    state.last_failure_log = -std::numeric_limits<double>::infinity();
    return position;
}

bool PositionResolver::should_log(CprState& state, double timestamp) const {
    if (timestamp - state.last_failure_log <= kFailureLogIntervalSeconds) {
        return false;
    }
    state.last_failure_log = timestamp;
    return true;
}

double haversine_nm(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = radians(lat1);
    double phi2 = radians(lat2);
    double dphi = radians(lat2 - lat1);
    double dlambda = radians(lon2 - lon1);

    double a = std::pow(std::sin(dphi / 2.0), 2.0) +
               std::cos(phi1) * std::cos(phi2) *
                   std::pow(std::sin(dlambda / 2.0), 2.0);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return kEarthRadiusNm * c;
}

void annotate_distance(AircraftRecord& record,
                       const std::optional<GeoPosition>& reference) {
    if (!reference || !record.position) {
        record.distance_nm.reset();
        record.distance_km.reset();
        return;
    }
    double nm = haversine_nm(record.position->lat, record.position->lon,
                             reference->lat, reference->lon);
    record.distance_nm = nm;
    record.distance_km = nm * kKmPerNm;
}
