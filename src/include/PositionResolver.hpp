#ifndef POSITIONRESOLVER_HPP
#define POSITIONRESOLVER_HPP

#include <limits>
#include <optional>
#include <string>

#include "AircraftRecord.hpp"
#include "MessageDecoder.hpp"

struct ParitySlot {
    std::string frame;
    double timestamp = 0.0;
};

// Per-aircraft pairing state. Lives inside the aggregator.
struct CprState {
    std::optional<ParitySlot> even;
    std::optional<ParitySlot> odd;
    int stale_pairs = 0;
    double last_failure_log = -std::numeric_limits<double>::infinity();
};

class PositionResolver {
   public:
    static constexpr double kDefaultStalenessSeconds = 10.0;
    static constexpr double kFailureLogIntervalSeconds = 30.0;

    explicit PositionResolver(const MessageDecoder& decoder,
                              double staleness_seconds = kDefaultStalenessSeconds);

    std::optional<GeoPosition> update(CprState& state,
                                      const std::string& address,
                                      const std::string& frame, bool odd,
                                      double timestamp) const;

    double staleness_seconds() const { return staleness; }

   private:
    bool should_log(CprState& state, double timestamp) const;

    const MessageDecoder& decoder;
    double staleness;
};

double haversine_nm(double lat1, double lon1, double lat2, double lon2);

// Sets distance_nm/distance_km from the record's position to the reference,
// or clears them when either is missing.
void annotate_distance(AircraftRecord& record,
                       const std::optional<GeoPosition>& reference);

#endif  // POSITIONRESOLVER_HPP
