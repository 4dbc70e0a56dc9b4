#ifndef MESSAGEDECODER_HPP
#define MESSAGEDECODER_HPP

#include <cstddef>
#include <optional>
#include <string>

constexpr std::size_t kExtendedSquitterHexLength = 28;

struct GeoPosition {
    double lat = 0.0;
    double lon = 0.0;
};

struct Velocity {
    double speed = 0.0;
    double track = 0.0;
    double vertical_rate = 0.0;
    std::string type;
};

// Field extraction over a single 112-bit extended squitter, given as a
// 28 character hex string.
class MessageDecoder {
   public:
    virtual ~MessageDecoder() = default;

    virtual bool crc_valid(const std::string& frame) const = 0;
    virtual int downlink_format(const std::string& frame) const = 0;
    virtual std::string address(const std::string& frame) const = 0;
    virtual int typecode(const std::string& frame) const = 0;

    virtual std::optional<std::string> callsign(
        const std::string& frame) const = 0;
    virtual std::optional<double> altitude(const std::string& frame) const = 0;
    // CPR format bit: true for odd frames.
    virtual std::optional<bool> odd_parity(const std::string& frame) const = 0;
    virtual std::optional<Velocity> airborne_velocity(
        const std::string& frame) const = 0;
    virtual std::optional<Velocity> surface_velocity(
        const std::string& frame) const = 0;

    // Global position from an even/odd pair. Returns nullopt when the pair
    // is inconsistent (latitude zones differ, mixed surface/airborne, ...).
    virtual std::optional<GeoPosition> resolve_position(
        const std::string& even_frame, const std::string& odd_frame,
        double even_time, double odd_time) const = 0;
};

#endif  // MESSAGEDECODER_HPP
