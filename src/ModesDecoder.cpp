#include "ModesDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kCprScale = 131072.0;  // 2^17
constexpr std::uint32_t kCrcGenerator = 0xFFF409;

const char kCallsignCharset[] =
    "#ABCDEFGHIJKLMNOPQRSTUVWXYZ##### ###############0123456789######";

int floor_mod(int a, int b) {
    int r = a % b;
    return r < 0 ? r + b : r;
}

double round5(double value) { return std::round(value * 1e5) / 1e5; }

bool well_formed(const std::string& frame) {
    return frame.size() == ModesDecoder::kFrameHexLength &&
           std::all_of(frame.begin(), frame.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

// Ground speed in knots from the 7 bit surface movement field.
std::optional<double> surface_movement_speed(std::uint32_t mov) {
    if (mov == 0 || mov > 124) {
        return std::nullopt;
    }
    if (mov == 1) return 0.0;
    if (mov <= 8) return 0.125 + (mov - 2) * 0.125;
    if (mov <= 12) return 1.0 + (mov - 9) * 0.25;
    if (mov <= 38) return 2.0 + (mov - 13) * 0.5;
    if (mov <= 93) return 15.0 + (mov - 39) * 1.0;
    if (mov <= 108) return 70.0 + (mov - 94) * 2.0;
    if (mov <= 123) return 100.0 + (mov - 109) * 5.0;
    return 175.0;
}

}  // namespace

ModesDecoder::ModesDecoder(std::optional<GeoPosition> reference)
    : reference(reference) {}

ModesDecoder::Bytes ModesDecoder::to_bytes(const std::string& frame) {
    if (!well_formed(frame)) {
        throw std::invalid_argument("not a 112 bit hex frame: " + frame);
    }
    Bytes bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>(
            std::stoul(frame.substr(i * 2, 2), nullptr, 16));
    }
    return bytes;
}

std::uint32_t ModesDecoder::bits(const Bytes& bytes, int first, int count) {
    std::uint32_t value = 0;
    for (int i = first; i < first + count; ++i) {
        value = (value << 1) | ((bytes[i / 8] >> (7 - i % 8)) & 1u);
    }
    return value;
}

std::uint32_t ModesDecoder::crc24(const Bytes& bytes) {
    std::uint32_t crc = 0;
    for (int i = 0; i < 88; ++i) {
        std::uint32_t bit = bits(bytes, i, 1);
        std::uint32_t top = (crc >> 23) & 1u;
        crc = (crc << 1) & 0xFFFFFF;
        if (top ^ bit) {
            crc ^= kCrcGenerator;
        }
    }
    return crc;
}

bool ModesDecoder::crc_valid(const std::string& frame) const {
    if (!well_formed(frame)) {
        return false;
    }
    Bytes bytes = to_bytes(frame);
    return crc24(bytes) == bits(bytes, 88, 24);
}

int ModesDecoder::downlink_format(const std::string& frame) const {
    return static_cast<int>(bits(to_bytes(frame), 0, 5));
}

std::string ModesDecoder::address(const std::string& frame) const {
    if (!well_formed(frame)) {
        throw std::invalid_argument("not a 112 bit hex frame: " + frame);
    }
    std::string icao = frame.substr(2, 6);
    std::transform(icao.begin(), icao.end(), icao.begin(), [](char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    return icao;
}

int ModesDecoder::typecode(const std::string& frame) const {
    return static_cast<int>(bits(to_bytes(frame), 32, 5));
}

std::optional<std::string> ModesDecoder::callsign(
    const std::string& frame) const {
    int tc = typecode(frame);
    if (tc < 1 || tc > 4) {
        return std::nullopt;
    }
    Bytes bytes = to_bytes(frame);
    std::string result;
    for (int i = 0; i < 8; ++i) {
        char c = kCallsignCharset[bits(bytes, 40 + 6 * i, 6)];
        if (c != '#') {
            result.push_back(c);
        }
    }
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::optional<double> ModesDecoder::altitude(const std::string& frame) const {
    std::uint32_t n = bits(to_bytes(frame), 40, 12);
    // Q=0 means 100 ft Gillham coding, which is not decoded.
    if (n == 0 || ((n >> 4) & 1u) == 0) {
        return std::nullopt;
    }
    n = ((n >> 5) << 4) | (n & 0xF);
    return static_cast<double>(n) * 25.0 - 1000.0;
}

std::optional<bool> ModesDecoder::odd_parity(const std::string& frame) const {
    int tc = typecode(frame);
    if (tc < 5 || tc > 18) {
        return std::nullopt;
    }
    return bits(to_bytes(frame), 53, 1) == 1u;
}

std::optional<Velocity> ModesDecoder::airborne_velocity(
    const std::string& frame) const {
    Bytes bytes = to_bytes(frame);
    std::uint32_t subtype = bits(bytes, 37, 3);
    Velocity velocity;

    if (subtype == 1 || subtype == 2) {
        std::uint32_t v_ew = bits(bytes, 46, 10);
        std::uint32_t v_ns = bits(bytes, 57, 10);
        if (v_ew == 0 || v_ns == 0) {
            return std::nullopt;
        }
        double ew = static_cast<double>(v_ew) - 1.0;
        double ns = static_cast<double>(v_ns) - 1.0;
        if (bits(bytes, 45, 1)) ew = -ew;
        if (bits(bytes, 56, 1)) ns = -ns;
        if (subtype == 2) {
            ew *= 4.0;
            ns *= 4.0;
        }
        velocity.speed = std::hypot(ew, ns);
        double track = std::atan2(ew, ns) * 180.0 / kPi;
        velocity.track = track < 0.0 ? track + 360.0 : track;
        velocity.type = "GS";
    } else if (subtype == 3 || subtype == 4) {
        std::uint32_t airspeed = bits(bytes, 57, 10);
        if (airspeed == 0) {
            return std::nullopt;
        }
        velocity.speed = static_cast<double>(airspeed) - 1.0;
        if (subtype == 4) {
            velocity.speed *= 4.0;
        }
        if (bits(bytes, 45, 1)) {
            velocity.track = bits(bytes, 46, 10) * 360.0 / 1024.0;
        }
        velocity.type = bits(bytes, 56, 1) ? "TAS" : "IAS";
    } else {
        return std::nullopt;
    }

    std::uint32_t vr = bits(bytes, 69, 9);
    if (vr != 0) {
        velocity.vertical_rate = (static_cast<double>(vr) - 1.0) * 64.0;
        if (bits(bytes, 68, 1)) {
            velocity.vertical_rate = -velocity.vertical_rate;
        }
    }
    return velocity;
}

std::optional<Velocity> ModesDecoder::surface_velocity(
    const std::string& frame) const {
    Bytes bytes = to_bytes(frame);
    auto speed = surface_movement_speed(bits(bytes, 37, 7));
    if (!speed) {
        return std::nullopt;
    }
    Velocity velocity;
    velocity.speed = *speed;
    if (bits(bytes, 44, 1)) {
        velocity.track = bits(bytes, 45, 7) * 360.0 / 128.0;
    }
    velocity.type = "GS";
    return velocity;
}

int ModesDecoder::cpr_nl(double lat) {
    lat = std::fabs(lat);
    if (lat == 0.0) return 59;
    if (lat == 87.0) return 2;
    if (lat > 87.0) return 1;

    const double nz = 15.0;
    double a = 1.0 - std::cos(kPi / (2.0 * nz));
    double b = std::pow(std::cos(kPi / 180.0 * lat), 2.0);
    return static_cast<int>(std::floor(2.0 * kPi / std::acos(1.0 - a / b)));
}

std::optional<GeoPosition> ModesDecoder::resolve_position(
    const std::string& even_frame, const std::string& odd_frame,
    double even_time, double odd_time) const {
    int tc_even = typecode(even_frame);
    int tc_odd = typecode(odd_frame);
    bool even_surface = tc_even >= 5 && tc_even <= 8;
    bool odd_surface = tc_odd >= 5 && tc_odd <= 8;
    if (even_surface != odd_surface) {
        return std::nullopt;
    }

    Bytes even = to_bytes(even_frame);
    Bytes odd = to_bytes(odd_frame);
    bool even_newer = even_time > odd_time;
    return even_surface ? surface_position(even, odd, even_newer)
                        : airborne_position(even, odd, even_newer);
}

std::optional<GeoPosition> ModesDecoder::airborne_position(
    const Bytes& even, const Bytes& odd, bool even_newer) const {
    double lat_e = bits(even, 54, 17) / kCprScale;
    double lon_e = bits(even, 71, 17) / kCprScale;
    double lat_o = bits(odd, 54, 17) / kCprScale;
    double lon_o = bits(odd, 71, 17) / kCprScale;

    int j = static_cast<int>(std::floor(59.0 * lat_e - 60.0 * lat_o + 0.5));
    double rlat_e = 360.0 / 60.0 * (floor_mod(j, 60) + lat_e);
    double rlat_o = 360.0 / 59.0 * (floor_mod(j, 59) + lat_o);
    if (rlat_e >= 270.0) rlat_e -= 360.0;
    if (rlat_o >= 270.0) rlat_o -= 360.0;

    if (cpr_nl(rlat_e) != cpr_nl(rlat_o)) {
        return std::nullopt;
    }

    GeoPosition position;
    int nl = cpr_nl(even_newer ? rlat_e : rlat_o);
    int ni = even_newer ? std::max(nl, 1) : std::max(nl - 1, 1);
    int m = static_cast<int>(
        std::floor(lon_e * (nl - 1) - lon_o * nl + 0.5));
    position.lat = even_newer ? rlat_e : rlat_o;
    position.lon = 360.0 / ni * (floor_mod(m, ni) + (even_newer ? lon_e : lon_o));
    if (position.lon > 180.0) {
        position.lon -= 360.0;
    }

    position.lat = round5(position.lat);
    position.lon = round5(position.lon);
    return position;
}

std::optional<GeoPosition> ModesDecoder::surface_position(
    const Bytes& even, const Bytes& odd, bool even_newer) const {
    if (!reference) {
        return std::nullopt;
    }

    double lat_e = bits(even, 54, 17) / kCprScale;
    double lon_e = bits(even, 71, 17) / kCprScale;
    double lat_o = bits(odd, 54, 17) / kCprScale;
    double lon_o = bits(odd, 71, 17) / kCprScale;

    int j = static_cast<int>(std::floor(59.0 * lat_e - 60.0 * lat_o + 0.5));
    double rlat_e = 90.0 / 60.0 * (floor_mod(j, 60) + lat_e);
    double rlat_o = 90.0 / 59.0 * (floor_mod(j, 59) + lat_o);
    // Each latitude has a northern and a southern solution.
    if (reference->lat <= 0.0) {
        rlat_e -= 90.0;
        rlat_o -= 90.0;
    }

    if (cpr_nl(rlat_e) != cpr_nl(rlat_o)) {
        return std::nullopt;
    }

    int nl = cpr_nl(even_newer ? rlat_e : rlat_o);
    int ni = even_newer ? std::max(nl, 1) : std::max(nl - 1, 1);
    int m = static_cast<int>(
        std::floor(lon_e * (nl - 1) - lon_o * nl + 0.5));
    double lon = 90.0 / ni * (floor_mod(m, ni) + (even_newer ? lon_e : lon_o));

    // Four candidate longitudes, 90 degrees apart; keep the one nearest the
    // reference.
    double best = lon;
    double best_distance = 360.0;
    for (int quadrant = 0; quadrant < 4; ++quadrant) {
        double candidate = std::fmod(lon + 90.0 * quadrant + 180.0, 360.0);
        if (candidate < 0.0) candidate += 360.0;
        candidate -= 180.0;
        double distance = std::fabs(candidate - reference->lon);
        if (distance > 180.0) distance = 360.0 - distance;
        if (distance < best_distance) {
            best_distance = distance;
            best = candidate;
        }
    }

    GeoPosition position;
    position.lat = round5(even_newer ? rlat_e : rlat_o);
    position.lon = round5(best);
    return position;
}
