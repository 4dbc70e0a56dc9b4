#ifndef MODESDECODER_HPP
#define MODESDECODER_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "MessageDecoder.hpp"

// DF17 extended squitter decoder. Surface positions need a reference
// coordinate to pick the right 90 degree quadrant; without one they never
// resolve.
class ModesDecoder : public MessageDecoder {
   public:
    static constexpr std::size_t kFrameHexLength = kExtendedSquitterHexLength;

    explicit ModesDecoder(std::optional<GeoPosition> reference = std::nullopt);

    bool crc_valid(const std::string& frame) const override;
    int downlink_format(const std::string& frame) const override;
    std::string address(const std::string& frame) const override;
    int typecode(const std::string& frame) const override;

    std::optional<std::string> callsign(
        const std::string& frame) const override;
    std::optional<double> altitude(const std::string& frame) const override;
    std::optional<bool> odd_parity(const std::string& frame) const override;
    std::optional<Velocity> airborne_velocity(
        const std::string& frame) const override;
    std::optional<Velocity> surface_velocity(
        const std::string& frame) const override;

    std::optional<GeoPosition> resolve_position(
        const std::string& even_frame, const std::string& odd_frame,
        double even_time, double odd_time) const override;

    static int cpr_nl(double lat);

   private:
    using Bytes = std::array<std::uint8_t, kFrameHexLength / 2>;

    static Bytes to_bytes(const std::string& frame);
    static std::uint32_t bits(const Bytes& bytes, int first, int count);
    static std::uint32_t crc24(const Bytes& bytes);

    std::optional<GeoPosition> airborne_position(const Bytes& even,
                                                 const Bytes& odd,
                                                 bool even_newer) const;
    std::optional<GeoPosition> surface_position(const Bytes& even,
                                                const Bytes& odd,
                                                bool even_newer) const;

    std::optional<GeoPosition> reference;
};

#endif  // MODESDECODER_HPP
