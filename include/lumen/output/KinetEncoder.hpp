#pragma once

#include "lumen/output/PacketEncoder.hpp"

namespace lumen::output {

/**
 * @brief Color Kinetics KiNET v1 encoder.
 *
 * Both framings carry a fixed 512-byte DMX body; unused channels are sent as
 * zero. PORTOUT addresses a physical output port on the power supply, DMXOUT
 * addresses the whole supply. KiNET v1 has no sequence numbering, the
 * sequence field stays zero.
 */
class KinetEncoder : public PacketEncoder {
public:
    Protocol protocol() const override { return Protocol::Kinet; }
    unsigned short defaultPort() const override;
    std::size_t headerLength(const PacketAddress& address) const override;
    std::size_t maxPoints(const PacketAddress& address) const override;
    std::size_t packetLength(const PacketAddress& address, std::size_t pointCount) const override;
    expected<std::vector<std::uint8_t>> buildHeader(const PacketAddress& address,
                                                    std::size_t pointCount) const override;
};

} // namespace lumen::output
