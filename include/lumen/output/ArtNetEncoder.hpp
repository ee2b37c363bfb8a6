#pragma once

#include "lumen/output/PacketEncoder.hpp"

namespace lumen::output {

/// Art-Net ArtDmx encoder. The DMX body is padded to an even length of at least two.
class ArtNetEncoder : public PacketEncoder {
public:
    Protocol protocol() const override { return Protocol::ArtNet; }
    unsigned short defaultPort() const override;
    std::size_t headerLength(const PacketAddress& address) const override;
    std::size_t maxPoints(const PacketAddress& address) const override;
    std::size_t packetLength(const PacketAddress& address, std::size_t pointCount) const override;
    expected<std::vector<std::uint8_t>> buildHeader(const PacketAddress& address,
                                                    std::size_t pointCount) const override;

protected:
    void stampSequence(std::uint8_t* header, std::uint8_t sequence) const override;
};

} // namespace lumen::output
