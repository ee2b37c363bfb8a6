#pragma once

#include "lumen/output/PacketEncoder.hpp"

namespace lumen::output {

/// Open Pixel Control "set pixel colours" message, one message per UDP datagram.
class OpcEncoder : public PacketEncoder {
public:
    Protocol protocol() const override { return Protocol::Opc; }
    unsigned short defaultPort() const override;
    std::size_t headerLength(const PacketAddress& address) const override;
    std::size_t maxPoints(const PacketAddress& address) const override;
    expected<std::vector<std::uint8_t>> buildHeader(const PacketAddress& address,
                                                    std::size_t pointCount) const override;
};

} // namespace lumen::output
