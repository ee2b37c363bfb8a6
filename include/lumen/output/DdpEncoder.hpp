#pragma once

#include "lumen/output/PacketEncoder.hpp"

namespace lumen::output {

/**
 * @brief Distributed Display Protocol v1 encoder (RGB, 8 bits per channel).
 *
 * Every packet sets the push flag. Large fixtures are split across several
 * packets, each addressed by its byte offset into the display buffer.
 */
class DdpEncoder : public PacketEncoder {
public:
    Protocol protocol() const override { return Protocol::Ddp; }
    unsigned short defaultPort() const override;
    std::size_t headerLength(const PacketAddress& address) const override;
    std::size_t maxPoints(const PacketAddress& address) const override;
    expected<std::vector<std::uint8_t>> buildHeader(const PacketAddress& address,
                                                    std::size_t pointCount) const override;

protected:
    void stampSequence(std::uint8_t* header, std::uint8_t sequence) const override;
};

} // namespace lumen::output
