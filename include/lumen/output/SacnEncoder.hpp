#pragma once

#include "lumen/output/PacketEncoder.hpp"

namespace lumen::output {

/**
 * @brief E1.31 (streaming ACN) data packet encoder.
 *
 * Without an explicit host, packets go to the universe's multicast group
 * 239.255.<hi>.<lo>. Universe 0 is reserved by the standard and rejected.
 */
class SacnEncoder : public PacketEncoder {
public:
    Protocol protocol() const override { return Protocol::Sacn; }
    unsigned short defaultPort() const override;
    std::size_t headerLength(const PacketAddress& address) const override;
    std::size_t maxPoints(const PacketAddress& address) const override;
    expected<std::vector<std::uint8_t>> buildHeader(const PacketAddress& address,
                                                    std::size_t pointCount) const override;
    std::string defaultHost(const PacketAddress& address) const override;

protected:
    void stampSequence(std::uint8_t* header, std::uint8_t sequence) const override;
};

} // namespace lumen::output
