#include "lumen/output/DdpEncoder.hpp"

#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/packet_schema.hpp"

namespace lumen::output {

namespace {
constexpr std::size_t SEQUENCE_OFFSET = 1;
constexpr std::uint8_t SEQUENCE_MODULUS = 15;
}

unsigned short DdpEncoder::defaultPort() const {
    return config::DDP_PORT_DEFAULT;
}

std::size_t DdpEncoder::headerLength(const PacketAddress&) const {
    return config::DDP_HEADER_LENGTH;
}

std::size_t DdpEncoder::maxPoints(const PacketAddress&) const {
    return config::DDP_MAX_DATA_LENGTH / BYTES_PER_POINT;
}

expected<std::vector<std::uint8_t>> DdpEncoder::buildHeader(const PacketAddress& address,
                                                            std::size_t pointCount) const {
    if (pointCount > maxPoints(address)) {
        return unexpected(errc::encoding_length_mismatch);
    }

    schema::DdpHeader header;
    header.offset = address.dataOffset;
    header.length = static_cast<std::uint16_t>(pointCount * BYTES_PER_POINT);
    return schema::encodeHeader(schema::ddpSchema, header, "DDP");
}

void DdpEncoder::stampSequence(std::uint8_t* header, std::uint8_t sequence) const {
    // 4-bit sequence, 1..15; zero means the receiver ignores sequencing.
    if (sequence == 0) {
        header[SEQUENCE_OFFSET] = 0;
        return;
    }
    header[SEQUENCE_OFFSET] = static_cast<std::uint8_t>((sequence - 1) % SEQUENCE_MODULUS + 1);
}

} // namespace lumen::output
