#include "lumen/output/SacnEncoder.hpp"

#include <cstring>
#include <string>

#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/packet_schema.hpp"

namespace lumen::output {

namespace {

constexpr std::size_t SEQUENCE_OFFSET = 111;
constexpr std::uint16_t FLAGS = 0x7000;

// PDU lengths run from the start of each layer to the end of the packet.
constexpr std::uint16_t ROOT_LAYER_LENGTH = 110;
constexpr std::uint16_t FRAMING_LAYER_LENGTH = 88;
constexpr std::uint16_t DMP_LAYER_LENGTH = 11;

} // namespace

unsigned short SacnEncoder::defaultPort() const {
    return config::SACN_PORT_DEFAULT;
}

std::size_t SacnEncoder::headerLength(const PacketAddress&) const {
    return config::SACN_HEADER_LENGTH;
}

std::size_t SacnEncoder::maxPoints(const PacketAddress&) const {
    return config::SACN_MAX_DATA_LENGTH / BYTES_PER_POINT;
}

expected<std::vector<std::uint8_t>> SacnEncoder::buildHeader(const PacketAddress& address,
                                                             std::size_t pointCount) const {
    if (pointCount > maxPoints(address)) {
        return unexpected(errc::encoding_length_mismatch);
    }
    if (address.universe < 1 || address.universe > config::SACN_MAX_UNIVERSE) {
        return unexpected(errc::invalid_parameter);
    }

    const auto dataLength = static_cast<std::uint16_t>(pointCount * BYTES_PER_POINT);

    schema::SacnHeader header;
    header.rootFlagsLength = static_cast<std::uint16_t>(FLAGS | (ROOT_LAYER_LENGTH + dataLength));
    header.framingFlagsLength = static_cast<std::uint16_t>(FLAGS | (FRAMING_LAYER_LENGTH + dataLength));
    header.dmpFlagsLength = static_cast<std::uint16_t>(FLAGS | (DMP_LAYER_LENGTH + dataLength));
    header.propertyValueCount = static_cast<std::uint16_t>(dataLength + 1);
    header.universe = static_cast<std::uint16_t>(address.universe);
    std::strncpy(header.sourceName.data(), config::SACN_SOURCE_NAME, header.sourceName.size() - 1);
    return schema::encodeHeader(schema::sacnSchema, header, "sACN");
}

std::string SacnEncoder::defaultHost(const PacketAddress& address) const {
    const auto hi = (address.universe >> 8) & 0xFFu;
    const auto lo = address.universe & 0xFFu;
    return "239.255." + std::to_string(hi) + "." + std::to_string(lo);
}

void SacnEncoder::stampSequence(std::uint8_t* header, std::uint8_t sequence) const {
    header[SEQUENCE_OFFSET] = sequence;
}

} // namespace lumen::output
