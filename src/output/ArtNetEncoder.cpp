#include "lumen/output/ArtNetEncoder.hpp"

#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/packet_schema.hpp"

namespace lumen::output {

namespace {

constexpr std::size_t SEQUENCE_OFFSET = 12;

std::size_t paddedDataLength(std::size_t pointCount) {
    std::size_t length = pointCount * BYTES_PER_POINT;
    if (length % 2 != 0) ++length;
    return length < 2 ? 2 : length;
}

} // namespace

unsigned short ArtNetEncoder::defaultPort() const {
    return config::ARTNET_PORT_DEFAULT;
}

std::size_t ArtNetEncoder::headerLength(const PacketAddress&) const {
    return config::ARTNET_HEADER_LENGTH;
}

std::size_t ArtNetEncoder::maxPoints(const PacketAddress&) const {
    return config::ARTNET_MAX_DATA_LENGTH / BYTES_PER_POINT;
}

std::size_t ArtNetEncoder::packetLength(const PacketAddress&, std::size_t pointCount) const {
    return config::ARTNET_HEADER_LENGTH + paddedDataLength(pointCount);
}

expected<std::vector<std::uint8_t>> ArtNetEncoder::buildHeader(const PacketAddress& address,
                                                               std::size_t pointCount) const {
    if (pointCount > maxPoints(address)) {
        return unexpected(errc::encoding_length_mismatch);
    }
    if (address.universe > config::ARTNET_MAX_UNIVERSE) {
        return unexpected(errc::invalid_parameter);
    }

    schema::ArtNetDmxHeader header;
    header.universe = static_cast<std::uint16_t>(address.universe);
    header.length = static_cast<std::uint16_t>(paddedDataLength(pointCount));
    return schema::encodeHeader(schema::artNetDmxSchema, header, "Art-Net");
}

void ArtNetEncoder::stampSequence(std::uint8_t* header, std::uint8_t sequence) const {
    header[SEQUENCE_OFFSET] = sequence;
}

} // namespace lumen::output
