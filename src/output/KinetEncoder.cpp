#include "lumen/output/KinetEncoder.hpp"

#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/packet_schema.hpp"

namespace lumen::output {

unsigned short KinetEncoder::defaultPort() const {
    return config::KINET_PORT_DEFAULT;
}

std::size_t KinetEncoder::headerLength(const PacketAddress& address) const {
    return address.kinetVersion == KinetVersion::DmxOut
        ? config::KINET_DMXOUT_HEADER_LENGTH
        : config::KINET_PORTOUT_HEADER_LENGTH;
}

std::size_t KinetEncoder::maxPoints(const PacketAddress&) const {
    return config::KINET_DATA_LENGTH / BYTES_PER_POINT;
}

std::size_t KinetEncoder::packetLength(const PacketAddress& address, std::size_t) const {
    return headerLength(address) + config::KINET_DATA_LENGTH;
}

expected<std::vector<std::uint8_t>> KinetEncoder::buildHeader(const PacketAddress& address,
                                                              std::size_t pointCount) const {
    if (pointCount > maxPoints(address)) {
        return unexpected(errc::encoding_length_mismatch);
    }

    if (address.kinetVersion == KinetVersion::DmxOut) {
        schema::KinetDmxOutHeader header;
        return schema::encodeHeader(schema::kinetDmxOutSchema, header, "KiNET");
    }

    schema::KinetPortOutHeader header;
    header.port = address.kinetPort;
    return schema::encodeHeader(schema::kinetPortOutSchema, header, "KiNET");
}

} // namespace lumen::output
