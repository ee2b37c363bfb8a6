#include "lumen/output/OpcEncoder.hpp"

#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/packet_schema.hpp"

namespace lumen::output {

unsigned short OpcEncoder::defaultPort() const {
    return config::OPC_PORT_DEFAULT;
}

std::size_t OpcEncoder::headerLength(const PacketAddress&) const {
    return config::OPC_HEADER_LENGTH;
}

std::size_t OpcEncoder::maxPoints(const PacketAddress&) const {
    return config::OPC_MAX_DATA_LENGTH / BYTES_PER_POINT;
}

expected<std::vector<std::uint8_t>> OpcEncoder::buildHeader(const PacketAddress& address,
                                                            std::size_t pointCount) const {
    if (pointCount > maxPoints(address)) {
        return unexpected(errc::encoding_length_mismatch);
    }

    schema::OpcHeader header;
    header.channel = address.channel;
    header.length = static_cast<std::uint16_t>(pointCount * BYTES_PER_POINT);
    return schema::encodeHeader(schema::opcSchema, header, "OPC");
}

} // namespace lumen::output
