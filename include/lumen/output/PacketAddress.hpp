#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "lumen/output/Protocol.hpp"

namespace lumen::output {

/**
 * @brief Protocol-level addressing of one packet.
 *
 * Only the fields relevant to @ref protocol are read by its encoder:
 * - KiNET:   kinetVersion, kinetPort (PORTOUT only)
 * - Art-Net: universe (15-bit port address)
 * - sACN:    universe (1..63999)
 * - OPC:     channel
 * - DDP:     dataOffset (byte offset into the receiver frame)
 */
struct PacketAddress {
    Protocol protocol = Protocol::None;
    KinetVersion kinetVersion = KinetVersion::PortOut;
    std::uint32_t universe = 0;
    std::uint8_t kinetPort = 1;
    std::uint8_t channel = 0;
    std::uint32_t dataOffset = 0;
    ByteOrder byteOrder = ByteOrder::RGB;
};

/// Network destination; an empty host or zero port selects the encoder default.
struct Destination {
    std::string host;
    unsigned short port = 0;
};

inline bool operator==(const Destination& a, const Destination& b) {
    return a.host == b.host && a.port == b.port;
}

inline bool operator!=(const Destination& a, const Destination& b) {
    return !(a == b);
}

} // namespace lumen::output
