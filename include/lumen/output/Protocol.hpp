#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lumen::output {

/// Output datagram protocols.
enum class Protocol : std::uint8_t {
    None = 0, // no network output
    ArtNet,   // Art-Net ArtDmx
    Sacn,     // E1.31 streaming ACN
    Opc,      // Open Pixel Control over UDP
    Ddp,      // Distributed Display Protocol
    Kinet     // Color Kinetics KiNET
};

enum class KinetVersion : std::uint8_t {
    DmxOut = 0,
    PortOut
};

/// Order in which the red, green and blue channels of a point go on the wire.
enum class ByteOrder : std::uint8_t {
    RGB = 0,
    RBG,
    GRB,
    GBR,
    BRG,
    BGR
};

constexpr std::size_t BYTES_PER_POINT = 3;

const char* toString(Protocol protocol);
const char* toString(KinetVersion version);
const char* toString(ByteOrder order);

std::optional<Protocol> protocolFromString(std::string_view name);
std::optional<KinetVersion> kinetVersionFromString(std::string_view name);
std::optional<ByteOrder> byteOrderFromString(std::string_view name);

/// For each wire slot, which source channel (0=red, 1=green, 2=blue) goes there.
std::array<std::uint8_t, BYTES_PER_POINT> channelLayout(ByteOrder order);

} // namespace lumen::output
