#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lumen::output::config {

/**
 * @brief Constants that define protocol framing and output loop behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * encoder translation units.
 */

// KiNET -----------------------------------------------------------------------
constexpr unsigned short KINET_PORT_DEFAULT = 6038;
constexpr std::size_t KINET_DMXOUT_HEADER_LENGTH = 21;
constexpr std::size_t KINET_PORTOUT_HEADER_LENGTH = 24;
constexpr std::size_t KINET_DATA_LENGTH = 512;
constexpr std::uint32_t KINET_MAGIC = 0x4ADC0104; // 04 01 DC 4A on the wire
constexpr std::uint16_t KINET_VERSION = 0x0001;
constexpr std::uint16_t KINET_TYPE_DMXOUT = 0x0101;
constexpr std::uint16_t KINET_TYPE_PORTOUT = 0x0108;
constexpr std::uint32_t KINET_UNIVERSE_UNUSED = 0xFFFFFFFF;
constexpr std::uint8_t KINET_PORTOUT_PORT_COUNT = 0x02; // header byte 20, ignored by receivers

// Art-Net ---------------------------------------------------------------------
constexpr unsigned short ARTNET_PORT_DEFAULT = 6454;
constexpr std::size_t ARTNET_HEADER_LENGTH = 18;
constexpr std::size_t ARTNET_MAX_DATA_LENGTH = 512;
constexpr std::uint16_t ARTNET_OPCODE_DMX = 0x5000;
constexpr std::uint16_t ARTNET_PROTOCOL_VERSION = 14;
constexpr std::uint16_t ARTNET_MAX_UNIVERSE = 0x7FFF;

// sACN (E1.31) ----------------------------------------------------------------
constexpr unsigned short SACN_PORT_DEFAULT = 5568;
constexpr std::size_t SACN_HEADER_LENGTH = 126;
constexpr std::size_t SACN_MAX_DATA_LENGTH = 512;
constexpr std::uint8_t SACN_DEFAULT_PRIORITY = 100;
constexpr std::uint16_t SACN_MAX_UNIVERSE = 63999;
constexpr const char* SACN_SOURCE_NAME = "lumen";
constexpr std::array<std::uint8_t, 16> SACN_DEFAULT_CID = {
    0x6c, 0x75, 0x6d, 0x65, 0x6e, 0x2d, 0x73, 0x61,
    0x63, 0x6e, 0x2d, 0x63, 0x69, 0x64, 0x00, 0x01
};

// OPC -------------------------------------------------------------------------
constexpr unsigned short OPC_PORT_DEFAULT = 7890;
constexpr std::size_t OPC_HEADER_LENGTH = 4;
constexpr std::size_t OPC_MAX_DATA_LENGTH = 65502; // 65507-byte UDP payload minus header, multiple of 3
constexpr std::uint8_t OPC_COMMAND_SET_PIXELS = 0x00;

// DDP -------------------------------------------------------------------------
constexpr unsigned short DDP_PORT_DEFAULT = 4048;
constexpr std::size_t DDP_HEADER_LENGTH = 10;
constexpr std::size_t DDP_MAX_DATA_LENGTH = 1440; // 480 RGB pixels per datagram
constexpr std::uint8_t DDP_FLAGS_V1_PUSH = 0x41;
constexpr std::uint8_t DDP_DATA_TYPE_RGB8 = 0x0B;
constexpr std::uint8_t DDP_DESTINATION_DISPLAY = 0x01;

// Output loop -----------------------------------------------------------------
constexpr double OUTPUT_FRAME_RATE_DEFAULT = 60.0;
constexpr double OUTPUT_FRAME_RATE_MIN = 1.0;
constexpr double OUTPUT_FRAME_RATE_MAX = 300.0;
constexpr std::chrono::milliseconds OUTPUT_MIN_SLEEP{1};

} // namespace lumen::output::config
