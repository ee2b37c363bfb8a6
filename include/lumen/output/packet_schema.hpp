#pragma once
// Fixed header layouts for every supported output protocol, described with
// lumen::schema so one declaration both builds header templates and decodes
// captured packets.

#include <array>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "lumen/core/Expected.hpp"
#include "lumen/log/Log.hpp"
#include "lumen/output/OutputConfig.hpp"
#include "lumen/schema/wire_schema.hpp"

namespace lumen::output::schema {

namespace lsch = ::lumen::schema;

// --- KiNET PORTOUT (24 bytes) ------------------------------------------------
struct KinetPortOutHeader {
    std::uint32_t magic = config::KINET_MAGIC;
    std::uint16_t version = config::KINET_VERSION;
    std::uint16_t type = config::KINET_TYPE_PORTOUT;
    std::uint32_t sequence = 0;
    std::uint32_t universe = config::KINET_UNIVERSE_UNUSED;
    std::uint8_t port = 0;           // physical output on the power supply
    std::uint8_t padding = 0;
    std::uint16_t flags = 0;
    std::uint8_t portCount = config::KINET_PORTOUT_PORT_COUNT;
    std::uint8_t reserved = 0;
    std::uint16_t startCode = 0;
};

inline const auto kinetPortOutFields = std::make_tuple(
    lsch::field<&KinetPortOutHeader::magic    >("magic"    , lsch::LeU32{}, lsch::Equals<config::KINET_MAGIC>{}),
    lsch::field<&KinetPortOutHeader::version  >("version"  , lsch::LeU16{}, lsch::Equals<config::KINET_VERSION>{}),
    lsch::field<&KinetPortOutHeader::type     >("type"     , lsch::LeU16{}, lsch::Equals<config::KINET_TYPE_PORTOUT>{}),
    lsch::field<&KinetPortOutHeader::sequence >("sequence" , lsch::LeU32{}),
    lsch::field<&KinetPortOutHeader::universe >("universe" , lsch::LeU32{}),
    lsch::field<&KinetPortOutHeader::port     >("port"     , lsch::U8{}),
    lsch::field<&KinetPortOutHeader::padding  >("padding"  , lsch::U8{}),
    lsch::field<&KinetPortOutHeader::flags    >("flags"    , lsch::LeU16{}),
    lsch::field<&KinetPortOutHeader::portCount>("portCount", lsch::U8{}),
    lsch::field<&KinetPortOutHeader::reserved >("reserved" , lsch::U8{}),
    lsch::field<&KinetPortOutHeader::startCode>("startCode", lsch::LeU16{})
);

inline const auto kinetPortOutSchema = lsch::makeSchema<KinetPortOutHeader>(kinetPortOutFields);

// --- KiNET DMXOUT (21 bytes) -------------------------------------------------
struct KinetDmxOutHeader {
    std::uint32_t magic = config::KINET_MAGIC;
    std::uint16_t version = config::KINET_VERSION;
    std::uint16_t type = config::KINET_TYPE_DMXOUT;
    std::uint32_t sequence = 0;
    std::uint32_t reserved = 0;
    std::uint32_t universe = config::KINET_UNIVERSE_UNUSED;
    std::uint8_t startCode = 0;      // one byte leads the DMX data
};

inline const auto kinetDmxOutFields = std::make_tuple(
    lsch::field<&KinetDmxOutHeader::magic    >("magic"    , lsch::LeU32{}, lsch::Equals<config::KINET_MAGIC>{}),
    lsch::field<&KinetDmxOutHeader::version  >("version"  , lsch::LeU16{}, lsch::Equals<config::KINET_VERSION>{}),
    lsch::field<&KinetDmxOutHeader::type     >("type"     , lsch::LeU16{}, lsch::Equals<config::KINET_TYPE_DMXOUT>{}),
    lsch::field<&KinetDmxOutHeader::sequence >("sequence" , lsch::LeU32{}),
    lsch::field<&KinetDmxOutHeader::reserved >("reserved" , lsch::LeU32{}),
    lsch::field<&KinetDmxOutHeader::universe >("universe" , lsch::LeU32{}, lsch::Equals<config::KINET_UNIVERSE_UNUSED>{}),
    lsch::field<&KinetDmxOutHeader::startCode>("startCode", lsch::U8{})
);

inline const auto kinetDmxOutSchema = lsch::makeSchema<KinetDmxOutHeader>(kinetDmxOutFields);

// --- Art-Net ArtDmx (18 bytes) -----------------------------------------------
struct ArtNetDmxHeader {
    std::array<char, 8> id = {'A', 'r', 't', '-', 'N', 'e', 't', 0};
    std::uint16_t opcode = config::ARTNET_OPCODE_DMX;
    std::uint16_t protocolVersion = config::ARTNET_PROTOCOL_VERSION;
    std::uint8_t sequence = 0;       // 0 disables sequencing on the receiver
    std::uint8_t physical = 0;
    std::uint16_t universe = 0;      // 15-bit port address: net, subnet, universe
    std::uint16_t length = 0;        // even, 2..512
};

inline const auto artNetDmxFields = std::make_tuple(
    lsch::field<&ArtNetDmxHeader::id             >("id"             , lsch::FixedAscii<8>{}),
    lsch::field<&ArtNetDmxHeader::opcode         >("opcode"         , lsch::LeU16{}, lsch::Equals<config::ARTNET_OPCODE_DMX>{}),
    lsch::field<&ArtNetDmxHeader::protocolVersion>("protocolVersion", lsch::BeU16{}),
    lsch::field<&ArtNetDmxHeader::sequence       >("sequence"       , lsch::U8{}),
    lsch::field<&ArtNetDmxHeader::physical       >("physical"       , lsch::U8{}),
    lsch::field<&ArtNetDmxHeader::universe       >("universe"       , lsch::LeU16{}, lsch::AtMost<config::ARTNET_MAX_UNIVERSE>{}),
    lsch::field<&ArtNetDmxHeader::length         >("length"         , lsch::BeU16{}, lsch::AtMost<config::ARTNET_MAX_DATA_LENGTH>{})
);

inline const auto artNetDmxSchema = lsch::makeSchema<ArtNetDmxHeader>(artNetDmxFields);

// --- sACN / E1.31 data packet (126 bytes) ------------------------------------
struct SacnHeader {
    // Root layer
    std::uint16_t preambleSize = 0x0010;
    std::uint16_t postambleSize = 0;
    std::array<std::uint8_t, 12> acnId = {0x41, 0x53, 0x43, 0x2d, 0x45, 0x31, 0x2e, 0x31, 0x37, 0x00, 0x00, 0x00};
    std::uint16_t rootFlagsLength = 0;
    std::uint32_t rootVector = 0x00000004;
    std::array<std::uint8_t, 16> cid = config::SACN_DEFAULT_CID;
    // Framing layer
    std::uint16_t framingFlagsLength = 0;
    std::uint32_t framingVector = 0x00000002;
    std::array<char, 64> sourceName{};
    std::uint8_t priority = config::SACN_DEFAULT_PRIORITY;
    std::uint16_t syncAddress = 0;
    std::uint8_t sequence = 0;
    std::uint8_t options = 0;
    std::uint16_t universe = 1;
    // DMP layer
    std::uint16_t dmpFlagsLength = 0;
    std::uint8_t dmpVector = 0x02;
    std::uint8_t addressType = 0xA1;
    std::uint16_t firstPropertyAddress = 0;
    std::uint16_t addressIncrement = 1;
    std::uint16_t propertyValueCount = 1;
    std::uint8_t startCode = 0;
};

inline const auto sacnFields = std::make_tuple(
    lsch::field<&SacnHeader::preambleSize        >("preambleSize"        , lsch::BeU16{}, lsch::Equals<0x0010>{}),
    lsch::field<&SacnHeader::postambleSize       >("postambleSize"       , lsch::BeU16{}),
    lsch::field<&SacnHeader::acnId               >("acnId"               , lsch::FixedBytes<12>{}),
    lsch::field<&SacnHeader::rootFlagsLength     >("rootFlagsLength"     , lsch::BeU16{}),
    lsch::field<&SacnHeader::rootVector          >("rootVector"          , lsch::BeU32{}, lsch::Equals<0x00000004>{}),
    lsch::field<&SacnHeader::cid                 >("cid"                 , lsch::FixedBytes<16>{}),
    lsch::field<&SacnHeader::framingFlagsLength  >("framingFlagsLength"  , lsch::BeU16{}),
    lsch::field<&SacnHeader::framingVector       >("framingVector"       , lsch::BeU32{}, lsch::Equals<0x00000002>{}),
    lsch::field<&SacnHeader::sourceName          >("sourceName"          , lsch::FixedAscii<64>{}),
    lsch::field<&SacnHeader::priority            >("priority"            , lsch::U8{}, lsch::AtMost<200>{}),
    lsch::field<&SacnHeader::syncAddress         >("syncAddress"         , lsch::BeU16{}),
    lsch::field<&SacnHeader::sequence            >("sequence"            , lsch::U8{}),
    lsch::field<&SacnHeader::options             >("options"             , lsch::U8{}),
    lsch::field<&SacnHeader::universe            >("universe"            , lsch::BeU16{}, lsch::AtMost<config::SACN_MAX_UNIVERSE>{}),
    lsch::field<&SacnHeader::dmpFlagsLength      >("dmpFlagsLength"      , lsch::BeU16{}),
    lsch::field<&SacnHeader::dmpVector           >("dmpVector"           , lsch::U8{}, lsch::Equals<0x02>{}),
    lsch::field<&SacnHeader::addressType         >("addressType"         , lsch::U8{}, lsch::Equals<0xA1>{}),
    lsch::field<&SacnHeader::firstPropertyAddress>("firstPropertyAddress", lsch::BeU16{}),
    lsch::field<&SacnHeader::addressIncrement    >("addressIncrement"    , lsch::BeU16{}),
    lsch::field<&SacnHeader::propertyValueCount  >("propertyValueCount"  , lsch::BeU16{}),
    lsch::field<&SacnHeader::startCode           >("startCode"           , lsch::U8{})
);

inline const auto sacnSchema = lsch::makeSchema<SacnHeader>(sacnFields);

// --- OPC (4 bytes) -----------------------------------------------------------
struct OpcHeader {
    std::uint8_t channel = 0;        // 0 broadcasts to every channel
    std::uint8_t command = config::OPC_COMMAND_SET_PIXELS;
    std::uint16_t length = 0;
};

inline const auto opcFields = std::make_tuple(
    lsch::field<&OpcHeader::channel>("channel", lsch::U8{}),
    lsch::field<&OpcHeader::command>("command", lsch::U8{}, lsch::Equals<config::OPC_COMMAND_SET_PIXELS>{}),
    lsch::field<&OpcHeader::length >("length" , lsch::BeU16{})
);

inline const auto opcSchema = lsch::makeSchema<OpcHeader>(opcFields);

// --- DDP (10 bytes) ----------------------------------------------------------
struct DdpHeader {
    std::uint8_t flags = config::DDP_FLAGS_V1_PUSH;
    std::uint8_t sequence = 0;       // low nibble, 0 = unused
    std::uint8_t dataType = config::DDP_DATA_TYPE_RGB8;
    std::uint8_t destination = config::DDP_DESTINATION_DISPLAY;
    std::uint32_t offset = 0;        // byte offset into the receiver's frame buffer
    std::uint16_t length = 0;
};

inline const auto ddpFields = std::make_tuple(
    lsch::field<&DdpHeader::flags      >("flags"      , lsch::U8{}),
    lsch::field<&DdpHeader::sequence   >("sequence"   , lsch::U8{}, lsch::AtMost<0x0F>{}),
    lsch::field<&DdpHeader::dataType   >("dataType"   , lsch::U8{}),
    lsch::field<&DdpHeader::destination>("destination", lsch::U8{}),
    lsch::field<&DdpHeader::offset     >("offset"     , lsch::BeU32{}),
    lsch::field<&DdpHeader::length     >("length"     , lsch::BeU16{}, lsch::AtMost<config::DDP_MAX_DATA_LENGTH>{})
);

inline const auto ddpSchema = lsch::makeSchema<DdpHeader>(ddpFields);

static_assert(std::decay_t<decltype(kinetPortOutSchema)>::width() == config::KINET_PORTOUT_HEADER_LENGTH, "KiNET PORTOUT header size");
static_assert(std::decay_t<decltype(kinetDmxOutSchema)>::width() == config::KINET_DMXOUT_HEADER_LENGTH, "KiNET DMXOUT header size");
static_assert(std::decay_t<decltype(artNetDmxSchema)>::width() == config::ARTNET_HEADER_LENGTH, "Art-Net header size");
static_assert(std::decay_t<decltype(sacnSchema)>::width() == config::SACN_HEADER_LENGTH, "sACN header size");
static_assert(std::decay_t<decltype(opcSchema)>::width() == config::OPC_HEADER_LENGTH, "OPC header size");
static_assert(std::decay_t<decltype(ddpSchema)>::width() == config::DDP_HEADER_LENGTH, "DDP header size");

/// Encodes a header template; schema violations surface as invalid_parameter.
template<class T, class FieldsTuple>
expected<std::vector<std::uint8_t>> encodeHeader(const lsch::Schema<T, FieldsTuple>& sch,
                                                 const T& header,
                                                 const char* protocolName) {
    auto bytes = lsch::encode(sch, header);
    if (!bytes) {
        logError("[", protocolName, "] header field '", bytes.error().where, "': ",
                 bytes.error().what, "\n");
        return unexpected(errc::invalid_parameter);
    }
    return std::move(*bytes);
}

} // namespace lumen::output::schema
