#include "lumen/log/Log.hpp"
#include "lumen/output/OutputConfig.hpp"
#include "lumen/output/OutputPacketSpec.hpp"
#include "lumen/output/PacketEncoder.hpp"
#include "lumen/output/packet_schema.hpp"

#include <array>
#include <cstdint>
#include <vector>

using namespace lumen;
using namespace lumen::output;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lumen::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lumen::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static OutputPacketSpec::Ptr makeSpec(KinetVersion version, std::uint8_t port, model::IndexBuffer indices) {
    PacketAddress address;
    address.protocol = Protocol::Kinet;
    address.kinetVersion = version;
    address.kinetPort = port;
    auto spec = OutputPacketSpec::create(address, IndexSource(std::move(indices)));
    ASSERT_TRUE(spec.has_value(), "KiNET spec created");
    return spec ? *spec : nullptr;
}

static void testPortOutFrame() {
    auto spec = makeSpec(KinetVersion::PortOut, 3, {0});
    if (!spec) return;

    ASSERT_EQ(spec->destination().port, config::KINET_PORT_DEFAULT, "default KiNET port");
    ASSERT_TRUE(spec->destination().host == "127.0.0.1", "default host");

    const std::vector<std::uint32_t> colors = {0xFFFF0000u};
    auto packet = spec->encoder().encode(*spec, ColorBufferView(colors));
    ASSERT_TRUE(packet.has_value(), "encode PORTOUT");
    if (!packet) return;

    ASSERT_EQ(packet->size, static_cast<std::size_t>(536), "24-byte header plus 512 data bytes");

    const std::array<std::uint8_t, 24> expected = {
        0x04, 0x01, 0xDC, 0x4A, 0x01, 0x00, 0x08, 0x01,
        0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF,
        0x03, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00
    };
    for (std::size_t i = 0; i < expected.size(); ++i) {
        ASSERT_EQ(packet->data[i], expected[i], "PORTOUT header byte");
    }
    ASSERT_EQ(packet->data[20], config::KINET_PORTOUT_PORT_COUNT, "port count at offset 20");
    ASSERT_EQ(packet->data[21], 0x00, "offset 21 reserved");

    auto decoded = ::lumen::schema::decode(schema::kinetPortOutSchema,
                                           ::lumen::schema::ByteView(packet->data, packet->size));
    ASSERT_TRUE(decoded.has_value(), "PORTOUT header decodes against its schema");
    if (decoded) {
        ASSERT_EQ(decoded->port, 3, "port field");
        ASSERT_EQ(decoded->portCount, config::KINET_PORTOUT_PORT_COUNT, "port count field");
    }

    ASSERT_EQ(packet->data[24], 0xFF, "red");
    ASSERT_EQ(packet->data[25], 0x00, "green");
    ASSERT_EQ(packet->data[26], 0x00, "blue");
    for (std::size_t i = 27; i < packet->size; ++i) {
        if (packet->data[i] != 0) {
            ASSERT_TRUE(false, "unused DMX slots are zero");
            break;
        }
    }
}

static void testDmxOutFrame() {
    auto spec = makeSpec(KinetVersion::DmxOut, 1, {0, 1});
    if (!spec) return;

    const std::vector<std::uint32_t> colors = {0xFF010203u, 0xFF0A0B0Cu};
    auto packet = spec->encoder().encode(*spec, ColorBufferView(colors));
    ASSERT_TRUE(packet.has_value(), "encode DMXOUT");
    if (!packet) return;

    ASSERT_EQ(packet->size, static_cast<std::size_t>(533), "21-byte header plus 512 data bytes");
    ASSERT_EQ(packet->data[6], 0x01, "DMXOUT type low byte");
    ASSERT_EQ(packet->data[7], 0x01, "DMXOUT type high byte");
    ASSERT_EQ(packet->data[20], 0x00, "start code");
    ASSERT_EQ(packet->data[21], 0x01, "first red");
    ASSERT_EQ(packet->data[26], 0x0C, "second blue");

    auto decoded = ::lumen::schema::decode(schema::kinetDmxOutSchema,
                                           ::lumen::schema::ByteView(packet->data, packet->size));
    ASSERT_TRUE(decoded.has_value(), "header decodes against its schema");
    if (decoded) {
        ASSERT_EQ(decoded->universe, config::KINET_UNIVERSE_UNUSED, "universe field unused");
    }
}

static void testUnmappedAndOutOfRange() {
    auto spec = makeSpec(KinetVersion::PortOut, 1, {model::UNMAPPED_INDEX, 0, 5});
    if (!spec) return;

    const std::vector<std::uint32_t> colors = {0xFF102030u};
    auto packet = spec->encoder().encode(*spec, ColorBufferView(colors));
    ASSERT_TRUE(packet.has_value(), "encode with holes");
    if (!packet) return;

    const std::uint8_t* body = packet->data + config::KINET_PORTOUT_HEADER_LENGTH;
    ASSERT_EQ(body[0] + body[1] + body[2], 0, "unmapped point is blank");
    ASSERT_EQ(body[3], 0x10, "mapped point red");
    ASSERT_EQ(body[5], 0x30, "mapped point blue");
    ASSERT_EQ(body[6] + body[7] + body[8], 0, "index past the colour buffer is blank");
}

static void testCapacityAndMismatch() {
    model::IndexBuffer tooMany(171, 0);
    PacketAddress address;
    address.protocol = Protocol::Kinet;
    auto oversized = OutputPacketSpec::create(address, IndexSource(tooMany));
    ASSERT_TRUE(!oversized && oversized.error() == errc::encoding_length_mismatch, "171 points do not fit");
    ASSERT_TRUE(oversized.error() == error_class::protocol_encoding_error, "encoding error class");

    auto spec = makeSpec(KinetVersion::PortOut, 1, model::IndexBuffer(170, 0));
    if (!spec) return;

    const std::vector<std::uint32_t> colors = {0xFFFFFFFFu};
    auto full = spec->encoder().encode(*spec, ColorBufferView(colors));
    ASSERT_TRUE(full.has_value(), "170 points fill the universe");

    // An encoder only accepts specs framed for its own protocol.
    auto wrong = encoderFor(Protocol::Opc)->encode(*spec, ColorBufferView(colors));
    ASSERT_TRUE(!wrong && wrong.error() == errc::encoding_length_mismatch, "foreign spec rejected");

    PacketAddress none;
    auto disabled = OutputPacketSpec::create(none, IndexSource(model::IndexBuffer{0}));
    ASSERT_TRUE(!disabled && disabled.error() == errc::unsupported_protocol, "no encoder for None");
}

static void testBrightnessAndByteOrder() {
    PacketAddress address;
    address.protocol = Protocol::Kinet;
    address.byteOrder = ByteOrder::GRB;
    auto spec = OutputPacketSpec::create(address, IndexSource(model::IndexBuffer{0}));
    ASSERT_TRUE(spec.has_value(), "GRB spec");
    if (!spec) return;

    const std::vector<std::uint32_t> colors = {0xFF112233u};
    auto packet = (*spec)->encoder().encode(**spec, ColorBufferView(colors));
    ASSERT_TRUE(packet.has_value(), "encode GRB");
    if (packet) {
        const std::uint8_t* body = packet->data + config::KINET_PORTOUT_HEADER_LENGTH;
        ASSERT_EQ(body[0], 0x22, "green first");
        ASSERT_EQ(body[1], 0x11, "red second");
        ASSERT_EQ(body[2], 0x33, "blue third");
    }

    const std::vector<std::uint32_t> white = {0xFFFFFFFFu};
    EncodeOptions half;
    half.brightness = 0.5f;
    auto dimmed = (*spec)->encoder().encode(**spec, ColorBufferView(white), half);
    ASSERT_TRUE(dimmed.has_value(), "encode dimmed");
    if (dimmed) {
        ASSERT_EQ(dimmed->data[config::KINET_PORTOUT_HEADER_LENGTH], 0x80, "half brightness rounds");
    }

    EncodeOptions dark;
    dark.brightness = 0.0f;
    auto off = (*spec)->encoder().encode(**spec, ColorBufferView(white), dark);
    ASSERT_TRUE(off && off->data[config::KINET_PORTOUT_HEADER_LENGTH] == 0, "zero brightness is dark");
}

int main() {
    testPortOutFrame();
    testDmxOutFrame();
    testUnmappedAndOutOfRange();
    testCapacityAndMismatch();
    testBrightnessAndByteOrder();

    if (g_failures) {
        lumen::logError("Tests failed: ", g_failures, "\n");
        return 1;
    }
    lumen::logInfo("All KiNET encoder tests passed.\n");
    return 0;
}
