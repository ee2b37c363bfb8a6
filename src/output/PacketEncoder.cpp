#include "lumen/output/PacketEncoder.hpp"

#include <algorithm>
#include <cstring>

#include "lumen/output/ArtNetEncoder.hpp"
#include "lumen/output/DdpEncoder.hpp"
#include "lumen/output/KinetEncoder.hpp"
#include "lumen/output/OpcEncoder.hpp"
#include "lumen/output/OutputPacketSpec.hpp"
#include "lumen/output/SacnEncoder.hpp"

namespace lumen::output {

namespace {

// Per-thread packet buffer, reused across frames to keep the output path free
// of allocations once it has grown to the largest packet.
std::vector<std::uint8_t>& scratchBuffer() {
    thread_local std::vector<std::uint8_t> scratch;
    return scratch;
}

inline std::uint8_t channelOf(std::uint32_t argb, std::uint8_t channel) {
    return static_cast<std::uint8_t>((argb >> (16 - 8 * channel)) & 0xFFu);
}

} // namespace

std::size_t PacketEncoder::packetLength(const PacketAddress& address, std::size_t pointCount) const {
    return headerLength(address) + pointCount * BYTES_PER_POINT;
}

std::string PacketEncoder::defaultHost(const PacketAddress&) const {
    return "127.0.0.1";
}

void PacketEncoder::stampSequence(std::uint8_t*, std::uint8_t) const {}

void PacketEncoder::writeBody(std::uint8_t* out,
                              const std::vector<std::int32_t>& indices,
                              const ColorBufferView& colors,
                              ByteOrder order,
                              float brightness) {
    const auto layout = channelLayout(order);
    const float scale = std::clamp(brightness, 0.0f, 1.0f);
    const bool scaled = scale < 1.0f;

    for (const std::int32_t index : indices) {
        if (index < 0 || static_cast<std::size_t>(index) >= colors.size) {
            out[0] = out[1] = out[2] = 0;
            out += BYTES_PER_POINT;
            continue;
        }
        const std::uint32_t argb = colors.data[index];
        for (std::size_t slot = 0; slot < BYTES_PER_POINT; ++slot) {
            std::uint8_t value = channelOf(argb, layout[slot]);
            if (scaled) {
                value = static_cast<std::uint8_t>(static_cast<float>(value) * scale + 0.5f);
            }
            out[slot] = value;
        }
        out += BYTES_PER_POINT;
    }
}

expected<PacketView> PacketEncoder::encode(const OutputPacketSpec& spec,
                                           const ColorBufferView& colors,
                                           const EncodeOptions& options) const {
    const auto& address = spec.address();
    const auto& header = spec.headerTemplate();
    const std::size_t headerSize = headerLength(address);
    if (header.size() != headerSize) {
        return unexpected(errc::encoding_length_mismatch);
    }

    const auto indices = spec.indices().snapshot();
    if (!indices || indices->size() != spec.pointCount()) {
        return unexpected(errc::encoding_length_mismatch);
    }

    const std::size_t length = packetLength(address, indices->size());
    if (indices->size() > maxPoints(address) ||
        headerSize + indices->size() * BYTES_PER_POINT > length ||
        length != spec.packetLength()) {
        return unexpected(errc::encoding_length_mismatch);
    }

    auto& scratch = scratchBuffer();
    scratch.assign(length, 0);
    std::memcpy(scratch.data(), header.data(), headerSize);
    writeBody(scratch.data() + headerSize, *indices, colors, address.byteOrder, options.brightness);
    stampSequence(scratch.data(), options.sequence);

    return PacketView{scratch.data(), scratch.size()};
}

const PacketEncoder* encoderFor(Protocol protocol) {
    static const KinetEncoder kinet;
    static const ArtNetEncoder artNet;
    static const SacnEncoder sacn;
    static const OpcEncoder opc;
    static const DdpEncoder ddp;

    switch (protocol) {
        case Protocol::Kinet:  return &kinet;
        case Protocol::ArtNet: return &artNet;
        case Protocol::Sacn:   return &sacn;
        case Protocol::Opc:    return &opc;
        case Protocol::Ddp:    return &ddp;
        case Protocol::None:   break;
    }
    return nullptr;
}

} // namespace lumen::output
