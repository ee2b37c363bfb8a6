#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "lumen/core/Expected.hpp"
#include "lumen/output/PacketAddress.hpp"
#include "lumen/output/Protocol.hpp"

namespace lumen::output {

class OutputPacketSpec;

/// Read-only view of the frame colour buffer, one ARGB word per point index.
struct ColorBufferView {
    const std::uint32_t* data = nullptr;
    std::size_t size = 0;

    ColorBufferView() = default;
    ColorBufferView(const std::uint32_t* d, std::size_t n) : data(d), size(n) {}
    explicit ColorBufferView(const std::vector<std::uint32_t>& colors)
    : data(colors.data()), size(colors.size()) {}
};

struct EncodeOptions {
    std::uint8_t sequence = 0; // 0 leaves sequencing disabled where the protocol allows it
    float brightness = 1.0f;   // 0..1, scales every channel
};

/**
 * @brief Encoded datagram.
 *
 * Points into per-thread scratch storage owned by the encoder. Valid until the
 * next encode() call on the same thread.
 */
struct PacketView {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;
};

/**
 * @brief Stateless encoder for one output protocol.
 *
 * Subclasses describe the protocol framing (header layout, payload capacity,
 * padding, sequence position). The shared encode() path copies the header
 * template of a spec, then writes one channel group per index in the spec's
 * byte order. Unmapped or out-of-range indices are sent as 0,0,0.
 *
 * Encoders hold no per-packet state and are safe to share across threads.
 */
class PacketEncoder {
public:
    virtual ~PacketEncoder() = default;

    virtual Protocol protocol() const = 0;
    virtual unsigned short defaultPort() const = 0;
    virtual std::size_t headerLength(const PacketAddress& address) const = 0;

    /// Largest number of RGB points that fit in one packet.
    virtual std::size_t maxPoints(const PacketAddress& address) const = 0;

    /// Total datagram size for @p pointCount points, padding included.
    virtual std::size_t packetLength(const PacketAddress& address, std::size_t pointCount) const;

    /// Header bytes for a packet carrying @p pointCount points. Sequence slots are zero.
    virtual expected<std::vector<std::uint8_t>> buildHeader(const PacketAddress& address,
                                                            std::size_t pointCount) const = 0;

    virtual std::string defaultHost(const PacketAddress& address) const;

    expected<PacketView> encode(const OutputPacketSpec& spec,
                                const ColorBufferView& colors,
                                const EncodeOptions& options = {}) const;

protected:
    /// Writes the per-frame sequence number into an encoded header. No-op by default.
    virtual void stampSequence(std::uint8_t* header, std::uint8_t sequence) const;

    static void writeBody(std::uint8_t* out,
                          const std::vector<std::int32_t>& indices,
                          const ColorBufferView& colors,
                          ByteOrder order,
                          float brightness);
};

/// Shared encoder instance for @p protocol, nullptr for Protocol::None.
const PacketEncoder* encoderFor(Protocol protocol);

} // namespace lumen::output
