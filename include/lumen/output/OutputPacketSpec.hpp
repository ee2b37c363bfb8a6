#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lumen/core/Expected.hpp"
#include "lumen/model/Point.hpp"
#include "lumen/output/PacketAddress.hpp"

namespace lumen::structure {
class DynamicIndexBuffer;
}

namespace lumen::output {

class PacketEncoder;

/**
 * @brief Where a packet reads its colour-buffer indices from.
 *
 * Either a fixed array captured when the packet was built, or a dynamic index
 * buffer that is republished whenever the structure reindexes.
 */
class IndexSource {
public:
    IndexSource();
    explicit IndexSource(model::IndexBuffer indices);
    explicit IndexSource(std::shared_ptr<const structure::DynamicIndexBuffer> buffer);

    bool isDynamic() const { return dynamic != nullptr; }

    /// Current index array. Safe to call from the output thread.
    std::shared_ptr<const model::IndexBuffer> snapshot() const;

    /// Number of indices the source was created with.
    std::size_t size() const;

    const std::shared_ptr<const structure::DynamicIndexBuffer>& dynamicBuffer() const { return dynamic; }

private:
    std::shared_ptr<const model::IndexBuffer> fixed;
    std::shared_ptr<const structure::DynamicIndexBuffer> dynamic;
};

/**
 * @brief Everything the output thread needs to send one datagram.
 *
 * A spec is immutable once created, apart from the released flag. Fixtures
 * build specs on the mutation thread; the output loop reads them through the
 * published output frame.
 */
class OutputPacketSpec {
public:
    using Ptr = std::shared_ptr<OutputPacketSpec>;

    static expected<Ptr> create(const PacketAddress& address,
                                IndexSource indices,
                                Destination destination = {},
                                std::string label = {});

    Protocol protocol() const { return address_.protocol; }
    const PacketAddress& address() const { return address_; }
    const PacketEncoder& encoder() const { return *encoder_; }
    const IndexSource& indices() const { return indices_; }
    std::size_t pointCount() const { return pointCount_; }
    const std::vector<std::uint8_t>& headerTemplate() const { return header_; }
    std::size_t packetLength() const { return packetLength_; }
    const Destination& destination() const { return destination_; }
    const std::string& label() const { return label_; }

    /// Marks the spec as no longer owned by a fixture; the output loop skips it.
    void release() { released_.store(true, std::memory_order_release); }
    bool isReleased() const { return released_.load(std::memory_order_acquire); }

private:
    OutputPacketSpec() = default;

    PacketAddress address_;
    const PacketEncoder* encoder_ = nullptr;
    IndexSource indices_;
    std::size_t pointCount_ = 0;
    std::vector<std::uint8_t> header_;
    std::size_t packetLength_ = 0;
    Destination destination_;
    std::string label_;
    std::atomic<bool> released_{false};
};

/// One packet of a published output frame plus the owning fixture's output state.
struct OutputEntry {
    OutputPacketSpec::Ptr spec;
    float brightness = 1.0f;
    bool enabled = true;
};

/// Immutable list of packets published by the structure for the output thread.
struct OutputFrame {
    std::uint64_t generation = 0;
    std::size_t pointCount = 0; // size of the colour buffer the packets index into
    std::vector<OutputEntry> entries;
};

/// Transport primitive: hand one datagram to the network (or a test capture).
class PacketSink {
public:
    virtual ~PacketSink() = default;
    virtual void send(const std::uint8_t* data, std::size_t size, const Destination& destination) = 0;
};

} // namespace lumen::output
