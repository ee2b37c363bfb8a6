#include "lumen/output/OutputPacketSpec.hpp"

#include <utility>

#include "lumen/output/PacketEncoder.hpp"
#include "lumen/structure/DynamicIndexBuffer.hpp"

namespace lumen::output {

IndexSource::IndexSource()
: fixed(std::make_shared<const model::IndexBuffer>()) {}

IndexSource::IndexSource(model::IndexBuffer indices)
: fixed(std::make_shared<const model::IndexBuffer>(std::move(indices))) {}

IndexSource::IndexSource(std::shared_ptr<const structure::DynamicIndexBuffer> buffer)
: dynamic(std::move(buffer)) {}

std::shared_ptr<const model::IndexBuffer> IndexSource::snapshot() const {
    if (dynamic) {
        return dynamic->indices();
    }
    return fixed;
}

std::size_t IndexSource::size() const {
    if (dynamic) {
        return dynamic->count();
    }
    return fixed ? fixed->size() : 0;
}

expected<OutputPacketSpec::Ptr> OutputPacketSpec::create(const PacketAddress& address,
                                                         IndexSource indices,
                                                         Destination destination,
                                                         std::string label) {
    const PacketEncoder* encoder = encoderFor(address.protocol);
    if (!encoder) {
        return unexpected(errc::unsupported_protocol);
    }

    const std::size_t count = indices.size();
    if (count > encoder->maxPoints(address)) {
        return unexpected(errc::encoding_length_mismatch);
    }

    auto header = encoder->buildHeader(address, count);
    if (!header) {
        return unexpected(header.error());
    }

    if (destination.host.empty()) {
        destination.host = encoder->defaultHost(address);
    }
    if (destination.port == 0) {
        destination.port = encoder->defaultPort();
    }

    Ptr spec(new OutputPacketSpec());
    spec->address_ = address;
    spec->encoder_ = encoder;
    spec->indices_ = std::move(indices);
    spec->pointCount_ = count;
    spec->header_ = std::move(*header);
    spec->packetLength_ = encoder->packetLength(address, count);
    spec->destination_ = std::move(destination);
    spec->label_ = std::move(label);
    return spec;
}

} // namespace lumen::output
