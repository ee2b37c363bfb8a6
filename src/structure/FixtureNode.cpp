#include "lumen/structure/FixtureNode.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <glm/trigonometric.hpp>

#include "lumen/log/Log.hpp"
#include "lumen/output/PacketEncoder.hpp"

namespace lumen::structure {

FixtureNode::FixtureNode(std::string label)
: label_(std::move(label)) {
    for (Parameter* p : {&x, &y, &z, &yaw, &pitch, &roll,
                         &enabled, &brightness, &mute, &solo, &selected, &identify,
                         &protocol, &host, &port, &universe, &kinetPort, &kinetVersion,
                         &channel, &byteOrder}) {
        addParameter(*p);
    }
}

FixtureNode::~FixtureNode() {
    teardown();
}

void FixtureNode::addParameter(Parameter& parameter) {
    parameters_.push_back(&parameter);
}

Parameter* FixtureNode::parameter(std::string_view key) const {
    for (Parameter* p : parameters_) {
        if (p->key() == key) return p;
    }
    return nullptr;
}

expected<void> FixtureNode::checkMutable() const {
    if (disposed_) {
        return unexpected(errc::invalid_argument);
    }
    if (isIterating()) {
        return unexpected(errc::reentrant_mutation);
    }
    return {};
}

bool FixtureNode::isIterating() const {
    return iterationDepth_ > 0 || (container_ && container_->isIterating());
}

bool FixtureNode::isLoading() const {
    return container_ && container_->isLoading();
}

// ---------------------------------------------------------------------------
// Tree
// ---------------------------------------------------------------------------

void FixtureNode::attach(FixtureContainer& container, FixtureNode* parent, std::size_t index,
                         const model::Matrix& parentTransform) {
    container_ = &container;
    parent_ = parent;
    index_ = index;
    parentTransform_ = parentTransform;
}

void FixtureNode::detach() {
    container_ = nullptr;
    parent_ = nullptr;
    index_ = 0;
}

void FixtureNode::renumberChildren() {
    for (std::size_t i = 0; i < children_.size(); ++i) {
        children_[i]->index_ = i;
    }
}

expected<void> FixtureNode::addChild(std::unique_ptr<FixtureNode> child,
                                     std::optional<std::size_t> position) {
    if (!child || child.get() == this || child->disposed_) {
        return unexpected(errc::invalid_argument);
    }
    if (auto ok = checkMutable(); !ok) return ok;
    if (child->container_ == this) {
        return unexpected(errc::duplicate_child);
    }
    if (child->container_) {
        return unexpected(errc::already_attached);
    }

    const std::size_t at = position.value_or(children_.size());
    if (at > children_.size()) {
        return unexpected(errc::invalid_argument);
    }

    FixtureNode& added = *child;
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(at), std::move(child));
    renumberChildren();
    layoutDirty_ = true;

    added.attach(*this, this, at, geometryMatrix_);
    return added.regenerate();
}

expected<std::unique_ptr<FixtureNode>> FixtureNode::removeChild(FixtureNode& child) {
    if (auto ok = checkMutable(); !ok) return unexpected(ok.error());

    auto it = std::find_if(children_.begin(), children_.end(),
                           [&](const std::unique_ptr<FixtureNode>& c) { return c.get() == &child; });
    if (it == children_.end()) {
        return unexpected(errc::unknown_child);
    }

    std::unique_ptr<FixtureNode> removed = std::move(*it);
    children_.erase(it);
    renumberChildren();
    layoutDirty_ = true;
    removed->detach();

    fixtureGenerationChanged(*this);
    return removed;
}

expected<void> FixtureNode::regenerate() {
    if (auto ok = checkMutable(); !ok) return ok;

    generated_ = true;
    ++layoutGeneration_;
    layoutDirty_ = true;
    invalidateDynamicBuffers(false);

    points_.assign(size(), model::Point{});
    for (std::size_t i = 0; i < points_.size(); ++i) {
        points_[i].index = firstPointIndex_ + static_cast<std::uint32_t>(i);
    }

    recomputeGeometry();
    rebuildPacketSpecs();
    onRegenerate();

    fixtureGenerationChanged(*this);
    return {};
}

bool FixtureNode::reindex(std::uint32_t startIndex) {
    bool changed = layoutDirty_ || firstPointIndex_ != startIndex;
    if (changed) {
        firstPointIndex_ = startIndex;
        for (std::size_t i = 0; i < points_.size(); ++i) {
            points_[i].index = startIndex + static_cast<std::uint32_t>(i);
        }
    }
    layoutDirty_ = false;

    auto next = startIndex + static_cast<std::uint32_t>(points_.size());
    for (auto& child : children_) {
        if (child->reindex(next)) {
            changed = true;
        }
        next += static_cast<std::uint32_t>(child->totalSize());
    }

    if (changed) {
        refreshDynamicBuffers();
        inBuildPacketSpecs_ = true;
        reindexPacketSpecs();
        inBuildPacketSpecs_ = false;
    }
    return changed;
}

expected<void> FixtureNode::dispose() {
    if (disposed_) return {};
    if (isIterating()) {
        return unexpected(errc::reentrant_mutation);
    }
    for (auto& child : children_) {
        if (auto ok = child->dispose(); !ok) return ok;
    }
    teardown();
    return {};
}

void FixtureNode::teardown() {
    releasePacketSpecs();
    invalidateDynamicBuffers(false);
    disposed_ = true;
}

// ---------------------------------------------------------------------------
// Change propagation
// ---------------------------------------------------------------------------

void FixtureNode::fixtureGenerationChanged(FixtureNode& fixture) {
    if (container_) {
        if (!container_->isLoading()) {
            container_->fixtureGenerationChanged(fixture);
        }
        return;
    }
    // Detached root: keep the subtree indexed from where it already starts.
    reindex(firstPointIndex_);
}

void FixtureNode::fixtureGeometryChanged(FixtureNode& fixture) {
    if (container_ && !container_->isLoading()) {
        container_->fixtureGeometryChanged(fixture);
    }
}

void FixtureNode::fixturePacketsChanged(FixtureNode& fixture) {
    if (container_ && !container_->isLoading()) {
        container_->fixturePacketsChanged(fixture);
    }
}

void FixtureNode::fixtureOutputChanged(FixtureNode& fixture) {
    if (container_ && !container_->isLoading()) {
        container_->fixtureOutputChanged(fixture);
    }
}

// ---------------------------------------------------------------------------
// Parameters
// ---------------------------------------------------------------------------

expected<void> FixtureNode::setParameter(std::string_view key, Parameter::Value value) {
    Parameter* p = parameter(key);
    if (!p) {
        return unexpected(errc::unknown_parameter);
    }
    return set(*p, std::move(value));
}

expected<void> FixtureNode::set(Parameter& parameter, Parameter::Value value) {
    if (std::find(parameters_.begin(), parameters_.end(), &parameter) == parameters_.end()) {
        return unexpected(errc::unknown_parameter);
    }
    if (disposed_) {
        return unexpected(errc::invalid_argument);
    }
    const bool structural = parameter.tier() == ParameterTier::Metrics ||
                            parameter.tier() == ParameterTier::Datagram;
    if (structural && isAttached() && !isLoading() && isIterating()) {
        return unexpected(errc::reentrant_mutation);
    }

    auto changed = parameter.assign(std::move(value));
    if (!changed) {
        return unexpected(changed.error());
    }
    if (!*changed) {
        return {};
    }
    return onParameterChanged(parameter);
}

expected<void> FixtureNode::onParameterChanged(Parameter& parameter) {
    if (isLoading() || (!isAttached() && !generated_)) {
        return {};
    }

    switch (parameter.tier()) {
        case ParameterTier::Metrics:
            return regenerate();

        case ParameterTier::Geometry:
            recomputeGeometry();
            fixtureGeometryChanged(*this);
            return {};

        case ParameterTier::Datagram:
            rebuildPacketSpecs();
            fixturePacketsChanged(*this);
            return {};

        case ParameterTier::Output:
            fixtureOutputChanged(*this);
            return {};
    }
    return {};
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

model::Matrix FixtureNode::computeGeometryMatrix(const model::Matrix& parentTransform) const {
    model::Matrix m = model::translate(parentTransform, x.getFloat(), y.getFloat(), z.getFloat());
    m = model::rotateY(m, glm::radians(yaw.getFloat()));
    m = model::rotateX(m, glm::radians(pitch.getFloat()));
    m = model::rotateZ(m, glm::radians(roll.getFloat()));
    return m;
}

void FixtureNode::recomputeGeometry() {
    geometryMatrix_ = computeGeometryMatrix(parentTransform_);
    computePointGeometry(geometryMatrix_, points_);
    for (auto& child : children_) {
        child->parentTransform_ = geometryMatrix_;
        child->recomputeGeometry();
    }
}

// ---------------------------------------------------------------------------
// Points & addressing
// ---------------------------------------------------------------------------

std::size_t FixtureNode::totalSize() const {
    std::size_t total = points_.size();
    for (const auto& child : children_) {
        total += child->totalSize();
    }
    return total;
}

expected<model::Point> FixtureNode::point(std::size_t offset) const {
    if (offset < points_.size()) {
        return points_[offset];
    }
    offset -= points_.size();
    for (const auto& child : children_) {
        const std::size_t childSize = child->totalSize();
        if (offset < childSize) {
            return child->point(offset);
        }
        offset -= childSize;
    }
    return unexpected(errc::index_out_of_range);
}

std::vector<std::string> FixtureNode::modelKeys() const {
    return {typeKey()};
}

model::IndexBuffer FixtureNode::toIndexBuffer() const {
    model::IndexBuffer indices;
    indices.reserve(totalSize());
    for (const auto& p : points_) {
        indices.push_back(static_cast<std::int32_t>(p.index));
    }
    for (const auto& child : children_) {
        auto sub = child->toIndexBuffer();
        indices.insert(indices.end(), sub.begin(), sub.end());
    }
    return indices;
}

expected<DynamicIndexBuffer::Ptr> FixtureNode::toDynamicIndexBuffer(std::size_t start,
                                                                    std::size_t count,
                                                                    std::size_t stride) {
    if (disposed_ || stride == 0) {
        return unexpected(errc::invalid_argument);
    }
    if (count > 0 && start + (count - 1) * stride >= totalSize()) {
        return unexpected(errc::index_out_of_range);
    }

    DynamicIndexBuffer::Ptr buffer(
        new DynamicIndexBuffer(*this, start, count, stride, layoutGeneration_, inBuildPacketSpecs_));
    if (auto ok = buffer->refresh(toIndexBuffer()); !ok) {
        return unexpected(ok.error());
    }
    dynamicBuffers_.push_back(buffer);
    return buffer;
}

expected<DynamicIndexBuffer::Ptr> FixtureNode::toDynamicIndexBuffer() {
    return toDynamicIndexBuffer(0, totalSize(), 1);
}

void FixtureNode::refreshDynamicBuffers() {
    if (dynamicBuffers_.empty()) return;

    // One flattening per reindex, shared by every buffer of this node.
    const model::IndexBuffer subtree = toIndexBuffer();
    auto it = dynamicBuffers_.begin();
    while (it != dynamicBuffers_.end()) {
        auto buffer = it->lock();
        if (!buffer) {
            it = dynamicBuffers_.erase(it);
            continue;
        }
        if (auto ok = buffer->refresh(subtree); !ok) {
            logError("[FixtureNode] addressing error in '", label_, "': range ",
                     buffer->start(), "+", buffer->count(), "x", buffer->stride(),
                     " no longer resolves (", ok.error().message(), "), buffer invalidated\n");
            it = dynamicBuffers_.erase(it);
            continue;
        }
        ++it;
    }
}

void FixtureNode::invalidateDynamicBuffers(bool packetScopedOnly) {
    auto it = dynamicBuffers_.begin();
    while (it != dynamicBuffers_.end()) {
        auto buffer = it->lock();
        if (buffer && packetScopedOnly && !buffer->isPacketScoped()) {
            ++it;
            continue;
        }
        if (buffer) {
            buffer->invalidate();
        }
        it = dynamicBuffers_.erase(it);
    }
}

// ---------------------------------------------------------------------------
// Models
// ---------------------------------------------------------------------------

model::Model::Ptr FixtureNode::toModel() {
    auto storage = std::make_shared<model::Model::Storage>();
    storage->points.reserve(totalSize());
    return buildModel(storage);
}

model::Model::Ptr FixtureNode::buildModel(const std::shared_ptr<model::Model::Storage>& storage) const {
    const std::size_t offset = storage->points.size();
    storage->points.insert(storage->points.end(), points_.begin(), points_.end());

    std::vector<model::Model::Ptr> childModels;
    childModels.reserve(children_.size());
    for (auto& child : children_) {
        childModels.push_back(child->buildModel(storage));
    }
    for (auto& sub : submodels()) {
        if (sub.count == 0 || sub.stride == 0 ||
            sub.start + (sub.count - 1) * sub.stride >= points_.size()) {
            logWarning("[FixtureNode] '", label_, "' skipped submodel outside its points\n");
            continue;
        }
        childModels.push_back(std::make_shared<model::Model>(
            storage, offset + sub.start, sub.count, sub.stride,
            std::move(sub.keys), std::vector<model::Model::Ptr>{}, geometryMatrix_));
    }

    return std::make_shared<model::Model>(
        storage, offset, storage->points.size() - offset, 1,
        modelKeys(), std::move(childModels), geometryMatrix_);
}

// ---------------------------------------------------------------------------
// Packets
// ---------------------------------------------------------------------------

output::PacketAddress FixtureNode::datagramAddress() const {
    output::PacketAddress address;
    address.protocol = output::protocolFromString(protocol.getString()).value_or(output::Protocol::None);
    address.kinetVersion = output::kinetVersionFromString(kinetVersion.getString())
                               .value_or(output::KinetVersion::PortOut);
    address.universe = static_cast<std::uint32_t>(universe.getInt());
    address.kinetPort = static_cast<std::uint8_t>(kinetPort.getInt());
    address.channel = static_cast<std::uint8_t>(channel.getInt());
    address.byteOrder = output::byteOrderFromString(byteOrder.getString()).value_or(output::ByteOrder::RGB);
    return address;
}

output::Destination FixtureNode::datagramDestination() const {
    output::Destination destination;
    destination.host = host.getString();
    destination.port = static_cast<unsigned short>(port.getInt());
    return destination;
}

expected<void> FixtureNode::addPacketSpec(output::OutputPacketSpec::Ptr spec) {
    if (!inBuildPacketSpecs_) {
        return unexpected(errc::packet_spec_outside_build);
    }
    if (!spec) {
        return unexpected(errc::invalid_argument);
    }
    if (std::find(packetSpecs_.begin(), packetSpecs_.end(), spec) != packetSpecs_.end()) {
        return unexpected(errc::duplicate_packet_spec);
    }
    packetSpecs_.push_back(std::move(spec));
    return {};
}

expected<void> FixtureNode::removePacketSpec(const output::OutputPacketSpec::Ptr& spec) {
    if (!inBuildPacketSpecs_) {
        return unexpected(errc::packet_spec_outside_build);
    }
    auto it = std::find(packetSpecs_.begin(), packetSpecs_.end(), spec);
    if (it == packetSpecs_.end()) {
        return unexpected(errc::unknown_packet_spec);
    }
    (*it)->release();
    packetSpecs_.erase(it);
    return {};
}

void FixtureNode::releasePacketSpecs() {
    for (auto& spec : packetSpecs_) {
        spec->release();
    }
    packetSpecs_.clear();
}

void FixtureNode::rebuildPacketSpecs() {
    releasePacketSpecs();
    invalidateDynamicBuffers(true);

    inBuildPacketSpecs_ = true;
    buildPacketSpecs();
    inBuildPacketSpecs_ = false;
}

void FixtureNode::buildPacketSpecs() {
    const output::PacketAddress address = datagramAddress();
    if (address.protocol == output::Protocol::None || points_.empty()) {
        return;
    }
    const output::PacketEncoder* encoder = output::encoderFor(address.protocol);
    if (!encoder) {
        return;
    }

    const output::Destination destination = datagramDestination();
    const std::size_t chunk = encoder->maxPoints(address);
    std::uint32_t packet = 0;

    for (std::size_t start = 0; start < points_.size(); start += chunk, ++packet) {
        const std::size_t count = std::min(chunk, points_.size() - start);

        if (address.protocol == output::Protocol::Kinet &&
            address.kinetPort + packet > std::numeric_limits<std::uint8_t>::max()) {
            logError("[FixtureNode] '", label_, "' needs KiNET port ", address.kinetPort + packet,
                     " past the last port 255; ", points_.size() - start, " point(s) not sent\n");
            return;
        }

        output::PacketAddress chunkAddress = address;
        chunkAddress.universe = address.universe + packet;
        chunkAddress.kinetPort = static_cast<std::uint8_t>(address.kinetPort + packet);
        chunkAddress.dataOffset = static_cast<std::uint32_t>(start * output::BYTES_PER_POINT);

        auto buffer = toDynamicIndexBuffer(start, count);
        if (!buffer) {
            logError("[FixtureNode] '", label_, "' packet ", packet, " has no index range: ",
                     buffer.error().message(), "\n");
            return;
        }

        auto spec = output::OutputPacketSpec::create(
            chunkAddress, output::IndexSource(*buffer), destination, label_);
        if (!spec) {
            logError("[FixtureNode] '", label_, "' packet ", packet, " not built (",
                     output::toString(address.protocol), "): ", spec.error().message(), "\n");
            continue;
        }
        if (auto added = addPacketSpec(std::move(*spec)); !added) {
            logError("[FixtureNode] '", label_, "' packet ", packet, " rejected: ",
                     added.error().message(), "\n");
        }
    }
}

} // namespace lumen::structure
