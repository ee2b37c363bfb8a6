#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lumen/core/Expected.hpp"
#include "lumen/model/Geometry.hpp"
#include "lumen/model/Model.hpp"
#include "lumen/model/Point.hpp"
#include "lumen/output/OutputPacketSpec.hpp"
#include "lumen/structure/DynamicIndexBuffer.hpp"
#include "lumen/structure/FixtureContainer.hpp"
#include "lumen/structure/IterationScope.hpp"
#include "lumen/structure/Parameter.hpp"

namespace lumen::structure {

class Structure;

/**
 * @brief Mutable node of the fixture tree.
 *
 * A fixture owns its own points (stored by value), its children, and the
 * packet specs that send its points to hardware. Point indices over a subtree
 * are the contiguous pre-order partition of
 * [firstPointIndex(), firstPointIndex() + totalSize()): own points first,
 * then each child in order.
 *
 * Parameter changes propagate by tier:
 * - Metrics:  regenerate() (points reallocated, container reindexes)
 * - Geometry: positions recomputed in place, indices untouched
 * - Datagram: packet specs rebuilt
 * - Output:   output state republished
 * Changes apply immediately once the fixture has been generated (by being
 * attached, or by regenerate()), including on a detached root, except while
 * its structure is loading. A fixture that was never generated only stores
 * values and applies them all on its first regenerate.
 *
 * Threading model: every method runs on the mutation thread. Other threads
 * only see models, dynamic index buffers and packet specs published from here.
 */
class FixtureNode : public FixtureContainer {
public:
    struct Submodel {
        std::size_t start = 0;
        std::size_t count = 0;
        std::size_t stride = 1;
        std::vector<std::string> keys;
    };

    explicit FixtureNode(std::string label = {});
    ~FixtureNode() override;

    FixtureNode(const FixtureNode&) = delete;
    FixtureNode& operator=(const FixtureNode&) = delete;

    /// Persistence type key ("strip", "grid", ...).
    virtual std::string typeKey() const = 0;

    const std::string& label() const { return label_; }
    void setLabel(std::string label) { label_ = std::move(label); }

    /// Position among the siblings of the same container.
    std::size_t index() const { return index_; }
    FixtureContainer* container() const { return container_; }
    FixtureNode* parent() const { return parent_; }
    bool isAttached() const { return container_ != nullptr; }
    bool isDisposed() const { return disposed_; }

    // --- tree -------------------------------------------------------------
    expected<void> addChild(std::unique_ptr<FixtureNode> child,
                            std::optional<std::size_t> position = std::nullopt);
    expected<std::unique_ptr<FixtureNode>> removeChild(FixtureNode& child);
    const std::vector<std::unique_ptr<FixtureNode>>& children() const { return children_; }

    /// Reallocates own points, recomputes geometry, rebuilds packet specs.
    expected<void> regenerate();

    /// Pre-order index assignment from @p startIndex. Returns whether anything moved.
    bool reindex(std::uint32_t startIndex);

    expected<void> dispose();

    // --- points -----------------------------------------------------------
    /// Number of points owned directly by this fixture.
    virtual std::size_t size() const = 0;
    std::size_t totalSize() const;
    std::uint32_t firstPointIndex() const { return firstPointIndex_; }
    const std::vector<model::Point>& points() const { return points_; }

    /// Point at @p offset within the subtree (own points, then children).
    expected<model::Point> point(std::size_t offset) const;

    const model::Matrix& geometryMatrix() const { return geometryMatrix_; }
    const model::Matrix& parentTransform() const { return parentTransform_; }

    virtual std::vector<std::string> modelKeys() const;

    // --- addressing -------------------------------------------------------
    model::IndexBuffer toIndexBuffer() const;
    expected<DynamicIndexBuffer::Ptr> toDynamicIndexBuffer(std::size_t start,
                                                           std::size_t count,
                                                           std::size_t stride = 1);
    expected<DynamicIndexBuffer::Ptr> toDynamicIndexBuffer();

    /// Deep-copied snapshot of the subtree.
    model::Model::Ptr toModel();

    // --- parameters -------------------------------------------------------
    const std::vector<Parameter*>& parameters() const { return parameters_; }
    Parameter* parameter(std::string_view key) const;
    expected<void> setParameter(std::string_view key, Parameter::Value value);
    expected<void> set(Parameter& parameter, Parameter::Value value);

    bool isEnabled() const { return enabled.getBool(); }
    bool isMuted() const { return mute.getBool(); }
    bool isSoloed() const { return solo.getBool(); }
    bool isSelected() const { return selected.getBool(); }
    bool isIdentifying() const { return identify.getBool(); }
    float brightnessLevel() const { return brightness.getFloat(); }

    // --- packets ----------------------------------------------------------
    const std::vector<output::OutputPacketSpec::Ptr>& packetSpecs() const { return packetSpecs_; }

    /// Only valid from buildPacketSpecs() / reindexPacketSpecs().
    expected<void> addPacketSpec(output::OutputPacketSpec::Ptr spec);
    expected<void> removePacketSpec(const output::OutputPacketSpec::Ptr& spec);

    /// Addressing built from the datagram parameters, protocol None when disabled.
    output::PacketAddress datagramAddress() const;
    output::Destination datagramDestination() const;

    // --- reentrancy -------------------------------------------------------
    IterationScope beginIteration() { return IterationScope(iterationDepth_); }
    bool isIterating() const override;
    bool isLoading() const override;

    // --- FixtureContainer (children report here) ---------------------------
    void fixtureGenerationChanged(FixtureNode& fixture) override;
    void fixtureGeometryChanged(FixtureNode& fixture) override;
    void fixturePacketsChanged(FixtureNode& fixture) override;
    void fixtureOutputChanged(FixtureNode& fixture) override;

    std::uint64_t layoutGeneration() const { return layoutGeneration_; }

protected:
    /// Registers a subclass parameter; call from the subclass constructor.
    void addParameter(Parameter& parameter);

    /// Local transform composed onto the parent's: parent * T * Ry * Rx * Rz.
    virtual model::Matrix computeGeometryMatrix(const model::Matrix& parentTransform) const;

    /// Writes structure-space positions of the own points using @p transform.
    virtual void computePointGeometry(const model::Matrix& transform,
                                      std::vector<model::Point>& points) const = 0;

    /// Default: one packet per protocol-sized chunk of own points.
    virtual void buildPacketSpecs();

    /// Called after a reindex that moved points in this subtree.
    virtual void reindexPacketSpecs() {}

    virtual std::vector<Submodel> submodels() const { return {}; }

    virtual void onRegenerate() {}

    Parameter x{"x", 0.0, -1.0e6, 1.0e6, ParameterTier::Geometry};
    Parameter y{"y", 0.0, -1.0e6, 1.0e6, ParameterTier::Geometry};
    Parameter z{"z", 0.0, -1.0e6, 1.0e6, ParameterTier::Geometry};
    Parameter yaw{"yaw", 0.0, -360.0, 360.0, ParameterTier::Geometry};
    Parameter pitch{"pitch", 0.0, -360.0, 360.0, ParameterTier::Geometry};
    Parameter roll{"roll", 0.0, -360.0, 360.0, ParameterTier::Geometry};

    Parameter enabled{"enabled", true};
    Parameter brightness{"brightness", 1.0, 0.0, 1.0, ParameterTier::Output};
    Parameter mute{"mute", false};
    Parameter solo{"solo", false};
    Parameter selected{"selected", false};
    Parameter identify{"identify", false};

    Parameter protocol{"protocol", std::string("none"),
                       {"none", "artnet", "sacn", "opc", "ddp", "kinet"}, ParameterTier::Datagram};
    Parameter host{"host", std::string(), ParameterTier::Datagram};
    Parameter port{"port", 0, 0, 65535, ParameterTier::Datagram};
    Parameter universe{"universe", 0, 0, 63999, ParameterTier::Datagram};
    Parameter kinetPort{"kinetPort", 1, 0, 255, ParameterTier::Datagram};
    Parameter kinetVersion{"kinetVersion", std::string("portout"),
                           {"portout", "dmxout"}, ParameterTier::Datagram};
    Parameter channel{"channel", 0, 0, 255, ParameterTier::Datagram};
    Parameter byteOrder{"byteOrder", std::string("rgb"),
                        {"rgb", "rbg", "grb", "gbr", "brg", "bgr"}, ParameterTier::Datagram};

private:
    friend class DynamicIndexBuffer;
    friend class Structure;

    expected<void> checkMutable() const;
    void attach(FixtureContainer& container, FixtureNode* parent, std::size_t index,
                const model::Matrix& parentTransform);
    void detach();
    void renumberChildren();

    expected<void> onParameterChanged(Parameter& parameter);
    void recomputeGeometry();
    void rebuildPacketSpecs();
    void releasePacketSpecs();
    void refreshDynamicBuffers();
    void invalidateDynamicBuffers(bool packetScopedOnly);
    void teardown();

    model::Model::Ptr buildModel(const std::shared_ptr<model::Model::Storage>& storage) const;

    std::string label_;
    std::size_t index_ = 0;
    FixtureContainer* container_ = nullptr;
    FixtureNode* parent_ = nullptr;

    std::vector<std::unique_ptr<FixtureNode>> children_;
    std::vector<model::Point> points_;
    std::uint32_t firstPointIndex_ = 0;
    bool layoutDirty_ = true;
    std::uint64_t layoutGeneration_ = 0;

    model::Matrix parentTransform_{1.0f};
    model::Matrix geometryMatrix_{1.0f};

    std::vector<Parameter*> parameters_;
    std::vector<output::OutputPacketSpec::Ptr> packetSpecs_;
    std::vector<std::weak_ptr<DynamicIndexBuffer>> dynamicBuffers_;

    bool generated_ = false;
    bool inBuildPacketSpecs_ = false;
    std::size_t iterationDepth_ = 0;
    bool disposed_ = false;
};

} // namespace lumen::structure
