#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lumen/core/Expected.hpp"
#include "lumen/model/Model.hpp"
#include "lumen/output/OutputPacketSpec.hpp"
#include "lumen/structure/FixtureContainer.hpp"
#include "lumen/structure/FixtureFactory.hpp"
#include "lumen/structure/FixtureNode.hpp"
#include "lumen/structure/IterationScope.hpp"

namespace lumen::structure {

/**
 * @brief Root container of the fixture tree.
 *
 * Owns the top-level fixtures, assigns global point indices, and publishes two
 * snapshots for other threads:
 * - model():       the root Model, one child per top-level fixture
 * - outputFrame(): every packet spec with its fixture's effective output state
 *
 * Both are swapped atomically, so readers on the output thread never block the
 * mutation thread and never see a half-built snapshot.
 */
class Structure : public FixtureContainer {
public:
    static constexpr int FILE_VERSION = 1;

    /// Invoked on the mutation thread after a new model is published.
    using ModelChangedCallback = std::function<void(const model::Model::Ptr& model, bool geometryOnly)>;

    explicit Structure(const FixtureFactory& factory = FixtureFactory::builtin());
    ~Structure() override;

    Structure(const Structure&) = delete;
    Structure& operator=(const Structure&) = delete;

    expected<void> addFixture(std::unique_ptr<FixtureNode> fixture,
                              std::optional<std::size_t> position = std::nullopt);
    expected<std::unique_ptr<FixtureNode>> removeFixture(FixtureNode& fixture);
    expected<void> moveFixture(FixtureNode& fixture, std::size_t position);
    expected<void> removeAllFixtures();

    const std::vector<std::unique_ptr<FixtureNode>>& fixtures() const { return fixtures_; }
    std::size_t totalSize() const;

    /// Solo @p fixture (clearing any other solo), or clear solo with nullptr.
    expected<void> soloFixture(FixtureNode* fixture);

    model::Model::Ptr model() const;
    std::shared_ptr<const output::OutputFrame> outputFrame() const;

    void setModelChangedCallback(ModelChangedCallback callback);

    IterationScope beginIteration() { return IterationScope(iterationDepth_); }
    bool isIterating() const override { return iterationDepth_ > 0; }
    bool isLoading() const override { return loading_; }

    // Persistence ------------------------------------------------------------
    nlohmann::json save() const;
    expected<void> load(const nlohmann::json& document);
    expected<void> saveFile(const std::string& path) const;
    expected<void> loadFile(const std::string& path);

    // FixtureContainer -------------------------------------------------------
    void fixtureGenerationChanged(FixtureNode& fixture) override;
    void fixtureGeometryChanged(FixtureNode& fixture) override;
    void fixturePacketsChanged(FixtureNode& fixture) override;
    void fixtureOutputChanged(FixtureNode& fixture) override;

private:
    expected<void> checkMutable() const;
    void renumberFixtures();
    void rebuild();
    void reindex();
    void rebuildModel(bool geometryOnly);
    void publishOutput();
    void notifyModelChanged(bool geometryOnly);

    expected<std::unique_ptr<FixtureNode>> fixtureFromJson(const nlohmann::json& object) const;

    const FixtureFactory* factory_;
    std::vector<std::unique_ptr<FixtureNode>> fixtures_;

    std::shared_ptr<const model::Model> model_;
    std::shared_ptr<const output::OutputFrame> outputFrame_;
    std::uint64_t outputGeneration_ = 0;

    ModelChangedCallback modelChangedCallback_;

    std::size_t iterationDepth_ = 0;
    bool loading_ = false;
};

nlohmann::json fixtureToJson(const FixtureNode& fixture);

} // namespace lumen::structure
