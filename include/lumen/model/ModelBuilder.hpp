#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "lumen/core/Expected.hpp"
#include "lumen/model/Model.hpp"
#include "lumen/model/Point.hpp"

namespace lumen::model {

/**
 * @brief Procedural construction of a model without a fixture tree.
 *
 * Points receive indices in insertion order. Adding a child builder appends
 * a copy of its points (reindexed into this builder) and records the child's
 * range and keys so it becomes a child model of the result.
 *
 * A builder produces exactly one model. After toModel() has been called any
 * further edit fails with errc::model_builder_locked.
 */
class ModelBuilder {
public:
    ModelBuilder();
    explicit ModelBuilder(std::vector<std::string> keys);

    expected<void> addKey(std::string key);
    expected<void> setKeys(std::vector<std::string> keys);

    expected<void> addPoint(const Vec3& position);
    expected<void> addPoints(const std::vector<Vec3>& positions);
    expected<void> addChild(const ModelBuilder& child);

    std::size_t size() const { return points.size(); }
    bool isLocked() const { return model != nullptr; }

    IndexBuffer toIndexBuffer() const;

    /// Converts the builder into its model. Repeated calls return the same model.
    Model::Ptr toModel();

private:
    struct ChildRange {
        std::size_t offset = 0;
        std::size_t count = 0;
        std::vector<std::string> keys;
        std::vector<ChildRange> children;
    };

    expected<void> checkEditState() const;
    static std::vector<Model::Ptr> buildChildren(const std::shared_ptr<Model::Storage>& storage,
                                                 const std::vector<ChildRange>& ranges,
                                                 std::size_t baseOffset);

    std::vector<Point> points;
    std::vector<ChildRange> children;
    std::vector<std::string> keys;
    Model::Ptr model;
};

} // namespace lumen::model
