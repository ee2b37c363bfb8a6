#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lumen/model/Geometry.hpp"
#include "lumen/model/Point.hpp"

namespace lumen::model {

/**
 * @brief Immutable snapshot of a set of points, tagged with type keys.
 *
 * A model is a view (offset, count, stride) into a shared, deep-copied point
 * array. The root model of a snapshot and every child model or submodel
 * produced alongside it share that array, so the snapshot costs one copy of
 * the points no matter how deep the tree is.
 *
 * Threading model:
 * - Models are built on the mutation thread and handed to other threads as
 *   `std::shared_ptr<const Model>`.
 * - Nothing in a model changes after construction. Geometry changes publish
 *   a new snapshot with the same point count and indices.
 */
class Model {
public:
    struct Storage {
        std::vector<Point> points;
    };

    struct Bounds {
        Vec3 min{0.0f, 0.0f, 0.0f};
        Vec3 max{0.0f, 0.0f, 0.0f};

        Vec3 center() const { return (min + max) * 0.5f; }
        Vec3 extent() const { return max - min; }
    };

    using Ptr = std::shared_ptr<const Model>;

    static constexpr const char* DEFAULT_KEY = "model";

    Model(std::shared_ptr<Storage> storage,
          std::size_t offset,
          std::size_t count,
          std::size_t stride,
          std::vector<std::string> keys,
          std::vector<Ptr> children,
          const Matrix& transform);

    /// Builds a standalone model that owns a fresh copy of @p points.
    static std::shared_ptr<Model> fromPoints(std::vector<Point> points,
                                             std::vector<std::string> keys = {DEFAULT_KEY});

    std::size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    /// Point at position @p i of this view. Precondition: i < size().
    const Point& point(std::size_t i) const {
        return storage_->points[offset_ + i * stride_];
    }

    std::vector<Point> points() const;

    const std::vector<std::string>& keys() const { return keys_; }
    bool is(std::string_view key) const;

    const std::vector<Ptr>& children() const { return children_; }

    /// All descendants (depth-first, pre-order) tagged with @p key.
    std::vector<Ptr> sub(std::string_view key) const;

    Matrix transform() const { return transform_; }

    IndexBuffer toIndexBuffer() const;

    Bounds bounds() const;

private:
    std::shared_ptr<Storage> storage_;
    std::size_t offset_ = 0;
    std::size_t count_ = 0;
    std::size_t stride_ = 1;
    std::vector<std::string> keys_;
    std::vector<Ptr> children_;
    Matrix transform_{1.0f};
};

} // namespace lumen::model
