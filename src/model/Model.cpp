#include "lumen/model/Model.hpp"

#include <algorithm>
#include <glm/common.hpp>
#include <utility>

namespace lumen::model {

Model::Model(std::shared_ptr<Storage> storage,
             std::size_t offset,
             std::size_t count,
             std::size_t stride,
             std::vector<std::string> keys,
             std::vector<Ptr> children,
             const Matrix& transform)
: storage_(std::move(storage))
, offset_(offset)
, count_(count)
, stride_(stride == 0 ? 1 : stride)
, keys_(std::move(keys))
, children_(std::move(children))
, transform_(transform)
{
    if (keys_.empty()) {
        keys_.emplace_back(DEFAULT_KEY);
    }
}

std::shared_ptr<Model> Model::fromPoints(std::vector<Point> points, std::vector<std::string> keys) {
    auto storage = std::make_shared<Storage>();
    storage->points = std::move(points);
    const auto count = storage->points.size();
    return std::make_shared<Model>(std::move(storage), 0, count, 1,
                                   std::move(keys), std::vector<Ptr>{}, identityMatrix());
}

std::vector<Point> Model::points() const {
    std::vector<Point> out;
    out.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        out.push_back(point(i));
    }
    return out;
}

bool Model::is(std::string_view key) const {
    return std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

std::vector<Model::Ptr> Model::sub(std::string_view key) const {
    std::vector<Ptr> found;
    for (const auto& child : children_) {
        if (child->is(key)) {
            found.push_back(child);
        }
        auto nested = child->sub(key);
        found.insert(found.end(), nested.begin(), nested.end());
    }
    return found;
}

IndexBuffer Model::toIndexBuffer() const {
    IndexBuffer indices;
    indices.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        indices.push_back(static_cast<std::int32_t>(point(i).index));
    }
    return indices;
}

Model::Bounds Model::bounds() const {
    Bounds b;
    if (count_ == 0) {
        return b;
    }
    b.min = b.max = point(0).position;
    for (std::size_t i = 1; i < count_; ++i) {
        const auto& p = point(i).position;
        b.min = glm::min(b.min, p);
        b.max = glm::max(b.max, p);
    }
    return b;
}

} // namespace lumen::model
