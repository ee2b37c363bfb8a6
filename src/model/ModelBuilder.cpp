#include "lumen/model/ModelBuilder.hpp"

#include <utility>

namespace lumen::model {

ModelBuilder::ModelBuilder()
: ModelBuilder(std::vector<std::string>{Model::DEFAULT_KEY}) {}

ModelBuilder::ModelBuilder(std::vector<std::string> initialKeys)
: keys(std::move(initialKeys)) {}

expected<void> ModelBuilder::checkEditState() const {
    if (model) {
        return unexpected(errc::model_builder_locked);
    }
    return {};
}

expected<void> ModelBuilder::addKey(std::string key) {
    if (auto ok = checkEditState(); !ok) return ok;
    keys.push_back(std::move(key));
    return {};
}

expected<void> ModelBuilder::setKeys(std::vector<std::string> newKeys) {
    if (auto ok = checkEditState(); !ok) return ok;
    keys = std::move(newKeys);
    return {};
}

expected<void> ModelBuilder::addPoint(const Vec3& position) {
    if (auto ok = checkEditState(); !ok) return ok;
    Point p;
    p.index = static_cast<std::uint32_t>(points.size());
    p.position = position;
    points.push_back(p);
    return {};
}

expected<void> ModelBuilder::addPoints(const std::vector<Vec3>& positions) {
    if (auto ok = checkEditState(); !ok) return ok;
    points.reserve(points.size() + positions.size());
    for (const auto& position : positions) {
        Point p;
        p.index = static_cast<std::uint32_t>(points.size());
        p.position = position;
        points.push_back(p);
    }
    return {};
}

expected<void> ModelBuilder::addChild(const ModelBuilder& child) {
    if (auto ok = checkEditState(); !ok) return ok;
    if (&child == this) {
        return unexpected(errc::invalid_argument);
    }

    ChildRange range;
    range.offset = points.size();
    range.count = child.points.size();
    range.keys = child.keys;
    range.children = child.children; // offsets stay relative to the child

    for (const auto& source : child.points) {
        Point p = source;
        p.index = static_cast<std::uint32_t>(points.size());
        points.push_back(p);
    }
    children.push_back(std::move(range));
    return {};
}

IndexBuffer ModelBuilder::toIndexBuffer() const {
    IndexBuffer indices;
    indices.reserve(points.size());
    for (const auto& p : points) {
        indices.push_back(static_cast<std::int32_t>(p.index));
    }
    return indices;
}

std::vector<Model::Ptr> ModelBuilder::buildChildren(const std::shared_ptr<Model::Storage>& storage,
                                                    const std::vector<ChildRange>& ranges,
                                                    std::size_t baseOffset) {
    std::vector<Model::Ptr> built;
    built.reserve(ranges.size());
    for (const auto& range : ranges) {
        const auto offset = baseOffset + range.offset;
        built.push_back(std::make_shared<Model>(storage, offset, range.count, 1, range.keys,
                                                buildChildren(storage, range.children, offset),
                                                identityMatrix()));
    }
    return built;
}

Model::Ptr ModelBuilder::toModel() {
    if (model) {
        return model;
    }
    auto storage = std::make_shared<Model::Storage>();
    storage->points = points;
    const auto count = storage->points.size();
    auto childModels = buildChildren(storage, children, 0);
    model = std::make_shared<Model>(storage, 0, count, 1, keys, std::move(childModels), identityMatrix());
    return model;
}

} // namespace lumen::model
