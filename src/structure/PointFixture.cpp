#include "lumen/structure/PointFixture.hpp"

#include <utility>

namespace lumen::structure {

PointFixture::PointFixture(std::string label)
: FixtureNode(std::move(label)) {}

void PointFixture::computePointGeometry(const model::Matrix& transform,
                                        std::vector<model::Point>& points) const {
    for (auto& p : points) {
        p.position = model::transformPoint(transform, model::Vec3(0.0f, 0.0f, 0.0f));
    }
}

} // namespace lumen::structure
