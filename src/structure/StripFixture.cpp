#include "lumen/structure/StripFixture.hpp"

#include <utility>

namespace lumen::structure {

StripFixture::StripFixture(std::string label)
: FixtureNode(std::move(label)) {
    addParameter(numPoints);
    addParameter(spacing);
}

std::size_t StripFixture::size() const {
    return static_cast<std::size_t>(numPoints.getInt());
}

void StripFixture::computePointGeometry(const model::Matrix& transform,
                                        std::vector<model::Point>& points) const {
    const float step = spacing.getFloat();
    for (std::size_t i = 0; i < points.size(); ++i) {
        points[i].position = model::transformPoint(
            transform, model::Vec3(static_cast<float>(i) * step, 0.0f, 0.0f));
    }
}

} // namespace lumen::structure
