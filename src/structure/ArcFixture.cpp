#include "lumen/structure/ArcFixture.hpp"

#include <cmath>
#include <utility>

#include <glm/trigonometric.hpp>

namespace lumen::structure {

ArcFixture::ArcFixture(std::string label)
: FixtureNode(std::move(label)) {
    addParameter(numPoints);
    addParameter(radius);
    addParameter(degrees);
}

std::size_t ArcFixture::size() const {
    return static_cast<std::size_t>(numPoints.getInt());
}

void ArcFixture::computePointGeometry(const model::Matrix& transform,
                                      std::vector<model::Point>& points) const {
    const float r = radius.getFloat();
    const float sweep = glm::radians(degrees.getFloat());
    // The first and last points sit on the ends of the arc.
    const float step = points.size() > 1 ? sweep / static_cast<float>(points.size() - 1) : 0.0f;
    for (std::size_t i = 0; i < points.size(); ++i) {
        const float theta = static_cast<float>(i) * step;
        points[i].position = model::transformPoint(
            transform, model::Vec3(r * std::cos(theta), r * std::sin(theta), 0.0f));
    }
}

} // namespace lumen::structure
