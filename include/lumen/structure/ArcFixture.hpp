#pragma once

#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

/// Points spread evenly over an arc of the given radius and sweep in the local xy plane.
class ArcFixture : public FixtureNode {
public:
    explicit ArcFixture(std::string label = "Arc");

    std::string typeKey() const override { return "arc"; }
    std::size_t size() const override;

protected:
    void computePointGeometry(const model::Matrix& transform,
                              std::vector<model::Point>& points) const override;

    Parameter numPoints{"numPoints", 10, 0, 4096, ParameterTier::Metrics};
    Parameter radius{"radius", 100.0, 0.0, 1.0e6, ParameterTier::Geometry};
    Parameter degrees{"degrees", 90.0, 0.0, 360.0, ParameterTier::Geometry};
};

} // namespace lumen::structure
