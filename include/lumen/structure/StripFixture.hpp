#pragma once

#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

/**
 * @brief Straight line of evenly spaced points along the local x axis.
 *
 * numPoints is a metrics parameter (changing it regenerates the fixture);
 * spacing only moves points.
 */
class StripFixture : public FixtureNode {
public:
    static constexpr int MAX_POINTS = 4096;

    explicit StripFixture(std::string label = "Strip");

    std::string typeKey() const override { return "strip"; }
    std::size_t size() const override;

protected:
    void computePointGeometry(const model::Matrix& transform,
                              std::vector<model::Point>& points) const override;

    Parameter numPoints{"numPoints", 10, 0, MAX_POINTS, ParameterTier::Metrics};
    Parameter spacing{"spacing", 10.0, 0.0, 1.0e6, ParameterTier::Geometry};
};

} // namespace lumen::structure
