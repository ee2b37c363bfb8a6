#pragma once

#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

/// A single point at the fixture origin.
class PointFixture : public FixtureNode {
public:
    explicit PointFixture(std::string label = "Point");

    std::string typeKey() const override { return "point"; }
    std::size_t size() const override { return 1; }

protected:
    void computePointGeometry(const model::Matrix& transform,
                              std::vector<model::Point>& points) const override;
};

} // namespace lumen::structure
