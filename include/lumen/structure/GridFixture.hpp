#pragma once

#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

/**
 * @brief Rows x columns of points in the local xy plane, row-major.
 *
 * The model exposes one "row" submodel per row and one strided "column"
 * submodel per column.
 */
class GridFixture : public FixtureNode {
public:
    explicit GridFixture(std::string label = "Grid");

    std::string typeKey() const override { return "grid"; }
    std::size_t size() const override;

protected:
    void computePointGeometry(const model::Matrix& transform,
                              std::vector<model::Point>& points) const override;
    std::vector<Submodel> submodels() const override;

    Parameter numRows{"numRows", 10, 1, 1024, ParameterTier::Metrics};
    Parameter numColumns{"numColumns", 10, 1, 1024, ParameterTier::Metrics};
    Parameter rowSpacing{"rowSpacing", 10.0, 0.0, 1.0e6, ParameterTier::Geometry};
    Parameter columnSpacing{"columnSpacing", 10.0, 0.0, 1.0e6, ParameterTier::Geometry};
};

} // namespace lumen::structure
