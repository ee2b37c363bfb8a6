#include "lumen/structure/GridFixture.hpp"

#include <utility>

namespace lumen::structure {

GridFixture::GridFixture(std::string label)
: FixtureNode(std::move(label)) {
    addParameter(numRows);
    addParameter(numColumns);
    addParameter(rowSpacing);
    addParameter(columnSpacing);
}

std::size_t GridFixture::size() const {
    return static_cast<std::size_t>(numRows.getInt()) * static_cast<std::size_t>(numColumns.getInt());
}

void GridFixture::computePointGeometry(const model::Matrix& transform,
                                       std::vector<model::Point>& points) const {
    const auto columns = static_cast<std::size_t>(numColumns.getInt());
    const float dx = columnSpacing.getFloat();
    const float dy = rowSpacing.getFloat();
    for (std::size_t i = 0; i < points.size(); ++i) {
        const auto row = static_cast<float>(i / columns);
        const auto column = static_cast<float>(i % columns);
        points[i].position = model::transformPoint(transform, model::Vec3(column * dx, row * dy, 0.0f));
    }
}

std::vector<FixtureNode::Submodel> GridFixture::submodels() const {
    const auto rows = static_cast<std::size_t>(numRows.getInt());
    const auto columns = static_cast<std::size_t>(numColumns.getInt());

    std::vector<Submodel> subs;
    subs.reserve(rows + columns);
    for (std::size_t r = 0; r < rows; ++r) {
        subs.push_back({r * columns, columns, 1, {"row"}});
    }
    for (std::size_t c = 0; c < columns; ++c) {
        subs.push_back({c, rows, columns, {"column"}});
    }
    return subs;
}

} // namespace lumen::structure
