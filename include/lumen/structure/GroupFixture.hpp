#pragma once

#include "lumen/structure/FixtureNode.hpp"

namespace lumen::structure {

/// Container without points of its own; positions its children as one unit.
class GroupFixture : public FixtureNode {
public:
    explicit GroupFixture(std::string label = "Group");

    std::string typeKey() const override { return "group"; }
    std::size_t size() const override { return 0; }

protected:
    void computePointGeometry(const model::Matrix&, std::vector<model::Point>&) const override {}
};

} // namespace lumen::structure
