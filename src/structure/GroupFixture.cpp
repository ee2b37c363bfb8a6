#include "lumen/structure/GroupFixture.hpp"

#include <utility>

namespace lumen::structure {

GroupFixture::GroupFixture(std::string label)
: FixtureNode(std::move(label)) {}

} // namespace lumen::structure
