#pragma once

#include <cstdint>
#include <vector>

#include "lumen/model/Geometry.hpp"

namespace lumen::model {

// A single addressable light-emitting point.
// - index    : global position in the colour buffer, reassigned on reindex
// - position : structure-space coordinates, recomputed on geometry change
struct Point {
    std::uint32_t index = 0;
    Vec3 position{0.0f, 0.0f, 0.0f};
};

/// Ordered list of colour-buffer indices. UNMAPPED_INDEX entries are sent blank.
using IndexBuffer = std::vector<std::int32_t>;

constexpr std::int32_t UNMAPPED_INDEX = -1;

} // namespace lumen::model
