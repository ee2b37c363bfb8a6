#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace lumen::model {

using Vec3 = glm::vec3;
using Matrix = glm::mat4;

inline Matrix identityMatrix() {
    return Matrix(1.0f);
}

/// Applies the affine transform to a local-space position.
inline Vec3 transformPoint(const Matrix& transform, const Vec3& local) {
    const glm::vec4 world = transform * glm::vec4(local, 1.0f);
    return Vec3(world.x, world.y, world.z);
}

// Post-multiplying helpers, so `m = rotateY(translate(m, ...), ...)` composes
// in reading order: parent * T * Ry.
inline Matrix translate(const Matrix& m, float x, float y, float z) {
    return glm::translate(m, Vec3(x, y, z));
}

inline Matrix rotateX(const Matrix& m, float radians) {
    return glm::rotate(m, radians, Vec3(1.0f, 0.0f, 0.0f));
}

inline Matrix rotateY(const Matrix& m, float radians) {
    return glm::rotate(m, radians, Vec3(0.0f, 1.0f, 0.0f));
}

inline Matrix rotateZ(const Matrix& m, float radians) {
    return glm::rotate(m, radians, Vec3(0.0f, 0.0f, 1.0f));
}

} // namespace lumen::model
