#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace tessera::core {

// Default concrete vector family. Everything in tessera is templated on the
// vector type; these aliases select Eigen single precision storage.
// - 4D points use (x, y, z, w) ordering; w is the axis removed by projection
//   and cross-section.
using Vec2 = Eigen::Vector2f;
using Vec3 = Eigen::Vector3f;
using Vec4 = Eigen::Vector4f;
using Mat4 = Eigen::Matrix4f;

}  // namespace tessera::core
