#pragma once
#include <cmath>
#include <string>

#include "tessera/core/common/logger.hpp"
#include "tessera/core/common/status.hpp"
#include "tessera/core/math/eigen_traits.hpp"
#include "tessera/core/mesh/extrude.hpp"
#include "tessera/core/mesh/project.hpp"
#include "tessera/core/mesh/simplex_mesh.hpp"

namespace tessera::core {

// Primitive builders. All shapes are centered at the origin and sized by
// full side lengths. 2D triangles are wound so that their handedness is +1,
// and the solids built from them by extrusion inherit it.

template <typename V = Vec2>
TriangleMesh<V> makeRectangle(float size_x, float size_y) {
  using T = VectorTraits<V>;
  const float x = 0.5f * size_x;
  const float y = 0.5f * size_y;
  TriangleMesh<V> mesh;
  mesh.vertices = {{T::make(x, y)}, {T::make(x, -y)}, {T::make(-x, -y)}, {T::make(-x, y)}};
  mesh.simplexes = {{0, 1, 2}, {2, 3, 0}};
  return mesh;
}

template <typename V = Vec2>
TriangleMesh<V> makeSquare(float size) {
  return makeRectangle<V>(size, size);
}

// Regular polygon with `sides` vertices on a circle of `radius`, as a fan
// around vertex 0.
template <typename V = Vec2>
Status makeCircle(float radius, int sides, TriangleMesh<V>* out) {
  if (!out) return Status::InvalidParameter;
  if (sides < 3 || !(radius > 0.0f)) {
    log(LogLevel::Error, "mesh",
        "makeCircle: need sides >= 3 and radius > 0 (sides=" + std::to_string(sides) +
        ", radius=" + std::to_string(radius) + ")");
    return Status::InvalidParameter;
  }
  constexpr double kTwoPi = 6.283185307179586;
  TriangleMesh<V> mesh;
  mesh.vertices.reserve(static_cast<std::size_t>(sides));
  for (int i = 0; i < sides; ++i) {
    const double angle = kTwoPi * static_cast<double>(i) / static_cast<double>(sides);
    mesh.vertices.push_back({VectorTraits<V>::make(static_cast<float>(radius * std::cos(angle)),
                                                   static_cast<float>(radius * std::sin(angle)))});
  }
  for (int i = 0; i + 2 < sides; ++i) {
    const auto k = static_cast<SimplexIndex>(i);
    mesh.simplexes.push_back({0, k + 2, k + 1});
  }
  *out = std::move(mesh);
  return Status::Success;
}

// Closed triangle surface of a box.
template <typename V = Vec3>
TriangleMesh<V> makeBoxShell(float size_x, float size_y, float size_z) {
  using T = VectorTraits<V>;
  const float x = 0.5f * size_x;
  const float y = 0.5f * size_y;
  const float z = 0.5f * size_z;
  TriangleMesh<V> mesh;
  mesh.vertices = {
      {T::make(x, y, z)},   {T::make(-x, y, z)},   {T::make(x, -y, z)},   {T::make(-x, -y, z)},
      {T::make(x, y, -z)},  {T::make(-x, y, -z)},  {T::make(x, -y, -z)},  {T::make(-x, -y, -z)},
  };
  mesh.simplexes = {
      {0, 2, 3}, {3, 1, 0},   // +z
      {4, 7, 6}, {4, 5, 7},   // -z
      {0, 4, 2}, {4, 6, 2},   // +x
      {1, 3, 5}, {7, 5, 3},   // -x
      {3, 2, 6}, {3, 6, 7},   // -y
      {0, 1, 4}, {4, 1, 5},   // +y
  };
  return mesh;
}

template <typename V = Vec3>
TriangleMesh<V> makeCubeShell(float size) {
  return makeBoxShell<V>(size, size, size);
}

// Solid box as tetrahedra: the xy rectangle extruded along z.
template <typename V = Vec3>
TetrahedronMesh<V> makeBoxSolid(float size_x, float size_y, float size_z) {
  return extrude(makeRectangle<ProjectedVector<V>>(size_x, size_y), size_z);
}

template <typename V = Vec3>
TetrahedronMesh<V> makeCubeSolid(float size) {
  return makeBoxSolid<V>(size, size, size);
}

// Closed tetrahedral hypersurface of a 4D box: the box shell swept along w,
// capped at w = -size_w/2 and w = +size_w/2 by solid boxes. The top cap is
// inverted so all cells face the same way.
template <typename V = Vec4>
TetrahedronMesh<V> makeTesseract(float size_x, float size_y, float size_z, float size_w) {
  using V3 = ProjectedVector<V>;
  const TetrahedronMesh<V> sides = extrude(makeBoxShell<V3>(size_x, size_y, size_z), size_w);
  const TetrahedronMesh<V3> cap = makeBoxSolid<V3>(size_x, size_y, size_z);
  const float half_w = 0.5f * size_w;
  return sides.join(liftOrthographic(cap, half_w).invert())
              .join(liftOrthographic(cap, -half_w));
}

template <typename V = Vec4>
TetrahedronMesh<V> makeTesseractCube(float size) {
  return makeTesseract<V>(size, size, size, size);
}

}  // namespace tessera::core
