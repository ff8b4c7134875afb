#pragma once
#include <cstddef>

#include "tessera/core/mesh/project.hpp"
#include "tessera/core/mesh/simplex_mesh.hpp"

namespace tessera::core {

// Sweeps a triangle mesh along a new last axis from -height/2 to +height/2.
// Vertex i of the input becomes vertex i at -height/2 and vertex i + n at
// +height/2. Each triangle (a, b, c) fills its prism with three tetrahedra
//   (a, c, b, a'), (c, b, a', c'), (a', b', c', b)
// which tile it without gaps, and a triangle of handedness s yields
// tetrahedra of handedness s.
template <typename V>
TetrahedronMesh<LiftedVector<V>> extrude(const TriangleMesh<V>& mesh, float height) {
  TetrahedronMesh<LiftedVector<V>> out;
  const float half = 0.5f * height;
  const auto n = static_cast<SimplexIndex>(mesh.vertices.size());

  out.vertices.reserve(2 * mesh.vertices.size());
  for (const Vertex<V>& v : mesh.vertices) {
    out.vertices.push_back({liftPoint(v.position, -half)});
  }
  for (const Vertex<V>& v : mesh.vertices) {
    out.vertices.push_back({liftPoint(v.position, half)});
  }

  out.simplexes.reserve(3 * mesh.simplexes.size());
  for (const auto& tri : mesh.simplexes) {
    const SimplexIndex a = tri[0];
    const SimplexIndex b = tri[1];
    const SimplexIndex c = tri[2];
    const SimplexIndex a2 = a + n;
    const SimplexIndex b2 = b + n;
    const SimplexIndex c2 = c + n;
    out.simplexes.push_back({a, c, b, a2});
    out.simplexes.push_back({c, b, a2, c2});
    out.simplexes.push_back({a2, b2, c2, b});
  }
  return out;
}

}  // namespace tessera::core
