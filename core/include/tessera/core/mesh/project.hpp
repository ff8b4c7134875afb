#pragma once
#include <array>
#include <cstddef>

#include "tessera/core/math/vector_traits.hpp"
#include "tessera/core/mesh/simplex_mesh.hpp"

namespace tessera::core {

// Orthographic projection drops the last axis; the dropped coordinate is the
// depth. Lifting appends a given depth as the new last axis.

template <typename V>
float pointDepth(const V& p) {
  return VectorTraits<V>::component(p, kVectorDimension<V> - 1);
}

template <typename V>
ProjectedVector<V> projectPoint(const V& p) {
  using P = ProjectedVector<V>;
  std::array<float, kVectorDimension<P>> c{};
  for (int i = 0; i < kVectorDimension<P>; ++i) {
    c[static_cast<std::size_t>(i)] = VectorTraits<V>::component(p, i);
  }
  return VectorTraits<P>::fromArray(c);
}

template <typename V>
LiftedVector<V> liftPoint(const V& p, float depth) {
  using L = LiftedVector<V>;
  std::array<float, kVectorDimension<L>> c{};
  for (int i = 0; i < kVectorDimension<V>; ++i) {
    c[static_cast<std::size_t>(i)] = VectorTraits<V>::component(p, i);
  }
  c[static_cast<std::size_t>(kVectorDimension<V>)] = depth;
  return VectorTraits<L>::fromArray(c);
}

template <typename V, std::size_t N>
SimplexMesh<ProjectedVector<V>, N> projectOrthographic(const SimplexMesh<V, N>& mesh) {
  SimplexMesh<ProjectedVector<V>, N> out;
  out.vertices.reserve(mesh.vertices.size());
  for (const Vertex<V>& v : mesh.vertices) {
    out.vertices.push_back({projectPoint(v.position)});
  }
  out.simplexes = mesh.simplexes;
  return out;
}

// Places the whole mesh in the hyperplane at `depth` along a new last axis.
template <typename V, std::size_t N>
SimplexMesh<LiftedVector<V>, N> liftOrthographic(const SimplexMesh<V, N>& mesh, float depth) {
  SimplexMesh<LiftedVector<V>, N> out;
  out.vertices.reserve(mesh.vertices.size());
  for (const Vertex<V>& v : mesh.vertices) {
    out.vertices.push_back({liftPoint(v.position, depth)});
  }
  out.simplexes = mesh.simplexes;
  return out;
}

}  // namespace tessera::core
