#pragma once
#include <array>
#include <cstdint>
#include <unordered_map>

#include "tessera/core/common/constants.hpp"
#include "tessera/core/export.hpp"
#include "tessera/core/math/vector_traits.hpp"
#include "tessera/core/mesh/project.hpp"
#include "tessera/core/mesh/simplex_mesh.hpp"

namespace tessera::core {

// Face opposite vertex i, wound clockwise when viewed from vertex i.
inline constexpr std::array<std::array<std::uint8_t, 3>, 4> kTetrahedronFaceWinding = {{
    {1, 3, 2},
    {0, 2, 3},
    {0, 3, 1},
    {0, 1, 2},
}};

// Vertex roles for a tetrahedron with two vertices on each side of the
// hyperplane. `positive_mask` has bit i set when vertex i has depth > 0.
struct TwoTwoSplit {
  std::uint8_t positive_mask;
  std::uint8_t neg1;
  std::uint8_t neg2;
  std::uint8_t pos1;
  std::uint8_t pos2;
};

inline constexpr std::array<TwoTwoSplit, 6> kTwoTwoSplits = {{
    {0b1100, 0, 1, 2, 3},
    {0b0011, 3, 2, 1, 0},
    {0b0101, 3, 1, 0, 2},
    {0b1010, 0, 2, 3, 1},
    {0b1001, 2, 1, 3, 0},
    {0b0110, 0, 3, 1, 2},
}};

// Edge between two local vertices of a tetrahedron.
struct TetrahedronEdge {
  std::uint8_t a;
  std::uint8_t b;
};

using SliceTriangle = std::array<TetrahedronEdge, 3>;

// Triangles (as crossing edges) of one tetrahedron's slice.
struct TetrahedronSlice {
  int triangle_count = 0;
  std::array<SliceTriangle, 2> triangles{};
};

// Slice pattern for the given sides: 0 triangles when all four vertices are on
// one side, 1 for a 1-3 split, 2 for a 2-2 split. The emitted triangles have
// the handedness of the tetrahedron.
TESSERA_CORE_API TetrahedronSlice sliceTetrahedron(const std::array<bool, 4>& positive);

// Slices a tetrahedral mesh with the hyperplane where the last coordinate is
// zero and projects the result one dimension down. Edges shared between
// tetrahedra produce one shared output vertex.
//
// Tetrahedra must be non-degenerate; the crossing-point interpolation is not
// guarded against NaN input.
template <typename V>
TriangleMesh<ProjectedVector<V>> crossSection(const TetrahedronMesh<V>& mesh) {
  using P = ProjectedVector<V>;
  TriangleMesh<P> out;
  std::unordered_map<std::uint64_t, SimplexIndex> edge_vertices;

  auto edgeVertex = [&](SimplexIndex i, SimplexIndex j) -> SimplexIndex {
    const SimplexIndex lo = i < j ? i : j;
    const SimplexIndex hi = i < j ? j : i;
    const std::uint64_t key = (static_cast<std::uint64_t>(lo) << 32) | hi;
    const auto it = edge_vertices.find(key);
    if (it != edge_vertices.end()) return it->second;

    const V& p = mesh.vertices[i].position;
    const V& q = mesh.vertices[j].position;
    const float dp = pointDepth(p) - kCrossSectionDepth;
    const float dq = pointDepth(q) - kCrossSectionDepth;
    const float t = dp / (dp - dq);
    const auto index = static_cast<SimplexIndex>(out.vertices.size());
    out.vertices.push_back({projectPoint(lerp(p, q, t))});
    edge_vertices.emplace(key, index);
    return index;
  };

  for (const auto& tet : mesh.simplexes) {
    std::array<bool, 4> positive{};
    for (std::size_t k = 0; k < 4; ++k) {
      positive[k] = pointDepth(mesh.vertices[tet[k]].position) > kCrossSectionDepth;
    }
    const TetrahedronSlice slice = sliceTetrahedron(positive);
    for (int t = 0; t < slice.triangle_count; ++t) {
      typename TriangleMesh<P>::Simplex tri{};
      for (std::size_t k = 0; k < 3; ++k) {
        const TetrahedronEdge& e = slice.triangles[static_cast<std::size_t>(t)][k];
        tri[k] = edgeVertex(tet[e.a], tet[e.b]);
      }
      out.simplexes.push_back(tri);
    }
  }
  return out;
}

}  // namespace tessera::core
