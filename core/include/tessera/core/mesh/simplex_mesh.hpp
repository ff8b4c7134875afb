#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "tessera/core/common/logger.hpp"
#include "tessera/core/common/status.hpp"
#include "tessera/core/math/types.hpp"
#include "tessera/core/mesh/vertex.hpp"

namespace tessera::core {

using SimplexIndex = std::uint32_t;

// Shared vertices plus N-tuples of indices into them (N = 3 triangles,
// N = 4 tetrahedra). Orientation of a simplex is its index order.
// Every index must be < vertices.size(); validate() checks this.
template <typename V, std::size_t N>
struct SimplexMesh {
  using Vector = V;
  using VertexType = Vertex<V>;
  using Simplex = std::array<SimplexIndex, N>;
  static constexpr std::size_t kSimplexSize = N;

  std::vector<VertexType> vertices;
  std::vector<Simplex> simplexes;

  // `transform` is any object with a `V transform(const V&) const` member:
  // Rotor4, RotateScaleTranslate4, MatrixTransform, ...
  template <typename T>
  SimplexMesh applyTransform(const T& transform) const {
    SimplexMesh out;
    out.vertices.reserve(vertices.size());
    for (const VertexType& v : vertices) {
      out.vertices.push_back(v.transformed(transform));
    }
    out.simplexes = simplexes;
    return out;
  }

  // Flips the orientation of every simplex.
  SimplexMesh invert() const {
    SimplexMesh out = *this;
    for (Simplex& s : out.simplexes) {
      std::swap(s[0], s[1]);
    }
    return out;
  }

  // Appends `other`, offsetting its indices. Vertices are not merged.
  SimplexMesh join(const SimplexMesh& other) const {
    SimplexMesh out = *this;
    const auto offset = static_cast<SimplexIndex>(vertices.size());
    out.vertices.insert(out.vertices.end(), other.vertices.begin(), other.vertices.end());
    out.simplexes.reserve(simplexes.size() + other.simplexes.size());
    for (Simplex s : other.simplexes) {
      for (SimplexIndex& i : s) i += offset;
      out.simplexes.push_back(s);
    }
    return out;
  }

  Status validate() const {
    for (std::size_t k = 0; k < simplexes.size(); ++k) {
      for (SimplexIndex i : simplexes[k]) {
        if (i >= vertices.size()) {
          log(LogLevel::Debug, "mesh",
              "validate: simplex " + std::to_string(k) + " index " + std::to_string(i) +
              " out of range (" + std::to_string(vertices.size()) + " vertices)");
          return Status::InvalidParameter;
        }
      }
    }
    return Status::Success;
  }

  // Positions of simplex k.
  std::array<V, N> simplexPositions(std::size_t k) const {
    std::array<V, N> out;
    for (std::size_t i = 0; i < N; ++i) {
      out[i] = vertices[simplexes[k][i]].position;
    }
    return out;
  }
};

template <typename V>
using TriangleMesh = SimplexMesh<V, 3>;

template <typename V>
using TetrahedronMesh = SimplexMesh<V, 4>;

using TriangleMesh2D = TriangleMesh<Vec2>;
using TriangleMesh3D = TriangleMesh<Vec3>;
using TriangleMesh4D = TriangleMesh<Vec4>;
using TetrahedronMesh3D = TetrahedronMesh<Vec3>;
using TetrahedronMesh4D = TetrahedronMesh<Vec4>;

}  // namespace tessera::core
