#pragma once
#include "tessera/core/math/vector_traits.hpp"

namespace tessera::core {

// Position-only vertex record.
template <typename V>
struct Vertex {
  V position;

  Vertex interpolateWith(const Vertex& other, float t) const {
    return Vertex{lerp(position, other.position, t)};
  }

  template <typename T>
  Vertex transformed(const T& transform) const {
    return Vertex{transform.transform(position)};
  }
};

}  // namespace tessera::core
