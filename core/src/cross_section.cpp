#include "tessera/core/mesh/cross_section.hpp"

#include <cstddef>

namespace tessera::core {

static TetrahedronSlice sliceOneThree(std::uint8_t lone, bool lone_positive) {
  const auto& face = kTetrahedronFaceWinding[lone];
  TetrahedronSlice slice;
  slice.triangle_count = 1;
  for (std::size_t k = 0; k < 3; ++k) {
    // A lone positive vertex sees the face from the other side.
    const std::uint8_t other = lone_positive ? face[2 - k] : face[k];
    slice.triangles[0][k] = TetrahedronEdge{lone, other};
  }
  return slice;
}

static TetrahedronSlice sliceTwoTwo(const TwoTwoSplit& s) {
  TetrahedronSlice slice;
  slice.triangle_count = 2;
  slice.triangles[0] = {{{s.neg1, s.pos2}, {s.neg1, s.pos1}, {s.neg2, s.pos2}}};
  slice.triangles[1] = {{{s.neg1, s.pos1}, {s.neg2, s.pos1}, {s.neg2, s.pos2}}};
  return slice;
}

TetrahedronSlice sliceTetrahedron(const std::array<bool, 4>& positive) {
  std::uint8_t mask = 0;
  int positive_count = 0;
  for (std::uint8_t i = 0; i < 4; ++i) {
    if (positive[i]) {
      mask = static_cast<std::uint8_t>(mask | (1u << i));
      ++positive_count;
    }
  }

  switch (positive_count) {
    case 1:
    case 3: {
      // The lone vertex is the one whose side differs from the other three.
      const bool lone_positive = positive_count == 1;
      for (std::uint8_t i = 0; i < 4; ++i) {
        if (positive[i] == lone_positive) {
          return sliceOneThree(i, lone_positive);
        }
      }
      break;
    }
    case 2:
      for (const TwoTwoSplit& s : kTwoTwoSplits) {
        if (s.positive_mask == mask) {
          return sliceTwoTwo(s);
        }
      }
      break;
    default:
      break;
  }
  return TetrahedronSlice{};
}

}  // namespace tessera::core
