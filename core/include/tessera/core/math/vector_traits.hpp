#pragma once
#include <array>
#include <cmath>
#include <cstddef>

namespace tessera::core {

// Every algorithm in tessera is written against these two traits templates
// instead of a concrete vector layout. To plug a vector family in, specialise
// VectorTraits for its 2, 3 and 4 component types and Matrix4Traits for its
// 4x4 matrix (see eigen_traits.hpp for the default Eigen adapter).
//
// A VectorTraits<V> specialisation provides:
//   using Scalar = float;
//   static constexpr int kDimension;          // 2, 3 or 4
//   using Vector2, Vector3, Vector4;          // sibling types of the family
//   using Matrix4;                            // (4-component types only)
//   using Projected;                          // type with kDimension - 1 components
//   using Lifted;                             // type with kDimension + 1 components
//   static V make(x, y[, z[, w]]);
//   static float component(const V&, int axis);
//   static V fromArray(const std::array<float, kDimension>&);
//   static V zero();
//   static V add(const V&, const V&);
//   static V scale(const V&, float);
//   static float dot(const V&, const V&);
//   static V normalized(const V&);
//
// A Matrix4Traits<M> specialisation provides:
//   using Vector4;
//   static M fromColumns(const Mat4Array&);   // column-major, [col][row]
//   static Vector4 multiply(const M&, const Vector4&);
template <typename V>
struct VectorTraits;

template <typename M>
struct Matrix4Traits;

// Column-major 4x4 array, indexed [column][row].
using Mat4Array = std::array<std::array<float, 4>, 4>;

template <typename V>
using ProjectedVector = typename VectorTraits<V>::Projected;

template <typename V>
using LiftedVector = typename VectorTraits<V>::Lifted;

template <typename V>
inline constexpr int kVectorDimension = VectorTraits<V>::kDimension;

// Per-axis accessors.
template <typename V>
inline float xOf(const V& v) { return VectorTraits<V>::component(v, 0); }
template <typename V>
inline float yOf(const V& v) { return VectorTraits<V>::component(v, 1); }
template <typename V>
inline float zOf(const V& v) {
  static_assert(kVectorDimension<V> >= 3, "vector has no z axis");
  return VectorTraits<V>::component(v, 2);
}
template <typename V>
inline float wOf(const V& v) {
  static_assert(kVectorDimension<V> >= 4, "vector has no w axis");
  return VectorTraits<V>::component(v, 3);
}

template <typename V>
inline V subtract(const V& a, const V& b) {
  return VectorTraits<V>::add(a, VectorTraits<V>::scale(b, -1.0f));
}

template <typename V>
inline float lengthSquared(const V& v) {
  return VectorTraits<V>::dot(v, v);
}

template <typename V>
inline float length(const V& v) {
  return std::sqrt(lengthSquared(v));
}

// a + (b - a) * t
template <typename V>
inline V lerp(const V& a, const V& b, float t) {
  using T = VectorTraits<V>;
  return T::add(a, T::scale(subtract(b, a), t));
}

template <typename V>
inline V cross(const V& a, const V& b) {
  static_assert(kVectorDimension<V> == 3, "cross product needs 3-component vectors");
  return VectorTraits<V>::make(yOf(a) * zOf(b) - zOf(a) * yOf(b),
                               zOf(a) * xOf(b) - xOf(a) * zOf(b),
                               xOf(a) * yOf(b) - yOf(a) * xOf(b));
}

template <typename V>
inline std::array<float, kVectorDimension<V>> toArray(const V& v) {
  std::array<float, kVectorDimension<V>> out{};
  for (int i = 0; i < kVectorDimension<V>; ++i) {
    out[static_cast<std::size_t>(i)] = VectorTraits<V>::component(v, i);
  }
  return out;
}

}  // namespace tessera::core
