#pragma once
#include "tessera/core/math/types.hpp"
#include "tessera/core/math/vector_traits.hpp"

namespace tessera::core {

template <>
struct VectorTraits<Eigen::Vector2f> {
  using Scalar = float;
  using Vector2 = Eigen::Vector2f;
  using Vector3 = Eigen::Vector3f;
  using Vector4 = Eigen::Vector4f;
  using Lifted = Eigen::Vector3f;
  static constexpr int kDimension = 2;

  static Vector2 make(float x, float y) { return Vector2(x, y); }
  static float component(const Vector2& v, int axis) { return v(axis); }
  static Vector2 fromArray(const std::array<float, 2>& a) { return Vector2(a[0], a[1]); }
  static Vector2 zero() { return Vector2::Zero(); }
  static Vector2 add(const Vector2& a, const Vector2& b) { return a + b; }
  static Vector2 scale(const Vector2& v, float s) { return v * s; }
  static float dot(const Vector2& a, const Vector2& b) { return a.dot(b); }
  static Vector2 normalized(const Vector2& v) { return v.normalized(); }
};

template <>
struct VectorTraits<Eigen::Vector3f> {
  using Scalar = float;
  using Vector2 = Eigen::Vector2f;
  using Vector3 = Eigen::Vector3f;
  using Vector4 = Eigen::Vector4f;
  using Projected = Eigen::Vector2f;
  using Lifted = Eigen::Vector4f;
  static constexpr int kDimension = 3;

  static Vector3 make(float x, float y, float z) { return Vector3(x, y, z); }
  static float component(const Vector3& v, int axis) { return v(axis); }
  static Vector3 fromArray(const std::array<float, 3>& a) {
    return Vector3(a[0], a[1], a[2]);
  }
  static Vector3 zero() { return Vector3::Zero(); }
  static Vector3 add(const Vector3& a, const Vector3& b) { return a + b; }
  static Vector3 scale(const Vector3& v, float s) { return v * s; }
  static float dot(const Vector3& a, const Vector3& b) { return a.dot(b); }
  static Vector3 normalized(const Vector3& v) { return v.normalized(); }
};

template <>
struct VectorTraits<Eigen::Vector4f> {
  using Scalar = float;
  using Vector2 = Eigen::Vector2f;
  using Vector3 = Eigen::Vector3f;
  using Vector4 = Eigen::Vector4f;
  using Matrix4 = Eigen::Matrix4f;
  using Projected = Eigen::Vector3f;
  static constexpr int kDimension = 4;

  static Vector4 make(float x, float y, float z, float w) { return Vector4(x, y, z, w); }
  static float component(const Vector4& v, int axis) { return v(axis); }
  static Vector4 fromArray(const std::array<float, 4>& a) {
    return Vector4(a[0], a[1], a[2], a[3]);
  }
  static Vector4 zero() { return Vector4::Zero(); }
  static Vector4 add(const Vector4& a, const Vector4& b) { return a + b; }
  static Vector4 scale(const Vector4& v, float s) { return v * s; }
  static float dot(const Vector4& a, const Vector4& b) { return a.dot(b); }
  static Vector4 normalized(const Vector4& v) { return v.normalized(); }
};

template <>
struct Matrix4Traits<Eigen::Matrix4f> {
  using Vector4 = Eigen::Vector4f;

  static Eigen::Matrix4f fromColumns(const Mat4Array& cols) {
    Eigen::Matrix4f m;
    for (int c = 0; c < 4; ++c) {
      for (int r = 0; r < 4; ++r) {
        m(r, c) = cols[static_cast<std::size_t>(c)][static_cast<std::size_t>(r)];
      }
    }
    return m;
  }

  static Vector4 multiply(const Eigen::Matrix4f& m, const Vector4& v) { return m * v; }
};

}  // namespace tessera::core
