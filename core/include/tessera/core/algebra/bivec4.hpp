#pragma once
#include <array>

#include "tessera/core/common/constants.hpp"
#include "tessera/core/common/status.hpp"
#include "tessera/core/export.hpp"
#include "tessera/core/math/vector_traits.hpp"

namespace tessera::core {

class Rotor4;
class SimpleBivec4;
struct Bivec4;

// Scalar plus pseudoscalar: c + xyzw * I, with I = e1234 and I^2 = +1.
// Closed under multiplication and commutes with every bivector.
struct ScalarPlusQuadvec4 {
  float c = 0.0f;
  float xyzw = 0.0f;

  ScalarPlusQuadvec4 operator*(const ScalarPlusQuadvec4& rhs) const {
    return {c * rhs.c + xyzw * rhs.xyzw, c * rhs.xyzw + xyzw * rhs.c};
  }

  Bivec4 operator*(const Bivec4& rhs) const;
};

// Bivector in 4D, one component per basis plane. The w-y plane is stored as
// `wy` (e4 ^ e2) rather than `yw`, which keeps the product tables symmetric:
// the dual of a bivector is its component list reversed and negated.
struct TESSERA_CORE_API Bivec4 {
  float xy = 0.0f;
  float xz = 0.0f;
  float xw = 0.0f;
  float yz = 0.0f;
  float wy = 0.0f;
  float zw = 0.0f;

  Bivec4 operator-() const { return {-xy, -xz, -xw, -yz, -wy, -zw}; }
  Bivec4 operator+(const Bivec4& rhs) const {
    return {xy + rhs.xy, xz + rhs.xz, xw + rhs.xw, yz + rhs.yz, wy + rhs.wy, zw + rhs.zw};
  }
  Bivec4 operator-(const Bivec4& rhs) const { return *this + (-rhs); }
  Bivec4 operator*(float s) const { return scaled(s); }

  Bivec4 scaled(float s) const {
    return {xy * s, xz * s, xw * s, yz * s, wy * s, zw * s};
  }

  // B^2 = (-|B|^2) + 2 (xy zw + xz wy + xw yz) I
  ScalarPlusQuadvec4 square() const;

  float magnitudeSquared() const;
  float magnitude() const;
  Bivec4 normalized() const;   // zero stays zero

  // I * B, the plane(s) orthogonal to B.
  Bivec4 dual() const { return {-zw, -wy, -yz, -xw, -xz, -xy}; }

  // Grade 0, 2 and 4 parts of the geometric product this * rhs.
  float dot(const Bivec4& rhs) const;
  Bivec4 commutator(const Bivec4& rhs) const;
  float wedge(const Bivec4& rhs) const;

  // Splits B into B1 + B2 where B1 and B2 are simple and commute.
  // Returns Status::NotSimple if either part fails the simplicity check.
  Status factorIntoSimpleOrthogonal(SimpleBivec4* first,
                                    SimpleBivec4* second,
                                    const Thresholds& thr = kDefaultThresholds) const;

  // exp(B) as a double rotation. The result is a unit rotor.
  Status exp(Rotor4* out, const Thresholds& thr = kDefaultThresholds) const;
};

// Components in storage order (xy, xz, xw, yz, wy, zw), widened for
// double-precision intermediates.
inline std::array<double, 6> toDoubleArray(const Bivec4& b) {
  return {b.xy, b.xz, b.xw, b.yz, b.wy, b.zw};
}

// a ^ b for 4-component vectors.
template <typename V>
Bivec4 wedge(const V& a, const V& b) {
  static_assert(kVectorDimension<V> == 4, "wedge product needs 4-component vectors");
  const float ax = xOf(a), ay = yOf(a), az = zOf(a), aw = wOf(a);
  const float bx = xOf(b), by = yOf(b), bz = zOf(b), bw = wOf(b);
  return {ax * by - ay * bx,
          ax * bz - az * bx,
          ax * bw - aw * bx,
          ay * bz - az * by,
          aw * by - ay * bw,
          az * bw - aw * bz};
}

// A bivector whose square has no pseudoscalar part, i.e. a rotation confined
// to a single plane. Only obtainable through the checked fromBivec() or from
// operations that keep an existing simple bivector simple.
class TESSERA_CORE_API SimpleBivec4 {
public:
  SimpleBivec4() = default;   // zero

  static Status fromBivec(const Bivec4& b,
                          SimpleBivec4* out,
                          const Thresholds& thr = kDefaultThresholds);

  const Bivec4& bivec() const { return b_; }

  float magnitude() const { return b_.magnitude(); }
  // B^2, a non-positive scalar.
  float squared() const { return -b_.magnitudeSquared(); }

  // Unit plane; the xy plane when the magnitude is too small to give a direction.
  SimpleBivec4 normalized() const;
  SimpleBivec4 scaled(float s) const { return SimpleBivec4(b_.scaled(s)); }
  SimpleBivec4 operator-() const { return SimpleBivec4(-b_); }

  // The plane orthogonal to this one, same magnitude.
  SimpleBivec4 orthogonalComplement() const { return SimpleBivec4(b_.dual()); }

  // cos|B| + sin|B| B/|B|
  Rotor4 exp() const;

private:
  explicit SimpleBivec4(const Bivec4& b) : b_(b) {}

  Bivec4 b_{};
};

inline Bivec4 ScalarPlusQuadvec4::operator*(const Bivec4& rhs) const {
  return rhs.scaled(c) + rhs.dual().scaled(xyzw);
}

inline Bivec4 operator*(float s, const Bivec4& b) { return b.scaled(s); }

}  // namespace tessera::core
