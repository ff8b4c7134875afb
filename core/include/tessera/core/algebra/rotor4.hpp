#pragma once
#include <cstdint>

#include "tessera/core/algebra/bivec4.hpp"
#include "tessera/core/common/constants.hpp"
#include "tessera/core/common/logger.hpp"
#include "tessera/core/common/status.hpp"
#include "tessera/core/export.hpp"
#include "tessera/core/math/vector_traits.hpp"

namespace tessera::core {

enum class RotorLogType : std::uint8_t {
  Simple = 0,          // rotation in one plane
  DoubleRotation = 1   // rotations in two orthogonal planes
};

// Logarithm of a rotor, R = exp(angle1 * plane1 + angle2 * plane2).
// Planes are unit simple bivectors. Angles are rotor (half) angles: the
// rotation they describe turns vectors by twice the angle in each plane.
// For RotorLogType::Simple only plane1/angle1 are meaningful.
struct TESSERA_CORE_API RotorLog4 {
  RotorLogType type{RotorLogType::Simple};
  SimpleBivec4 plane1;
  float angle1{0.0f};
  SimpleBivec4 plane2;
  float angle2{0.0f};

  RotorLog4 scaled(float s) const;
  Rotor4 exp() const;

  // angle1 * plane1 + angle2 * plane2
  Bivec4 toBivec() const;
};

// Unit rotor of the 4D even subalgebra: c + bivec + xyzw * I.
//
// A rotor acts on vectors by v' = ~R v R, so compose() is the geometric product
// and (a.compose(b)).transform(v) == b.transform(a.transform(v)).
// Every constructor and every composition renormalizes, keeping
//   c^2 + xyzw^2 - bivec^2 = 1  and  2 c xyzw = (bivec^2).xyzw
// within float round-off across long chains of compositions.
class TESSERA_CORE_API Rotor4 {
public:
  Rotor4();                                // identity

  static Rotor4 identity();

  // Normalizes the given components. Degenerate input logs and yields identity.
  static Rotor4 fromComponents(float c, const Bivec4& bivec, float xyzw);

  // Rotation by `angle` radians in `plane`, turning the plane's first axis
  // toward its second.
  static Rotor4 fromSimpleBivecAngle(const SimpleBivec4& plane, float angle);

  // Each component is a rotation angle in radians in that plane, e.g.
  // {xy = pi/2} takes x to y. Equal to exp(angles / 2).
  static Rotor4 fromBivecAngles(const Bivec4& angles,
                                const Thresholds& thr = kDefaultThresholds);

  // Rotation in the plane of `from` and `to` by twice the angle between them.
  template <typename V>
  static Rotor4 between(const V& from, const V& to);

  float c() const { return c_; }
  const Bivec4& bivec() const { return bivec_; }
  float xyzw() const { return xyzw_; }

  // this, then other
  Rotor4 compose(const Rotor4& other) const;
  Rotor4 inverse() const;
  Rotor4 normalized() const;

  // Deviation from both unit-rotor conditions (0 for an exact unit rotor).
  float invariantError() const;

  Status log(RotorLog4* out, const Thresholds& thr = kDefaultThresholds) const;
  Status pow(float exponent, Rotor4* out, const Thresholds& thr = kDefaultThresholds) const;

  // Inverse of fromBivecAngles.
  Status toBivecAngles(Bivec4* out, const Thresholds& thr = kDefaultThresholds) const;

  // Spherical interpolation: this * (this^-1 * other)^t. Falls back to the
  // nearer endpoint when the power cannot be taken.
  Rotor4 interpolateWith(const Rotor4& other, float t,
                         const Thresholds& thr = kDefaultThresholds) const;

  // Equivalent rotation matrix, column-major [col][row].
  Mat4Array toMat4Array() const;

  template <typename M>
  M toMatrix() const {
    return Matrix4Traits<M>::fromColumns(toMat4Array());
  }

  template <typename V>
  V transform(const V& v) const;

private:
  Rotor4(float c, const Bivec4& bivec, float xyzw)
      : c_(c), bivec_(bivec), xyzw_(xyzw) {}

  float c_{1.0f};
  Bivec4 bivec_{};
  float xyzw_{0.0f};
};

template <typename V>
Rotor4 Rotor4::between(const V& from, const V& to) {
  using T = VectorTraits<V>;
  const float from_len = length(from);
  const float to_len = length(to);
  if (from_len <= 0.0f || to_len <= 0.0f) {
    tessera::core::log(LogLevel::Warn, "rotor4",
                       "between: zero-length vector, returning identity");
    return identity();
  }
  const V a = T::normalized(from);
  const V b = T::normalized(to);
  return fromComponents(T::dot(a, b), wedge(a, b), 0.0f);
}

// Through the vector family's own 4x4 matrix type.
template <typename V>
V Rotor4::transform(const V& v) const {
  static_assert(kVectorDimension<V> == 4, "rotors act on 4-component vectors");
  using M = typename VectorTraits<V>::Matrix4;
  return Matrix4Traits<M>::multiply(toMatrix<M>(), v);
}

}  // namespace tessera::core
