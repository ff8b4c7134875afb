#include "tessera/core/algebra/rotor4.hpp"

#include "tessera/core/common/logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace tessera::core {

static void logRotor(LogLevel level, const std::string& msg) {
  log(level, "rotor4", msg);
}

// ---------------------------------------------------------------------------
// RotorLog4

RotorLog4 RotorLog4::scaled(float s) const {
  RotorLog4 out = *this;
  out.angle1 *= s;
  out.angle2 *= s;
  return out;
}

Rotor4 RotorLog4::exp() const {
  const double s1 = std::sin(angle1);
  const double c1 = std::cos(angle1);
  if (type == RotorLogType::Simple) {
    return Rotor4::fromComponents(static_cast<float>(c1),
                                  plane1.bivec().scaled(static_cast<float>(s1)),
                                  0.0f);
  }
  const double s2 = std::sin(angle2);
  const double c2 = std::cos(angle2);
  const Bivec4 bivec = plane1.bivec().scaled(static_cast<float>(s1 * c2)) +
                       plane2.bivec().scaled(static_cast<float>(c1 * s2));
  const double xyzw = s1 * s2 * plane1.bivec().wedge(plane2.bivec());
  return Rotor4::fromComponents(static_cast<float>(c1 * c2), bivec,
                                static_cast<float>(xyzw));
}

Bivec4 RotorLog4::toBivec() const {
  if (type == RotorLogType::Simple) {
    return plane1.bivec().scaled(angle1);
  }
  return plane1.bivec().scaled(angle1) + plane2.bivec().scaled(angle2);
}

// ---------------------------------------------------------------------------
// Rotor4

Rotor4::Rotor4() = default;

Rotor4 Rotor4::identity() {
  return Rotor4();
}

Rotor4 Rotor4::fromComponents(float c, const Bivec4& bivec, float xyzw) {
  double cd = c;
  double qd = xyzw;
  const std::array<double, 6> b = toDoubleArray(bivec);
  double b2 = 0.0;
  for (double v : b) b2 += v * v;
  const double sq_q = 2.0 * (b[0] * b[5] + b[1] * b[4] + b[2] * b[3]);

  // Re-derive the smaller of (c, xyzw) from 2 c xyzw = (B^2).xyzw.
  const double largest = std::max(std::abs(cd), std::abs(qd));
  if (largest > kDefaultThresholds.zero_magnitude_eps) {
    if (std::abs(cd) >= std::abs(qd)) {
      qd = sq_q / (2.0 * cd);
    } else {
      cd = sq_q / (2.0 * qd);
    }
  }

  const double n2 = cd * cd + qd * qd + b2;
  if (!(n2 > kDefaultThresholds.normalize_min_norm)) {
    logRotor(LogLevel::Error, "fromComponents: degenerate rotor, returning identity");
    return Rotor4();
  }
  const double inv = 1.0 / std::sqrt(n2);
  return Rotor4(static_cast<float>(cd * inv),
                bivec.scaled(static_cast<float>(inv)),
                static_cast<float>(qd * inv));
}

Rotor4 Rotor4::fromSimpleBivecAngle(const SimpleBivec4& plane, float angle) {
  return plane.normalized().scaled(0.5f * angle).exp();
}

Rotor4 Rotor4::fromBivecAngles(const Bivec4& angles, const Thresholds& thr) {
  Rotor4 out;
  const Status st = angles.scaled(0.5f).exp(&out, thr);
  if (!ok(st)) {
    logRotor(LogLevel::Warn, std::string("fromBivecAngles: ") + statusToString(st) +
                             ", returning identity");
    return Rotor4();
  }
  return out;
}

Rotor4 Rotor4::compose(const Rotor4& other) const {
  const Bivec4& b1 = bivec_;
  const Bivec4& b2 = other.bivec_;
  const ScalarPlusQuadvec4 r1{c_, xyzw_};
  const ScalarPlusQuadvec4 r2{other.c_, other.xyzw_};

  const float c = c_ * other.c_ + xyzw_ * other.xyzw_ + b1.dot(b2);
  const Bivec4 bivec = r1 * b2 + r2 * b1 + b1.commutator(b2);
  const float xyzw = c_ * other.xyzw_ + xyzw_ * other.c_ + b1.wedge(b2);
  return fromComponents(c, bivec, xyzw);
}

Rotor4 Rotor4::inverse() const {
  return Rotor4(c_, -bivec_, xyzw_);
}

Rotor4 Rotor4::normalized() const {
  return fromComponents(c_, bivec_, xyzw_);
}

float Rotor4::invariantError() const {
  const ScalarPlusQuadvec4 sq = bivec_.square();
  const float norm_err = c_ * c_ + xyzw_ * xyzw_ - sq.c - 1.0f;
  const float quad_err = 2.0f * c_ * xyzw_ - sq.xyzw;
  return std::abs(norm_err) + std::abs(quad_err);
}

Status Rotor4::log(RotorLog4* out, const Thresholds& thr) const {
  if (!out) return Status::InvalidParameter;

  const float bmag = bivec_.magnitude();
  const float eps = static_cast<float>(thr.rotor_log_eps);

  if (std::abs(xyzw_) < eps) {
    // Rotation in a single plane.
    SimpleBivec4 plane;
    const Status st = SimpleBivec4::fromBivec(bivec_, &plane, thr);
    if (!ok(st)) return st;
    RotorLog4 res;
    res.type = RotorLogType::Simple;
    res.plane1 = plane.normalized();
    res.angle1 = std::atan2(bmag, c_);
    *out = res;
    return Status::Success;
  }

  SimpleBivec4 u1;
  SimpleBivec4 u2;
  double a = 0.0;
  double b = 0.0;
  if (std::abs(c_) < eps) {
    // At least one angle is pi/2, the split into planes is not unique; any
    // plane of the bivector together with its complement works.
    SimpleBivec4 plane;
    const Status st = SimpleBivec4::fromBivec(bivec_, &plane, thr);
    if (!ok(st)) return st;
    u1 = plane.normalized();
    u2 = u1.orthogonalComplement();
    a = bmag;
  } else {
    SimpleBivec4 b1;
    SimpleBivec4 b2;
    const Status st = bivec_.factorIntoSimpleOrthogonal(&b1, &b2, thr);
    if (!ok(st)) return st;
    a = b1.magnitude();
    b = b2.magnitude();
    u1 = b1.normalized();
    u2 = b2.normalized();
  }

  // R = c1 c2 + s1 c2 u1 + c1 s2 u2 + s1 s2 (u1 ^ u2), with u1 ^ u2 = +-I:
  //   c - w xyzw = cos(t1 + t2), a + b = sin(t1 + t2)
  //   c + w xyzw = cos(t1 - t2), a - b = sin(t1 - t2)
  const double w = u1.bivec().wedge(u2.bivec()) >= 0.0f ? 1.0 : -1.0;
  const double t_sum = std::atan2(a + b, c_ - xyzw_ * w);
  const double t_diff = std::atan2(a - b, c_ + xyzw_ * w);

  RotorLog4 res;
  res.type = RotorLogType::DoubleRotation;
  res.plane1 = u1;
  res.angle1 = static_cast<float>(0.5 * (t_sum + t_diff));
  res.plane2 = u2;
  res.angle2 = static_cast<float>(0.5 * (t_sum - t_diff));
  *out = res;
  return Status::Success;
}

Status Rotor4::pow(float exponent, Rotor4* out, const Thresholds& thr) const {
  if (!out) return Status::InvalidParameter;
  RotorLog4 l;
  const Status st = log(&l, thr);
  if (!ok(st)) return st;
  *out = l.scaled(exponent).exp();
  return Status::Success;
}

Status Rotor4::toBivecAngles(Bivec4* out, const Thresholds& thr) const {
  if (!out) return Status::InvalidParameter;
  RotorLog4 l;
  const Status st = log(&l, thr);
  if (!ok(st)) return st;
  *out = l.toBivec().scaled(2.0f);
  return Status::Success;
}

Rotor4 Rotor4::interpolateWith(const Rotor4& other, float t, const Thresholds& thr) const {
  Rotor4 step;
  const Status st = inverse().compose(other).pow(t, &step, thr);
  if (!ok(st)) {
    logRotor(LogLevel::Warn, std::string("interpolateWith: ") + statusToString(st) +
                             ", snapping to nearer endpoint");
    return t < 0.5f ? *this : other;
  }
  return compose(step);
}

Mat4Array Rotor4::toMat4Array() const {
  const float c = c_;
  const float q = xyzw_;
  const float xy = bivec_.xy;
  const float xz = bivec_.xz;
  const float xw = bivec_.xw;
  const float yz = bivec_.yz;
  const float wy = bivec_.wy;
  const float zw = bivec_.zw;

  const float cc = c * c;
  const float qq = q * q;
  const float xy2 = xy * xy;
  const float xz2 = xz * xz;
  const float xw2 = xw * xw;
  const float yz2 = yz * yz;
  const float wy2 = wy * wy;
  const float zw2 = zw * zw;

  Mat4Array m{};
  // image of x
  m[0][0] = cc + wy2 - xw2 - xy2 - qq - xz2 + yz2 + zw2;
  m[0][1] = 2.0f * (c * xy + wy * xw + q * zw - xz * yz);
  m[0][2] = 2.0f * (c * xz + wy * q - xw * zw + xy * yz);
  m[0][3] = 2.0f * (c * xw - wy * xy + q * yz + xz * zw);
  // image of y
  m[1][0] = 2.0f * (-c * xy + wy * xw - q * zw - xz * yz);
  m[1][1] = cc - wy2 + xw2 - xy2 - qq + xz2 - yz2 + zw2;
  m[1][2] = 2.0f * (c * yz + wy * zw + xw * q - xy * xz);
  m[1][3] = 2.0f * (-c * wy - xw * xy - q * xz + yz * zw);
  // image of z
  m[2][0] = 2.0f * (-c * xz - wy * q - xw * zw + xy * yz);
  m[2][1] = 2.0f * (-c * yz + wy * zw - xw * q - xy * xz);
  m[2][2] = cc + wy2 + xw2 + xy2 - qq - xz2 - yz2 - zw2;
  m[2][3] = 2.0f * (c * zw + wy * yz - xw * xz + xy * q);
  // image of w
  m[3][0] = 2.0f * (-c * xw - wy * xy - q * yz + xz * zw);
  m[3][1] = 2.0f * (c * wy - xw * xy + q * xz + yz * zw);
  m[3][2] = 2.0f * (-c * zw + wy * yz - xw * xz - xy * q);
  m[3][3] = cc - wy2 - xw2 + xy2 - qq + xz2 + yz2 - zw2;
  return m;
}

}  // namespace tessera::core
