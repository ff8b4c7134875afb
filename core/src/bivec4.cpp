#include "tessera/core/algebra/bivec4.hpp"

#include "tessera/core/algebra/rotor4.hpp"
#include "tessera/core/common/logger.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cmath>
#include <string>

namespace tessera::core {

static constexpr const char* kComponent = "bivec4";

// sin(x) / x, continuous at zero.
static inline double sinc(double x) {
  if (std::abs(x) < 1e-6) {
    return 1.0 - (x * x) / 6.0;
  }
  return std::sin(x) / x;
}

ScalarPlusQuadvec4 Bivec4::square() const {
  return {-magnitudeSquared(), 2.0f * (xy * zw + xz * wy + xw * yz)};
}

float Bivec4::magnitudeSquared() const {
  return xy * xy + xz * xz + xw * xw + yz * yz + wy * wy + zw * zw;
}

float Bivec4::magnitude() const {
  return std::sqrt(magnitudeSquared());
}

Bivec4 Bivec4::normalized() const {
  const float n = magnitude();
  if (n <= 0.0f) return *this;
  return scaled(1.0f / n);
}

float Bivec4::dot(const Bivec4& rhs) const {
  return -(xy * rhs.xy + xz * rhs.xz + xw * rhs.xw +
           yz * rhs.yz + wy * rhs.wy + zw * rhs.zw);
}

Bivec4 Bivec4::commutator(const Bivec4& b) const {
  const Bivec4& a = *this;
  Bivec4 out;
  out.xy = -a.wy * b.xw + a.xw * b.wy - a.xz * b.yz + a.yz * b.xz;
  out.xz = -a.xw * b.zw + a.xy * b.yz - a.yz * b.xy + a.zw * b.xw;
  out.xw =  a.wy * b.xy - a.xy * b.wy + a.xz * b.zw - a.zw * b.xz;
  out.yz =  a.wy * b.zw - a.xy * b.xz + a.xz * b.xy - a.zw * b.wy;
  out.wy = -a.xw * b.xy + a.xy * b.xw - a.yz * b.zw + a.zw * b.yz;
  out.zw = -a.wy * b.yz + a.xw * b.xz - a.xz * b.xw + a.yz * b.wy;
  return out;
}

float Bivec4::wedge(const Bivec4& b) const {
  return xy * b.zw + zw * b.xy + xz * b.wy + wy * b.xz + xw * b.yz + yz * b.xw;
}

Status Bivec4::factorIntoSimpleOrthogonal(SimpleBivec4* first,
                                          SimpleBivec4* second,
                                          const Thresholds& thr) const {
  if (!first || !second) return Status::InvalidParameter;

  // Evaluated in double: det is a difference of squares and loses most of
  // its precision in float near isoclinic inputs.
  const std::array<double, 6> b = toDoubleArray(*this);
  double c = 0.0;
  for (double v : b) c -= v * v;
  const double q = 2.0 * (b[0] * b[5] + b[1] * b[4] + b[2] * b[3]);
  const double det = std::sqrt(std::max(c * c - q * q, 0.0));

  Bivec4 part1;
  Bivec4 part2;
  if (det <= thr.isoclinic_rel_eps * (-c) || det < thr.normalize_min_norm) {
    // Isoclinic (or zero): the planes through x and the planes orthogonal to
    // x are already simple and orthogonal.
    part1 = {xy, xz, xw, 0.0f, 0.0f, 0.0f};
    part2 = {0.0f, 0.0f, 0.0f, yz, wy, zw};
  } else {
    // (fc + fq I) * B = fc * B - fq * reverse(B)
    const double inv = 1.0 / (2.0 * det);
    const double f1c = (-c + det) * inv;
    const double f1q = q * inv;
    const double f2c = (c + det) * inv;
    const double f2q = -q * inv;
    std::array<float, 6> p1{};
    std::array<float, 6> p2{};
    for (std::size_t i = 0; i < 6; ++i) {
      p1[i] = static_cast<float>(f1c * b[i] - f1q * b[5 - i]);
      p2[i] = static_cast<float>(f2c * b[i] - f2q * b[5 - i]);
    }
    part1 = {p1[0], p1[1], p1[2], p1[3], p1[4], p1[5]};
    part2 = {p2[0], p2[1], p2[2], p2[3], p2[4], p2[5]};
  }

  Status st = SimpleBivec4::fromBivec(part1, first, thr);
  if (ok(st)) {
    st = SimpleBivec4::fromBivec(part2, second, thr);
  }
  if (!ok(st)) {
    log(LogLevel::Debug, kComponent,
        "factorIntoSimpleOrthogonal: factor is not simple (square=(" +
        std::to_string(c) + ", " + std::to_string(q) + "))");
  }
  return st;
}

Status Bivec4::exp(Rotor4* out, const Thresholds& thr) const {
  if (!out) return Status::InvalidParameter;

  SimpleBivec4 b1;
  SimpleBivec4 b2;
  const Status st = factorIntoSimpleOrthogonal(&b1, &b2, thr);
  if (!ok(st)) return st;

  // Two commuting simple rotations: exp(B1) * exp(B2).
  const double t1 = b1.magnitude();
  const double t2 = b2.magnitude();
  const double c1 = std::cos(t1);
  const double c2 = std::cos(t2);
  const double s1 = sinc(t1);
  const double s2 = sinc(t2);

  const Bivec4 bivec = b1.bivec().scaled(static_cast<float>(s1 * c2)) +
                       b2.bivec().scaled(static_cast<float>(c1 * s2));
  const double xyzw = s1 * s2 * b1.bivec().wedge(b2.bivec());
  *out = Rotor4::fromComponents(static_cast<float>(c1 * c2), bivec,
                                static_cast<float>(xyzw));
  return Status::Success;
}

Status SimpleBivec4::fromBivec(const Bivec4& b, SimpleBivec4* out, const Thresholds& thr) {
  if (!out) return Status::InvalidParameter;
  if (std::abs(b.square().xyzw) > thr.simple_bivec_eps) {
    return Status::NotSimple;
  }
  *out = SimpleBivec4(b);
  return Status::Success;
}

SimpleBivec4 SimpleBivec4::normalized() const {
  const float n = b_.magnitude();
  if (n < kDefaultThresholds.zero_magnitude_eps) {
    return SimpleBivec4(Bivec4{1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f});
  }
  return SimpleBivec4(b_.scaled(1.0f / n));
}

Rotor4 SimpleBivec4::exp() const {
  const double theta = b_.magnitude();
  return Rotor4::fromComponents(static_cast<float>(std::cos(theta)),
                                b_.scaled(static_cast<float>(sinc(theta))),
                                0.0f);
}

}  // namespace tessera::core
