#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

#include "tessera/core/math/eigen_traits.hpp"
#include "tessera/core/transform/rotate_scale_translate4.hpp"
#include "test_util.hpp"

using tessera::core::Bivec4;
using tessera::core::Mat4;
using tessera::core::Rotor4;
using tessera::core::Vec4;
using tessera::test::kPi;
using tessera::test::near;
using tessera::test::nearRotor;
using tessera::test::nearVec;
using tessera::test::PlainMat4;
using tessera::test::PlainVec4;

using Rst = tessera::core::RotateScaleTranslate4<Vec4>;

static constexpr double kEps = 1e-3;

static Rotor4 xyQuarterTurn() {
  return Rotor4::fromBivecAngles(Bivec4{static_cast<float>(kPi / 2.0), 0, 0, 0, 0, 0});
}

static Rotor4 zwQuarterTurn() {
  return Rotor4::fromBivecAngles(Bivec4{0, 0, 0, 0, 0, static_cast<float>(kPi / 2.0)});
}

static void test_rotate_scale_matrix() {
  const Rst t(xyQuarterTurn(), 2.0f, Vec4(1, 2, 3, 4));
  const Mat4 m = t.rotateScaleMatrix();
  Mat4 expected;
  expected << 0, -2, 0, 0,
              2,  0, 0, 0,
              0,  0, 2, 0,
              0,  0, 0, 2;
  assert((m - expected).cwiseAbs().maxCoeff() < kEps);
  assert(nearVec(Vec4(m * Vec4(5, 6, 7, 8)), Vec4(-12, 10, 14, 16), kEps));
  // the matrix leaves the translation out
  assert(nearVec(t.transform(Vec4(5, 6, 7, 8)), Vec4(-11, 12, 17, 20), kEps));
}

static void test_rotated_scaled_translated() {
  const Vec4 v(1, 2, 3, 4);
  const Rotor4 r = xyQuarterTurn();

  const Rst base(Rotor4::identity(), 2.0f, Vec4(3, 4, 5, 6));
  assert(nearVec(r.transform(base.transform(v)), Vec4(-8, 5, 11, 14), kEps));
  assert(nearVec(base.rotated(r).transform(v), Vec4(-8, 5, 11, 14), kEps));

  const Rst rot(r, 1.0f, Vec4(3, 4, 5, 6));
  assert(nearVec(Vec4(rot.transform(v) * 2.0f), Vec4(2, 10, 16, 20), kEps));
  assert(nearVec(rot.scaled(2.0f).transform(v), Vec4(2, 10, 16, 20), kEps));

  const Rst scaled(r, 2.0f, Vec4::Zero());
  assert(nearVec(scaled.translated(Vec4(3, 4, 5, 6)).transform(v), Vec4(-1, 6, 11, 14), kEps));
}

static void test_transform_direction_only_rotates() {
  const Rst t(xyQuarterTurn(), 2.0f, Vec4(1, 2, 3, 4));
  assert(nearVec(t.transformDirection(Vec4(5, 6, 7, 8)), Vec4(-6, 5, 7, 8), kEps));
}

static void test_compose() {
  const Rst t1(xyQuarterTurn(), 2.0f, Vec4(1, 2, 3, 4));
  const Rst t2(zwQuarterTurn(), 3.0f, Vec4(4, 3, 2, 1));
  const Rst got = t1.compose(t2);

  const float half_pi = static_cast<float>(kPi / 2.0);
  assert(nearRotor(got.rotation(),
                   Rotor4::fromBivecAngles(Bivec4{half_pi, 0, 0, 0, 0, half_pi}), kEps));
  assert(near(got.scale(), 6.0, kEps));
  assert(nearVec(got.translation(), Vec4(7, 9, -10, 10), kEps));

  // applying the composition == applying one after the other
  std::mt19937 rng(29);
  std::uniform_real_distribution<float> u(-2.0f, 2.0f);
  for (int i = 0; i < 100; ++i) {
    const Vec4 p(u(rng), u(rng), u(rng), u(rng));
    assert(nearVec(got.transform(p), t2.transform(t1.transform(p)), kEps));
  }
}

static void test_inverse() {
  const Rst t(Rotor4::fromBivecAngles(Bivec4{0.4f, -0.2f, 1.0f, 0.3f, 0.0f, -0.7f}), 2.5f,
              Vec4(1, -2, 3, 0.5f));
  const Rst inv = t.inverse();
  const Vec4 p(0.3f, 1.5f, -2.0f, 4.0f);
  assert(nearVec(inv.transform(t.transform(p)), p, kEps));
  assert(nearVec(t.transform(inv.transform(p)), p, kEps));

  const Rst round = t.compose(inv);
  assert(near(round.scale(), 1.0, 1e-5));
  assert(nearVec(round.translation(), Vec4::Zero().eval(), kEps));
}

static void test_interpolate() {
  const Rst t1(xyQuarterTurn(), 2.0f, Vec4(1, 2, 3, 4));
  const Rst t2(zwQuarterTurn(), 3.0f, Vec4(4, 3, 2, 1));
  const Rst got = t1.interpolateWith(t2, 0.5f);

  const float quarter_pi = static_cast<float>(kPi / 4.0);
  assert(nearRotor(got.rotation(),
                   Rotor4::fromBivecAngles(Bivec4{quarter_pi, 0, 0, 0, 0, quarter_pi}), kEps));
  assert(near(got.scale(), 2.5, kEps));
  assert(nearVec(got.translation(), Vec4(2.5f, 2.5f, 2.5f, 2.5f), kEps));
}

static void test_identity() {
  const Rst id = Rst::identity();
  assert(nearVec(id.transform(Vec4(5, 6, 7, 8)), Vec4(5, 6, 7, 8), 0.0));
  assert(near(id.scale(), 1.0, 0.0));
}

// The same transform over a vector family that has nothing to do with Eigen.
static void test_plain_vector_family() {
  using PlainRst = tessera::core::RotateScaleTranslate4<PlainVec4>;
  const PlainRst t(xyQuarterTurn(), 2.0f, PlainVec4{1, 2, 3, 4});
  const PlainVec4 got = t.transform(PlainVec4{5, 6, 7, 8});
  assert(near(got.x, -11.0, kEps) && near(got.y, 12.0, kEps));
  assert(near(got.z, 17.0, kEps) && near(got.w, 20.0, kEps));

  const PlainMat4 m = t.rotateScaleMatrix();
  const PlainVec4 mv =
      tessera::core::Matrix4Traits<PlainMat4>::multiply(m, PlainVec4{5, 6, 7, 8});
  assert(near(mv.x, -12.0, kEps) && near(mv.y, 10.0, kEps));
}

int main() {
  test_rotate_scale_matrix();
  test_rotated_scaled_translated();
  test_transform_direction_only_rotates();
  test_compose();
  test_inverse();
  test_interpolate();
  test_identity();
  test_plain_vector_family();
  std::cout << "rotate_scale_translate4_test: PASS\n";
  return 0;
}
