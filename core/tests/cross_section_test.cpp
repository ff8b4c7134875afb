#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

#include "tessera/core/math/eigen_traits.hpp"
#include "tessera/core/mesh/cross_section.hpp"
#include "tessera/core/mesh/simplex_mesh.hpp"
#include "test_util.hpp"

using tessera::core::SimplexIndex;
using tessera::core::TetrahedronMesh3D;
using tessera::core::TetrahedronMesh4D;
using tessera::core::TetrahedronSlice;
using tessera::core::TriangleMesh2D;
using tessera::core::TriangleMesh3D;
using tessera::core::Vec2;
using tessera::core::Vec3;
using tessera::core::Vec4;
using tessera::core::crossSection;
using tessera::core::sliceTetrahedron;
using tessera::test::near;
using tessera::test::nearVec;
using tessera::test::tetrahedronSign;
using tessera::test::triangleArea;
using tessera::test::triangleSign;

static TetrahedronMesh3D makeTet(const std::array<Vec3, 4>& p) {
  TetrahedronMesh3D mesh;
  for (const Vec3& v : p) mesh.vertices.push_back({v});
  mesh.simplexes = {{0, 1, 2, 3}};
  return mesh;
}

static void checkSlicePreservesHandedness(const std::array<Vec3, 4>& p,
                                          std::size_t expected_triangles) {
  const double tet_sign = tetrahedronSign(p);
  assert(tet_sign != 0.0);
  const TriangleMesh2D got = crossSection(makeTet(p));
  assert(got.simplexes.size() == expected_triangles);
  assert(got.vertices.size() == expected_triangles + 2);
  for (std::size_t k = 0; k < got.simplexes.size(); ++k) {
    assert(triangleSign(got.simplexPositions(k)) == tet_sign);
  }
}

static void test_edge_crossing_point() {
  TetrahedronMesh3D mesh = makeTet({Vec3(0, 0, -1), Vec3(2, 0, 3), Vec3(0, 1, -1),
                                    Vec3(1, 1, -2)});
  const TriangleMesh2D got = crossSection(mesh);
  assert(got.simplexes.size() == 1);
  // edge 0-1 crosses z = 0 a quarter of the way along
  bool found = false;
  for (const auto& v : got.vertices) {
    if (nearVec(v.position, Vec2(0.5f, 0.0f), 1e-6)) found = true;
  }
  assert(found);
}

// One vertex alone on its side, every position and both windings of the rest.
static void test_one_three_all_cases() {
  const Vec3 base[3] = {Vec3(0, 0, -1), Vec3(1, 0, -1), Vec3(0, 1, -1)};
  const Vec3 apex(0.2f, 0.3f, 1.0f);
  for (float side : {1.0f, -1.0f}) {
    for (std::size_t lone = 0; lone < 4; ++lone) {
      for (int swap = 0; swap < 2; ++swap) {
        std::array<Vec3, 3> rest = {base[0], base[1], base[2]};
        if (swap) std::swap(rest[0], rest[1]);
        std::array<Vec3, 4> p;
        std::size_t r = 0;
        for (std::size_t i = 0; i < 4; ++i) {
          p[i] = (i == lone) ? apex : rest[r++];
          p[i].z() *= side;
        }
        checkSlicePreservesHandedness(p, 1);
      }
    }
  }
}

// Two vertices on each side, every assignment of roles and both windings.
static void test_two_two_all_cases() {
  const Vec3 below[2] = {Vec3(0, 0, -1), Vec3(1, 0.2f, -1)};
  const Vec3 above[2] = {Vec3(0.1f, 1, 1), Vec3(-0.7f, 0.4f, 1)};
  int cases = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    for (std::size_t j = i + 1; j < 4; ++j) {
      for (int swap = 0; swap < 2; ++swap) {
        std::array<Vec3, 4> p;
        std::size_t a = 0;
        std::size_t b = 0;
        for (std::size_t k = 0; k < 4; ++k) {
          p[k] = (k == i || k == j) ? above[a++] : below[b++];
        }
        if (swap) std::swap(p[i], p[j]);
        checkSlicePreservesHandedness(p, 2);
        ++cases;
      }
    }
  }
  assert(cases == 12);
}

static void test_slice_table() {
  for (int mask = 0; mask < 16; ++mask) {
    std::array<bool, 4> positive{};
    int count = 0;
    for (int i = 0; i < 4; ++i) {
      positive[static_cast<std::size_t>(i)] = (mask >> i) & 1;
      count += (mask >> i) & 1;
    }
    const TetrahedronSlice s = sliceTetrahedron(positive);
    const int expected = (count == 0 || count == 4) ? 0 : (count == 2 ? 2 : 1);
    assert(s.triangle_count == expected);
    // every emitted edge crosses the plane
    for (int t = 0; t < s.triangle_count; ++t) {
      for (const auto& e : s.triangles[static_cast<std::size_t>(t)]) {
        assert(positive[e.a] != positive[e.b]);
      }
    }
  }
}

static void test_no_crossing_gives_empty_mesh() {
  const TriangleMesh2D above = crossSection(makeTet({Vec3(0, 0, 1), Vec3(1, 0, 1),
                                                     Vec3(0, 1, 1), Vec3(0, 0, 2)}));
  assert(above.vertices.empty() && above.simplexes.empty());
  // depth exactly zero counts as the negative side
  const TriangleMesh2D touching = crossSection(makeTet({Vec3(0, 0, 0), Vec3(1, 0, 0),
                                                        Vec3(0, 1, 0), Vec3(0, 0, -1)}));
  assert(touching.simplexes.empty());
}

static void test_random_tetrahedra_preserve_handedness() {
  std::mt19937 rng(31);
  std::uniform_real_distribution<float> u(-1.0f, 1.0f);
  int checked = 0;
  for (int n = 0; n < 3000; ++n) {
    std::array<Vec3, 4> p;
    bool near_plane = false;
    for (Vec3& v : p) {
      v = Vec3(u(rng), u(rng), u(rng));
      near_plane = near_plane || std::abs(v.z()) < 0.05f;
    }
    const float volume = (p[1] - p[0]).cross(p[2] - p[0]).dot(p[3] - p[0]);
    if (near_plane || std::abs(volume) < 1e-2f) continue;

    const double tet_sign = tetrahedronSign(p);
    const TriangleMesh2D got = crossSection(makeTet(p));
    for (std::size_t k = 0; k < got.simplexes.size(); ++k) {
      const auto tri = got.simplexPositions(k);
      if (triangleArea(tri) < 1e-6) continue;
      assert(triangleSign(tri) == tet_sign);
      ++checked;
    }
  }
  assert(checked > 1000);
}

// Two tetrahedra sharing a crossing face produce one vertex per crossing edge.
static void test_shared_edges_share_vertices() {
  TetrahedronMesh3D mesh;
  mesh.vertices = {{Vec3(0, 0, -1)}, {Vec3(1, 0, -1)}, {Vec3(0, 1, 1)},
                   {Vec3(0.2f, 0.2f, 2)}, {Vec3(0.2f, 0.2f, -2)}};
  mesh.simplexes = {{0, 1, 2, 3}, {1, 0, 2, 4}};
  const TriangleMesh2D got = crossSection(mesh);
  // tet 1: edges 0-2, 1-2, 0-3, 1-3 (2-2 split); tet 2: 1-2, 0-2, 2-4 (1-3 split)
  assert(got.simplexes.size() == 3);
  assert(got.vertices.size() == 5);
  for (std::size_t k = 0; k < got.simplexes.size(); ++k) {
    assert(triangleSign(got.simplexPositions(k)) ==
           tetrahedronSign(mesh.simplexPositions(k == 2 ? 1 : 0)));
  }
}

static void test_four_dimensional_mesh() {
  TetrahedronMesh4D mesh;
  mesh.vertices = {{Vec4(0, 0, 0, -1)}, {Vec4(1, 0, 0, 1)}, {Vec4(0, 1, 0, 1)},
                   {Vec4(0, 0, 1, 1)}};
  mesh.simplexes = {{0, 1, 2, 3}};
  const TriangleMesh3D got = crossSection(mesh);
  assert(got.simplexes.size() == 1);
  assert(got.vertices.size() == 3);
  for (const auto& v : got.vertices) {
    assert(near(v.position.sum(), 0.5, 1e-6));
  }
}

int main() {
  test_edge_crossing_point();
  test_one_three_all_cases();
  test_two_two_all_cases();
  test_slice_table();
  test_no_crossing_gives_empty_mesh();
  test_random_tetrahedra_preserve_handedness();
  test_shared_edges_share_vertices();
  test_four_dimensional_mesh();
  std::cout << "cross_section_test: PASS\n";
  return 0;
}
