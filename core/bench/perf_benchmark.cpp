#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "tessera/core/algebra/rotor4.hpp"
#include "tessera/core/math/eigen_traits.hpp"
#include "tessera/core/mesh/cross_section.hpp"
#include "tessera/core/mesh/primitives.hpp"
#include "tessera/core/transform/rotate_scale_translate4.hpp"

using tessera::core::Bivec4;
using tessera::core::Mat4;
using tessera::core::Rotor4;
using tessera::core::TetrahedronMesh4D;
using tessera::core::TriangleMesh3D;
using tessera::core::Vec4;
using tessera::core::crossSection;

using Rst = tessera::core::RotateScaleTranslate4<Vec4>;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

// Slowly varying rotation for frame i.
static Rotor4 frameRotor(int i) {
  const float t = 0.01f * static_cast<float>(i);
  return Rotor4::fromBivecAngles(
      Bivec4{0.7f * t, 0.3f * t, 1.1f * t, -0.5f * t, 0.9f * t, 0.2f * t});
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: tessera_perf_benchmark [--compose-iters=N] [--interp-iters=N]"
                 " [--slice-iters=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int compose_iters = parseIntArg(argc, argv, "--compose-iters", 200000);
  const int interp_iters = parseIntArg(argc, argv, "--interp-iters", 50000);
  const int slice_iters = parseIntArg(argc, argv, "--slice-iters", 2000);
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  const Rotor4 step = Rotor4::fromBivecAngles(Bivec4{0.01f, 0.02f, -0.03f, 0.005f, 0.01f, -0.02f});
  const Rotor4 a = frameRotor(17);
  const Rotor4 b = frameRotor(230);
  const TetrahedronMesh4D tesseract = tessera::core::makeTesseractCube(1.0f);
  double acc = 0.0;

  auto run_compose = [&]() {
    Rotor4 r = Rotor4::identity();
    for (int i = 0; i < compose_iters; ++i) {
      r = r.compose(step);
    }
    acc += r.c();
  };

  // Same chain through 4x4 matrices, no renormalization.
  auto run_compose_matrix = [&]() {
    const Mat4 m = step.toMatrix<Mat4>();
    Mat4 r = Mat4::Identity();
    for (int i = 0; i < compose_iters; ++i) {
      r = m * r;
    }
    acc += r(0, 0);
  };

  auto run_interp = [&]() {
    for (int i = 0; i < interp_iters; ++i) {
      const float t = static_cast<float>(i % 101) / 100.0f;
      acc += a.interpolateWith(b, t).c();
    }
  };

  auto run_slice = [&]() {
    for (int i = 0; i < slice_iters; ++i) {
      const Rst transform(frameRotor(i), 1.0f, Vec4::Zero());
      const TriangleMesh3D slice = crossSection(tesseract.applyTransform(transform));
      acc += static_cast<double>(slice.simplexes.size());
    }
  };

  std::vector<double> compose_runs;
  std::vector<double> compose_matrix_runs;
  std::vector<double> interp_runs;
  std::vector<double> slice_runs;
  compose_runs.reserve(trials);
  compose_matrix_runs.reserve(trials);
  interp_runs.reserve(trials);
  slice_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_compose();
    run_compose_matrix();
    run_interp();
    run_slice();
  }

  for (int i = 0; i < trials; ++i) {
    compose_runs.push_back(benchMs(run_compose));
    compose_matrix_runs.push_back(benchMs(run_compose_matrix));
    interp_runs.push_back(benchMs(run_interp));
    slice_runs.push_back(benchMs(run_slice));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double compose_ms = median(compose_runs);
  const double compose_matrix_ms = median(compose_matrix_runs);
  const double interp_ms = median(interp_runs);
  const double slice_ms = median(slice_runs);

  std::cout << "tessera_perf_benchmark\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  Rotor4::compose:          " << compose_ms << " ms total, "
            << (compose_ms * 1000.0 / compose_iters) << " us/call\n";
  std::cout << "  Mat4 product (baseline):  " << compose_matrix_ms << " ms total, "
            << (compose_matrix_ms * 1000.0 / compose_iters) << " us/call\n";
  std::cout << "  Rotor4::interpolateWith:  " << interp_ms << " ms total, "
            << (interp_ms * 1000.0 / interp_iters) << " us/call\n";
  std::cout << "  tesseract transform+slice: " << slice_ms << " ms total, "
            << (slice_ms * 1000.0 / slice_iters) << " us/frame ("
            << tesseract.simplexes.size() << " cells)\n";

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
