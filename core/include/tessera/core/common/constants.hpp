#pragma once

namespace tessera::core {

// Numerical tolerances shared by the bivector and rotor routines.
struct Thresholds {
  // |pseudoscalar part of B^2| allowed for B to count as simple.
  double simple_bivec_eps = 1.0e-3;

  // rotor log case analysis: scalar or pseudoscalar part treated as zero
  double rotor_log_eps = 1.0e-5;

  // factorization splits the bivector directly when
  // sqrt(c^2 - q^2) <= isoclinic_rel_eps * |c|
  double isoclinic_rel_eps = 1.0e-5;

  // general numerical
  double zero_magnitude_eps = 1.0e-6;
  double normalize_min_norm = 1.0e-12;
};

inline constexpr Thresholds kDefaultThresholds{};

// Cross-sections are taken at the hyperplane where the last coordinate is zero.
inline constexpr float kCrossSectionDepth = 0.0f;

}  // namespace tessera::core
