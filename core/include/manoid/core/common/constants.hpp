#pragma once

namespace manoid::core {

// Numerical thresholds, grouped so callers can override them per robot.
struct Thresholds {
  // Squared norm of the quaternion block of a pose residual above which the
  // two quaternions lie on opposite sides of the double cover. For unit
  // quaternions ||q1 - q2||^2 > 1 iff q1.q2 < 0.5.
  double quat_opposite_sq_norm = 1.0;

  double axis_norm_eps = 1.0e-12;

  // Max |R^T R - I| entry still accepted as a rotation block.
  double rotation_orthonormality_tol = 1.0e-6;
};

inline constexpr Thresholds kDefaultThresholds{};

// Task parameters used when the caller does not set them.
inline constexpr double kDefaultTaskGain = 0.85;
inline constexpr double kDefaultTaskWeight = 1.0;

// Half-size of the cube drawn for a point, and for point masses the lower
// bound of the mass-proportional size.
inline constexpr double kDefaultPointSize = 0.01;
inline constexpr double kMinPointMassSize = 5.0e-3;
inline constexpr double kPointMassSizePerKg = 6.0e-4;

}  // namespace manoid::core
