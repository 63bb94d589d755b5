#pragma once

namespace rigid::core {

// Numeric tolerances used by comparisons and validation helpers.
struct Tolerances {
  double position_eps = 1.0e-6;     // m, Euclidean distance
  double rotation_eps = 1.0e-6;     // chordal quaternion distance
  double unit_norm_eps = 1.0e-6;    // | |q| - 1 |
  double orthonormal_eps = 1.0e-5;  // max |R^T R - I| entry, |det R - 1|

  // below this a quaternion norm is treated as zero
  double zero_norm_eps = 1.0e-15;
};

inline constexpr Tolerances kDefaultTolerances{};

}  // namespace rigid::core
