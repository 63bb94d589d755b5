#pragma once
#include "rigid/core/common/constants.hpp"
#include "rigid/core/math/types.hpp"

namespace rigid::core {

// SO(3)
Quat quatFromSO3(const Mat3& R);
Mat3 so3FromQuat(const Quat& q);

// Shortest-path spherical interpolation; t is not clamped.
Quat slerp(const Quat& q0, const Quat& q1, double t);

bool isUnitQuaternion(const Quat& q, double eps = kDefaultTolerances.unit_norm_eps);
bool isRotationMatrix(const Mat3& R, double eps = kDefaultTolerances.orthonormal_eps);

// Chordal quaternion distance, sign-invariant
double rotationDistance(const Quat& q1, const Quat& q2);

}  // namespace rigid::core
