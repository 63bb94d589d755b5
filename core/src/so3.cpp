// SO(3) utilities.
// - `slerp` flips the target onto the same hemisphere so it follows the shorter arc.
// - `rotationDistance(q1,q2)` is the quaternion chordal distance:
//     min(||q1 - q2||, ||q1 + q2||)
//   (sign-invariant; not the rotation angle in radians).
#include "rigid/core/math/so3.hpp"
#include <cmath>

namespace rigid::core {

Quat quatFromSO3(const Mat3& R) {
  Quat q(R);
  q.normalize();
  return q;
}

Mat3 so3FromQuat(const Quat& q) {
  return q.normalized().toRotationMatrix();
}

Quat slerp(const Quat& q0, const Quat& q1, double t) {
  Quat a = q0.normalized();
  Quat b = q1.normalized();
  // Ensure shortest path
  if (a.dot(b) < 0.0) b.coeffs() *= -1.0;
  Quat out = a.slerp(t, b);
  out.normalize();
  return out;
}

bool isUnitQuaternion(const Quat& q, double eps) {
  return std::abs(q.norm() - 1.0) <= eps;
}

bool isRotationMatrix(const Mat3& R, double eps) {
  const double ortho_err = (R.transpose() * R - Mat3::Identity()).cwiseAbs().maxCoeff();
  return ortho_err <= eps && std::abs(R.determinant() - 1.0) <= eps;
}

double rotationDistance(const Quat& q1, const Quat& q2) {
  const Quat a = q1.normalized();
  const Quat b = q2.normalized();

  const Eigen::Vector4d v1 = a.coeffs();
  const Eigen::Vector4d v2 = b.coeffs();
  const double d1 = (v1 - v2).norm();
  const double d2 = (v1 + v2).norm();
  return (d1 > d2) ? d2 : d1;
}

}  // namespace rigid::core
