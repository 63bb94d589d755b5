#include "rigid/core/math/rigid_transform.hpp"

#include "rigid/core/common/logger.hpp"
#include "rigid/core/math/distance.hpp"
#include "rigid/core/math/so3.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <string>

namespace rigid::core {

// Restores unit norm; a zero-norm product is kept as-is and reported.
static inline Quat normalizeOrKeep(const Quat& q, const char* where) {
  const double n = q.norm();
  if (n < kDefaultTolerances.zero_norm_eps) {
    log(LogLevel::Error, std::string(where) + ": zero-norm orientation");
    return q;
  }
  Quat out = q;
  out.coeffs() /= n;
  return out;
}

RigidTransform::RigidTransform() = default;

RigidTransform::RigidTransform(const Vec3& position, const Quat& orientation)
  : position_(position), orientation_(orientation) {}

RigidTransform::RigidTransform(const Vec3& position, const Mat3& rotation)
  : position_(position), orientation_(quatFromSO3(rotation)) {}

RigidTransform RigidTransform::identity() { return RigidTransform(); }

RigidTransform RigidTransform::fromPositionAndOrientation(const Vec3& position,
                                                         const Quat& orientation) {
  return RigidTransform(position, orientation);
}

RigidTransform RigidTransform::fromPositionAndRotationMatrix(const Vec3& position,
                                                            const Mat3& rotation) {
  return RigidTransform(position, rotation);
}

RigidTransform RigidTransform::fromIsometry(const Isometry& T) {
  const Vec3 p = T.translation();
  const Mat3 R = T.rotation();
  return RigidTransform(p, R);
}

RigidTransform RigidTransform::fromMatrix4(const Mat4& T) {
  const Vec3 p = T.block<3, 1>(0, 3);
  const Mat3 R = T.block<3, 3>(0, 0);
  return RigidTransform(p, R);
}

RigidTransform RigidTransform::fromColumnMajorMatrix(const ColumnMajorMatrix& m) {
  RigidTransform out;
  out.setFromColumnMajorMatrix(m);
  return out;
}

void RigidTransform::setOrientation(const Quat& orientation) {
  orientation_ = orientation;
  if (shouldLog(LogLevel::Debug) && !isUnitQuaternion(orientation)) {
    log(LogLevel::Debug, "RigidTransform::setOrientation: non-unit quaternion (norm " +
                         std::to_string(orientation.norm()) + ")");
  }
}

void RigidTransform::setToIdentity() {
  position_ = Vec3::Zero();
  orientation_ = Quat::Identity();
}

Mat3 RigidTransform::rotationMatrix() const {
  return so3FromQuat(orientation_);
}

Isometry RigidTransform::isometry() const {
  Isometry T = Isometry::Identity();
  T.linear() = rotationMatrix();
  T.translation() = position_;
  return T;
}

Mat4 RigidTransform::matrix4() const {
  Mat4 out = Mat4::Identity();
  out.block<3, 3>(0, 0) = rotationMatrix();
  out.block<3, 1>(0, 3) = position_;
  return out;
}

Status RigidTransform::setFromColumnMajorMatrix(const float* m) {
  if (!m) {
    log(LogLevel::Error, "setFromColumnMajorMatrix: null input pointer");
    return Status::InvalidParameter;
  }
  ColumnMajorMatrix a;
  std::copy(m, m + a.size(), a.begin());
  setFromColumnMajorMatrix(a);
  return Status::Success;
}

void RigidTransform::setFromColumnMajorMatrix(const ColumnMajorMatrix& m) {
  if (shouldLog(LogLevel::Debug) && !ok(checkRigidMatrix(m))) {
    log(LogLevel::Debug, "setFromColumnMajorMatrix: input is not a rigid affine matrix");
  }

  const Mat4 T = matrix4FromColumnMajor(m);
  const Mat3 R = T.block<3, 3>(0, 0);
  orientation_ = quatFromSO3(R);
  position_ = T.block<3, 1>(0, 3);
}

Status RigidTransform::toColumnMajorMatrix(float* m) const {
  if (!m) {
    log(LogLevel::Error, "toColumnMajorMatrix: null output pointer");
    return Status::InvalidParameter;
  }
  const ColumnMajorMatrix a = toColumnMajorMatrix();
  std::copy(a.begin(), a.end(), m);
  return Status::Success;
}

ColumnMajorMatrix RigidTransform::toColumnMajorMatrix() const {
  // matrix4() carries the [0 0 0 1] bottom row, i.e. indices 3/7/11/15.
  return columnMajorFromMatrix4(matrix4());
}

RigidTransform RigidTransform::inverse() const {
  if (orientation_.norm() < kDefaultTolerances.zero_norm_eps) {
    log(LogLevel::Error, "RigidTransform::inverse: zero-norm orientation");
    return RigidTransform(-position_, Quat::Identity());
  }
  const Quat q_inv = orientation_.inverse().normalized();
  const Mat3 R_inv = so3FromQuat(q_inv);
  return RigidTransform(R_inv * (-position_), q_inv);
}

RigidTransform RigidTransform::compose(const RigidTransform& rhs) const {
  const Vec3 p = position_ + rotationMatrix() * rhs.position_;
  const Quat q = normalizeOrKeep(orientation_ * rhs.orientation_, "RigidTransform::compose");
  return RigidTransform(p, q);
}

Vec3 RigidTransform::apply(const Vec3& point) const {
  return rotationMatrix() * point + position_;
}

RigidTransform RigidTransform::interpolate(const RigidTransform& from,
                                           const RigidTransform& to,
                                           double factor) {
  const Vec3 p = (1.0 - factor) * from.position_ + factor * to.position_;
  const Quat q = slerp(from.orientation_, to.orientation_, factor);
  return RigidTransform(p, q);
}

bool RigidTransform::operator==(const RigidTransform& rhs) const {
  return position_ == rhs.position_ && orientation_.coeffs() == rhs.orientation_.coeffs();
}

bool RigidTransform::isApprox(const RigidTransform& rhs, const Tolerances& tol) const {
  return positionDistance(*this, rhs) <= tol.position_eps &&
         rotationDistance(*this, rhs) <= tol.rotation_eps;
}

Status checkRigidMatrix(const ColumnMajorMatrix& m, const Tolerances& tol) {
  const Mat4 T = matrix4FromColumnMajor(m);

  // written as !(x <= eps) so that NaN entries fail
  for (int c = 0; c < 3; ++c) {
    if (!(std::abs(T(3, c)) <= tol.orthonormal_eps)) {
      return Status::InvalidParameter;
    }
  }
  if (!(std::abs(T(3, 3) - 1.0) <= tol.orthonormal_eps)) {
    return Status::InvalidParameter;
  }
  if (!T.block<3, 1>(0, 3).allFinite()) {
    return Status::InvalidParameter;
  }

  const Mat3 R = T.block<3, 3>(0, 0);
  if (!isRotationMatrix(R, tol.orthonormal_eps)) {
    return Status::InvalidParameter;
  }
  return Status::Success;
}

std::ostream& operator<<(std::ostream& os, const RigidTransform& T) {
  const Vec3& p = T.position();
  const Quat& q = T.orientation();
  os << "(position= " << p.x() << ' ' << p.y() << ' ' << p.z()
     << ", orientation= " << q.w() << ' ' << q.x() << ' ' << q.y() << ' ' << q.z() << ")";
  return os;
}

// +0.0 and -0.0 compare equal, so they must hash alike.
static inline void hashCombine(std::size_t* seed, double v) {
  const double canonical = (v == 0.0) ? 0.0 : v;
  *seed ^= std::hash<double>{}(canonical) + 0x9e3779b9 + (*seed << 6) + (*seed >> 2);
}

}  // namespace rigid::core

namespace std {

size_t hash<rigid::core::RigidTransform>::operator()(
    const rigid::core::RigidTransform& T) const noexcept {
  size_t seed = 3;
  const rigid::core::Vec3& p = T.position();
  const rigid::core::Quat& q = T.orientation();
  rigid::core::hashCombine(&seed, p.x());
  rigid::core::hashCombine(&seed, p.y());
  rigid::core::hashCombine(&seed, p.z());
  rigid::core::hashCombine(&seed, q.w());
  rigid::core::hashCombine(&seed, q.x());
  rigid::core::hashCombine(&seed, q.y());
  rigid::core::hashCombine(&seed, q.z());
  return seed;
}

}  // namespace std
