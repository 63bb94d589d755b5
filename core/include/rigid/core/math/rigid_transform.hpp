#pragma once
#include "rigid/core/export.hpp"
#include "rigid/core/common/constants.hpp"
#include "rigid/core/common/status.hpp"
#include "rigid/core/math/types.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>

namespace rigid::core {

// Position + orientation of a rigid body in 3D (an element of SE(3)).
//
// Acting on points, T(p) = R(q) * p + position. Composition follows the
// rotation-matrix order: (A * B)(p) = A(B(p)).
//
// The orientation is expected to be a unit quaternion. Setters copy their argument
// and do not validate it; operations that produce a new orientation normalize it.
class RIGID_CORE_API RigidTransform {
public:
  RigidTransform();                       // identity
  RigidTransform(const Vec3& position, const Quat& orientation);
  RigidTransform(const Vec3& position, const Mat3& rotation);

  static RigidTransform identity();
  static RigidTransform fromPositionAndOrientation(const Vec3& position,
                                                   const Quat& orientation);
  static RigidTransform fromPositionAndRotationMatrix(const Vec3& position,
                                                      const Mat3& rotation);
  static RigidTransform fromIsometry(const Isometry& T);
  static RigidTransform fromMatrix4(const Mat4& T);
  static RigidTransform fromColumnMajorMatrix(const ColumnMajorMatrix& m);

  // References to the owned fields; they observe later setter calls.
  const Vec3& position() const { return position_; }
  const Quat& orientation() const { return orientation_; }

  void setPosition(const Vec3& position) { position_ = position; }
  void setOrientation(const Quat& orientation);
  void setToIdentity();

  Mat3 rotationMatrix() const;
  Isometry isometry() const;
  Mat4 matrix4() const;

  // OpenGL column-major 4x4 interchange (see ColumnMajorMatrix).
  // The pointer forms read/write exactly 16 floats.
  Status setFromColumnMajorMatrix(const float* m);
  void setFromColumnMajorMatrix(const ColumnMajorMatrix& m);
  Status toColumnMajorMatrix(float* m) const;
  ColumnMajorMatrix toColumnMajorMatrix() const;

  // (q^-1, -R(q^-1) * p)
  RigidTransform inverse() const;

  // this * rhs: applies rhs first, then this.
  RigidTransform compose(const RigidTransform& rhs) const;
  Vec3 apply(const Vec3& point) const;

  RigidTransform operator*(const RigidTransform& rhs) const { return compose(rhs); }
  Vec3 operator*(const Vec3& point) const { return apply(point); }

  // Linear blend of positions, slerp of orientations. The factor is not clamped.
  static RigidTransform interpolate(const RigidTransform& from,
                                    const RigidTransform& to,
                                    double factor);

  // Exact component-wise equality.
  bool operator==(const RigidTransform& rhs) const;
  bool operator!=(const RigidTransform& rhs) const { return !(*this == rhs); }

  // Position within `tol.position_eps`, orientation within `tol.rotation_eps`
  // (chordal distance, so q and -q compare equal).
  bool isApprox(const RigidTransform& rhs,
                const Tolerances& tol = kDefaultTolerances) const;

private:
  Vec3 position_{Vec3::Zero()};
  Quat orientation_{Quat::Identity()};
};

// Validates that `m` is a rigid affine matrix: orthonormal rotation block with
// det +1, zeros at indices 3/7/11 and 1 at index 15.
Status checkRigidMatrix(const ColumnMajorMatrix& m,
                        const Tolerances& tol = kDefaultTolerances);

// "(position= x y z, orientation= w x y z)"
std::ostream& operator<<(std::ostream& os, const RigidTransform& T);

}  // namespace rigid::core

namespace std {

// Consistent with RigidTransform::operator== (exact equality).
template <>
struct RIGID_CORE_API hash<rigid::core::RigidTransform> {
  std::size_t operator()(const rigid::core::RigidTransform& T) const noexcept;
};

}  // namespace std
