// Distance helpers between rigid transforms.
// - Position distance is the Euclidean norm in meters.
// - Rotation distance delegates to SO(3) helpers and returns chordal quaternion distance.
#include "rigid/core/math/distance.hpp"
#include "rigid/core/math/rigid_transform.hpp"
#include "rigid/core/math/so3.hpp"

namespace rigid::core {

double positionDistance(const RigidTransform& T1, const RigidTransform& T2) {
  return positionDistance(T1.position(), T2.position());
}

double positionDistance(const Vec3& p1, const Vec3& p2) {
  return (p1 - p2).norm();
}

double rotationDistance(const RigidTransform& T1, const RigidTransform& T2) {
  return rotationDistance(T1.orientation(), T2.orientation());
}

}  // namespace rigid::core
