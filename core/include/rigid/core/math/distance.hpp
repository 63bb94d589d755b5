#pragma once
#include "rigid/core/math/types.hpp"

namespace rigid::core {

class RigidTransform;

double positionDistance(const RigidTransform& T1, const RigidTransform& T2);
double positionDistance(const Vec3& p1, const Vec3& p2);

double rotationDistance(const RigidTransform& T1, const RigidTransform& T2);

}  // namespace rigid::core
