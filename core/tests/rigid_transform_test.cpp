#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <unordered_set>

#include <Eigen/Geometry>

#include "rigid/core/math/rigid_transform.hpp"
#include "rigid/core/math/distance.hpp"
#include "rigid/core/math/so3.hpp"

using rigid::core::Isometry;
using rigid::core::Mat3;
using rigid::core::Quat;
using rigid::core::RigidTransform;
using rigid::core::Tolerances;
using rigid::core::Vec3;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static bool vecNear(const Vec3& a, const Vec3& b, double tol) {
  return (a - b).norm() <= tol;
}

static Quat axisAngle(double angle, const Vec3& axis) {
  return Quat(Eigen::AngleAxisd(angle, axis.normalized()));
}

static RigidTransform randomTransform(std::mt19937& rng) {
  std::uniform_real_distribution<double> pos(-5.0, 5.0);
  std::normal_distribution<double> gauss(0.0, 1.0);
  Quat q(gauss(rng), gauss(rng), gauss(rng), gauss(rng));
  q.normalize();
  return RigidTransform(Vec3(pos(rng), pos(rng), pos(rng)), q);
}

static Vec3 randomPoint(std::mt19937& rng) {
  std::uniform_real_distribution<double> pos(-10.0, 10.0);
  return Vec3(pos(rng), pos(rng), pos(rng));
}

static void test_construction() {
  const RigidTransform I;
  assert(I.position() == Vec3::Zero());
  assert(I.orientation().coeffs() == Quat::Identity().coeffs());
  assert(I == RigidTransform::identity());

  const Vec3 p(1.0, -2.0, 3.0);
  const Quat q = axisAngle(0.7, Vec3(1.0, 1.0, 0.0));
  const RigidTransform a = RigidTransform::fromPositionAndOrientation(p, q);
  assert(a.position() == p);
  assert(a.orientation().coeffs() == q.coeffs());

  // Rotation-matrix construction goes through the quaternion conversion.
  const Mat3 R = q.toRotationMatrix();
  const RigidTransform b = RigidTransform::fromPositionAndRotationMatrix(p, R);
  assert(b.isApprox(a));
  assert((b.rotationMatrix() - R).cwiseAbs().maxCoeff() < 1e-12);

  // Copies are independent values.
  RigidTransform c = a;
  assert(c == a);
  c.setPosition(Vec3(9.0, 9.0, 9.0));
  assert(a.position() == p);
  assert(c != a);
}

static void test_setters() {
  RigidTransform T;
  Vec3 p(1.0, 2.0, 3.0);
  T.setPosition(p);
  p.x() = 100.0;  // caller's vector is not aliased
  assert(T.position() == Vec3(1.0, 2.0, 3.0));

  const Quat q = axisAngle(M_PI / 3.0, Vec3::UnitY());
  T.setOrientation(q);
  assert(T.orientation().coeffs() == q.coeffs());

  // Accessors observe later setter calls.
  const Vec3& pos_ref = T.position();
  T.setPosition(Vec3(4.0, 5.0, 6.0));
  assert(pos_ref == Vec3(4.0, 5.0, 6.0));

  // No validation on the setter.
  const Quat scaled(2.0, 0.0, 0.0, 0.0);
  T.setOrientation(scaled);
  assert(T.orientation().coeffs() == scaled.coeffs());

  T.setToIdentity();
  assert(T == RigidTransform::identity());
}

static void test_identity_law() {
  std::mt19937 rng(7);
  const RigidTransform I = RigidTransform::identity();
  for (int i = 0; i < 50; ++i) {
    const RigidTransform T = randomTransform(rng);
    assert(T.compose(I).isApprox(T));
    assert(I.compose(T).isApprox(T));

    const Vec3 p = randomPoint(rng);
    assert(vecNear(I.apply(p), p, 1e-12));
  }
}

static void test_inverse_law() {
  std::mt19937 rng(11);
  const RigidTransform I = RigidTransform::identity();
  for (int i = 0; i < 50; ++i) {
    const RigidTransform T = randomTransform(rng);
    const RigidTransform Tinv = T.inverse();
    assert(T.compose(Tinv).isApprox(I));
    assert(Tinv.compose(T).isApprox(I));
    assert(rigid::core::isUnitQuaternion(Tinv.orientation(), 1e-12));

    const Vec3 p = randomPoint(rng);
    assert(vecNear(Tinv.apply(T.apply(p)), p, 1e-9));
  }

  // (R, t)^-1 = (R^T, -R^T t)
  const Quat q = axisAngle(M_PI / 2.0, Vec3::UnitZ());
  const RigidTransform T(Vec3(1.0, 2.0, 3.0), q);
  const RigidTransform Tinv = T.inverse();
  assert(vecNear(Tinv.position(), Vec3(-2.0, 1.0, -3.0), 1e-12));
}

static void test_composition() {
  std::mt19937 rng(23);
  for (int i = 0; i < 50; ++i) {
    const RigidTransform A = randomTransform(rng);
    const RigidTransform B = randomTransform(rng);
    const RigidTransform C = randomTransform(rng);
    const Vec3 p = randomPoint(rng);

    // Point-application homomorphism.
    assert(vecNear(A.compose(B).apply(p), A.apply(B.apply(p)), 1e-9));
    assert(vecNear((A * B) * p, A * (B * p), 1e-9));

    // Associativity.
    assert(A.compose(B).compose(C).isApprox(A.compose(B.compose(C)), Tolerances{1e-9, 1e-9}));

    // Matches Eigen's isometry product.
    const Isometry AB = A.isometry() * B.isometry();
    assert(RigidTransform::fromIsometry(AB).isApprox(A * B, Tolerances{1e-9, 1e-9}));
    assert(rigid::core::isUnitQuaternion((A * B).orientation(), 1e-12));
  }
}

static void test_non_commutative() {
  const RigidTransform T1(Vec3(1.0, 0.0, 0.0), Quat::Identity());
  const RigidTransform T2(Vec3::Zero(), axisAngle(M_PI / 2.0, Vec3::UnitZ()));
  const Vec3 p(0.0, 1.0, 0.0);

  const Vec3 a = T1.compose(T2).apply(p);
  const Vec3 b = T2.compose(T1).apply(p);
  assert(vecNear(a, Vec3(0.0, 0.0, 0.0), 1e-12));
  assert(vecNear(b, Vec3(-1.0, 1.0, 0.0), 1e-12));
  assert(!vecNear(a, b, 1e-3));
}

static void test_interpolation() {
  std::mt19937 rng(31);
  for (int i = 0; i < 20; ++i) {
    const RigidTransform A = randomTransform(rng);
    const RigidTransform B = randomTransform(rng);
    assert(RigidTransform::interpolate(A, B, 0.0).isApprox(A, Tolerances{1e-9, 1e-9}));
    assert(RigidTransform::interpolate(A, B, 1.0).isApprox(B, Tolerances{1e-9, 1e-9}));
  }

  // Midpoint between identity and (2,0,0) with a half turn about Z.
  const RigidTransform A = RigidTransform::identity();
  const RigidTransform B(Vec3(2.0, 0.0, 0.0), axisAngle(M_PI, Vec3::UnitZ()));
  const RigidTransform mid = RigidTransform::interpolate(A, B, 0.5);
  assert(vecNear(mid.position(), Vec3(1.0, 0.0, 0.0), 1e-12));
  const Quat quarter = axisAngle(M_PI / 2.0, Vec3::UnitZ());
  assert(rigid::core::rotationDistance(mid.orientation(), quarter) < 1e-9);

  // Factors outside [0,1] extrapolate the position linearly.
  const RigidTransform ext = RigidTransform::interpolate(A, B, 1.5);
  assert(vecNear(ext.position(), Vec3(3.0, 0.0, 0.0), 1e-12));
  assert(std::isfinite(ext.orientation().w()));
}

static void test_equality() {
  const Quat q = axisAngle(0.3, Vec3::UnitX());
  const RigidTransform a(Vec3(1.0, 2.0, 3.0), q);
  const RigidTransform b(Vec3(1.0, 2.0, 3.0), q);
  // Distinct objects with equal values compare equal.
  assert(a == b);
  assert(!(a != b));

  // q and -q describe the same rotation: approximately equal, not exactly.
  const RigidTransform neg(Vec3(1.0, 2.0, 3.0), Quat(-q.coeffs()));
  assert(neg != a);
  assert(neg.isApprox(a));

  const RigidTransform shifted(Vec3(1.0, 2.0, 3.0 + 1e-3), q);
  assert(!shifted.isApprox(a));
  assert(shifted.isApprox(a, Tolerances{1e-2, 1e-6}));
  assert(near(rigid::core::positionDistance(a, shifted), 1e-3, 1e-12));
}

static void test_isometry_interop() {
  std::mt19937 rng(43);
  for (int i = 0; i < 10; ++i) {
    const RigidTransform T = randomTransform(rng);
    const Isometry iso = T.isometry();
    const Vec3 p = randomPoint(rng);
    assert(vecNear(iso * p, T.apply(p), 1e-9));
    assert(RigidTransform::fromIsometry(iso).isApprox(T, Tolerances{1e-9, 1e-9}));
    assert(vecNear((iso.inverse() * p), T.inverse().apply(p), 1e-9));

    const rigid::core::Mat4 M = T.matrix4();
    assert(RigidTransform::fromMatrix4(M).isApprox(T, Tolerances{1e-9, 1e-9}));
  }
}

static void test_stream() {
  const RigidTransform T(Vec3(1.0, 2.0, 3.0), Quat::Identity());
  std::ostringstream os;
  os << T;
  assert(os.str() == "(position= 1 2 3, orientation= 1 0 0 0)");
}

static void test_hash() {
  const std::hash<RigidTransform> hasher{};
  const Quat q = axisAngle(1.1, Vec3(0.0, 1.0, 1.0));
  const RigidTransform a(Vec3(1.0, -2.0, 0.5), q);
  const RigidTransform b(Vec3(1.0, -2.0, 0.5), q);
  assert(a == b);
  assert(hasher(a) == hasher(b));

  // +0.0 and -0.0 compare equal and must hash alike.
  const RigidTransform pos_zero(Vec3(0.0, 0.0, 0.0), Quat::Identity());
  const RigidTransform neg_zero(Vec3(-0.0, 0.0, -0.0), Quat::Identity());
  assert(pos_zero == neg_zero);
  assert(hasher(pos_zero) == hasher(neg_zero));

  std::unordered_set<RigidTransform> poses;
  poses.insert(a);
  poses.insert(b);
  poses.insert(pos_zero);
  poses.insert(neg_zero);
  poses.insert(RigidTransform::identity());
  assert(poses.size() == 2);
  assert(poses.count(RigidTransform(Vec3(1.0, -2.0, 0.5), q)) == 1);

  const RigidTransform moved(Vec3(1.0, -2.0, 0.75), q);
  poses.insert(moved);
  assert(poses.size() == 3);
}

int main() {
  test_construction();
  test_setters();
  test_identity_law();
  test_inverse_law();
  test_composition();
  test_non_commutative();
  test_interpolation();
  test_equality();
  test_isometry_interop();
  test_stream();
  test_hash();
  std::cout << "rigid_transform_test: PASS\n";
  return 0;
}
