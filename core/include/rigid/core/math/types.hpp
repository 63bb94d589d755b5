#pragma once
#include <array>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace rigid::core {

// Fundamental math types and conventions used across the library.
// - Rotations act on column vectors (p' = R * p); quaternions are Hamilton, unit norm.
// - Transforms compose by left-multiplication (A * B applies B, then A).
// - Computation is double precision; the OpenGL interchange array is float.
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Mat4 = Eigen::Matrix4d;
using Quat = Eigen::Quaterniond;
using Isometry = Eigen::Isometry3d;

// Column-major 4x4 affine matrix: element (row, col) lives at index 4*col + row.
// Rotation at 0,1,2 / 4,5,6 / 8,9,10, translation at 12,13,14, homogeneous row at 3,7,11,15.
using ColumnMajorMatrix = std::array<float, 16>;

inline constexpr int columnMajorIndex(int row, int col) { return 4 * col + row; }

Mat4 matrix4FromColumnMajor(const ColumnMajorMatrix& m);
ColumnMajorMatrix columnMajorFromMatrix4(const Mat4& T);

}  // namespace rigid::core
