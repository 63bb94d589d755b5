#include "rigid/core/math/types.hpp"

namespace rigid::core {

// Eigen's default storage is column-major, which is exactly the OpenGL layout.
Mat4 matrix4FromColumnMajor(const ColumnMajorMatrix& m) {
  return Eigen::Map<const Eigen::Matrix4f>(m.data()).cast<double>();
}

ColumnMajorMatrix columnMajorFromMatrix4(const Mat4& T) {
  ColumnMajorMatrix out;
  Eigen::Map<Eigen::Matrix4f>(out.data()) = T.cast<float>();
  return out;
}

}  // namespace rigid::core
