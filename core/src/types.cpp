#include "manoid/core/math/types.hpp"

#include "manoid/core/common/constants.hpp"
#include "manoid/core/math/so3.hpp"

#include <stdexcept>

namespace manoid::core {

Transform transformFromMatrix4(const Mat4& T) {
  if (!T.allFinite()) {
    throw std::runtime_error("transformFromMatrix4: non-finite entry");
  }
  const Eigen::RowVector4d bottom = T.row(3);
  if (!bottom.isApprox(Eigen::RowVector4d(0.0, 0.0, 0.0, 1.0), 1e-9)) {
    throw std::runtime_error("transformFromMatrix4: bottom row is not [0 0 0 1]");
  }
  const Mat3 R = T.topLeftCorner<3, 3>();
  if (!isRotationMatrix(R, kDefaultThresholds.rotation_orthonormality_tol)) {
    throw std::runtime_error("transformFromMatrix4: rotation block is not in SO(3)");
  }

  Transform out = Transform::Identity();
  out.linear() = R;
  out.translation() = T.topRightCorner<3, 1>();
  return out;
}

Mat4 matrix4FromTransform(const Transform& T) {
  Mat4 out = Mat4::Identity();
  out.topLeftCorner<3, 3>() = T.linear();
  out.topRightCorner<3, 1>() = T.translation();
  return out;
}

}  // namespace manoid::core
