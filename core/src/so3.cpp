// SO(3) helpers.
// - RPY follows the fixed-axis X-Y-Z convention (the one URDF uses).
// - `rpyFromRotationMatrix` returns pitch on [-pi/2, pi/2]; at pitch = +-pi/2
//   roll and yaw are coupled and roll is reported as 0.
#include "manoid/core/math/so3.hpp"

#include <Eigen/SVD>
#include <algorithm>
#include <cmath>

namespace manoid::core {

static inline double clamp(double x, double lo, double hi) {
  return std::max(lo, std::min(hi, x));
}

Mat3 hat3(const Vec3& w) {
  Mat3 W;
  W <<     0.0, -w.z(),  w.y(),
        w.z(),     0.0, -w.x(),
       -w.y(),  w.x(),     0.0;
  return W;
}

Vec3 vee3(const Mat3& W) {
  return Vec3(W(2,1), W(0,2), W(1,0));
}

Mat3 rotationMatrixFromRpy(double roll, double pitch, double yaw) {
  const Eigen::AngleAxisd Rx(roll, Vec3::UnitX());
  const Eigen::AngleAxisd Ry(pitch, Vec3::UnitY());
  const Eigen::AngleAxisd Rz(yaw, Vec3::UnitZ());
  return (Rz * Ry * Rx).toRotationMatrix();
}

Mat3 rotationMatrixFromRpy(const Vec3& rpy) {
  return rotationMatrixFromRpy(rpy.x(), rpy.y(), rpy.z());
}

Vec3 rpyFromRotationMatrix(const Mat3& R) {
  const double sp = clamp(-R(2,0), -1.0, 1.0);
  const double pitch = std::asin(sp);
  if (std::abs(sp) > 1.0 - 1e-12) {
    // Gimbal lock: only yaw - sign(pitch) * roll is observable.
    const double yaw = std::atan2(-R(0,1), R(1,1));
    return Vec3(0.0, pitch, yaw);
  }
  const double roll = std::atan2(R(2,1), R(2,2));
  const double yaw = std::atan2(R(1,0), R(0,0));
  return Vec3(roll, pitch, yaw);
}

Vec3 rpyFromQuat(const Quat& q) {
  return rpyFromRotationMatrix(q.normalized().toRotationMatrix());
}

Mat3 orthonormalizeRotation(const Mat3& R) {
  Eigen::JacobiSVD<Mat3> svd(R, Eigen::ComputeFullU | Eigen::ComputeFullV);
  Mat3 U = svd.matrixU();
  const Mat3 V = svd.matrixV();
  if ((U * V.transpose()).determinant() < 0.0) {
    U.col(2) *= -1.0;
  }
  return U * V.transpose();
}

bool isRotationMatrix(const Mat3& R, double tol) {
  if (!R.allFinite()) return false;
  const Mat3 E = R.transpose() * R - Mat3::Identity();
  if (E.cwiseAbs().maxCoeff() > tol) return false;
  return R.determinant() > 0.0;
}

Eigen::Matrix<double, 4, 3> quatRateMatrix(const Quat& q) {
  const Vec3 v = q.vec();
  Eigen::Matrix<double, 4, 3> E;
  E.row(0) = -0.5 * v.transpose();
  E.block<3,3>(1,0) = 0.5 * (q.w() * Mat3::Identity() - hat3(v));
  return E;
}

}  // namespace manoid::core
