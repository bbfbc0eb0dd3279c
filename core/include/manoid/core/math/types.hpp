#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace manoid::core {

// Fundamental math types and conventions used across the library.
// - `Transform` is a rigid transform (rotation block + translation) in the world frame.
// - `Pose` is [qw, qx, qy, qz, x, y, z]: orientation quaternion first, then translation.
// - Jacobian twist ordering is [v; w] (linear; angular).
// - Units are meters and radians.
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Mat4 = Eigen::Matrix4d;
using Quat = Eigen::Quaterniond;

using Transform = Eigen::Isometry3d;
using Pose = Eigen::Matrix<double, 7, 1>;
using AdjointMatrix = Eigen::Matrix<double, 6, 6>;
using ScrewMatrix = Eigen::Matrix<double, 6, Eigen::Dynamic>;

inline constexpr int kPoseDim = 7;
inline constexpr int kPositionDim = 3;

// Throws std::runtime_error unless T is a finite homogeneous rigid transform.
Transform transformFromMatrix4(const Mat4& T);
Mat4 matrix4FromTransform(const Transform& T);

// Blocks as stored; no orthonormalization.
inline Mat3 rotation(const Transform& T) { return T.linear(); }
inline Vec3 translation(const Transform& T) { return T.translation(); }

}  // namespace manoid::core
