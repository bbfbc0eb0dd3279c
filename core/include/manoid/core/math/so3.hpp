#pragma once
#include "manoid/core/math/types.hpp"

namespace manoid::core {

// so(3): hat3(w) * x == w.cross(x)
Mat3 hat3(const Vec3& w);
Vec3 vee3(const Mat3& W);

// Roll-pitch-yaw, composed as R = Rz(yaw) * Ry(pitch) * Rx(roll).
Mat3 rotationMatrixFromRpy(double roll, double pitch, double yaw);
Mat3 rotationMatrixFromRpy(const Vec3& rpy);
Vec3 rpyFromRotationMatrix(const Mat3& R);
Vec3 rpyFromQuat(const Quat& q);

// Nearest proper rotation (Frobenius norm), via SVD.
Mat3 orthonormalizeRotation(const Mat3& R);
bool isRotationMatrix(const Mat3& R, double tol);

// Maps a world angular velocity to the time derivative of [qw, qx, qy, qz]:
//   qdot = 0.5 * omega (x) q  =  quatRateMatrix(q) * omega
Eigen::Matrix<double, 4, 3> quatRateMatrix(const Quat& q);

}  // namespace manoid::core
