#include "manoid/core/math/pose.hpp"

namespace manoid::core {

Pose makePose(const Quat& q, const Vec3& p) {
  Pose pose;
  pose << q.w(), q.x(), q.y(), q.z(), p.x(), p.y(), p.z();
  return pose;
}

Pose canonicalizePose(const Pose& pose) {
  Pose out = pose;
  if (out(0) < 0.0) {
    out.head<4>() *= -1.0;
  }
  return out;
}

Pose transformToPose(const Transform& T) {
  const Quat q(Mat3(T.linear()));
  return canonicalizePose(makePose(q, T.translation()));
}

Transform poseToTransform(const Pose& pose) {
  Transform T = Transform::Identity();
  T.linear() = poseQuat(pose).toRotationMatrix();
  T.translation() = posePosition(pose);
  return T;
}

}  // namespace manoid::core
