#pragma once
#include "manoid/core/math/types.hpp"

namespace manoid::core {

// Pose <-> transform conversions.
//
// Poses produced here always satisfy qw >= 0: when the quaternion extracted
// from the rotation block has a negative scalar part, the whole quaternion is
// negated. q and -q encode the same rotation; picking the representative
// nearest identity keeps slerp between consecutive poses on the short arc.
Pose transformToPose(const Transform& T);

// Accepts either quaternion sign. The quaternion is used as given (not
// normalized); a non-unit input yields a non-rotation block.
Transform poseToTransform(const Pose& pose);

Pose canonicalizePose(const Pose& pose);

inline Quat poseQuat(const Pose& pose) {
  return Quat(pose(0), pose(1), pose(2), pose(3));
}
inline Vec3 posePosition(const Pose& pose) { return pose.tail<3>(); }

Pose makePose(const Quat& q, const Vec3& p);

}  // namespace manoid::core
