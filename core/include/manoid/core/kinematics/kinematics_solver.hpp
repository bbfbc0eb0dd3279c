#pragma once
#include "manoid/core/common/status.hpp"
#include "manoid/core/export.hpp"
#include "manoid/core/math/types.hpp"
#include "manoid/core/model/robot_model.hpp"

#include <vector>

namespace manoid::core {

// Kinematics + differential kinematics for a serial-chain `RobotModel`.
//
// Outputs are expressed in the world frame (the model base offset applied):
// - Space Jacobian is 6 x n with twist ordering [v; w].
// - Link position Jacobian is 3 x n: d(p_link)/dt = J * qdot.
// - Link pose Jacobian is 7 x n over [qw, qx, qy, qz, x, y, z], where the
//   quaternion is the link's canonical (qw >= 0) orientation.
// Columns of joints beyond the link's own joint are zero.
class MANOID_CORE_API KinematicsSolver {
public:
  explicit KinematicsSolver(RobotModel model);

  const RobotModel& model() const { return model_; }

  Status forwardKinematics(const Eigen::VectorXd& q, int link_index,
                           Transform* g_world_link) const;

  // One transform per link, in chain order.
  Status forwardKinematicsAll(const Eigen::VectorXd& q,
                              std::vector<Transform>* link_transforms) const;

  Status spatialJacobian(const Eigen::VectorXd& q, Eigen::MatrixXd* J_space) const;

  // `J_space_prefix` must be 6 x n; columns after link_index are set to zero.
  Status spatialJacobianUpToLink(const Eigen::VectorXd& q, int link_index,
                                 Eigen::Ref<Eigen::MatrixXd> J_space_prefix) const;

  Status linkPositionJacobian(const Eigen::VectorXd& q, int link_index,
                              Eigen::MatrixXd* J_pos) const;

  Status linkPoseJacobian(const Eigen::VectorXd& q, int link_index,
                          Eigen::MatrixXd* J_pose) const;

private:
  Status checkArgs(const char* op, const Eigen::VectorXd& q, int link_index) const;

  RobotModel model_;
};

}  // namespace manoid::core
