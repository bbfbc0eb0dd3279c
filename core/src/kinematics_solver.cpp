#include "manoid/core/kinematics/kinematics_solver.hpp"

#include "manoid/core/common/logger.hpp"
#include "manoid/core/math/pose.hpp"
#include "manoid/core/math/so3.hpp"

#include <Eigen/Geometry>
#include <string>
#include <utility>

namespace manoid::core {

KinematicsSolver::KinematicsSolver(RobotModel model)
  : model_(std::move(model)) {}

static Transform jointExp(const JointSpec& j, double q) {
  Transform T = Transform::Identity();

  if (j.type == JointType::Revolute) {
    const Mat3 R = Eigen::AngleAxisd(q, j.axis).toRotationMatrix();
    T.linear() = R;
    T.translation() = (Mat3::Identity() - R) * j.point;
  } else if (j.type == JointType::Prismatic) {
    T.translation() = j.axis * q;
  }
  return T;
}

static AdjointMatrix adjointVW(const Transform& T) {
  const Mat3 R = T.linear();
  AdjointMatrix Ad = AdjointMatrix::Zero();
  Ad.block<3,3>(0,0) = R;
  Ad.block<3,3>(3,3) = R;
  Ad.block<3,3>(0,3) = hat3(T.translation()) * R;  // ordering: [v; w]
  return Ad;
}

Status KinematicsSolver::checkArgs(const char* op, const Eigen::VectorXd& q,
                                   int link_index) const {
  if (q.size() != model_.dof()) {
    log(LogLevel::Error, std::string(op) + ": q size mismatch");
    return Status::InvalidParameter;
  }
  if (link_index < 0 || link_index >= model_.dof()) {
    log(LogLevel::Error, std::string(op) + ": link index out of range");
    return Status::InvalidParameter;
  }
  return Status::Success;
}

Status KinematicsSolver::forwardKinematics(const Eigen::VectorXd& q, int link_index,
                                           Transform* g_world_link) const {
  if (!g_world_link) {
    log(LogLevel::Error, "forwardKinematics: null output pointer");
    return Status::InvalidParameter;
  }
  const Status st = checkArgs("forwardKinematics", q, link_index);
  if (!ok(st)) return st;

  Transform prod = Transform::Identity();
  for (int i = 0; i <= link_index; ++i) {
    prod = prod * jointExp(model_.joint(i), q(i));
  }
  *g_world_link = model_.base_offset() * prod * model_.joint(link_index).link_home;
  return Status::Success;
}

Status KinematicsSolver::forwardKinematicsAll(const Eigen::VectorXd& q,
                                              std::vector<Transform>* link_transforms) const {
  if (!link_transforms) {
    log(LogLevel::Error, "forwardKinematicsAll: null output pointer");
    return Status::InvalidParameter;
  }
  if (q.size() != model_.dof()) {
    log(LogLevel::Error, "forwardKinematicsAll: q size mismatch");
    return Status::InvalidParameter;
  }

  link_transforms->clear();
  link_transforms->reserve(static_cast<std::size_t>(model_.dof()));

  const Transform& base = model_.base_offset();
  Transform prod = Transform::Identity();
  for (int i = 0; i < model_.dof(); ++i) {
    // g_i(q) = base * (prod_{k<=i} exp(S_k q_k)) * M_i
    prod = prod * jointExp(model_.joint(i), q(i));
    link_transforms->push_back(base * prod * model_.joint(i).link_home);
  }
  return Status::Success;
}

Status KinematicsSolver::spatialJacobian(const Eigen::VectorXd& q,
                                         Eigen::MatrixXd* J_space) const {
  if (!J_space) {
    log(LogLevel::Error, "spatialJacobian: null output pointer");
    return Status::InvalidParameter;
  }
  const int n = model_.dof();
  if (n == 0) {
    J_space->resize(6, 0);
    return Status::Success;
  }
  J_space->resize(6, n);
  return spatialJacobianUpToLink(q, n - 1, Eigen::Ref<Eigen::MatrixXd>(*J_space));
}

Status KinematicsSolver::spatialJacobianUpToLink(const Eigen::VectorXd& q, int link_index,
                                                 Eigen::Ref<Eigen::MatrixXd> J_space_prefix) const {
  const Status st = checkArgs("spatialJacobianUpToLink", q, link_index);
  if (!ok(st)) return st;

  const int n = model_.dof();
  if (J_space_prefix.rows() != 6 || J_space_prefix.cols() != n) {
    log(LogLevel::Error, "spatialJacobianUpToLink: output size mismatch");
    return Status::InvalidParameter;
  }

  const ScrewMatrix& S_space = model_.S_space();
  J_space_prefix.setZero();
  J_space_prefix.col(0) = S_space.col(0);

  Transform prod = Transform::Identity();  // prod_{k<i} exp(joint_k)
  for (int i = 1; i <= link_index; ++i) {
    prod = prod * jointExp(model_.joint(i - 1), q(i - 1));
    J_space_prefix.col(i) = adjointVW(prod) * S_space.col(i);
  }

  if (model_.has_base_offset()) {
    J_space_prefix = adjointVW(model_.base_offset()) * J_space_prefix;
  }
  return Status::Success;
}

Status KinematicsSolver::linkPositionJacobian(const Eigen::VectorXd& q, int link_index,
                                              Eigen::MatrixXd* J_pos) const {
  if (!J_pos) {
    log(LogLevel::Error, "linkPositionJacobian: null output pointer");
    return Status::InvalidParameter;
  }
  Transform g = Transform::Identity();
  Status st = forwardKinematics(q, link_index, &g);
  if (!ok(st)) return st;

  Eigen::MatrixXd J_space(6, model_.dof());
  st = spatialJacobianUpToLink(q, link_index, J_space);
  if (!ok(st)) return st;

  // Velocity of the link origin p from a spatial twist [v; w]: v + w x p.
  const Mat3 P = hat3(g.translation());
  *J_pos = J_space.topRows<3>() - P * J_space.bottomRows<3>();
  return Status::Success;
}

Status KinematicsSolver::linkPoseJacobian(const Eigen::VectorXd& q, int link_index,
                                          Eigen::MatrixXd* J_pose) const {
  if (!J_pose) {
    log(LogLevel::Error, "linkPoseJacobian: null output pointer");
    return Status::InvalidParameter;
  }
  Transform g = Transform::Identity();
  Status st = forwardKinematics(q, link_index, &g);
  if (!ok(st)) return st;

  Eigen::MatrixXd J_space(6, model_.dof());
  st = spatialJacobianUpToLink(q, link_index, J_space);
  if (!ok(st)) return st;

  const Quat q_link = poseQuat(transformToPose(g));
  const Mat3 P = hat3(g.translation());

  J_pose->resize(kPoseDim, model_.dof());
  J_pose->topRows<4>() = quatRateMatrix(q_link) * J_space.bottomRows<3>();
  J_pose->bottomRows<3>() = J_space.topRows<3>() - P * J_space.bottomRows<3>();
  return Status::Success;
}

}  // namespace manoid::core
