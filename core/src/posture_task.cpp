#include "manoid/core/tasks/posture_task.hpp"

#include "manoid/core/common/logger.hpp"

#include <memory>

namespace manoid::core {

Status PostureTask::create(const KinematicsProvider& kinematics,
                           const Eigen::VectorXd& q_ref, const TaskOptions& opt,
                           std::unique_ptr<PostureTask>* out) {
  if (!out) {
    log(LogLevel::Error, "PostureTask::create: null output pointer");
    return Status::InvalidParameter;
  }
  if (q_ref.size() != kinematics.dof() || !q_ref.allFinite()) {
    log(LogLevel::Error, "PostureTask: reference has " + std::to_string(q_ref.size()) +
                             " values, expected " + std::to_string(kinematics.dof()) +
                             " finite values");
    return Status::InvalidTarget;
  }
  const Status st = validateTaskOptions("PostureTask", opt);
  if (!ok(st)) return st;

  *out = std::make_unique<PostureTask>(CreateKey{}, q_ref, opt);
  return Status::Success;
}

Status PostureTask::jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const {
  if (!J) {
    log(LogLevel::Error, "PostureTask::jacobian: null output pointer");
    return Status::InvalidParameter;
  }
  if (ctx.kinematics.dof() != dimension()) {
    log(LogLevel::Error, "PostureTask::jacobian: provider dof changed");
    return Status::InvalidParameter;
  }
  *J = Eigen::MatrixXd::Identity(dimension(), dimension());
  return Status::Success;
}

Status PostureTask::residual(const TaskContext& ctx, Eigen::VectorXd* r) const {
  if (!r) {
    log(LogLevel::Error, "PostureTask::residual: null output pointer");
    return Status::InvalidParameter;
  }
  const Eigen::VectorXd& q = ctx.kinematics.dofValues();
  if (q.size() != q_ref_.size()) {
    log(LogLevel::Error, "PostureTask::residual: provider dof changed");
    return Status::InvalidParameter;
  }
  *r = q_ref_ - q;
  return Status::Success;
}

}  // namespace manoid::core
