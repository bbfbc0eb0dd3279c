#include "manoid/core/tasks/link_tasks.hpp"

#include "manoid/core/common/logger.hpp"
#include "manoid/core/math/pose.hpp"

#include <memory>
#include <string>

namespace manoid::core {
namespace {

std::string linkName(const Environment& env, BodyId link) {
  std::string name;
  if (!ok(env.getName(link, &name))) {
    return "<removed link #" + std::to_string(link) + ">";
  }
  return name;
}

// Configuration checks shared by link tasks; run once at creation.
Status checkLinkTaskConfig(const char* task_type, const Environment& env,
                           const RigidBody& link, const TaskTarget& target,
                           const TaskOptions& opt, int target_dim) {
  const std::string desc = std::string(task_type) + "(" + link.name() + ")";
  if (link.environment() != &env || !env.contains(link.id())) {
    log(LogLevel::Error, std::string(task_type) + ": link is not a body of this environment");
    return Status::InvalidParameter;
  }

  if (const auto* lit = std::get_if<LiteralTarget>(&target)) {
    if (lit->value.size() != target_dim) {
      log(LogLevel::Error, desc + ": target " + describeTarget(target) + " has " +
                               std::to_string(lit->value.size()) + " coordinates, expected " +
                               std::to_string(target_dim));
      return Status::InvalidTarget;
    }
    if (!lit->value.allFinite()) {
      log(LogLevel::Error, desc + ": target " + describeTarget(target) + " is non-finite");
      return Status::InvalidTarget;
    }
  } else if (!env.contains(std::get<BodyTarget>(target).body)) {
    log(LogLevel::Error, desc + ": target " + describeTarget(target) +
                             " is not a body of this environment");
    return Status::InvalidTarget;
  }

  return validateTaskOptions(desc, opt);
}

Status readTransform(const Environment& env, BodyId id, const char* what, Transform* T) {
  const Status st = env.getTransform(id, T);
  if (!ok(st)) {
    log(LogLevel::Error, std::string("link task: cannot read ") + what + " transform");
  }
  return st;
}

}  // namespace

// -------- LinkPosTask --------

Status LinkPosTask::create(const Environment& env, const RigidBody& link,
                           TaskTarget target, const TaskOptions& opt,
                           std::unique_ptr<LinkPosTask>* out) {
  if (!out) {
    log(LogLevel::Error, "LinkPosTask::create: null output pointer");
    return Status::InvalidParameter;
  }
  const Status st = checkLinkTaskConfig(kType, env, link, target, opt, kPositionDim);
  if (!ok(st)) return st;

  *out = std::make_unique<LinkPosTask>(CreateKey{}, link.id(), std::move(target), opt);
  return Status::Success;
}

std::string LinkPosTask::name(const Environment& env) const {
  return linkName(env, link_);
}

Status LinkPosTask::jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const {
  return ctx.kinematics.linkPositionJacobian(link_, J);
}

Status LinkPosTask::residual(const TaskContext& ctx, Eigen::VectorXd* r) const {
  if (!r) {
    log(LogLevel::Error, "LinkPosTask::residual: null output pointer");
    return Status::InvalidParameter;
  }
  Transform T_link;
  Status st = readTransform(ctx.env, link_, "link", &T_link);
  if (!ok(st)) return st;

  Vec3 p_target;
  if (const auto* lit = std::get_if<LiteralTarget>(&target_)) {
    p_target = lit->value;
  } else {
    Transform T_target;
    st = readTransform(ctx.env, std::get<BodyTarget>(target_).body, "target", &T_target);
    if (!ok(st)) return st;
    p_target = T_target.translation();
  }

  *r = p_target - T_link.translation();
  return Status::Success;
}

// -------- LinkPoseTask --------

Status LinkPoseTask::create(const Environment& env, const RigidBody& link,
                            TaskTarget target, const TaskOptions& opt,
                            std::unique_ptr<LinkPoseTask>* out,
                            const Thresholds& thr) {
  if (!out) {
    log(LogLevel::Error, "LinkPoseTask::create: null output pointer");
    return Status::InvalidParameter;
  }
  const Status st = checkLinkTaskConfig(kType, env, link, target, opt, kPoseDim);
  if (!ok(st)) return st;

  *out = std::make_unique<LinkPoseTask>(CreateKey{}, link.id(), std::move(target), opt, thr);
  return Status::Success;
}

std::string LinkPoseTask::name(const Environment& env) const {
  return linkName(env, link_);
}

Status LinkPoseTask::jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const {
  return ctx.kinematics.linkPoseJacobian(link_, J);
}

Status LinkPoseTask::residual(const TaskContext& ctx, Eigen::VectorXd* r) const {
  if (!r) {
    log(LogLevel::Error, "LinkPoseTask::residual: null output pointer");
    return Status::InvalidParameter;
  }
  Transform T_link;
  Status st = readTransform(ctx.env, link_, "link", &T_link);
  if (!ok(st)) return st;
  const Pose link_pose = transformToPose(T_link);

  Pose target_pose;
  if (const auto* lit = std::get_if<LiteralTarget>(&target_)) {
    target_pose = lit->value;
  } else {
    Transform T_target;
    st = readTransform(ctx.env, std::get<BodyTarget>(target_).body, "target", &T_target);
    if (!ok(st)) return st;
    target_pose = transformToPose(T_target);
  }

  Pose res = target_pose - link_pose;
  if (res.head<4>().squaredNorm() > thr_.quat_opposite_sq_norm) {
    const Eigen::Vector4d flipped = -target_pose.head<4>() - link_pose.head<4>();
    if (flipped.squaredNorm() < res.head<4>().squaredNorm()) {
      res.head<4>() = flipped;
    }
  }
  *r = res;
  return Status::Success;
}

}  // namespace manoid::core
