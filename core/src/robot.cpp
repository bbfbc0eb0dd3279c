#include "manoid/core/robot/robot.hpp"

#include "manoid/core/common/logger.hpp"

#include <memory>
#include <utility>

namespace manoid::core {

Status Robot::create(Environment* env, RobotModel model, std::unique_ptr<Robot>* out) {
  if (!env || !out) {
    log(LogLevel::Error, "Robot::create: null environment or output pointer");
    return Status::InvalidParameter;
  }
  if (model.dof() == 0) {
    log(LogLevel::Error, "Robot::create: model has no joints");
    return Status::InvalidParameter;
  }

  auto robot = std::make_unique<Robot>(CreateKey{}, std::move(model));
  const int n = robot->dof();
  robot->q_ = Eigen::VectorXd::Zero(n);

  Eigen::VectorXd q0;
  Status st = robot->model().clamp_to_limits(robot->q_, &q0);
  if (!ok(st)) return st;
  robot->q_ = q0;

  std::vector<Transform> link_transforms;
  st = robot->solver_.forwardKinematicsAll(robot->q_, &link_transforms);
  if (!ok(st)) {
    log(LogLevel::Error, "Robot::create: forward kinematics failed");
    return st;
  }

  robot->links_.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    BodyOptions opt;
    opt.name = robot->model().joint(i).link_name;
    RigidBody body;
    st = RigidBody::create(env, opt, &body);
    if (!ok(st)) {
      log(LogLevel::Error, "Robot::create: cannot add link '" + opt.name + "'");
      return st;
    }
    st = body.setTransform(link_transforms[static_cast<std::size_t>(i)]);
    if (!ok(st)) return st;
    robot->links_.push_back(std::move(body));
  }

  *out = std::move(robot);
  return Status::Success;
}

Status Robot::setDofValues(const Eigen::VectorXd& q) {
  if (q.size() != dof()) {
    log(LogLevel::Error, "Robot::setDofValues: q size mismatch");
    return Status::InvalidParameter;
  }
  if (!q.allFinite()) {
    log(LogLevel::Error, "Robot::setDofValues: q is non-finite");
    return Status::InvalidParameter;
  }

  Eigen::VectorXd clamped;
  const Status st = model().clamp_to_limits(q, &clamped);
  if (!ok(st)) return st;
  if (clamped != q && shouldLog(LogLevel::Warn)) {
    log(LogLevel::Warn, "Robot::setDofValues: q clamped to joint limits");
  }

  q_ = clamped;
  return writeLinkTransforms();
}

Status Robot::writeLinkTransforms() {
  std::vector<Transform> link_transforms;
  Status st = solver_.forwardKinematicsAll(q_, &link_transforms);
  if (!ok(st)) return st;

  for (std::size_t i = 0; i < links_.size(); ++i) {
    st = links_[i].setTransform(link_transforms[i]);
    if (!ok(st)) {
      log(LogLevel::Error, "Robot: failed to write transform of link '" +
                               model().link_names()[i] + "'");
      return st;
    }
  }
  return Status::Success;
}

RigidBody* Robot::link(const std::string& link_name) {
  int idx = -1;
  if (!ok(model().linkIndex(link_name, &idx))) return nullptr;
  return &links_[static_cast<std::size_t>(idx)];
}

const RigidBody* Robot::link(const std::string& link_name) const {
  int idx = -1;
  if (!ok(model().linkIndex(link_name, &idx))) return nullptr;
  return &links_[static_cast<std::size_t>(idx)];
}

Status Robot::linkIndex(BodyId link, int* out) const {
  if (!out) {
    log(LogLevel::Error, "Robot::linkIndex: null output pointer");
    return Status::InvalidParameter;
  }
  for (std::size_t i = 0; i < links_.size(); ++i) {
    if (links_[i].id() == link) {
      *out = static_cast<int>(i);
      return Status::Success;
    }
  }
  return Status::NotFound;
}

Status Robot::linkPositionJacobian(BodyId link, Eigen::MatrixXd* J) const {
  int idx = -1;
  const Status st = linkIndex(link, &idx);
  if (!ok(st)) {
    log(LogLevel::Error, "Robot::linkPositionJacobian: body is not a link of this robot");
    return st;
  }
  return solver_.linkPositionJacobian(q_, idx, J);
}

Status Robot::linkPoseJacobian(BodyId link, Eigen::MatrixXd* J) const {
  int idx = -1;
  const Status st = linkIndex(link, &idx);
  if (!ok(st)) {
    log(LogLevel::Error, "Robot::linkPoseJacobian: body is not a link of this robot");
    return st;
  }
  return solver_.linkPoseJacobian(q_, idx, J);
}

}  // namespace manoid::core
