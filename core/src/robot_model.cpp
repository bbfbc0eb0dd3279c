#include "manoid/core/model/robot_model.hpp"

#include "manoid/core/common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace manoid::core {
namespace {

bool isMovable(const JointSpec& j) {
  return j.type == JointType::Revolute || j.type == JointType::Prismatic;
}

Status fail(const std::string& msg) {
  log(LogLevel::Error, "RobotModel: " + msg);
  return Status::InvalidParameter;
}

// Per-joint structural checks, independent of the rest of the chain.
Status checkJoint(const JointSpec& j, const Thresholds& thr) {
  if (j.name.empty() || j.link_name.empty()) {
    return fail("joint or link name is empty");
  }
  if (!j.link_home.matrix().allFinite()) {
    return fail("home transform of link '" + j.link_name + "' is non-finite");
  }
  if (isMovable(j) && (!j.axis.allFinite() || !(j.axis.norm() > thr.axis_norm_eps))) {
    return fail("axis of joint '" + j.name + "' is degenerate");
  }
  if (j.type == JointType::Revolute && !j.point.allFinite()) {
    return fail("axis point of joint '" + j.name + "' is non-finite");
  }
  if (j.limit.enabled) {
    if (!std::isfinite(j.limit.lower) || !std::isfinite(j.limit.upper)) {
      return fail("limits of joint '" + j.name + "' are non-finite");
    }
    if (j.limit.lower > j.limit.upper) {
      return fail("lower limit above upper limit for joint '" + j.name + "'");
    }
  }
  return Status::Success;
}

// Space-frame screw axis [v; w] of a joint whose axis is already unit length.
Eigen::Matrix<double, 6, 1> screwAxis(const JointSpec& j) {
  Eigen::Matrix<double, 6, 1> S = Eigen::Matrix<double, 6, 1>::Zero();
  if (j.type == JointType::Revolute) {
    S.head<3>() = j.point.cross(j.axis);
    S.tail<3>() = j.axis;
  } else if (j.type == JointType::Prismatic) {
    S.head<3>() = j.axis;
  }
  return S;
}

}  // namespace

void RobotModel::clear() {
  joints_.clear();
  joint_names_.clear();
  link_names_.clear();
  link_index_.clear();
  S_space_.resize(6, 0);
}

Status RobotModel::init(std::vector<JointSpec> joints, const Thresholds& thr) {
  clear();
  for (const JointSpec& j : joints) {
    const Status st = checkJoint(j, thr);
    if (!ok(st)) {
      clear();
      return st;
    }
    if (!link_index_.emplace(j.link_name, static_cast<int>(link_names_.size())).second) {
      clear();
      return fail("duplicate link name '" + j.link_name + "'");
    }
    joint_names_.push_back(j.name);
    link_names_.push_back(j.link_name);
  }

  joints_ = std::move(joints);
  S_space_ = ScrewMatrix::Zero(6, dof());
  for (int i = 0; i < dof(); ++i) {
    JointSpec& j = joints_[static_cast<std::size_t>(i)];
    if (isMovable(j)) {
      j.axis.normalize();
    } else {
      j.axis.setZero();
    }
    if (j.type != JointType::Revolute) {
      j.point.setZero();
    }
    S_space_.col(i) = screwAxis(j);
  }

  const Status st = validate(thr);
  if (!ok(st)) {
    clear();
    return st;
  }
  return Status::Success;
}

Status RobotModel::linkIndex(const std::string& link_name, int* out) const {
  if (!out) {
    log(LogLevel::Error, "RobotModel::linkIndex: null output pointer");
    return Status::InvalidParameter;
  }
  const auto it = link_index_.find(link_name);
  if (it == link_index_.end()) {
    return Status::NotFound;
  }
  *out = it->second;
  return Status::Success;
}

Status RobotModel::validate(const Thresholds& thr) const {
  if (!base_offset_.matrix().allFinite()) {
    return fail("base offset is non-finite");
  }
  if (static_cast<int>(link_index_.size()) != dof()) {
    return fail("link names are not unique");
  }
  for (const JointSpec& j : joints_) {
    const Status st = checkJoint(j, thr);
    if (!ok(st)) return st;
  }
  return Status::Success;
}

Status RobotModel::clamp_to_limits(const Eigen::VectorXd& q, Eigen::VectorXd* out) const {
  if (!out || q.size() != dof()) {
    log(LogLevel::Error, "RobotModel::clamp_to_limits: null output or size mismatch");
    return Status::InvalidParameter;
  }
  *out = q;
  for (int i = 0; i < dof(); ++i) {
    const JointLimit& lim = joints_[static_cast<std::size_t>(i)].limit;
    if (lim.enabled) {
      (*out)(i) = std::clamp((*out)(i), lim.lower, lim.upper);
    }
  }
  return Status::Success;
}

// -------- Builder --------

RobotBuilder& RobotBuilder::add(JointType type, std::string name, std::string link_name,
                                const Vec3& axis, const Vec3& point,
                                Transform link_home, JointLimit limit) {
  JointSpec j;
  j.name = std::move(name);
  j.link_name = std::move(link_name);
  j.type = type;
  j.axis = axis;
  j.point = point;
  j.limit = limit;
  j.link_home = std::move(link_home);
  joints_.push_back(std::move(j));
  return *this;
}

RobotBuilder& RobotBuilder::add_revolute(std::string name, std::string link_name,
                                         const Vec3& w_unit, const Vec3& q_point,
                                         Transform link_home, JointLimit limit) {
  return add(JointType::Revolute, std::move(name), std::move(link_name), w_unit, q_point,
             std::move(link_home), limit);
}

RobotBuilder& RobotBuilder::add_prismatic(std::string name, std::string link_name,
                                          const Vec3& v_unit, Transform link_home,
                                          JointLimit limit) {
  return add(JointType::Prismatic, std::move(name), std::move(link_name), v_unit,
             Vec3::Zero(), std::move(link_home), limit);
}

RobotBuilder& RobotBuilder::add_fixed(std::string name, std::string link_name,
                                      Transform link_home) {
  return add(JointType::Fixed, std::move(name), std::move(link_name), Vec3::Zero(),
             Vec3::Zero(), std::move(link_home), JointLimit{});
}

Status RobotBuilder::build(RobotModel* out, const Thresholds& thr) const {
  if (!out) {
    log(LogLevel::Error, "RobotBuilder::build: null output pointer");
    return Status::InvalidParameter;
  }
  if (joints_.empty()) {
    log(LogLevel::Error, "RobotBuilder::build: no joints added");
    return Status::InvalidParameter;
  }
  out->set_base_offset(base_offset_.value_or(Transform::Identity()));
  return out->init(joints_, thr);
}

}  // namespace manoid::core
