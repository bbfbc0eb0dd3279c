#include "manoid/urdf/load_robot.hpp"

#include "manoid/core/common/logger.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include <urdf_model/model.h>
#include <urdf_parser/urdf_parser.h>

namespace manoid::urdf {
namespace {

using core::JointSpec;
using core::JointType;
using core::Status;
using core::Transform;
using core::Vec3;

LoadResult failure(Status st, std::string msg) {
  core::log(core::LogLevel::Error, "urdf: " + msg);
  LoadResult r;
  r.status = st;
  r.message = std::move(msg);
  return r;
}

Transform toTransform(const ::urdf::Pose& p) {
  Transform T = Transform::Identity();
  T.linear() = core::Quat(p.rotation.w, p.rotation.x, p.rotation.y, p.rotation.z)
                   .normalized()
                   .toRotationMatrix();
  T.translation() = Vec3(p.position.x, p.position.y, p.position.z);
  return T;
}

// false for joints that do not move (fixed, and anything unsupported).
bool movableType(const ::urdf::Joint& j, JointType* out) {
  switch (j.type) {
    case ::urdf::Joint::REVOLUTE:
    case ::urdf::Joint::CONTINUOUS:
      *out = JointType::Revolute;
      return true;
    case ::urdf::Joint::PRISMATIC:
      *out = JointType::Prismatic;
      return true;
    default:
      return false;
  }
}

bool knownType(const ::urdf::Joint& j) {
  JointType ignored;
  return movableType(j, &ignored) || j.type == ::urdf::Joint::FIXED;
}

// Parent joints from tip_link up to base_link, returned base first.
Status chainJoints(const ::urdf::ModelInterface& model, const LoadOptions& opt,
                   std::vector<::urdf::JointConstSharedPtr>* chain, std::string* why) {
  ::urdf::LinkConstSharedPtr link = model.getLink(opt.tip_link);
  if (!link) {
    *why = "tip_link '" + opt.tip_link + "' not found";
    return Status::InvalidParameter;
  }
  while (link->name != opt.base_link) {
    const ::urdf::JointConstSharedPtr joint = link->parent_joint;
    if (!joint) {
      *why = "'" + opt.base_link + "' is not an ancestor of '" + opt.tip_link + "'";
      return Status::InvalidParameter;
    }
    if (opt.strict && !knownType(*joint)) {
      *why = "joint '" + joint->name + "' has an unsupported type";
      return Status::InvalidParameter;
    }
    chain->push_back(joint);
    link = model.getLink(joint->parent_link_name);
    if (!link) {
      *why = "link '" + joint->parent_link_name + "' not found";
      return Status::InvalidParameter;
    }
  }
  std::reverse(chain->begin(), chain->end());
  return Status::Success;
}

}  // namespace

LoadResult loadRobotModelFromString(const std::string& urdf_xml, const LoadOptions& opt) {
  if (opt.base_link.empty() || opt.tip_link.empty()) {
    return failure(Status::InvalidParameter, "base_link and tip_link are required");
  }
  if (opt.base_link == opt.tip_link) {
    return failure(Status::InvalidParameter, "base_link equals tip_link, chain is empty");
  }

  const ::urdf::ModelInterfaceSharedPtr urdf_model = ::urdf::parseURDF(urdf_xml);
  if (!urdf_model) {
    return failure(Status::Failure, "cannot parse URDF document");
  }

  std::vector<::urdf::JointConstSharedPtr> chain;
  std::string why;
  const Status chain_st = chainJoints(*urdf_model, opt, &chain, &why);
  if (!ok(chain_st)) {
    return failure(chain_st, why);
  }

  core::RobotBuilder builder;
  int added = 0;
  // Last fixed joint folded since the previous link, if any.
  ::urdf::JointConstSharedPtr folded;
  Transform T_base_link = Transform::Identity();
  for (const auto& joint : chain) {
    T_base_link = T_base_link * toTransform(joint->parent_to_joint_origin_transform);

    JointType type;
    if (!movableType(*joint, &type)) {
      if (opt.collapse_fixed_joints) {
        folded = joint;
      } else {
        builder.add_fixed(joint->name, joint->child_link_name, T_base_link);
        ++added;
      }
      continue;
    }
    folded.reset();

    const Vec3 local_axis(joint->axis.x, joint->axis.y, joint->axis.z);
    if (!local_axis.allFinite() ||
        !(local_axis.norm() > core::kDefaultThresholds.axis_norm_eps)) {
      return failure(Status::InvalidParameter, "joint '" + joint->name + "' has a zero axis");
    }
    const Vec3 axis = T_base_link.linear() * local_axis.normalized();

    core::JointLimit limit;
    if (joint->limits && joint->type != ::urdf::Joint::CONTINUOUS) {
      limit.enabled = true;
      limit.lower = joint->limits->lower;
      limit.upper = joint->limits->upper;
    }

    if (type == JointType::Revolute) {
      builder.add_revolute(joint->name, joint->child_link_name, axis,
                           T_base_link.translation(), T_base_link, limit);
    } else {
      builder.add_prismatic(joint->name, joint->child_link_name, axis, T_base_link, limit);
    }
    ++added;
  }

  // Fixed joints after the last movable one have no link to fold into; the tip
  // becomes a fixed link so it can still be targeted by name.
  if (folded && added > 0) {
    builder.add_fixed(folded->name, folded->child_link_name, T_base_link);
    ++added;
  }

  if (added == 0) {
    return failure(Status::InvalidParameter,
                   "no movable joints between '" + opt.base_link + "' and '" + opt.tip_link + "'");
  }

  LoadResult res;
  res.status = builder.build(&res.model);
  if (!ok(res.status)) {
    return failure(res.status, "robot model rejected the chain");
  }
  res.robot_name = urdf_model->getName();
  res.message = "OK";
  return res;
}

LoadResult loadRobotModelFromFile(const std::string& urdf_path, const LoadOptions& opt) {
  std::ifstream in(urdf_path);
  if (!in) {
    return failure(Status::Failure, "cannot open '" + urdf_path + "'");
  }
  const std::string xml((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return loadRobotModelFromString(xml, opt);
}

}  // namespace manoid::urdf
