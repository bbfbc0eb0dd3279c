#pragma once

#include <string>

#include "manoid/core/common/status.hpp"
#include "manoid/core/model/robot_model.hpp"

namespace manoid::urdf {

// Builds a `core::RobotModel` for one limb of a URDF robot, the serial chain
// from `base_link` down to `tip_link`.
//
// Each revolute, continuous or prismatic joint yields one link named after the
// joint's child link, with the child frame at q=0 as its home transform.
// Continuous joints carry no limits.
struct LoadOptions {
  std::string base_link;
  std::string tip_link;

  // Fold fixed joints into the home transform of the next link. Fixed joints
  // after the last movable joint have no next link: they are folded into one
  // JointType::Fixed link named `tip_link`, which counts in dof(). When false,
  // every fixed joint becomes a JointType::Fixed link.
  bool collapse_fixed_joints = true;

  // Reject joint types other than revolute/continuous/prismatic/fixed
  // (floating, planar). When false they are treated as fixed.
  bool strict = true;
};

struct LoadResult {
  manoid::core::Status status{manoid::core::Status::Failure};
  manoid::core::RobotModel model;
  std::string robot_name;  // <robot name="..."> of the parsed file
  std::string message;     // failure reason, or "OK"
};

LoadResult loadRobotModelFromString(const std::string& urdf_xml, const LoadOptions& opt);

// Failure when the file cannot be read.
LoadResult loadRobotModelFromFile(const std::string& urdf_path, const LoadOptions& opt);

}  // namespace manoid::urdf
