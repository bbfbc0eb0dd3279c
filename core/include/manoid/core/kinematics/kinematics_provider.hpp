#pragma once
#include "manoid/core/common/status.hpp"
#include "manoid/core/sim/environment.hpp"

#include <Eigen/Core>

namespace manoid::core {

// What a task may ask of the robot during one control cycle. Implementations
// are read-only: no call may change body or joint state.
class KinematicsProvider {
public:
  virtual ~KinematicsProvider() = default;

  virtual int dof() const = 0;
  virtual const Eigen::VectorXd& dofValues() const = 0;

  // 3 x dof(). NotFound when `link` is not one of the provider's links.
  virtual Status linkPositionJacobian(BodyId link, Eigen::MatrixXd* J) const = 0;

  // 7 x dof() over [qw, qx, qy, qz, x, y, z].
  virtual Status linkPoseJacobian(BodyId link, Eigen::MatrixXd* J) const = 0;
};

}  // namespace manoid::core
