#pragma once
#include "manoid/core/body/rigid_body.hpp"
#include "manoid/core/common/status.hpp"
#include "manoid/core/export.hpp"
#include "manoid/core/kinematics/kinematics_provider.hpp"
#include "manoid/core/kinematics/kinematics_solver.hpp"
#include "manoid/core/model/robot_model.hpp"
#include "manoid/core/sim/environment.hpp"

#include <memory>
#include <string>
#include <vector>

namespace manoid::core {

// A robot limb living in an Environment: one RigidBody per link plus the joint
// configuration. `setDofValues` is the only joint-state writer; it runs forward
// kinematics and writes every link transform, and must be called between
// control cycles, never while tasks are being evaluated.
class MANOID_CORE_API Robot : public KinematicsProvider {
  // Constructible only through create().
  struct CreateKey { explicit CreateKey() = default; };

public:
  static Status create(Environment* env, RobotModel model, std::unique_ptr<Robot>* out);

  Robot(CreateKey, RobotModel model) : solver_(std::move(model)) {}

  const RobotModel& model() const { return solver_.model(); }
  const KinematicsSolver& solver() const { return solver_; }

  int dof() const override { return model().dof(); }
  const Eigen::VectorXd& dofValues() const override { return q_; }

  // Values outside enabled joint limits are clamped (logged at Warn).
  Status setDofValues(const Eigen::VectorXd& q);

  // nullptr when there is no link with that name.
  RigidBody* link(const std::string& link_name);
  const RigidBody* link(const std::string& link_name) const;
  const std::vector<RigidBody>& links() const { return links_; }

  Status linkIndex(BodyId link, int* out) const;

  Status linkPositionJacobian(BodyId link, Eigen::MatrixXd* J) const override;
  Status linkPoseJacobian(BodyId link, Eigen::MatrixXd* J) const override;

private:
  Status writeLinkTransforms();

  KinematicsSolver solver_;
  std::vector<RigidBody> links_;
  Eigen::VectorXd q_;
};

}  // namespace manoid::core
