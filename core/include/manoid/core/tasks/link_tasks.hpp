#pragma once
#include "manoid/core/common/constants.hpp"
#include "manoid/core/tasks/task.hpp"

#include <memory>
#include <utility>

namespace manoid::core {

// Drive the origin of `link` to a target position.
//   residual = p_target - p_link   (3)
//   jacobian = link position Jacobian (3 x dof)
class MANOID_CORE_API LinkPosTask : public Task {
  // Constructible only through create().
  struct CreateKey { explicit CreateKey() = default; };

public:
  static constexpr const char* kType = "link_pos";

  // InvalidTarget when the target is neither a 3-vector nor a body of `env`.
  static Status create(const Environment& env, const RigidBody& link,
                       TaskTarget target, const TaskOptions& opt,
                       std::unique_ptr<LinkPosTask>* out);

  LinkPosTask(CreateKey, BodyId link, TaskTarget target, TaskOptions opt)
    : Task(std::move(opt)), link_(link), target_(std::move(target)) {}

  const char* type() const override { return kType; }
  std::string name(const Environment& env) const override;
  int dimension() const override { return kPositionDim; }

  Status jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const override;
  Status residual(const TaskContext& ctx, Eigen::VectorXd* r) const override;

  BodyId link() const { return link_; }
  const TaskTarget& target() const { return target_; }

private:
  BodyId link_;
  TaskTarget target_;
};

// Drive the full pose [qw, qx, qy, qz, x, y, z] of `link` to a target pose.
//
// The residual is the component-wise difference target - link. Because q and
// -q are the same rotation, when the quaternion block of that difference has a
// squared norm above `thr.quat_opposite_sq_norm` and the negated target
// quaternion is closer, the quaternion block is recomputed against the negated
// target. The translation block is never affected.
class MANOID_CORE_API LinkPoseTask : public Task {
  // Constructible only through create().
  struct CreateKey { explicit CreateKey() = default; };

public:
  static constexpr const char* kType = "link_pose";

  // InvalidTarget when the target is neither a 7-vector nor a body of `env`.
  static Status create(const Environment& env, const RigidBody& link,
                       TaskTarget target, const TaskOptions& opt,
                       std::unique_ptr<LinkPoseTask>* out,
                       const Thresholds& thr = kDefaultThresholds);

  LinkPoseTask(CreateKey, BodyId link, TaskTarget target, TaskOptions opt,
               const Thresholds& thr)
    : Task(std::move(opt)), link_(link), target_(std::move(target)), thr_(thr) {}

  const char* type() const override { return kType; }
  std::string name(const Environment& env) const override;
  int dimension() const override { return kPoseDim; }

  Status jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const override;
  Status residual(const TaskContext& ctx, Eigen::VectorXd* r) const override;

  BodyId link() const { return link_; }
  const TaskTarget& target() const { return target_; }

private:
  BodyId link_;
  TaskTarget target_;
  Thresholds thr_;
};

}  // namespace manoid::core
