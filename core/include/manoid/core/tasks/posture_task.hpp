#pragma once
#include "manoid/core/tasks/task.hpp"

#include <memory>
#include <utility>

namespace manoid::core {

// Joint-space reference posture: residual q_ref - q, identity Jacobian.
// Usually given a small weight to regularize the stacked problem.
class MANOID_CORE_API PostureTask : public Task {
  // Constructible only through create().
  struct CreateKey { explicit CreateKey() = default; };

public:
  static constexpr const char* kType = "posture";

  static Status create(const KinematicsProvider& kinematics,
                       const Eigen::VectorXd& q_ref, const TaskOptions& opt,
                       std::unique_ptr<PostureTask>* out);

  PostureTask(CreateKey, Eigen::VectorXd q_ref, TaskOptions opt)
    : Task(std::move(opt)), q_ref_(std::move(q_ref)) {}

  const char* type() const override { return kType; }
  std::string name(const Environment&) const override { return kType; }
  int dimension() const override { return static_cast<int>(q_ref_.size()); }

  Status jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const override;
  Status residual(const TaskContext& ctx, Eigen::VectorXd* r) const override;

  const Eigen::VectorXd& reference() const { return q_ref_; }

private:
  Eigen::VectorXd q_ref_;
};

}  // namespace manoid::core
