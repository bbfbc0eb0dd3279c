#pragma once
#include "manoid/core/body/rigid_body.hpp"
#include "manoid/core/common/constants.hpp"
#include "manoid/core/common/status.hpp"
#include "manoid/core/export.hpp"
#include "manoid/core/kinematics/kinematics_provider.hpp"
#include "manoid/core/sim/environment.hpp"

#include <Eigen/Core>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace manoid::core {

// Task targets are resolved once, when the task is created.
// - LiteralTarget: fixed coordinates (3 for a position, 7 for a pose).
// - BodyTarget: another body, read live at every evaluation.
struct LiteralTarget {
  Eigen::VectorXd value;
};

struct BodyTarget {
  BodyId body{kInvalidBodyId};
};

using TaskTarget = std::variant<LiteralTarget, BodyTarget>;

inline TaskTarget literalTarget(const Eigen::VectorXd& value) {
  return LiteralTarget{value};
}

inline TaskTarget bodyTarget(const RigidBody& body) {
  return BodyTarget{body.id()};
}

std::string describeTarget(const TaskTarget& target);

struct TaskOptions {
  double gain = kDefaultTaskGain;      // fraction of the residual corrected per cycle, (0, 1]
  double weight = kDefaultTaskWeight;  // relative cost priority, > 0
  std::vector<int> exclude_dofs;       // Jacobian columns zeroed for this task
};

Status validateTaskOptions(const std::string& task_desc, const TaskOptions& opt);

// State a task reads during one control cycle. Tasks never write to it.
struct TaskContext {
  const Environment& env;
  const KinematicsProvider& kinematics;
};

// What the solver receives from one task in one cycle.
struct TaskEvaluation {
  std::string name;
  std::string type;
  Eigen::MatrixXd jacobian;       // dimension x dof, excluded columns zeroed
  Eigen::VectorXd residual;       // gain * (target - current)
  double weight{kDefaultTaskWeight};
  std::vector<int> excluded_dofs;
};

// Differential IK objective: a Jacobian and a residual over the same task
// space. Implementations hold no state across cycles.
class MANOID_CORE_API Task {
public:
  virtual ~Task() = default;

  virtual const char* type() const = 0;
  virtual std::string name(const Environment& env) const = 0;
  virtual int dimension() const = 0;

  // Raw Jacobian (dimension x dof), before DOF exclusion.
  virtual Status jacobian(const TaskContext& ctx, Eigen::MatrixXd* J) const = 0;

  // Raw residual (target - current), before gain scaling.
  virtual Status residual(const TaskContext& ctx, Eigen::VectorXd* r) const = 0;

  double gain() const { return options_.gain; }
  double weight() const { return options_.weight; }
  const std::vector<int>& excludedDofs() const { return options_.exclude_dofs; }
  const TaskOptions& options() const { return options_; }

  Status evaluate(const TaskContext& ctx, TaskEvaluation* out) const;

protected:
  explicit Task(TaskOptions opt) : options_(std::move(opt)) {}

private:
  TaskOptions options_;
};

}  // namespace manoid::core
