#include "manoid/core/tasks/task.hpp"

#include "manoid/core/common/logger.hpp"

#include <cmath>
#include <sstream>

namespace manoid::core {

std::string describeTarget(const TaskTarget& target) {
  std::ostringstream oss;
  if (const auto* lit = std::get_if<LiteralTarget>(&target)) {
    oss << "literal[" << lit->value.size() << "]";
  } else {
    oss << "body#" << std::get<BodyTarget>(target).body;
  }
  return oss.str();
}

Status validateTaskOptions(const std::string& task_desc, const TaskOptions& opt) {
  if (!(opt.gain > 0.0 && opt.gain <= 1.0)) {
    log(LogLevel::Error, task_desc + ": gain must be in (0, 1], got " + std::to_string(opt.gain));
    return Status::InvalidParameter;
  }
  if (!std::isfinite(opt.weight) || !(opt.weight > 0.0)) {
    log(LogLevel::Error, task_desc + ": weight must be finite and > 0");
    return Status::InvalidParameter;
  }
  for (int dof : opt.exclude_dofs) {
    if (dof < 0) {
      log(LogLevel::Error, task_desc + ": negative DOF index in exclude_dofs");
      return Status::InvalidParameter;
    }
  }
  return Status::Success;
}

Status Task::evaluate(const TaskContext& ctx, TaskEvaluation* out) const {
  if (!out) {
    log(LogLevel::Error, "Task::evaluate: null output pointer");
    return Status::InvalidParameter;
  }

  Eigen::MatrixXd J;
  Status st = jacobian(ctx, &J);
  if (!ok(st)) return st;

  Eigen::VectorXd r;
  st = residual(ctx, &r);
  if (!ok(st)) return st;

  if (J.rows() != dimension() || r.size() != dimension()) {
    log(LogLevel::Error, std::string("Task::evaluate: ") + type() +
                             " Jacobian/residual rows do not match task dimension");
    return Status::Failure;
  }

  for (int dof : options_.exclude_dofs) {
    if (dof >= J.cols()) {
      log(LogLevel::Error, std::string("Task::evaluate: ") + type() +
                               " excluded DOF " + std::to_string(dof) + " out of range");
      return Status::InvalidParameter;
    }
    J.col(dof).setZero();
  }

  out->name = name(ctx.env);
  out->type = type();
  out->jacobian = std::move(J);
  out->residual = options_.gain * r;
  out->weight = options_.weight;
  out->excluded_dofs = options_.exclude_dofs;
  return Status::Success;
}

}  // namespace manoid::core
