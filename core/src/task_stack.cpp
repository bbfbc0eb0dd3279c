#include "manoid/core/tasks/task_stack.hpp"

#include "manoid/core/common/logger.hpp"

#include <algorithm>
#include <utility>

namespace manoid::core {

Status TaskStack::add(const Environment& env, std::unique_ptr<Task> task) {
  if (!task) {
    log(LogLevel::Error, "TaskStack::add: null task");
    return Status::InvalidParameter;
  }
  std::string name = task->name(env);
  if (contains(name)) {
    log(LogLevel::Error, "TaskStack::add: a task named '" + name + "' already exists");
    return Status::InvalidParameter;
  }
  if (shouldLog(LogLevel::Debug)) {
    log(LogLevel::Debug, "TaskStack::add: " + std::string(task->type()) + " '" + name + "'");
  }
  entries_.push_back(Entry{std::move(name), std::move(task)});
  return Status::Success;
}

Status TaskStack::remove(const std::string& name) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return e.name == name; });
  if (it == entries_.end()) {
    log(LogLevel::Warn, "TaskStack::remove: no task named '" + name + "'");
    return Status::NotFound;
  }
  entries_.erase(it);
  return Status::Success;
}

bool TaskStack::contains(const std::string& name) const {
  return get(name) != nullptr;
}

const Task* TaskStack::get(const std::string& name) const {
  for (const auto& e : entries_) {
    if (e.name == name) return e.task.get();
  }
  return nullptr;
}

std::vector<std::string> TaskStack::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    out.push_back(e.name);
  }
  return out;
}

Status TaskStack::evaluate(const TaskContext& ctx, std::vector<TaskEvaluation>* out) const {
  if (!out) {
    log(LogLevel::Error, "TaskStack::evaluate: null output pointer");
    return Status::InvalidParameter;
  }
  out->clear();
  out->reserve(entries_.size());
  for (const auto& e : entries_) {
    TaskEvaluation eval;
    const Status st = e.task->evaluate(ctx, &eval);
    if (!ok(st)) {
      log(LogLevel::Error, "TaskStack::evaluate: task '" + e.name + "' failed");
      return st;
    }
    out->push_back(std::move(eval));
  }
  return Status::Success;
}

Status TaskStack::buildCost(const std::vector<TaskEvaluation>& evaluations, int dof,
                            Eigen::MatrixXd* H, Eigen::VectorXd* c) {
  if (!H || !c) {
    log(LogLevel::Error, "TaskStack::buildCost: null output pointer");
    return Status::InvalidParameter;
  }
  if (dof < 0) {
    log(LogLevel::Error, "TaskStack::buildCost: negative dof");
    return Status::InvalidParameter;
  }

  H->setZero(dof, dof);
  c->setZero(dof);
  for (const auto& e : evaluations) {
    if (e.jacobian.cols() != dof || e.jacobian.rows() != e.residual.size()) {
      log(LogLevel::Error, "TaskStack::buildCost: task '" + e.name + "' has mismatched sizes");
      return Status::InvalidParameter;
    }
    H->noalias() += e.weight * e.jacobian.transpose() * e.jacobian;
    c->noalias() -= e.weight * e.jacobian.transpose() * e.residual;
  }
  return Status::Success;
}

}  // namespace manoid::core
