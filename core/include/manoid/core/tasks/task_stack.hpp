#pragma once
#include "manoid/core/common/status.hpp"
#include "manoid/core/export.hpp"
#include "manoid/core/tasks/task.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace manoid::core {

// Active tasks of a control loop, keyed by task name.
//
// One call to `evaluate` is one control cycle: every task is evaluated against
// the same context, in insertion order. Adding or removing tasks between calls
// takes effect at the next cycle.
class MANOID_CORE_API TaskStack {
public:
  // InvalidParameter on a null task or a name already in the stack.
  Status add(const Environment& env, std::unique_ptr<Task> task);
  Status remove(const std::string& name);

  bool contains(const std::string& name) const;
  const Task* get(const std::string& name) const;
  std::size_t size() const { return entries_.size(); }
  std::vector<std::string> names() const;
  void clear() { entries_.clear(); }

  Status evaluate(const TaskContext& ctx, std::vector<TaskEvaluation>* out) const;

  // Weighted least-squares cost over joint velocities qd in the form
  //   0.5 qd^T H qd + c^T qd,  H = sum w_i J_i^T J_i,  c = -sum w_i J_i^T r_i,
  // whose minimizers are those of sum w_i ||J_i qd - r_i||^2.
  static Status buildCost(const std::vector<TaskEvaluation>& evaluations, int dof,
                          Eigen::MatrixXd* H, Eigen::VectorXd* c);

private:
  struct Entry {
    std::string name;
    std::unique_ptr<Task> task;
  };

  std::vector<Entry> entries_;
};

}  // namespace manoid::core
