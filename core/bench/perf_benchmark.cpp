#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Cholesky>

#include "manoid/core/common/logger.hpp"
#include "manoid/core/model/robot_model.hpp"
#include "manoid/core/robot/robot.hpp"
#include "manoid/core/sim/environment.hpp"
#include "manoid/core/tasks/link_tasks.hpp"
#include "manoid/core/tasks/posture_task.hpp"
#include "manoid/core/tasks/task_stack.hpp"

using manoid::core::Environment;
using manoid::core::LinkPosTask;
using manoid::core::LinkPoseTask;
using manoid::core::Pose;
using manoid::core::PostureTask;
using manoid::core::Robot;
using manoid::core::RobotBuilder;
using manoid::core::RobotModel;
using manoid::core::Status;
using manoid::core::TaskContext;
using manoid::core::TaskEvaluation;
using manoid::core::TaskOptions;
using manoid::core::TaskStack;
using manoid::core::Transform;
using manoid::core::Vec3;
using manoid::core::literalTarget;
using manoid::core::ok;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

static void check(Status st, const char* what) {
  if (!ok(st)) {
    std::cerr << what << " failed: " << manoid::core::statusToString(st) << "\n";
    std::exit(1);
  }
}

// Serial chain of revolute joints cycling through z, y, x axes.
static RobotModel makeBenchModel(int dof) {
  const double link_len = 0.3;
  RobotBuilder builder;
  for (int i = 0; i < dof; ++i) {
    Vec3 axis;
    switch (i % 3) {
      case 0: axis = Vec3(0.0, 0.0, 1.0); break;
      case 1: axis = Vec3(0.0, 1.0, 0.0); break;
      default: axis = Vec3(1.0, 0.0, 0.0); break;
    }
    Transform home = Transform::Identity();
    home.translation() = Vec3(link_len * (i + 1), 0.0, 0.0);
    builder.add_revolute("j" + std::to_string(i + 1), "link" + std::to_string(i + 1),
                         axis, Vec3(link_len * i, 0.0, 0.0), home);
  }
  RobotModel model;
  check(builder.build(&model), "RobotBuilder::build");
  return model;
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: manoid_core_benchmark [--dof=N] [--cycles=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int dof = std::max(2, parseIntArg(argc, argv, "--dof", 7));
  const int cycles = parseIntArg(argc, argv, "--cycles", 10000);
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  // clamping warnings would dominate the timings
  manoid::core::setLogLevel(manoid::core::LogLevel::Error);

  Environment env;
  std::unique_ptr<Robot> robot;
  check(Robot::create(&env, makeBenchModel(dof), &robot), "Robot::create");
  const TaskContext ctx{env, *robot};

  const std::string tip = "link" + std::to_string(dof);
  const std::string mid = "link" + std::to_string(dof / 2);

  Pose tip_goal;
  tip_goal << 0.9, 0.1, 0.3, -0.2, 0.3 * dof - 0.4, 0.2, 0.3;
  tip_goal.head<4>().normalize();

  TaskStack stack;
  std::unique_ptr<LinkPoseTask> reach;
  check(LinkPoseTask::create(env, *robot->link(tip), literalTarget(tip_goal),
                             TaskOptions{}, &reach), "LinkPoseTask::create");
  check(stack.add(env, std::move(reach)), "TaskStack::add");

  TaskOptions mid_opt;
  mid_opt.weight = 0.1;
  std::unique_ptr<LinkPosTask> elbow;
  check(LinkPosTask::create(env, *robot->link(mid), literalTarget(Vec3(0.15 * dof, 0.1, 0.1)),
                            mid_opt, &elbow), "LinkPosTask::create");
  check(stack.add(env, std::move(elbow)), "TaskStack::add");

  TaskOptions reg;
  reg.weight = 1e-3;
  std::unique_ptr<PostureTask> posture;
  check(PostureTask::create(*robot, Eigen::VectorXd::Zero(dof), reg, &posture),
        "PostureTask::create");
  check(stack.add(env, std::move(posture)), "TaskStack::add");

  std::vector<TaskEvaluation> evals;
  Eigen::MatrixXd H;
  Eigen::VectorXd c;
  Eigen::VectorXd q = Eigen::VectorXd::Zero(dof);
  double acc = 0.0;

  // Task evaluation and cost assembly at moving configurations.
  auto run_cost = [&]() {
    for (int i = 0; i < cycles; ++i) {
      const double t = 0.001 * static_cast<double>(i);
      for (int j = 0; j < dof; ++j) {
        q(j) = 0.2 * std::sin(t + 0.3 * j);
      }
      check(robot->setDofValues(q), "Robot::setDofValues");
      check(stack.evaluate(ctx, &evals), "TaskStack::evaluate");
      check(TaskStack::buildCost(evals, dof, &H, &c), "TaskStack::buildCost");
      acc += H(0, 0) + c(0);
    }
  };

  // Closed loop: evaluate, solve the damped normal equations, step.
  auto run_loop = [&]() {
    check(robot->setDofValues(Eigen::VectorXd::Zero(dof)), "Robot::setDofValues");
    for (int i = 0; i < cycles; ++i) {
      check(stack.evaluate(ctx, &evals), "TaskStack::evaluate");
      check(TaskStack::buildCost(evals, dof, &H, &c), "TaskStack::buildCost");
      H.diagonal().array() += 1e-6;
      const Eigen::VectorXd qd = H.ldlt().solve(-c);
      check(robot->setDofValues(robot->dofValues() + qd), "Robot::setDofValues");
    }
    acc += robot->dofValues().sum();
  };

  std::vector<double> cost_runs;
  std::vector<double> loop_runs;
  cost_runs.reserve(trials);
  loop_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_cost();
    run_loop();
  }

  for (int i = 0; i < trials; ++i) {
    cost_runs.push_back(benchMs(run_cost));
    loop_runs.push_back(benchMs(run_loop));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double cost_ms = median(cost_runs);
  const double loop_ms = median(loop_runs);

  std::cout << "manoid_core_benchmark\n";
  std::cout << "  dof: " << dof << ", tasks: " << stack.size() << "\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  evaluate + buildCost: " << cost_ms << " ms total, "
            << (cost_ms * 1000.0 / cycles) << " us/cycle\n";
  std::cout << "  full control cycle:   " << loop_ms << " ms total, "
            << (loop_ms * 1000.0 / cycles) << " us/cycle\n";

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
