#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

#include <Eigen/Core>

#include "manoid/core/body/rigid_body.hpp"
#include "manoid/core/kinematics/kinematics_solver.hpp"
#include "manoid/core/math/pose.hpp"
#include "manoid/core/math/so3.hpp"
#include "manoid/core/model/robot_model.hpp"
#include "manoid/core/robot/robot.hpp"
#include "manoid/core/sim/environment.hpp"

using manoid::core::Environment;
using manoid::core::JointLimit;
using manoid::core::KinematicsSolver;
using manoid::core::Mat3;
using manoid::core::Pose;
using manoid::core::RigidBody;
using manoid::core::Robot;
using manoid::core::RobotBuilder;
using manoid::core::RobotModel;
using manoid::core::Status;
using manoid::core::Transform;
using manoid::core::Vec3;
using manoid::core::ok;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static bool matNear(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b, double tol) {
  if (a.rows() != b.rows() || a.cols() != b.cols()) return false;
  if (a.size() == 0) return true;
  return (a - b).cwiseAbs().maxCoeff() <= tol;
}

static Transform translated(const Vec3& p, const Vec3& rpy = Vec3::Zero()) {
  Transform T = Transform::Identity();
  T.linear() = manoid::core::rotationMatrixFromRpy(rpy);
  T.translation() = p;
  return T;
}

// Shoulder yaw, elbow pitch, then a prismatic wrist slide along x.
static RobotModel makeArm(JointLimit shoulder_limit = {}) {
  RobotModel model;
  const Status st = RobotBuilder{}
    .add_revolute("shoulder", "upper_arm", Vec3(0, 0, 1), Vec3(0, 0, 0),
                  translated(Vec3(1.0, 0.0, 0.0)), shoulder_limit)
    .add_revolute("elbow", "forearm", Vec3(0, 1, 0), Vec3(1.0, 0.0, 0.0),
                  translated(Vec3(2.0, 0.0, 0.0), Vec3(0.1, 0.0, 0.0)))
    .add_prismatic("wrist", "hand", Vec3(1, 0, 0),
                   translated(Vec3(2.5, 0.0, 0.0), Vec3(0.1, 0.2, 0.0)))
    .build(&model);
  assert(ok(st));
  return model;
}

static void test_model_validation() {
  RobotModel model = makeArm();
  assert(model.dof() == 3);
  assert(model.link_names()[2] == "hand");

  int idx = -1;
  assert(ok(model.linkIndex("forearm", &idx)));
  assert(idx == 1);
  assert(model.linkIndex("head", &idx) == Status::NotFound);

  RobotModel bad;
  assert(RobotBuilder{}
           .add_revolute("a", "l", Vec3(0, 0, 1), Vec3::Zero(), Transform::Identity())
           .add_revolute("b", "l", Vec3(0, 0, 1), Vec3::Zero(), Transform::Identity())
           .build(&bad) == Status::InvalidParameter);
  assert(bad.dof() == 0);

  JointLimit inverted;
  inverted.enabled = true;
  inverted.lower = 1.0;
  inverted.upper = -1.0;
  assert(RobotBuilder{}
           .add_revolute("a", "l", Vec3(0, 0, 1), Vec3::Zero(), Transform::Identity(), inverted)
           .build(&bad) == Status::InvalidParameter);

  assert(RobotBuilder{}
           .add_prismatic("a", "l", Vec3::Zero(), Transform::Identity())
           .build(&bad) == Status::InvalidParameter);
}

static void test_forward_kinematics() {
  KinematicsSolver solver(makeArm());

  Eigen::Vector3d q(M_PI / 2.0, 0.0, 0.0);
  Transform g;
  assert(ok(solver.forwardKinematics(q, 0, &g)));
  assert(matNear(g.translation(), Vec3(0.0, 1.0, 0.0), 1e-12));
  assert(ok(solver.forwardKinematics(q, 1, &g)));
  assert(matNear(g.translation(), Vec3(0.0, 2.0, 0.0), 1e-12));

  // elbow pitch of +pi/2 about y sends the forearm down
  q << 0.0, M_PI / 2.0, 0.0;
  assert(ok(solver.forwardKinematics(q, 1, &g)));
  assert(matNear(g.translation(), Vec3(1.0, 0.0, -1.0), 1e-12));

  q << 0.0, 0.0, 0.3;
  assert(ok(solver.forwardKinematics(q, 2, &g)));
  assert(matNear(g.translation(), Vec3(2.8, 0.0, 0.0), 1e-12));

  std::vector<Transform> all;
  assert(ok(solver.forwardKinematicsAll(q, &all)));
  assert(all.size() == 3);
  assert(matNear(all[2].matrix(), g.matrix(), 1e-12));

  assert(solver.forwardKinematics(q, 3, &g) == Status::InvalidParameter);
  assert(solver.forwardKinematics(Eigen::Vector2d(0.0, 0.0), 0, &g) == Status::InvalidParameter);
}

static void test_link_jacobians_fd() {
  KinematicsSolver solver(makeArm());
  const Eigen::Vector3d q(0.3, -0.4, 0.2);
  const double eps = 1e-7;

  for (int link = 0; link < 3; ++link) {
    Eigen::MatrixXd Jp;
    Eigen::MatrixXd Jx;
    assert(ok(solver.linkPositionJacobian(q, link, &Jp)));
    assert(ok(solver.linkPoseJacobian(q, link, &Jx)));
    assert(Jp.rows() == 3 && Jp.cols() == 3);
    assert(Jx.rows() == 7 && Jx.cols() == 3);
    assert(matNear(Jx.bottomRows<3>(), Jp, 1e-14));

    Transform g;
    assert(ok(solver.forwardKinematics(q, link, &g)));
    const Pose x0 = manoid::core::transformToPose(g);

    for (int i = 0; i < 3; ++i) {
      Eigen::Vector3d qn = q;
      qn(i) += eps;
      Transform gn;
      assert(ok(solver.forwardKinematics(qn, link, &gn)));
      const Pose xn = manoid::core::transformToPose(gn);

      const Eigen::VectorXd dx = (xn - x0) / eps;
      assert(matNear(Jx.col(i), dx, 1e-5));

      // joints beyond the link do not move it
      if (i > link) {
        assert(matNear(Jx.col(i), Eigen::VectorXd::Zero(7), 0.0));
      }
    }
  }
}

static void test_spatial_jacobian_angular_rows() {
  KinematicsSolver solver(makeArm());
  const Eigen::Vector3d q(-0.2, 0.5, 0.1);
  const double eps = 1e-7;

  Eigen::MatrixXd J;
  assert(ok(solver.spatialJacobian(q, &J)));
  assert(J.rows() == 6 && J.cols() == 3);

  Transform g;
  assert(ok(solver.forwardKinematics(q, 2, &g)));
  for (int i = 0; i < 3; ++i) {
    Eigen::Vector3d qn = q;
    qn(i) += eps;
    Transform gn;
    assert(ok(solver.forwardKinematics(qn, 2, &gn)));
    const Mat3 Rdot = (gn.linear() - g.linear()) / eps;
    const Vec3 w = manoid::core::vee3(Rdot * g.linear().transpose());
    assert(matNear(J.col(i).tail<3>(), w, 1e-5));
  }
}

static void test_robot_writes_link_bodies() {
  Environment env;
  JointLimit lim;
  lim.enabled = true;
  lim.lower = -1.0;
  lim.upper = 1.0;

  std::unique_ptr<Robot> robot;
  assert(ok(Robot::create(&env, makeArm(lim), &robot)));
  assert(env.size() == 3);
  assert(robot->dof() == 3);

  const RigidBody* forearm = robot->link("forearm");
  assert(forearm != nullptr);
  assert(forearm->name() == "forearm");
  assert(robot->link("head") == nullptr);
  assert(matNear(forearm->position(), Vec3(2.0, 0.0, 0.0), 1e-12));

  Eigen::Vector3d q(0.5, 0.0, 0.1);
  assert(ok(robot->setDofValues(q)));
  Transform g;
  assert(ok(robot->solver().forwardKinematics(q, 1, &g)));
  assert(matNear(forearm->transform().matrix(), g.matrix(), 1e-12));

  // shoulder clamped to its limit
  q << 2.0, 0.0, 0.0;
  assert(ok(robot->setDofValues(q)));
  assert(near(robot->dofValues()(0), 1.0, 0.0));

  assert(robot->setDofValues(Eigen::Vector2d(0.0, 0.0)) == Status::InvalidParameter);
  assert(near(robot->dofValues()(0), 1.0, 0.0));

  // provider lookups by body handle
  Eigen::MatrixXd J;
  assert(ok(robot->linkPositionJacobian(forearm->id(), &J)));
  Eigen::MatrixXd J_direct;
  assert(ok(robot->solver().linkPositionJacobian(robot->dofValues(), 1, &J_direct)));
  assert(matNear(J, J_direct, 1e-14));

  RigidBody stranger;
  assert(ok(RigidBody::create(&env, {}, &stranger)));
  assert(robot->linkPoseJacobian(stranger.id(), &J) == Status::NotFound);

  robot.reset();
  assert(env.size() == 1);
}

int main() {
  test_model_validation();
  test_forward_kinematics();
  test_link_jacobians_fd();
  test_spatial_jacobian_angular_rows();
  test_robot_writes_link_bodies();
  std::cout << "manoid_core_kinematics_test: PASS\n";
  return 0;
}
