#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "manoid/core/body/point_mass.hpp"
#include "manoid/core/body/rigid_body.hpp"
#include "manoid/core/common/logger.hpp"
#include "manoid/core/common/status.hpp"
#include "manoid/core/math/pose.hpp"
#include "manoid/core/math/so3.hpp"
#include "manoid/core/sim/environment.hpp"

using manoid::core::BodyId;
using manoid::core::BodyOptions;
using manoid::core::BoxGeometry;
using manoid::core::Environment;
using manoid::core::LogLevel;
using manoid::core::Mat3;
using manoid::core::PointMass;
using manoid::core::Pose;
using manoid::core::Quat;
using manoid::core::RigidBody;
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

static RigidBody makeBody(Environment* env, const BodyOptions& opt = {}) {
  RigidBody body;
  const Status st = RigidBody::create(env, opt, &body);
  assert(ok(st));
  return body;
}

static void test_construction_options() {
  Environment env;

  BodyOptions opt;
  opt.pos = Vec3(1.0, 2.0, 3.0);
  opt.rpy = Vec3(0.1, 0.0, 0.0);
  RigidBody a = makeBody(&env, opt);
  assert(matNear(a.position(), Vec3(1.0, 2.0, 3.0), 0.0));
  assert(near(a.roll(), 0.1, 1e-12));
  assert(a.name() == "Body0");

  // pose supersedes pos and rpy
  Pose pose;
  pose << 1.0, 0.0, 0.0, 0.0, -1.0, -2.0, -3.0;
  opt.pose = pose;
  opt.name = "target";
  opt.box = BoxGeometry::cube(0.05);
  RigidBody b = makeBody(&env, opt);
  assert(matNear(b.position(), Vec3(-1.0, -2.0, -3.0), 0.0));
  assert(matNear(b.rotationMatrix(), Mat3::Identity(), 0.0));
  assert(b.name() == "target");
  assert(b.geometry().has_value());
  assert(near(b.geometry()->half_extents.x(), 0.05, 0.0));

  // names stay unique
  RigidBody c = makeBody(&env, opt);
  assert(c.name() == "target_1");

  BodyOptions bad;
  bad.box = BoxGeometry{Vec3(-1.0, 1.0, 1.0)};
  RigidBody d;
  assert(RigidBody::create(&env, bad, &d) == Status::InvalidParameter);
  assert(!d.valid());
  assert(env.size() == 3);
}

static void test_partial_mutators_preserve_state() {
  Environment env;
  BodyOptions opt;
  opt.pos = Vec3(0.5, -0.25, 2.0);
  opt.rpy = Vec3(0.3, -0.2, 1.1);
  RigidBody body = makeBody(&env, opt);

  const Mat3 R0 = body.rotationMatrix();

  assert(ok(body.setX(7.0)));
  assert(near(body.x(), 7.0, 0.0));
  assert(near(body.y(), -0.25, 0.0));
  assert(near(body.z(), 2.0, 0.0));
  assert(matNear(body.rotationMatrix(), R0, 0.0));

  assert(ok(body.setY(-3.0)));
  assert(near(body.x(), 7.0, 0.0));
  assert(near(body.y(), -3.0, 0.0));
  assert(near(body.z(), 2.0, 0.0));

  assert(ok(body.setZ(0.0)));
  assert(matNear(body.position(), Vec3(7.0, -3.0, 0.0), 0.0));
  assert(matNear(body.rotationMatrix(), R0, 0.0));

  const Mat3 R1 = Eigen::AngleAxisd(0.4, Vec3::UnitZ()).toRotationMatrix();
  assert(ok(body.setRotationMatrix(R1)));
  assert(matNear(body.rotationMatrix(), R1, 0.0));
  assert(matNear(body.position(), Vec3(7.0, -3.0, 0.0), 0.0));

  assert(ok(body.setPosition(Vec3(1.0, 1.0, 1.0))));
  assert(matNear(body.rotationMatrix(), R1, 0.0));

  assert(ok(body.setRpy(Vec3(0.2, 0.1, -0.3))));
  assert(matNear(body.position(), Vec3(1.0, 1.0, 1.0), 0.0));
  assert(matNear(body.rpy(), Vec3(0.2, 0.1, -0.3), 1e-12));
}

static void test_roll_pitch_yaw_setters() {
  Environment env;
  RigidBody body = makeBody(&env);

  assert(ok(body.setRoll(0.1)));
  assert(ok(body.setPitch(0.2)));
  assert(near(body.roll(), 0.1, 1e-12));
  assert(near(body.pitch(), 0.2, 1e-12));
  assert(near(body.yaw(), 0.0, 1e-12));

  assert(ok(body.setYaw(-0.5)));
  assert(near(body.roll(), 0.1, 1e-12));
  assert(near(body.pitch(), 0.2, 1e-12));
  assert(near(body.yaw(), -0.5, 1e-12));
}

static void test_basis_vectors_and_pose() {
  Environment env;
  BodyOptions opt;
  opt.rpy = Vec3(0.0, 0.0, M_PI / 2.0);
  opt.pos = Vec3(1.0, 0.0, 0.0);
  RigidBody body = makeBody(&env, opt);

  assert(matNear(body.tangent(), Vec3(0.0, 1.0, 0.0), 1e-12));
  assert(matNear(body.binormal(), Vec3(-1.0, 0.0, 0.0), 1e-12));
  assert(matNear(body.normal(), Vec3(0.0, 0.0, 1.0), 1e-12));

  const Pose pose = body.pose();
  assert(pose(0) >= 0.0);
  assert(near(pose(0), std::cos(M_PI / 4.0), 1e-12));
  assert(near(pose(3), std::sin(M_PI / 4.0), 1e-12));
  assert(matNear(pose.tail<3>(), Vec3(1.0, 0.0, 0.0), 0.0));

  // setQuat keeps the translation and accepts a negative scalar part
  const Quat q(Eigen::AngleAxisd(0.8, Vec3::UnitX()));
  const Quat neg(-q.w(), -q.x(), -q.y(), -q.z());
  assert(ok(body.setQuat(neg)));
  assert(matNear(body.position(), Vec3(1.0, 0.0, 0.0), 1e-12));
  assert(matNear(body.pose().head<4>(), Eigen::Vector4d(q.w(), q.x(), q.y(), q.z()), 1e-12));
  assert(matNear(body.quat().coeffs(), q.coeffs(), 1e-12));

  Pose target;
  target << 0.5, 0.5, 0.5, 0.5, 4.0, 5.0, 6.0;
  assert(ok(body.setPose(target)));
  assert(matNear(body.pose(), target, 1e-12));
}

static void test_apply_twist() {
  Environment env;
  BodyOptions opt;
  opt.pos = Vec3(1.0, 2.0, 3.0);
  RigidBody body = makeBody(&env, opt);

  assert(ok(body.applyTwist(Vec3(1.0, 0.0, -2.0), Vec3::Zero(), 0.5)));
  assert(matNear(body.position(), Vec3(1.5, 2.0, 2.0), 1e-12));
  assert(matNear(body.rotationMatrix(), Mat3::Identity(), 0.0));

  // first-order rotation update, no renormalization
  const Vec3 omega(0.0, 0.0, 1.0);
  assert(ok(body.applyTwist(Vec3::Zero(), omega, 0.1)));
  const Mat3 expected = Mat3::Identity() + manoid::core::hat3(omega) * 0.1;
  assert(matNear(body.rotationMatrix(), expected, 1e-12));
  assert(!manoid::core::isRotationMatrix(body.rotationMatrix(), 1e-6));

  assert(ok(body.renormalizeRotation()));
  assert(manoid::core::isRotationMatrix(body.rotationMatrix(), 1e-9));
  assert(near(body.yaw(), std::atan(0.1), 1e-9));
  assert(matNear(body.position(), Vec3(1.5, 2.0, 2.0), 1e-12));

  const Transform before = body.transform();
  assert(body.applyTwist(Vec3::Ones(), Vec3::Ones(), -0.1) == Status::InvalidParameter);
  assert(matNear(body.transform().matrix(), before.matrix(), 0.0));

  assert(ok(body.applyTwist(Vec3::Ones(), Vec3::Ones(), 0.0)));
  assert(matNear(body.transform().matrix(), before.matrix(), 0.0));
}

static void test_release_is_idempotent() {
  Environment env;
  RigidBody keep = makeBody(&env);
  RigidBody body = makeBody(&env);
  assert(env.size() == 2);

  const auto id = body.id();
  assert(ok(body.release()));
  assert(env.size() == 1);
  assert(!env.contains(id));
  assert(!body.valid());

  assert(ok(body.release()));
  assert(env.size() == 1);
  assert(keep.valid());
  assert(env.bodyIds() == std::vector<BodyId>{keep.id()});

  // removing an unknown id never touches other bodies
  assert(env.removeBody(id) == Status::NotFound);
  assert(env.size() == 1);

  // writers on a released body report instead of writing
  assert(body.setX(1.0) == Status::NotFound);
  assert(matNear(body.position(), Vec3::Zero(), 0.0));
}

static void test_scoped_ownership() {
  Environment env;
  {
    RigidBody a = makeBody(&env);
    assert(env.size() == 1);

    RigidBody b = std::move(a);
    assert(!a.valid());
    assert(b.valid());
    assert(env.size() == 1);

    RigidBody c = makeBody(&env);
    assert(env.size() == 2);
    c = std::move(b);  // c's previous body is released
    assert(env.size() == 1);
    assert(c.valid());
  }
  assert(env.size() == 0);
}

static std::vector<std::string> g_logs;

static void captureSink(LogLevel, const std::string& msg) {
  g_logs.push_back(msg);
}

static void test_release_diagnostics() {
  const LogLevel saved = manoid::core::getLogLevel();
  manoid::core::setLogLevel(LogLevel::Debug);
  g_logs.clear();
  {
    const manoid::core::ScopedLogSink capture(&captureSink);
    Environment env;

    // creation, moves and destruction of empty handles are not releases
    RigidBody a = makeBody(&env);
    RigidBody b = std::move(a);
    RigidBody c;
    c = std::move(b);
    PointMass pm;
    assert(ok(PointMass::create(&env, Vec3::Zero(), 2.0, &pm)));
    assert(g_logs.empty());

    assert(ok(c.release()));
    assert(g_logs.empty());
    assert(ok(c.release()));
    assert(g_logs.size() == 1);
    assert(g_logs[0].find("already released") != std::string::npos);

    // a released handle moved elsewhere still remembers it was released
    RigidBody d = std::move(c);
    assert(ok(d.release()));
    assert(g_logs.size() == 2);
    assert(env.size() == 1);
  }
  manoid::core::setLogLevel(saved);
  assert(g_logs.size() == 2);
}

static void test_point_mass() {
  Environment env;

  PointMass pm;
  assert(ok(PointMass::create(&env, Vec3::Zero(), 10.0, &pm)));
  assert(pm.body().name() == "PointMass0");
  assert(near(pm.mass(), 10.0, 0.0));
  assert(matNear(pm.velocity(), Vec3::Zero(), 0.0));
  assert(pm.body().geometry().has_value());
  assert(near(pm.body().geometry()->half_extents.x(), 6e-3, 1e-15));

  assert(ok(pm.integrateAcceleration(Vec3(0.0, 0.0, -9.8), 1.0)));
  assert(matNear(pm.position(), Vec3(0.0, 0.0, -4.9), 1e-12));
  assert(matNear(pm.velocity(), Vec3(0.0, 0.0, -9.8), 1e-12));

  // closed form with non-zero initial velocity
  PointMass p2;
  assert(ok(PointMass::create(&env, Vec3(1.0, 2.0, 3.0), 1.0, &p2, "com")));
  assert(p2.body().name() == "com");
  assert(near(p2.body().geometry()->half_extents.x(), 5e-3, 0.0));
  const Vec3 v0(0.5, -1.0, 2.0);
  const Vec3 a(1.0, 0.25, -3.0);
  const double dt = 0.3;
  p2.setVelocity(v0);
  assert(ok(p2.integrateAcceleration(a, dt)));
  assert(matNear(p2.position(), Vec3(1.0, 2.0, 3.0) + v0 * dt + 0.5 * a * dt * dt, 1e-12));
  assert(matNear(p2.velocity(), v0 + a * dt, 1e-12));

  const Vec3 p_before = p2.position();
  const Vec3 v_before = p2.velocity();
  assert(ok(p2.integrateAcceleration(a, 0.0)));
  assert(matNear(p2.position(), p_before, 0.0));
  assert(matNear(p2.velocity(), v_before, 0.0));

  assert(p2.integrateAcceleration(a, -0.1) == Status::InvalidParameter);
  assert(matNear(p2.position(), p_before, 0.0));
  assert(matNear(p2.velocity(), v_before, 0.0));

  PointMass bad;
  assert(PointMass::create(&env, Vec3::Zero(), -1.0, &bad) == Status::InvalidParameter);
  assert(env.size() == 2);

  // massless point: 1 cm cube, same integrator
  PointMass point;
  assert(ok(PointMass::createPoint(&env, Vec3(0.0, 0.0, 1.0), &point)));
  assert(point.body().name() == "Point1");
  assert(near(point.mass(), 0.0, 0.0));
  assert(near(point.body().geometry()->half_extents.z(), 0.01, 0.0));
  assert(ok(point.integrateAcceleration(Vec3(2.0, 0.0, 0.0), 0.5)));
  assert(matNear(point.position(), Vec3(0.25, 0.0, 1.0), 1e-15));
  assert(env.size() == 3);
}

int main() {
  test_construction_options();
  test_partial_mutators_preserve_state();
  test_roll_pitch_yaw_setters();
  test_basis_vectors_and_pose();
  test_apply_twist();
  test_release_is_idempotent();
  test_scoped_ownership();
  test_release_diagnostics();
  test_point_mass();
  std::cout << "manoid_core_body_test: PASS\n";
  return 0;
}
