#include "manoid/core/body/point_mass.hpp"

#include "manoid/core/common/constants.hpp"
#include "manoid/core/common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace manoid::core {

Status PointMass::create(Environment* env, const Vec3& pos, double mass,
                         PointMass* out, std::string name) {
  if (!std::isfinite(mass) || mass < 0.0) {
    log(LogLevel::Error, "PointMass::create: mass must be finite and >= 0");
    return Status::InvalidParameter;
  }
  const double half_size = std::max(kMinPointMassSize, kPointMassSizePerKg * mass);
  return build(env, pos, mass, half_size, "PointMass", std::move(name), out);
}

Status PointMass::createPoint(Environment* env, const Vec3& pos, PointMass* out,
                              std::string name) {
  return build(env, pos, 0.0, kDefaultPointSize, "Point", std::move(name), out);
}

Status PointMass::build(Environment* env, const Vec3& pos, double mass, double half_size,
                        const char* prefix, std::string name, PointMass* out) {
  if (!out) {
    log(LogLevel::Error, "PointMass::create: null output pointer");
    return Status::InvalidParameter;
  }

  BodyOptions opt;
  opt.name = std::move(name);
  opt.anonymous_prefix = prefix;
  opt.pos = pos;
  opt.box = BoxGeometry::cube(half_size);

  PointMass pm;
  const Status st = RigidBody::create(env, opt, &pm.body_);
  if (!ok(st)) {
    log(LogLevel::Error, "PointMass::create: body creation failed");
    return st;
  }
  pm.mass_ = mass;
  *out = std::move(pm);
  return Status::Success;
}

Status PointMass::integrateAcceleration(const Vec3& a, double dt) {
  if (!(dt >= 0.0)) {
    log(LogLevel::Error, "PointMass::integrateAcceleration: dt must be >= 0");
    return Status::InvalidParameter;
  }
  const Vec3 p = body_.position() + velocity_ * dt + 0.5 * a * dt * dt;
  const Status st = body_.setPosition(p);
  if (!ok(st)) {
    log(LogLevel::Error, "PointMass::integrateAcceleration: position update failed");
    return st;
  }
  velocity_ += a * dt;
  return Status::Success;
}

}  // namespace manoid::core
