#pragma once
#include "manoid/core/body/rigid_body.hpp"

#include <string>

namespace manoid::core {

// Rigid body with translational velocity and a constant-acceleration
// integrator. `mass` is informational; it only sizes the body's cube.
class MANOID_CORE_API PointMass {
public:
  PointMass() = default;

  // Cube of half-size max(5 mm, 0.6 mm/kg * mass). Anonymous point masses are
  // named "PointMass<N>".
  static Status create(Environment* env, const Vec3& pos, double mass,
                       PointMass* out, std::string name = {});

  // Massless point: a 1 cm cube named "Point<N>" when anonymous.
  static Status createPoint(Environment* env, const Vec3& pos, PointMass* out,
                            std::string name = {});

  RigidBody& body() { return body_; }
  const RigidBody& body() const { return body_; }

  Vec3 position() const { return body_.position(); }
  const Vec3& velocity() const { return velocity_; }
  double mass() const { return mass_; }

  void setVelocity(const Vec3& v) { velocity_ = v; }

  // p <- p + v dt + 0.5 a dt^2,  v <- v + a dt.
  // Velocity is committed only once the position write succeeded.
  Status integrateAcceleration(const Vec3& a, double dt);

private:
  static Status build(Environment* env, const Vec3& pos, double mass, double half_size,
                      const char* prefix, std::string name, PointMass* out);

  RigidBody body_;
  Vec3 velocity_{Vec3::Zero()};
  double mass_{0.0};
};

}  // namespace manoid::core
