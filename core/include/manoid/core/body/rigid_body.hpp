#pragma once
#include "manoid/core/common/status.hpp"
#include "manoid/core/export.hpp"
#include "manoid/core/math/types.hpp"
#include "manoid/core/sim/environment.hpp"

#include <optional>
#include <string>

namespace manoid::core {

// Axis-aligned box centered on the body frame: [-X, X] x [-Y, Y] x [-Z, Z].
struct BoxGeometry {
  Vec3 half_extents{Vec3::Zero()};

  static BoxGeometry cube(double half_size) {
    return BoxGeometry{Vec3::Constant(half_size)};
  }
};

struct BodyOptions {
  std::string name;              // empty: "<anonymous_prefix><N>"
  std::string anonymous_prefix = "Body";
  std::optional<Vec3> pos;
  std::optional<Vec3> rpy;
  std::optional<Pose> pose;      // supersedes pos and rpy
  std::optional<BoxGeometry> box;
};

// A rigid body whose transform lives in an Environment.
//
// The environment transform is the only state: every reader is a projection of
// it, and every writer patches one block of the current transform and writes
// the whole transform back with a single Environment::setTransform call.
//
// A RigidBody owns its environment handle. `release()` (or destruction) removes
// the body from the environment exactly once; the environment must outlive it.
class MANOID_CORE_API RigidBody {
public:
  RigidBody() = default;
  ~RigidBody();

  RigidBody(const RigidBody&) = delete;
  RigidBody& operator=(const RigidBody&) = delete;
  RigidBody(RigidBody&& other) noexcept;
  RigidBody& operator=(RigidBody&& other) noexcept;

  static Status create(Environment* env, const BodyOptions& opt, RigidBody* out);

  bool valid() const;
  BodyId id() const { return id_; }
  const Environment* environment() const { return env_; }
  std::string name() const;
  const std::optional<BoxGeometry>& geometry() const { return geometry_; }

  // Readers. On a released body these log an error and return identity values.
  Transform transform() const;
  Pose pose() const;
  Mat3 rotationMatrix() const;
  Vec3 position() const;
  double x() const { return position().x(); }
  double y() const { return position().y(); }
  double z() const { return position().z(); }

  Vec3 tangent() const { return rotationMatrix().col(0); }
  Vec3 binormal() const { return rotationMatrix().col(1); }
  Vec3 normal() const { return rotationMatrix().col(2); }

  Quat quat() const;
  Vec3 rpy() const;
  double roll() const { return rpy().x(); }
  double pitch() const { return rpy().y(); }
  double yaw() const { return rpy().z(); }

  // Writers.
  Status setTransform(const Transform& T);
  Status setPosition(const Vec3& p);
  Status setRotationMatrix(const Mat3& R);
  Status setX(double x);
  Status setY(double y);
  Status setZ(double z);
  Status setRpy(const Vec3& rpy);
  Status setRoll(double roll);
  Status setPitch(double pitch);
  Status setYaw(double yaw);
  Status setPose(const Pose& pose);
  Status setQuat(const Quat& q);

  // First-order update with `v` and `omega` over `dt`:
  //   p <- p + v * dt,   R <- R + hat(omega) * R * dt.
  // The rotation block is not re-orthonormalized (see renormalizeRotation).
  Status applyTwist(const Vec3& v, const Vec3& omega, double dt);

  // Projects the rotation block back onto SO(3).
  Status renormalizeRotation();

  // Removes the body from its environment. Idempotent: a second call logs at
  // Debug. Default-constructed and moved-from handles have nothing to release.
  Status release();

private:
  Status readTransform(const char* op, Transform* T) const;
  Status setTranslationComponent(int axis, double value);
  Status dropHandle();

  Environment* env_{nullptr};
  BodyId id_{kInvalidBodyId};
  std::optional<BoxGeometry> geometry_;
  bool released_{false};
};

}  // namespace manoid::core
