#include "manoid/core/body/rigid_body.hpp"

#include "manoid/core/common/logger.hpp"
#include "manoid/core/math/pose.hpp"
#include "manoid/core/math/so3.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace manoid::core {

Status RigidBody::create(Environment* env, const BodyOptions& opt, RigidBody* out) {
  if (!env || !out) {
    log(LogLevel::Error, "RigidBody::create: null environment or output pointer");
    return Status::InvalidParameter;
  }
  if (opt.box) {
    const Vec3& h = opt.box->half_extents;
    if (!h.allFinite() || (h.array() < 0.0).any()) {
      log(LogLevel::Error, "RigidBody::create: invalid box half-extents");
      return Status::InvalidParameter;
    }
  }

  Transform T = Transform::Identity();
  if (opt.pose) {
    T = poseToTransform(*opt.pose);
  } else {
    if (opt.pos) T.translation() = *opt.pos;
    if (opt.rpy) T.linear() = rotationMatrixFromRpy(*opt.rpy);
  }

  BodyId id = kInvalidBodyId;
  const Status st = env->addBody(opt.name, T, &id, opt.anonymous_prefix);
  if (!ok(st)) {
    log(LogLevel::Error, "RigidBody::create: environment rejected body '" + opt.name + "'");
    return st;
  }

  RigidBody body;
  body.env_ = env;
  body.id_ = id;
  body.geometry_ = opt.box;
  *out = std::move(body);
  return Status::Success;
}

RigidBody::~RigidBody() {
  if (!ok(dropHandle())) {
    log(LogLevel::Warn, "RigidBody: release during destruction failed");
  }
}

RigidBody::RigidBody(RigidBody&& other) noexcept
  : env_(other.env_), id_(other.id_), geometry_(std::move(other.geometry_)),
    released_(other.released_) {
  other.env_ = nullptr;
  other.id_ = kInvalidBodyId;
  other.geometry_.reset();
  other.released_ = false;
}

RigidBody& RigidBody::operator=(RigidBody&& other) noexcept {
  if (this != &other) {
    if (!ok(dropHandle())) {
      log(LogLevel::Warn, "RigidBody: release of overwritten body failed");
    }
    env_ = other.env_;
    id_ = other.id_;
    geometry_ = std::move(other.geometry_);
    released_ = other.released_;
    other.env_ = nullptr;
    other.id_ = kInvalidBodyId;
    other.geometry_.reset();
    other.released_ = false;
  }
  return *this;
}

bool RigidBody::valid() const {
  return env_ != nullptr && env_->contains(id_);
}

Status RigidBody::release() {
  if (!env_) {
    if (released_ && shouldLog(LogLevel::Debug)) {
      log(LogLevel::Debug, "RigidBody::release: already released");
    }
    return Status::Success;
  }
  released_ = true;
  return dropHandle();
}

// Silent on an empty handle.
Status RigidBody::dropHandle() {
  if (!env_) return Status::Success;
  const Status st = env_->removeBody(id_);
  env_ = nullptr;
  id_ = kInvalidBodyId;
  return st;
}

std::string RigidBody::name() const {
  std::string out;
  if (!env_ || !ok(env_->getName(id_, &out))) {
    return std::string();
  }
  return out;
}

Status RigidBody::readTransform(const char* op, Transform* T) const {
  if (!env_) {
    log(LogLevel::Error, std::string("RigidBody::") + op + ": body was released");
    return Status::NotFound;
  }
  return env_->getTransform(id_, T);
}

Transform RigidBody::transform() const {
  Transform T = Transform::Identity();
  if (!ok(readTransform("transform", &T))) {
    return Transform::Identity();
  }
  return T;
}

Pose RigidBody::pose() const {
  return transformToPose(transform());
}

Mat3 RigidBody::rotationMatrix() const {
  return transform().linear();
}

Vec3 RigidBody::position() const {
  return transform().translation();
}

Quat RigidBody::quat() const {
  return poseQuat(pose());
}

Vec3 RigidBody::rpy() const {
  return rpyFromQuat(quat());
}

Status RigidBody::setTransform(const Transform& T) {
  if (!env_) {
    log(LogLevel::Error, "RigidBody::setTransform: body was released");
    return Status::NotFound;
  }
  return env_->setTransform(id_, T);
}

Status RigidBody::setPosition(const Vec3& p) {
  Transform T;
  const Status st = readTransform("setPosition", &T);
  if (!ok(st)) return st;
  T.translation() = p;
  return setTransform(T);
}

Status RigidBody::setRotationMatrix(const Mat3& R) {
  Transform T;
  const Status st = readTransform("setRotationMatrix", &T);
  if (!ok(st)) return st;
  T.linear() = R;
  return setTransform(T);
}

Status RigidBody::setTranslationComponent(int axis, double value) {
  Transform T;
  const Status st = readTransform("setTranslationComponent", &T);
  if (!ok(st)) return st;
  T.translation()(axis) = value;
  return setTransform(T);
}

Status RigidBody::setX(double x) { return setTranslationComponent(0, x); }
Status RigidBody::setY(double y) { return setTranslationComponent(1, y); }
Status RigidBody::setZ(double z) { return setTranslationComponent(2, z); }

Status RigidBody::setRpy(const Vec3& rpy) {
  return setRotationMatrix(rotationMatrixFromRpy(rpy));
}

Status RigidBody::setRoll(double roll) {
  Vec3 angles = rpy();
  angles.x() = roll;
  return setRpy(angles);
}

Status RigidBody::setPitch(double pitch) {
  Vec3 angles = rpy();
  angles.y() = pitch;
  return setRpy(angles);
}

Status RigidBody::setYaw(double yaw) {
  Vec3 angles = rpy();
  angles.z() = yaw;
  return setRpy(angles);
}

Status RigidBody::setPose(const Pose& pose) {
  return setTransform(poseToTransform(pose));
}

Status RigidBody::setQuat(const Quat& q) {
  Transform T;
  const Status st = readTransform("setQuat", &T);
  if (!ok(st)) return st;
  Pose p = transformToPose(T);
  p.head<4>() << q.w(), q.x(), q.y(), q.z();
  return setPose(p);
}

Status RigidBody::applyTwist(const Vec3& v, const Vec3& omega, double dt) {
  if (!(dt >= 0.0)) {
    log(LogLevel::Error, "RigidBody::applyTwist: dt must be >= 0");
    return Status::InvalidParameter;
  }
  Transform T;
  const Status st = readTransform("applyTwist", &T);
  if (!ok(st)) return st;

  const Mat3 R = T.linear();
  T.translation() += v * dt;
  T.linear() = R + hat3(omega) * R * dt;
  return setTransform(T);
}

Status RigidBody::renormalizeRotation() {
  Transform T;
  const Status st = readTransform("renormalizeRotation", &T);
  if (!ok(st)) return st;
  T.linear() = orthonormalizeRotation(T.linear());
  return setTransform(T);
}

}  // namespace manoid::core
