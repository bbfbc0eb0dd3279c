#include "manoid/core/sim/environment.hpp"

#include "manoid/core/common/logger.hpp"

#include <algorithm>
#include <sstream>

namespace manoid::core {

Status Environment::addBody(std::string name, const Transform& T, BodyId* out,
                            const std::string& anonymous_prefix) {
  if (!out) {
    log(LogLevel::Error, "Environment::addBody: null output pointer");
    return Status::InvalidParameter;
  }
  if (!T.matrix().allFinite()) {
    log(LogLevel::Error, "Environment::addBody: transform is non-finite");
    return Status::InvalidParameter;
  }

  if (name.empty()) {
    std::ostringstream oss;
    oss << anonymous_prefix << anonymous_count_++;
    name = oss.str();
  }

  BodyId existing = kInvalidBodyId;
  const std::string base = name;
  for (std::size_t suffix = 1; ok(findBody(name, &existing)); ++suffix) {
    name = base + "_" + std::to_string(suffix);
  }

  const BodyId id = next_id_++;
  bodies_.emplace(id, BodyRecord{std::move(name), T});
  *out = id;
  return Status::Success;
}

Status Environment::removeBody(BodyId id) {
  auto it = bodies_.find(id);
  if (it == bodies_.end()) {
    log(LogLevel::Warn, "Environment::removeBody: unknown body id " + std::to_string(id));
    return Status::NotFound;
  }
  bodies_.erase(it);
  return Status::Success;
}

Status Environment::getTransform(BodyId id, Transform* out) const {
  if (!out) {
    log(LogLevel::Error, "Environment::getTransform: null output pointer");
    return Status::InvalidParameter;
  }
  auto it = bodies_.find(id);
  if (it == bodies_.end()) {
    log(LogLevel::Error, "Environment::getTransform: unknown body id " + std::to_string(id));
    return Status::NotFound;
  }
  *out = it->second.T;
  return Status::Success;
}

Status Environment::setTransform(BodyId id, const Transform& T) {
  auto it = bodies_.find(id);
  if (it == bodies_.end()) {
    log(LogLevel::Error, "Environment::setTransform: unknown body id " + std::to_string(id));
    return Status::NotFound;
  }
  if (!T.matrix().allFinite()) {
    log(LogLevel::Error, "Environment::setTransform: transform is non-finite for '" +
                             it->second.name + "'");
    return Status::InvalidParameter;
  }
  it->second.T = T;
  return Status::Success;
}

Status Environment::getName(BodyId id, std::string* out) const {
  if (!out) {
    log(LogLevel::Error, "Environment::getName: null output pointer");
    return Status::InvalidParameter;
  }
  auto it = bodies_.find(id);
  if (it == bodies_.end()) {
    return Status::NotFound;
  }
  *out = it->second.name;
  return Status::Success;
}

Status Environment::findBody(const std::string& name, BodyId* out) const {
  if (!out) {
    log(LogLevel::Error, "Environment::findBody: null output pointer");
    return Status::InvalidParameter;
  }
  for (const auto& [id, record] : bodies_) {
    if (record.name == name) {
      *out = id;
      return Status::Success;
    }
  }
  return Status::NotFound;
}

std::vector<BodyId> Environment::bodyIds() const {
  std::vector<BodyId> ids;
  ids.reserve(bodies_.size());
  for (const auto& entry : bodies_) {
    ids.push_back(entry.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace manoid::core
