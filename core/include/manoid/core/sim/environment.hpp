#pragma once
#include "manoid/core/common/status.hpp"
#include "manoid/core/export.hpp"
#include "manoid/core/math/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace manoid::core {

// Opaque handle to a body stored in an Environment. Ids are never reused, so a
// stale handle can never alias a body added later.
using BodyId = std::uint64_t;
inline constexpr BodyId kInvalidBodyId = 0;

// In-memory body store: the authoritative transform of every body.
//
// Bodies are added and removed explicitly; `removeBody` on an id that is not
// present returns NotFound and leaves every other body untouched.
class MANOID_CORE_API Environment {
public:
  Environment() = default;
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;

  // Empty `name` assigns "<prefix><counter>" with the per-environment counter.
  // Names are made unique by appending "_<n>".
  Status addBody(std::string name, const Transform& T, BodyId* out,
                 const std::string& anonymous_prefix = "Body");
  Status removeBody(BodyId id);

  bool contains(BodyId id) const { return bodies_.count(id) != 0; }
  std::size_t size() const { return bodies_.size(); }

  Status getTransform(BodyId id, Transform* out) const;
  Status setTransform(BodyId id, const Transform& T);

  Status getName(BodyId id, std::string* out) const;
  Status findBody(const std::string& name, BodyId* out) const;

  std::vector<BodyId> bodyIds() const;

private:
  struct BodyRecord {
    std::string name;
    Transform T{Transform::Identity()};
  };

  std::unordered_map<BodyId, BodyRecord> bodies_;
  BodyId next_id_{1};
  std::size_t anonymous_count_{0};
};

}  // namespace manoid::core
