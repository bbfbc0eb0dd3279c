#pragma once
#include <cstdint>

#include "manoid/core/export.hpp"

namespace manoid::core {

// Result code shared by every fallible operation in the library.
// - InvalidTarget: a task target has the wrong shape for the task type.
// - NotFound: unknown body handle, link, or task name.
enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  InvalidTarget = 3,
  NotFound = 4
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

MANOID_CORE_API const char* statusToString(Status s);

}  // namespace manoid::core
