#include "manoid/core/common/status.hpp"

namespace manoid::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::InvalidTarget: return "InvalidTarget";
    case Status::NotFound: return "NotFound";
  }
  return "Unknown";
}

}  // namespace manoid::core
