#include "rigid/core/common/status.hpp"

namespace rigid::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::InvalidParameter: return "InvalidParameter";
  }
  return "Unknown";
}

}  // namespace rigid::core
