#pragma once
#include <cstdint>

namespace rigid::core {

enum class Status : std::uint8_t {
  Success = 0,
  InvalidParameter = 1
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace rigid::core
