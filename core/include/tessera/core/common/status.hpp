#pragma once
#include <cstdint>

namespace tessera::core {

enum class Status : std::uint8_t {
  Success = 0,
  InvalidParameter = 1,
  NotSimple = 2          // bivector square has a pseudoscalar part
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

inline constexpr const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::NotSimple: return "NotSimple";
  }
  return "Unknown";
}

}  // namespace tessera::core
