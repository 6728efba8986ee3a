#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace stpa::util {

/*
  UUID helpers

  Review sessions are keyed by random RFC4122 version 4 UUIDs.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateSessionId() {
  return ToString(GenerateUUID());
}

} // namespace stpa::util
