#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace ticketflow::util {

/*
  UUID helpers

  Processing runs are keyed by a random RFC4122 v4 UUID (request_guid).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewRequestGuid() {
  return ToString(GenerateUUID());
}

} // namespace ticketflow::util
