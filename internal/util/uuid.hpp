#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace stagegraph::util {

/*
  Random RFC4122 version 4 UUIDs, used for session ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 8-4-4-4-12 lowercase hex.
std::string ToString(const UUID& id);

// "session-<uuid>"
std::string GenerateSessionId();

} // namespace stagegraph::util
