#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace waypoint::util {

/*
  UUID helpers

  Checkpoint ids are time-ordered (RFC 9562 version 7) so that their
  canonical string form sorts lexicographically in creation order.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Strictly increasing within the process, even for calls in the same millisecond.
UUID GenerateTimeOrderedUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Milliseconds since the epoch encoded in a version 7 UUID.
uint64_t TimestampMillis(const UUID& id);

} // namespace waypoint::util
