#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/channel/base_channel.hpp"

namespace waypoint::checkpoint {

/*
  Channel version strings.

  Format: <32-digit zero padded counter>.<md5 of the checkpoint value>
  The hash is empty when the channel has no value. Because of the padding,
  plain string comparison orders versions by their counter.
*/

// Next version after current (absent means the channel is new).
// Throws util::InvalidArgument if current has no integer prefix or its
// counter is already the largest representable one.
std::string NextVersion(const std::optional<std::string>& current, const channel::BaseChannel& channel);

// Counter prefix of version. Counters above UINT64_MAX are rejected.
uint64_t ParseVersion(std::string_view version);

// Content hash of the channel's checkpoint value, empty if the channel is empty.
std::string ContentHash(const channel::BaseChannel& channel);

// True if version orders after previous; an absent previous orders lowest.
bool VersionGreater(const std::string& version, const std::optional<std::string>& previous);

} // namespace waypoint::checkpoint
