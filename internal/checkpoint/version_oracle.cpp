#include "version_oracle.hpp"

#include <cstdio>
#include <limits>

#include "internal/serde/serializer.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace waypoint::checkpoint {

uint64_t ParseVersion(std::string_view version) {
  auto prefix = version.substr(0, version.find('.'));
  if (prefix.empty()) {
    throw util::InvalidArgument("malformed channel version: '" + std::string(version) + "'");
  }

  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

  uint64_t counter = 0;
  for (char c : prefix) {
    if (c < '0' || c > '9') {
      throw util::InvalidArgument("malformed channel version: '" + std::string(version) + "'");
    }
    const auto digit = static_cast<uint64_t>(c - '0');
    if (counter > (kMax - digit) / 10) {
      throw util::InvalidArgument("channel version counter out of range: '" + std::string(version) + "'");
    }
    counter = counter * 10 + digit;
  }
  return counter;
}

std::string ContentHash(const channel::BaseChannel& channel) {
  try {
    // deterministic bytes, so equal values hash equal regardless of map order
    return util::Md5Hex(serde::CanonicalBytes(channel.Checkpoint()));
  } catch (const util::EmptyChannelError&) {
    return {};
  }
}

std::string NextVersion(const std::optional<std::string>& current, const channel::BaseChannel& channel) {
  const uint64_t previous = current ? ParseVersion(*current) : 0;
  if (previous == std::numeric_limits<uint64_t>::max()) {
    throw util::InvalidArgument("channel version counter exhausted: '" + *current + "'");
  }
  const uint64_t next = previous + 1;

  char counter[40];
  std::snprintf(counter, sizeof(counter), "%032llu", static_cast<unsigned long long>(next));
  return std::string(counter) + "." + ContentHash(channel);
}

bool VersionGreater(const std::string& version, const std::optional<std::string>& previous) {
  if (!previous) {
    return true;
  }
  return version > *previous;
}

} // namespace waypoint::checkpoint
