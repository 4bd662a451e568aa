#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "base_channel.hpp"

namespace waypoint::channel {

struct ChannelOptions {
  // reject more than one update per step where the kind supports it
  bool guard = true;
};

/*
  Maps a channel kind tag to its implementation.

  Stores and executors only ever see BaseChannel; registering a new kind
  here is all it takes to make it available.
*/
class ChannelRegistry {
 public:
  using Factory = std::function<std::unique_ptr<BaseChannel>(const ChannelOptions&)>;

  // Process-wide registry with the built-in kinds installed.
  static ChannelRegistry& Instance();

  ChannelRegistry() = default;

  // Throws util::InvalidArgument if the kind is taken.
  void Register(const std::string& kind, Factory factory);

  // Throws util::NotFound for unknown kinds.
  std::unique_ptr<BaseChannel> Create(const std::string& kind, const ChannelOptions& options = {}) const;

  bool                     Contains(const std::string& kind) const;
  std::vector<std::string> Kinds() const;

 private:
  mutable std::shared_mutex                mutex_;
  std::unordered_map<std::string, Factory> factories_;
};

void RegisterBuiltinChannels(ChannelRegistry& registry);

} // namespace waypoint::channel
