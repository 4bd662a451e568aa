#include "channel_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"
#include "last_value.hpp"
#include "untracked_value.hpp"

namespace waypoint::channel {

ChannelRegistry& ChannelRegistry::Instance() {
  static ChannelRegistry* registry = [] {
    auto* r = new ChannelRegistry();
    RegisterBuiltinChannels(*r);
    return r;
  }();
  return *registry;
}

void ChannelRegistry::Register(const std::string& kind, Factory factory) {
  std::unique_lock lock(mutex_);
  if (!factories_.emplace(kind, std::move(factory)).second) {
    throw util::InvalidArgument("channel kind already registered: " + kind);
  }
}

std::unique_ptr<BaseChannel> ChannelRegistry::Create(const std::string& kind, const ChannelOptions& options) const {
  Factory factory;
  {
    std::shared_lock lock(mutex_);
    auto             it = factories_.find(kind);
    if (it == factories_.end()) {
      throw util::NotFound("unknown channel kind: " + kind);
    }
    factory = it->second;
  }
  return factory(options);
}

bool ChannelRegistry::Contains(const std::string& kind) const {
  std::shared_lock lock(mutex_);
  return factories_.count(kind) != 0;
}

std::vector<std::string> ChannelRegistry::Kinds() const {
  std::vector<std::string> kinds;
  {
    std::shared_lock lock(mutex_);
    kinds.reserve(factories_.size());
    for (const auto& [kind, _] : factories_) kinds.push_back(kind);
  }
  std::sort(kinds.begin(), kinds.end());
  return kinds;
}

void RegisterBuiltinChannels(ChannelRegistry& registry) {
  registry.Register(std::string(UntrackedValue::kKind),
                    [](const ChannelOptions& options) { return std::make_unique<UntrackedValue>(options.guard); });
  registry.Register(std::string(LastValue::kKind), [](const ChannelOptions&) { return std::make_unique<LastValue>(); });
}

} // namespace waypoint::channel
