#include "latest_tuple_cache.hpp"

namespace waypoint::checkpoint {

std::string LatestTupleCache::Key(const CheckpointConfig& config) {
  std::string key = config.thread_id;
  key.push_back('\0');
  key += config.checkpoint_ns;
  return key;
}

std::optional<uint64_t> LatestTupleCache::Arm(const CheckpointConfig& config) {
  std::lock_guard lock(mutex_);
  if (slot_.state == SlotState::kPending) {
    return std::nullopt;
  }

  slot_            = Slot{};
  slot_.state      = SlotState::kPending;
  slot_.generation = next_generation_++;
  slot_.key        = Key(config);
  return slot_.generation;
}

void LatestTupleCache::Complete(uint64_t generation, Result tuple) {
  std::vector<Waiter> waiters;
  {
    std::lock_guard lock(mutex_);
    if (slot_.state != SlotState::kPending || slot_.generation != generation) {
      return;
    }
    if (tuple) {
      NoteVersionsLocked(*tuple);
    }

    waiters.swap(slot_.waiters);
    if (!waiters.empty() || slot_.stale) {
      // handed out (or outdated): the next caller queries again
      slot_ = Slot{};
    } else {
      slot_.state = SlotState::kReady;
      slot_.tuple = tuple;
    }
  }

  for (auto& waiter : waiters) {
    waiter->set_value(tuple);
  }
}

void LatestTupleCache::Fail(uint64_t generation, std::exception_ptr error) {
  std::vector<Waiter> waiters;
  {
    std::lock_guard lock(mutex_);
    if (slot_.state != SlotState::kPending || slot_.generation != generation) {
      return;
    }
    waiters.swap(slot_.waiters);
    slot_ = Slot{};
  }

  for (auto& waiter : waiters) {
    waiter->set_exception(error);
  }
}

LatestTupleCache::Lookup LatestTupleCache::Claim(const CheckpointConfig& config) {
  std::lock_guard lock(mutex_);

  Lookup lookup;
  if (slot_.state == SlotState::kEmpty || slot_.key != Key(config)) {
    return lookup;
  }

  if (slot_.state == SlotState::kPending) {
    // the in-flight result is the latest; a specific id cannot be checked yet
    if (config.checkpoint_id || slot_.stale) {
      return lookup;
    }
    auto waiter = std::make_shared<std::promise<Result>>();
    slot_.waiters.push_back(waiter);
    lookup.status  = LookupStatus::kPending;
    lookup.pending = waiter->get_future();
    return lookup;
  }

  if (config.checkpoint_id) {
    const bool same_id = slot_.tuple && slot_.tuple->config.checkpoint_id == config.checkpoint_id;
    if (!same_id) {
      return lookup;
    }
  }

  lookup.status = LookupStatus::kHit;
  lookup.tuple  = std::move(slot_.tuple);
  slot_         = Slot{};
  return lookup;
}

void LatestTupleCache::Remember(const CheckpointTuple& tuple) {
  std::vector<Waiter> waiters;
  {
    std::lock_guard lock(mutex_);
    const auto key = Key(tuple.config);

    auto seen = seen_.find(key);
    if (seen != seen_.end() && tuple.config.checkpoint_id && seen->second.checkpoint_id > *tuple.config.checkpoint_id) {
      // written under an older id: not the thread's latest
      InvalidateLocked(key);
      return;
    }
    NoteVersionsLocked(tuple);

    if (slot_.state == SlotState::kPending && slot_.key != key) {
      // another thread's prefetch keeps the slot
      return;
    }

    waiters.swap(slot_.waiters);
    slot_ = Slot{};
    if (waiters.empty()) {
      slot_.state      = SlotState::kReady;
      slot_.generation = next_generation_++;
      slot_.key        = key;
      slot_.tuple      = tuple;
    }
  }

  for (auto& waiter : waiters) {
    waiter->set_value(tuple);
  }
}

void LatestTupleCache::NoteVersions(const CheckpointTuple& tuple) {
  std::lock_guard lock(mutex_);
  NoteVersionsLocked(tuple);
}

void LatestTupleCache::NoteVersionsLocked(const CheckpointTuple& tuple) {
  if (!tuple.config.checkpoint_id) {
    return;
  }

  const auto key = Key(tuple.config);
  auto       it  = seen_.find(key);
  if (it != seen_.end() && it->second.checkpoint_id > *tuple.config.checkpoint_id) {
    // an older checkpoint read during time travel does not replace the newest
    return;
  }
  if (it == seen_.end() && seen_.size() >= kMaxRememberedThreads) {
    seen_.clear();
  }
  seen_[key] = SeenVersions{*tuple.config.checkpoint_id, tuple.checkpoint.channel_versions()};
}

std::optional<ChannelVersions> LatestTupleCache::PreviousVersions(const CheckpointConfig& config) const {
  if (!config.checkpoint_id) {
    return std::nullopt;
  }

  std::lock_guard lock(mutex_);
  auto            it = seen_.find(Key(config));
  if (it == seen_.end() || it->second.checkpoint_id != *config.checkpoint_id) {
    return std::nullopt;
  }
  return it->second.versions;
}

void LatestTupleCache::Invalidate(const CheckpointConfig& config) {
  std::lock_guard lock(mutex_);
  InvalidateLocked(Key(config));
}

void LatestTupleCache::InvalidateLocked(const std::string& key) {
  if (slot_.state == SlotState::kEmpty || slot_.key != key) {
    return;
  }
  if (slot_.state == SlotState::kReady) {
    slot_ = Slot{};
    return;
  }
  slot_.stale = true;
}

bool LatestTupleCache::Armed() const {
  std::lock_guard lock(mutex_);
  return slot_.state != SlotState::kEmpty;
}

} // namespace waypoint::checkpoint
