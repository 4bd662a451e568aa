#pragma once

#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "blob_codec.hpp"
#include "types.hpp"

namespace waypoint::checkpoint {

/*
  LatestTupleCache

  Single-flight holder for one prefetched "latest checkpoint" result.

  A prefetch is armed for one (thread_id, checkpoint_ns). While it is in
  flight, every caller asking for that thread's latest tuple joins it and
  receives the same result; once the result has been handed out the slot is
  cleared, so the next caller queries the database again. Callers for any
  other thread, or for a specific checkpoint id that the slot does not hold,
  get kMiss and must query directly.

  Independently it remembers the channel versions of the last checkpoint
  seen per thread, which the saver uses to prune blob writes.
*/
class LatestTupleCache {
 public:
  using Result = std::optional<CheckpointTuple>;

  enum class LookupStatus {
    kMiss,
    kHit,
    kPending,
  };

  struct Lookup {
    LookupStatus        status = LookupStatus::kMiss;
    Result              tuple;
    std::future<Result> pending;
  };

  // Arms the slot. nullopt if a prefetch is already in flight.
  std::optional<uint64_t> Arm(const CheckpointConfig& config);

  void Complete(uint64_t generation, Result tuple);
  void Fail(uint64_t generation, std::exception_ptr error);

  Lookup Claim(const CheckpointConfig& config);

  // A tuple the saver just wrote: becomes the slot's ready result for its thread,
  // unless a newer checkpoint of that thread has been seen.
  void Remember(const CheckpointTuple& tuple);

  // Records versions only, leaving the slot alone.
  void NoteVersions(const CheckpointTuple& tuple);

  // Versions of config.checkpoint_id if it is the last checkpoint seen for the thread.
  std::optional<ChannelVersions> PreviousVersions(const CheckpointConfig& config) const;

  // The thread's cached result no longer reflects the database.
  void Invalidate(const CheckpointConfig& config);

  bool Armed() const;

 private:
  using Waiter = std::shared_ptr<std::promise<Result>>;

  enum class SlotState {
    kEmpty,
    kPending,
    kReady,
  };

  struct Slot {
    SlotState           state = SlotState::kEmpty;
    uint64_t            generation = 0;
    std::string         key;
    bool                stale = false;
    Result              tuple;
    std::vector<Waiter> waiters;
  };

  struct SeenVersions {
    std::string     checkpoint_id;
    ChannelVersions versions;
  };

  static std::string Key(const CheckpointConfig& config);
  void               NoteVersionsLocked(const CheckpointTuple& tuple);
  void               InvalidateLocked(const std::string& key);

  static constexpr std::size_t kMaxRememberedThreads = 4096;

  mutable std::mutex                            mutex_;
  Slot                                          slot_;
  uint64_t                                      next_generation_ = 1;
  std::unordered_map<std::string, SeenVersions> seen_;
};

} // namespace waypoint::checkpoint
