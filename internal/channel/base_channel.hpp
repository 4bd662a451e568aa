#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace waypoint::channel {

using Value = google::protobuf::Value;

class ScopedChannel;

/*
  A named slot of execution state.

  Update() folds the writes of one step into the channel, Checkpoint()
  produces the durable snapshot. Both Get() and Checkpoint() throw
  util::EmptyChannelError while no value is set; stores treat that as
  "omit this channel", never as a failure.

  Equality compares configuration, not the current value.
*/
class BaseChannel {
 public:
  virtual ~BaseChannel() = default;

  virtual std::string_view Kind() const = 0;

  // Applies the step's updates in emission order. Returns true if the visible value changed.
  virtual bool Update(const std::vector<Value>& values) = 0;

  virtual Value Get() const        = 0;
  virtual Value Checkpoint() const = 0;

  // Fresh instance hydrated from a snapshot, reset when the returned scope ends.
  ScopedChannel FromCheckpoint(const std::optional<Value>& checkpoint) const;

  virtual bool Equals(const BaseChannel& other) const = 0;

  // Drops the step-local value.
  virtual void Reset() noexcept = 0;

 protected:
  virtual std::unique_ptr<BaseChannel> Hydrate(const std::optional<Value>& checkpoint) const = 0;
};

inline bool operator==(const BaseChannel& lhs, const BaseChannel& rhs) {
  return lhs.Equals(rhs);
}

/*
  Owns a channel for the lifetime of one step and resets it on every exit
  path, so a value never leaks into the next step or another thread.
*/
class ScopedChannel {
 public:
  explicit ScopedChannel(std::unique_ptr<BaseChannel> channel) : channel_(std::move(channel)) {
  }

  ~ScopedChannel() {
    if (channel_) channel_->Reset();
  }

  ScopedChannel(const ScopedChannel&)            = delete;
  ScopedChannel& operator=(const ScopedChannel&) = delete;

  ScopedChannel(ScopedChannel&& other) noexcept = default;
  ScopedChannel& operator=(ScopedChannel&& other) noexcept {
    if (this != &other) {
      if (channel_) channel_->Reset();
      channel_ = std::move(other.channel_);
    }
    return *this;
  }

  BaseChannel* get() const {
    return channel_.get();
  }

  BaseChannel* operator->() const {
    return channel_.get();
  }

  BaseChannel& operator*() const {
    return *channel_;
  }

 private:
  std::unique_ptr<BaseChannel> channel_;
};

inline ScopedChannel BaseChannel::FromCheckpoint(const std::optional<Value>& checkpoint) const {
  return ScopedChannel(Hydrate(checkpoint));
}

} // namespace waypoint::channel
