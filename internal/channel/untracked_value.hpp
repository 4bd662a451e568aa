#pragma once

#include "base_channel.hpp"

namespace waypoint::channel {

/*
  Stores the last value received, never checkpointed.

  Participates in a step like any other channel but is excluded from
  durability: Checkpoint() always throws EmptyChannelError.
  With guard set, more than one value in a step is an InvalidUpdateError;
  without it the last value wins.
*/
class UntrackedValue final : public BaseChannel {
 public:
  static constexpr std::string_view kKind = "untracked_value";

  explicit UntrackedValue(bool guard = true);

  std::string_view Kind() const override {
    return kKind;
  }

  bool  Update(const std::vector<Value>& values) override;
  Value Get() const override;
  Value Checkpoint() const override;
  bool  Equals(const BaseChannel& other) const override;
  void  Reset() noexcept override;

  bool guard() const {
    return guard_;
  }

 protected:
  std::unique_ptr<BaseChannel> Hydrate(const std::optional<Value>& checkpoint) const override;

 private:
  bool                 guard_;
  std::optional<Value> value_;
};

} // namespace waypoint::channel
