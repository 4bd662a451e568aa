#pragma once

#include "base_channel.hpp"

namespace waypoint::channel {

// Stores the last value received; at most one value per step.
class LastValue final : public BaseChannel {
 public:
  static constexpr std::string_view kKind = "last_value";

  std::string_view Kind() const override {
    return kKind;
  }

  bool  Update(const std::vector<Value>& values) override;
  Value Get() const override;
  Value Checkpoint() const override;
  bool  Equals(const BaseChannel& other) const override;
  void  Reset() noexcept override;

 protected:
  std::unique_ptr<BaseChannel> Hydrate(const std::optional<Value>& checkpoint) const override;

 private:
  std::optional<Value> value_;
};

} // namespace waypoint::channel
