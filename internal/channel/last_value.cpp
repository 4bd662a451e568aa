#include "last_value.hpp"

#include "internal/util/errors.hpp"

namespace waypoint::channel {

bool LastValue::Update(const std::vector<Value>& values) {
  if (values.empty()) {
    return false;
  }
  if (values.size() != 1) {
    throw util::InvalidUpdateError("LastValue can receive only one value per step.");
  }

  value_ = values.back();
  return true;
}

Value LastValue::Get() const {
  if (!value_) {
    throw util::EmptyChannelError();
  }
  return *value_;
}

Value LastValue::Checkpoint() const {
  return Get();
}

bool LastValue::Equals(const BaseChannel& other) const {
  return dynamic_cast<const LastValue*>(&other) != nullptr;
}

void LastValue::Reset() noexcept {
  value_.reset();
}

std::unique_ptr<BaseChannel> LastValue::Hydrate(const std::optional<Value>& checkpoint) const {
  auto channel = std::make_unique<LastValue>();
  if (checkpoint) {
    channel->value_ = *checkpoint;
  }
  return channel;
}

} // namespace waypoint::channel
