#include "untracked_value.hpp"

#include "internal/util/errors.hpp"

namespace waypoint::channel {

UntrackedValue::UntrackedValue(bool guard) : guard_(guard) {
}

bool UntrackedValue::Update(const std::vector<Value>& values) {
  if (values.empty()) {
    return false;
  }
  if (values.size() != 1 && guard_) {
    throw util::InvalidUpdateError("UntrackedValue can only receive one value per step.");
  }

  value_ = values.back();
  return true;
}

Value UntrackedValue::Get() const {
  if (!value_) {
    throw util::EmptyChannelError();
  }
  return *value_;
}

Value UntrackedValue::Checkpoint() const {
  throw util::EmptyChannelError("UntrackedValue is never checkpointed");
}

bool UntrackedValue::Equals(const BaseChannel& other) const {
  const auto* rhs = dynamic_cast<const UntrackedValue*>(&other);
  return rhs != nullptr && rhs->guard_ == guard_;
}

void UntrackedValue::Reset() noexcept {
  value_.reset();
}

std::unique_ptr<BaseChannel> UntrackedValue::Hydrate(const std::optional<Value>&) const {
  // the snapshot is ignored: there never is one for this channel
  return std::make_unique<UntrackedValue>(guard_);
}

} // namespace waypoint::channel
