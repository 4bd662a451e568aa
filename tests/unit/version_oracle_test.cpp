#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/channel/last_value.hpp"
#include "internal/channel/untracked_value.hpp"
#include "internal/checkpoint/version_oracle.hpp"
#include "internal/util/errors.hpp"

namespace {

using waypoint::channel::LastValue;
using waypoint::channel::Value;
using waypoint::checkpoint::ContentHash;
using waypoint::checkpoint::NextVersion;
using waypoint::checkpoint::ParseVersion;
using waypoint::checkpoint::VersionGreater;

Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

LastValue Holding(const Value& value) {
  LastValue channel;
  channel.Update({value});
  return channel;
}

void TestFirstVersionStartsAtOne() {
  const auto version = NextVersion(std::nullopt, Holding(Str("a")));
  assert(version.size() == 32 + 1 + 32);
  assert(version.substr(0, 32) == std::string(31, '0') + "1");
  assert(version[32] == '.');
  assert(ParseVersion(version) == 1);
}

void TestCounterIncrements() {
  auto channel = Holding(Str("a"));
  auto v1      = NextVersion(std::nullopt, channel);
  auto v2      = NextVersion(v1, channel);
  assert(ParseVersion(v2) == 2);
  assert(VersionGreater(v2, v1));
  assert(!VersionGreater(v1, v2));
  assert(!VersionGreater(v1, v1));

  // zero padding keeps string order equal to numeric order past one digit
  std::string v = v1;
  for (int i = 0; i < 12; ++i) {
    auto next = NextVersion(v, channel);
    assert(VersionGreater(next, v));
    v = next;
  }
  assert(ParseVersion(v) == 13);
}

void TestHashTracksContent() {
  assert(ContentHash(Holding(Str("a"))) == ContentHash(Holding(Str("a"))));
  assert(ContentHash(Holding(Str("a"))) != ContentHash(Holding(Str("b"))));

  Value forward;
  (*forward.mutable_struct_value()->mutable_fields())["x"] = Str("1");
  (*forward.mutable_struct_value()->mutable_fields())["y"] = Str("2");
  Value backward;
  (*backward.mutable_struct_value()->mutable_fields())["y"] = Str("2");
  (*backward.mutable_struct_value()->mutable_fields())["x"] = Str("1");
  assert(ContentHash(Holding(forward)) == ContentHash(Holding(backward)));
}

void TestEmptyChannelHasEmptyHash() {
  LastValue empty;
  assert(ContentHash(empty).empty());
  const auto version = NextVersion(std::nullopt, empty);
  assert(version == std::string(31, '0') + "1.");

  waypoint::channel::UntrackedValue untracked;
  untracked.Update({Str("never stored")});
  assert(ContentHash(untracked).empty());
}

void TestMalformedVersionsAreRejected() {
  for (const char* bad : {"", ".abc", "12x.abc", "abc"}) {
    bool threw = false;
    try {
      (void)ParseVersion(bad);
    } catch (const waypoint::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
  assert(ParseVersion("7") == 7);
  assert(ParseVersion("00000000000000000000000000000042.deadbeef") == 42);
}

void TestCounterOverflowIsRejected() {
  const std::string largest = "00000000000018446744073709551615";
  assert(ParseVersion(largest + ".abc") == 18446744073709551615ULL);

  for (const std::string bad : {std::string("00000000000018446744073709551616.abc"), std::string(32, '9') + "."}) {
    bool threw = false;
    try {
      (void)ParseVersion(bad);
    } catch (const waypoint::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }

  // incrementing the largest counter must not wrap to a lower version
  bool threw = false;
  try {
    (void)NextVersion(largest + ".abc", Holding(Str("a")));
  } catch (const waypoint::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  const auto below = NextVersion("00000000000018446744073709551614.abc", Holding(Str("a")));
  assert(ParseVersion(below) == 18446744073709551615ULL);
  assert(VersionGreater(below, std::string("00000000000018446744073709551614.abc")));
}

void TestAbsentPreviousIsLowest() {
  assert(VersionGreater(std::string(31, '0') + "1.", std::nullopt));
}

} // namespace

int main() {
  TestFirstVersionStartsAtOne();
  TestCounterIncrements();
  TestHashTracksContent();
  TestEmptyChannelHasEmptyHash();
  TestMalformedVersionsAreRejected();
  TestCounterOverflowIsRejected();
  TestAbsentPreviousIsLowest();

  std::cout << "waypoint_unit_version_oracle: pass\n";
  return 0;
}
