#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/util/digest.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace waypoint::util;

void TestDigests() {
  assert(Md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
  assert(Md5Hex("abc") == "900150983cd24fb0d6963f7d28e17f72");

  assert(Base64Encode("hello") == "aGVsbG8=");
  assert(Base64Encode("") == "");
  assert(Base64Decode("aGVsbG8=") == "hello");
  assert(Base64Decode("aGVs\nbG8=") == "hello");
  assert(Base64Decode("") == "");

  const std::string binary("\x00\x80\xff.", 4);
  assert(Base64Decode(Base64Encode(binary)) == binary);
}

void TestTimeOrderedIdsSortInCreationOrder() {
  std::vector<std::string> ids;
  for (int i = 0; i < 2000; ++i) {
    ids.push_back(ToString(GenerateTimeOrderedUUID()));
  }
  for (std::size_t i = 1; i < ids.size(); ++i) {
    assert(ids[i - 1] < ids[i]);
  }

  const auto& id = ids.front();
  assert(id.size() == 36);
  assert(id[14] == '7');
  assert(FromString(id) == FromString(ToString(FromString(id))));
}

void TestTimestampIsEncoded() {
  const auto before = ToUnixMillis(Now());
  const auto id     = GenerateTimeOrderedUUID();
  const auto after  = ToUnixMillis(Now());

  const auto ms = TimestampMillis(id);
  // the sequence may roll into the next millisecond under load
  assert(ms >= before && ms <= after + 1);
}

void TestRandomIdsAreUnique() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    auto id = ToString(GenerateUUID());
    assert(id[14] == '4');
    assert(seen.insert(id).second);
  }
}

} // namespace

int main() {
  TestDigests();
  TestTimeOrderedIdsSortInCreationOrder();
  TestTimestampIsEncoded();
  TestRandomIdsAreUnique();

  std::cout << "waypoint_unit_util: pass\n";
  return 0;
}
