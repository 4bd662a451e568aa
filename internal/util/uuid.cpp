#include "uuid.hpp"

#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

#include "time.hpp"

namespace waypoint::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(Rng()());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

UUID GenerateTimeOrderedUUID() {
  static std::mutex mutex;
  static uint64_t   last_ms  = 0;
  static uint16_t   sequence = 0;

  uint64_t ms = ToUnixMillis(Now());
  uint16_t seq;
  {
    std::lock_guard lock(mutex);
    if (ms <= last_ms) {
      // same millisecond (or clock went backwards): keep counting on the last one
      ms = last_ms;
      if (++sequence > 0x0FFF) {
        ++ms;
        sequence = 0;
      }
    } else {
      sequence = 0;
    }
    last_ms = ms;
    seq     = sequence;
  }

  UUID id = GenerateUUID();
  for (int i = 0; i < 6; ++i)
    id[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));

  // 12 bit sequence in rand_a keeps ids ordered inside one millisecond
  id[6] = static_cast<uint8_t>(0x70 | ((seq >> 8) & 0x0F));
  id[7] = static_cast<uint8_t>(seq & 0xFF);
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  UUID id{};
  std::string hex;

  for (char c : str)
    if (c != '-') hex += c;

  if (hex.size() != 32)
    throw std::runtime_error("Invalid UUID string");

  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>(std::stoul(hex.substr(i*2,2), nullptr, 16));

  return id;
}

uint64_t TimestampMillis(const UUID& id) {
  uint64_t ms = 0;
  for (int i = 0; i < 6; ++i)
    ms = (ms << 8) | id[i];
  return ms;
}

} // namespace waypoint::util
