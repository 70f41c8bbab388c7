#include "uuid.hpp"

#include <cstdint>
#include <random>

namespace autopilot::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::mt19937_64& Engine() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

} // namespace

std::string NewId() {
  auto&          engine = Engine();
  const uint64_t hi     = (engine() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  const uint64_t lo     = (engine() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::string id;
  id.reserve(36);
  for (int nibble = 0; nibble < 32; ++nibble) {
    if (nibble == 8 || nibble == 12 || nibble == 16 || nibble == 20) {
      id.push_back('-');
    }
    const uint64_t word  = nibble < 16 ? hi : lo;
    const int      shift = 60 - 4 * (nibble % 16);
    id.push_back(kHex[(word >> shift) & 0xF]);
  }
  return id;
}

} // namespace autopilot::util
