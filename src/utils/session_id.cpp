#include "weathermcp/utils/session_id.hpp"

#include <cstdio>

namespace weathermcp {
namespace utils {

SessionIdGenerator::SessionIdGenerator() {
  std::random_device rd;
  std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
  rng_.seed(seed);
}

std::string SessionIdGenerator::next() {
  std::uint64_t high;
  std::uint64_t sequence;
  std::uint16_t clock_seq;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    high = rng_();
    clock_seq = static_cast<std::uint16_t>(rng_());
    sequence = ++sequence_ & 0xFFFFFFFFFFFFULL;
  }

  // time_low, time_mid, version 4 + time_hi, variant 10 + clock_seq, node
  auto time_low = static_cast<unsigned long>(high >> 32);
  auto time_mid = static_cast<unsigned>((high >> 16) & 0xFFFF);
  auto time_hi = static_cast<unsigned>((high & 0x0FFF) | 0x4000);
  auto variant = static_cast<unsigned>((clock_seq & 0x3FFF) | 0x8000);

  char buffer[37];
  std::snprintf(buffer, sizeof(buffer), "%08lx-%04x-%04x-%04x-%012llx",
                time_low, time_mid, time_hi, variant,
                static_cast<unsigned long long>(sequence));
  return buffer;
}

std::string generateSessionId() {
  static SessionIdGenerator generator;
  return generator.next();
}

} // namespace utils
} // namespace weathermcp
