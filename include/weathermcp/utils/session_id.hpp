#ifndef WEATHERMCP_UTILS_SESSION_ID_HPP_
#define WEATHERMCP_UTILS_SESSION_ID_HPP_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace weathermcp {
namespace utils {

/**
 * @brief Generator for session identifiers
 *
 * Identifiers use the textual UUID layout (version 4, RFC 4122 variant). The
 * last group carries a per-generator sequence number, so two identifiers from
 * the same generator never collide; the remaining 74 bits are random.
 */
class SessionIdGenerator {
public:
  SessionIdGenerator();

  /**
   * @brief Produce the next identifier; safe to call from any thread
   */
  std::string next();

private:
  std::mutex mutex_;
  std::mt19937_64 rng_;
  std::uint64_t sequence_ = 0;
};

/**
 * @brief Next identifier from the process-wide generator
 */
std::string generateSessionId();

} // namespace utils
} // namespace weathermcp

#endif // WEATHERMCP_UTILS_SESSION_ID_HPP_
