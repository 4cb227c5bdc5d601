#ifndef WEATHERMCP_SESSION_SESSION_REGISTRY_HPP_
#define WEATHERMCP_SESSION_SESSION_REGISTRY_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace weathermcp {
namespace session {

class TransportLifecycle;

/**
 * @brief Map from session id to the live session bound to it
 *
 * The registry is the only mutable state shared between sessions. Each
 * operation is atomic with respect to the others. It holds exactly the
 * sessions that are Active: an entry is inserted when a session is assigned
 * its id and removed when its transport reports closure.
 */
class SessionRegistry {
public:
  SessionRegistry() = default;

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  /**
   * @brief Bind a session id
   *
   * @param session_id The id
   * @param session The session
   * @throws DuplicateSessionException if the id is already bound
   */
  void insert(const std::string &session_id,
              std::shared_ptr<TransportLifecycle> session);

  /**
   * @brief Look a session up
   *
   * @return std::shared_ptr<TransportLifecycle> The session, or nullptr
   */
  std::shared_ptr<TransportLifecycle> get(const std::string &session_id) const;

  /**
   * @brief Unbind a session id; removing an unknown id is a no-op
   *
   * @return true if an entry was removed
   */
  bool remove(const std::string &session_id);

  std::size_t size() const;

  /**
   * @brief All sessions bound at the time of the call
   */
  std::vector<std::shared_ptr<TransportLifecycle>> snapshot() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<TransportLifecycle>>
      sessions_;
};

} // namespace session
} // namespace weathermcp

#endif // WEATHERMCP_SESSION_SESSION_REGISTRY_HPP_
