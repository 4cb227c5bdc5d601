#include "weathermcp/session/session_registry.hpp"
#include "weathermcp/session/transport_lifecycle.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/logging.hpp"

namespace weathermcp {
namespace session {

void SessionRegistry::insert(const std::string &session_id,
                             std::shared_ptr<TransportLifecycle> session) {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.emplace(session_id, std::move(session)).second) {
      throw DuplicateSessionException(session_id);
    }
    count = sessions_.size();
  }

  WEATHERMCP_LOG_DEBUG("Registered session " << session_id << " (" << count
                                             << " active)");
}

std::shared_ptr<TransportLifecycle>
SessionRegistry::get(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::remove(const std::string &session_id) {
  // Released outside the lock: the last reference may tear the session down
  std::shared_ptr<TransportLifecycle> removed;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    removed = std::move(it->second);
    sessions_.erase(it);
    count = sessions_.size();
  }

  WEATHERMCP_LOG_INFO("Removed session " << session_id << " (" << count
                                         << " active)");
  return true;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::shared_ptr<TransportLifecycle>>
SessionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<TransportLifecycle>> sessions;
  sessions.reserve(sessions_.size());
  for (const auto &[id, session] : sessions_) {
    sessions.push_back(session);
  }
  return sessions;
}

} // namespace session
} // namespace weathermcp
