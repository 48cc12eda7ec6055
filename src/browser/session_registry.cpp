#include "cdpgate/browser/session_registry.hpp"

#include <algorithm>

namespace cdpgate::browser {

SessionRegistry::SessionRegistry(std::string default_id) : default_id_(std::move(default_id)) {}

common::Result<Session> SessionRegistry::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return common::Result<Session>::failure(common::ErrorCode::SessionNotFound,
                                            "Session not found: " + id);
  }
  return common::Result<Session>::success(it->second);
}

bool SessionRegistry::contains(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.contains(id);
}

std::vector<std::string> SessionRegistry::ids() const {
  std::vector<std::string> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(sessions_.size());
    for (const auto &[id, session] : sessions_) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t SessionRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<Session> SessionRegistry::drain() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<Session> out;
  out.reserve(sessions_.size());
  for (auto &[id, session] : sessions_) {
    out.push_back(std::move(session));
  }
  sessions_.clear();
  return out;
}

} // namespace cdpgate::browser
