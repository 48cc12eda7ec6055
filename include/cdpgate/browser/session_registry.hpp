#pragma once

#include "cdpgate/common/result.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cdpgate::browser {

struct Session {
  std::string id;
  /// Empty for the default session, which lives in the browser's default context.
  std::string browser_context_id;
  std::string target_id;
  /// Flat-mode CDP session attached to target_id.
  std::string cdp_session_id;
};

using SessionMap = std::unordered_map<std::string, Session>;

/// Session records keyed by id. Lookups take the lock shared; modify() runs a
/// whole create or close sequence under the exclusive lock.
class SessionRegistry {
public:
  explicit SessionRegistry(std::string default_id = "default");

  [[nodiscard]] const std::string &default_id() const { return default_id_; }
  [[nodiscard]] bool is_default(const std::string &id) const { return id == default_id_; }

  [[nodiscard]] common::Result<Session> get(const std::string &id) const;
  [[nodiscard]] bool contains(const std::string &id) const;
  /// Sorted ids.
  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<Session> drain();

  template <typename Fn> decltype(auto) modify(Fn &&fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return fn(sessions_);
  }

private:
  std::string default_id_;
  mutable std::shared_mutex mutex_;
  SessionMap sessions_;
};

} // namespace cdpgate::browser
