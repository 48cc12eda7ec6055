#pragma once

#include "cdpgate/common/result.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cdpgate::browser {

struct Cookie {
  std::string name;
  std::string value;
  std::string domain;
  std::string path = "/";
  /// Seconds since epoch; absent for session cookies.
  std::optional<double> expires;
  bool secure = false;
  bool http_only = false;
  /// "Strict", "Lax" or "None".
  std::optional<std::string> same_site;
};

struct LocalStorageState {
  std::string origin;
  std::map<std::string, std::string> items;
};

struct AuthState {
  std::vector<Cookie> cookies;
  LocalStorageState local_storage;
  std::string saved_at;
};

struct SavedStateSummary {
  std::string name;
  std::vector<std::string> domains;
  std::string saved_at;
};

[[nodiscard]] std::string cookie_to_json(const Cookie &cookie);
[[nodiscard]] Cookie cookie_from_json(const std::string &json);
/// From a Network.getCookies entry; expiry <= 0 or session:true drops `expires`.
[[nodiscard]] Cookie cookie_from_cdp(const std::string &json);
/// Network.CookieParam for Network.setCookies.
[[nodiscard]] std::string cookie_to_cdp(const Cookie &cookie);

[[nodiscard]] std::string local_storage_to_json(const LocalStorageState &state);
[[nodiscard]] LocalStorageState local_storage_from_json(const std::string &json);

[[nodiscard]] std::string auth_state_to_json(const AuthState &state);
[[nodiscard]] common::Result<AuthState> auth_state_from_json(const std::string &json);

/// Distinct cookie domains in first-seen order.
[[nodiscard]] std::vector<std::string> cookie_domains(const std::vector<Cookie> &cookies);

/// Non-empty, [A-Za-z0-9._-] only, no leading dot.
[[nodiscard]] common::Status validate_state_name(const std::string &name);

/// Named AuthState documents stored as <dir>/<name>.json.
class StateStore {
public:
  explicit StateStore(std::filesystem::path dir);

  [[nodiscard]] common::Result<std::filesystem::path> save(const std::string &name,
                                                           const AuthState &state);
  [[nodiscard]] common::Result<AuthState> load(const std::string &name) const;
  /// One summary per document, sorted by name.
  [[nodiscard]] common::Result<std::vector<SavedStateSummary>> list() const;

  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }
  [[nodiscard]] std::filesystem::path path_for(const std::string &name) const;

private:
  std::filesystem::path dir_;
};

} // namespace cdpgate::browser
