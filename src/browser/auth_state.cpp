#include "cdpgate/browser/auth_state.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/json_util.hpp"
#include "cdpgate/health/health.hpp"
#include "cdpgate/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace cdpgate::browser {

namespace {

std::string format_number(const double value) {
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

std::optional<double> positive_expiry(const common::JsonRawMap &fields) {
  const auto expires = common::json_number_field(fields, "expires");
  if (!expires.has_value() || *expires <= 0) {
    return std::nullopt;
  }
  return expires;
}

} // namespace

std::string cookie_to_json(const Cookie &cookie) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"name", common::json_quote(cookie.name)},
      {"value", common::json_quote(cookie.value)},
      {"domain", common::json_quote(cookie.domain)},
      {"path", common::json_quote(cookie.path)},
  };
  if (cookie.expires.has_value()) {
    fields.emplace_back("expires", format_number(*cookie.expires));
  }
  fields.emplace_back("secure", common::json_bool(cookie.secure));
  fields.emplace_back("http_only", common::json_bool(cookie.http_only));
  if (cookie.same_site.has_value()) {
    fields.emplace_back("same_site", common::json_quote(*cookie.same_site));
  }
  return common::json_object(fields);
}

Cookie cookie_from_json(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  Cookie cookie;
  cookie.name = common::json_string_field(fields, "name").value_or("");
  cookie.value = common::json_string_field(fields, "value").value_or("");
  cookie.domain = common::json_string_field(fields, "domain").value_or("");
  cookie.path = common::json_string_field(fields, "path").value_or("/");
  cookie.expires = positive_expiry(fields);
  cookie.secure = common::json_bool_field(fields, "secure").value_or(false);
  cookie.http_only = common::json_bool_field(fields, "http_only").value_or(false);
  cookie.same_site = common::json_string_field(fields, "same_site");
  return cookie;
}

Cookie cookie_from_cdp(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  Cookie cookie;
  cookie.name = common::json_string_field(fields, "name").value_or("");
  cookie.value = common::json_string_field(fields, "value").value_or("");
  cookie.domain = common::json_string_field(fields, "domain").value_or("");
  cookie.path = common::json_string_field(fields, "path").value_or("/");
  if (!common::json_bool_field(fields, "session").value_or(false)) {
    cookie.expires = positive_expiry(fields);
  }
  cookie.secure = common::json_bool_field(fields, "secure").value_or(false);
  cookie.http_only = common::json_bool_field(fields, "httpOnly").value_or(false);
  cookie.same_site = common::json_string_field(fields, "sameSite");
  return cookie;
}

std::string cookie_to_cdp(const Cookie &cookie) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"name", common::json_quote(cookie.name)},
      {"value", common::json_quote(cookie.value)},
      {"domain", common::json_quote(cookie.domain)},
      {"path", common::json_quote(cookie.path)},
      {"secure", common::json_bool(cookie.secure)},
      {"httpOnly", common::json_bool(cookie.http_only)},
  };
  if (cookie.expires.has_value()) {
    fields.emplace_back("expires", format_number(*cookie.expires));
  }
  if (cookie.same_site.has_value()) {
    fields.emplace_back("sameSite", common::json_quote(*cookie.same_site));
  }
  return common::json_object(fields);
}

std::string local_storage_to_json(const LocalStorageState &state) {
  std::vector<std::pair<std::string, std::string>> items;
  items.reserve(state.items.size());
  for (const auto &[key, value] : state.items) {
    items.emplace_back(key, common::json_quote(value));
  }
  return common::json_object(
      {{"origin", common::json_quote(state.origin)}, {"items", common::json_object(items)}});
}

LocalStorageState local_storage_from_json(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  LocalStorageState state;
  state.origin = common::json_string_field(fields, "origin").value_or("");
  for (const auto &[key, raw] : common::json_parse_object(common::json_raw_field(fields, "items", "{}"))) {
    if (const auto value = common::json_as_string(raw); value.has_value()) {
      state.items[key] = *value;
    }
  }
  return state;
}

std::string auth_state_to_json(const AuthState &state) {
  std::vector<std::string> cookies;
  cookies.reserve(state.cookies.size());
  for (const auto &cookie : state.cookies) {
    cookies.push_back(cookie_to_json(cookie));
  }
  return common::json_object({{"cookies", common::json_array(cookies)},
                              {"local_storage", local_storage_to_json(state.local_storage)},
                              {"saved_at", common::json_quote(state.saved_at)}});
}

common::Result<AuthState> auth_state_from_json(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  if (fields.empty()) {
    return common::Result<AuthState>::failure("invalid saved state document");
  }
  AuthState state;
  for (const auto &raw : common::json_split_array(common::json_raw_field(fields, "cookies", "[]"))) {
    state.cookies.push_back(cookie_from_json(raw));
  }
  state.local_storage = local_storage_from_json(common::json_raw_field(fields, "local_storage", "{}"));
  state.saved_at = common::json_string_field(fields, "saved_at").value_or("");
  return common::Result<AuthState>::success(std::move(state));
}

std::vector<std::string> cookie_domains(const std::vector<Cookie> &cookies) {
  std::vector<std::string> domains;
  for (const auto &cookie : cookies) {
    if (std::find(domains.begin(), domains.end(), cookie.domain) == domains.end()) {
      domains.push_back(cookie.domain);
    }
  }
  return domains;
}

common::Status validate_state_name(const std::string &name) {
  if (name.empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "State name is empty");
  }
  if (name.front() == '.') {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "Invalid state name: " + name);
  }
  const bool valid = std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '_' ||
           ch == '-';
  });
  if (!valid) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "Invalid state name: " + name);
  }
  return common::Status::success();
}

StateStore::StateStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path StateStore::path_for(const std::string &name) const {
  return dir_ / (name + ".json");
}

common::Result<std::filesystem::path> StateStore::save(const std::string &name,
                                                       const AuthState &state) {
  if (const auto valid = validate_state_name(name); !valid.ok()) {
    return common::Result<std::filesystem::path>::propagate(valid);
  }
  if (auto dir = common::ensure_dir(dir_); !dir.ok()) {
    health::mark_error(health::Component::StateStore, dir.error());
    return common::Result<std::filesystem::path>::propagate(dir);
  }
  const auto path = path_for(name);
  if (const auto written = common::write_file_atomic(path, auth_state_to_json(state));
      !written.ok()) {
    health::mark_error(health::Component::StateStore, written.error());
    observability::record_error("state_store", written.error());
    return common::Result<std::filesystem::path>::propagate(written);
  }
  health::mark_ok(health::Component::StateStore);
  return common::Result<std::filesystem::path>::success(path);
}

common::Result<AuthState> StateStore::load(const std::string &name) const {
  if (const auto valid = validate_state_name(name); !valid.ok()) {
    return common::Result<AuthState>::propagate(valid);
  }
  const auto path = path_for(name);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<AuthState>::failure(common::ErrorCode::StateNotFound,
                                              "State '" + name + "' not found");
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<AuthState>::propagate(content);
  }
  return auth_state_from_json(content.value());
}

common::Result<std::vector<SavedStateSummary>> StateStore::list() const {
  std::vector<SavedStateSummary> out;
  std::error_code ec;
  if (!std::filesystem::exists(dir_, ec)) {
    return common::Result<std::vector<SavedStateSummary>>::success(std::move(out));
  }
  std::filesystem::directory_iterator it(dir_, ec);
  if (ec) {
    return common::Result<std::vector<SavedStateSummary>>::failure(
        "failed to list " + dir_.string() + ": " + ec.message());
  }
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
      continue;
    }
    SavedStateSummary summary;
    summary.name = entry.path().stem().string();
    if (auto content = common::read_file(entry.path()); content.ok()) {
      if (auto state = auth_state_from_json(content.value()); state.ok()) {
        summary.domains = cookie_domains(state.value().cookies);
        summary.saved_at = state.value().saved_at;
      }
    }
    out.push_back(std::move(summary));
  }
  std::sort(out.begin(), out.end(),
            [](const SavedStateSummary &a, const SavedStateSummary &b) { return a.name < b.name; });
  return common::Result<std::vector<SavedStateSummary>>::success(std::move(out));
}

} // namespace cdpgate::browser
