#include "cdpgate/config/config.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/toml.hpp"
#include "cdpgate/observability/router.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace cdpgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cdpgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CDPGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Existing environment wins over .env files.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("CDPGATE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

std::optional<std::uint16_t> parse_port(const char *text) {
  if (text == nullptr || *text == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(text);
  unsigned long parsed = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() ||
      parsed > std::numeric_limits<std::uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(parsed);
}

bool is_loopback_host(const std::string &host) {
  const std::string lowered = common::to_lower(common::trim(host));
  return lowered == "127.0.0.1" || lowered == "localhost" || lowered == "::1" ||
         lowered == "[::1]";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::propagate(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *url = std::getenv("CDPGATE_DEVTOOLS_URL"); url != nullptr && *url) {
    config.browser.devtools_url = url;
  }
  if (const auto port = parse_port(std::getenv("CDPGATE_DEVTOOLS_PORT")); port.has_value()) {
    config.browser.devtools_port = *port;
  }
  if (const auto port = parse_port(std::getenv("CDPGATE_BRIDGE_PORT")); port.has_value()) {
    config.bridge.port = *port;
  }
  if (const char *dir = std::getenv("CDPGATE_STATE_DIR"); dir != nullptr && *dir) {
    config.state.dir = dir;
  }
  if (const char *backend = std::getenv("CDPGATE_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const char *events = std::getenv("CDPGATE_OBSERVABILITY_EVENTS"); events != nullptr) {
    config.observability.events = events;
  }
  config.state.dir = common::expand_path(config.state.dir);
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::propagate(parsed);
  }
  const auto &doc = parsed.value();
  Config config;

  auto &browser = config.browser;
  browser.devtools_url = expand_config_value(doc.get_string("browser.devtools_url"));
  browser.devtools_host =
      expand_config_value(doc.get_string("browser.devtools_host", browser.devtools_host));
  browser.devtools_port = doc.get_u16("browser.devtools_port", browser.devtools_port);
  browser.command_timeout_ms =
      doc.get_u64("browser.command_timeout_ms", browser.command_timeout_ms);
  browser.navigation_settle_ms =
      doc.get_u64("browser.navigation_settle_ms", browser.navigation_settle_ms);

  config.sessions.default_id = doc.get_string("sessions.default_id", config.sessions.default_id);
  config.sessions.auto_create = doc.get_bool("sessions.auto_create", config.sessions.auto_create);

  auto &bridge = config.bridge;
  bridge.enabled = doc.get_bool("bridge.enabled", bridge.enabled);
  bridge.host = expand_config_value(doc.get_string("bridge.host", bridge.host));
  bridge.port = doc.get_u16("bridge.port", bridge.port);
  bridge.request_timeout_ms = doc.get_u64("bridge.request_timeout_ms", bridge.request_timeout_ms);

  config.state.dir = expand_config_value(doc.get_string("state.dir", config.state.dir));
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.events =
      doc.get_string("observability.events", config.observability.events);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::propagate(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.code(), path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Out = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.sessions.default_id).empty()) {
    return Out::failure(common::ErrorCode::InvalidArgument, "sessions.default_id must not be empty");
  }
  if (config.browser.devtools_url.empty() && config.browser.devtools_port == 0) {
    return Out::failure(common::ErrorCode::InvalidArgument,
                        "browser.devtools_port must be non-zero");
  }
  if (!config.browser.devtools_url.empty() &&
      !common::starts_with(config.browser.devtools_url, "ws://")) {
    return Out::failure(common::ErrorCode::InvalidArgument,
                        "browser.devtools_url must be a ws:// URL");
  }
  if (config.browser.command_timeout_ms == 0) {
    return Out::failure(common::ErrorCode::InvalidArgument,
                        "browser.command_timeout_ms must be positive");
  }
  if (config.bridge.enabled && config.bridge.port == 0) {
    return Out::failure(common::ErrorCode::InvalidArgument, "bridge.port must be non-zero");
  }
  if (config.bridge.request_timeout_ms == 0) {
    return Out::failure(common::ErrorCode::InvalidArgument,
                        "bridge.request_timeout_ms must be positive");
  }
  if (config.bridge.enabled && !is_loopback_host(config.bridge.host)) {
    warnings.push_back("bridge.host " + config.bridge.host +
                       " is not loopback; the extension bridge has no authentication");
  }

  if (auto plan = observability::plan_observers(config.observability); !plan.ok()) {
    return Out::propagate(plan);
  }

  return Out::success(std::move(warnings));
}

} // namespace cdpgate::config
