#pragma once

#include <cstdint>
#include <string>

namespace cdpgate::config {

struct BrowserConfig {
  /// Explicit browser websocket URL; when empty it is discovered over HTTP.
  std::string devtools_url;
  std::string devtools_host = "127.0.0.1";
  std::uint16_t devtools_port = 9222;
  std::uint64_t command_timeout_ms = 30'000;
  std::uint64_t navigation_settle_ms = 5'000;
};

struct SessionsConfig {
  std::string default_id = "default";
  bool auto_create = false;
};

struct BridgeConfig {
  bool enabled = true;
  std::string host = "127.0.0.1";
  std::uint16_t port = 9223;
  std::uint64_t request_timeout_ms = 30'000;
};

struct StateConfig {
  std::string dir = "~/.cdpgate/auth";
};

struct ObservabilityConfig {
  std::string backend = "log";
  /// Comma list of event kinds handed to the backends; empty means all.
  std::string events;
};

struct Config {
  BrowserConfig browser;
  SessionsConfig sessions;
  BridgeConfig bridge;
  StateConfig state;
  ObservabilityConfig observability;
};

} // namespace cdpgate::config
