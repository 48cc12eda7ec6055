#pragma once

#include "cdpgate/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace cdpgate::common {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

/// Plain GET via libcurl. Network failures are reported in the response, not as errors.
[[nodiscard]] HttpResponse http_get(const std::string &url, std::uint64_t timeout_ms);

/// Ask a DevTools HTTP endpoint for the browser-level websocket URL
/// (`webSocketDebuggerUrl` of /json/version).
[[nodiscard]] Result<std::string> discover_browser_ws_url(const std::string &host,
                                                          std::uint16_t port,
                                                          std::uint64_t timeout_ms);

} // namespace cdpgate::common
