#pragma once

#include "cdpgate/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cdpgate::bridge {

/// Outbound frame: {"id","method","params"}. `params` is a raw JSON object.
struct ExtensionRequest {
  std::string id;
  std::string method;
  std::string params = "{}";

  [[nodiscard]] std::string to_json() const;
};

/// Inbound frame: {"id","ok","result"?,"error"?}. `result` keeps its raw JSON.
struct ExtensionResponse {
  std::string id;
  bool ok = false;
  std::optional<std::string> result;
  std::optional<std::string> error;
};

/// Fails for anything that is not an object with a string id.
[[nodiscard]] common::Result<ExtensionResponse> parse_extension_response(const std::string &json);

[[nodiscard]] const std::vector<std::string> &extension_methods();
[[nodiscard]] bool is_extension_method(const std::string &method);

/// ok → result (or null); otherwise ExtensionError "Extension error: <error>".
[[nodiscard]] common::Result<std::string> response_to_value(const ExtensionResponse &response);

/// Random UUID v4, lowercase hex.
[[nodiscard]] std::string generate_request_id();

} // namespace cdpgate::bridge
