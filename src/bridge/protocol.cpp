#include "cdpgate/bridge/protocol.hpp"

#include "cdpgate/common/json_util.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <random>

#include <openssl/rand.h>

namespace cdpgate::bridge {

std::string ExtensionRequest::to_json() const {
  return common::json_object({{"id", common::json_quote(id)},
                              {"method", common::json_quote(method)},
                              {"params", params.empty() ? "{}" : params}});
}

common::Result<ExtensionResponse> parse_extension_response(const std::string &json) {
  const auto fields = common::json_parse_object(json);
  const auto id = common::json_string_field(fields, "id");
  if (!id.has_value()) {
    return common::Result<ExtensionResponse>::failure("extension response without id");
  }
  ExtensionResponse response;
  response.id = *id;
  response.ok = common::json_bool_field(fields, "ok").value_or(false);
  if (const auto it = fields.find("result"); it != fields.end()) {
    response.result = it->second;
  }
  response.error = common::json_string_field(fields, "error");
  return common::Result<ExtensionResponse>::success(std::move(response));
}

const std::vector<std::string> &extension_methods() {
  static const std::vector<std::string> methods = {
      "tabs.group",       "tabs.ungroup",   "tabGroups.update",     "tabGroups.query",
      "tabGroups.collapse", "cookies.get",  "cookies.getAll",       "cookies.set",
      "notifications.create", "storage.get", "storage.set",
  };
  return methods;
}

bool is_extension_method(const std::string &method) {
  const auto &methods = extension_methods();
  return std::find(methods.begin(), methods.end(), method) != methods.end();
}

common::Result<std::string> response_to_value(const ExtensionResponse &response) {
  if (response.ok) {
    return common::Result<std::string>::success(response.result.value_or("null"));
  }
  return common::Result<std::string>::failure(
      common::ErrorCode::ExtensionError,
      "Extension error: " + response.error.value_or("Unknown error"));
}

std::string generate_request_id() {
  std::array<std::uint8_t, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    std::random_device rd;
    for (auto &byte : bytes) {
      byte = static_cast<std::uint8_t>(rd() & 0xFF);
    }
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3Fu) | 0x80u);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[bytes[i] >> 4u]);
    out.push_back(kHex[bytes[i] & 0x0Fu]);
  }
  return out;
}

} // namespace cdpgate::bridge
