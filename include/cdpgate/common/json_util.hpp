#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cdpgate::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal (quotes already stripped).
/// Handles the short escapes and \uXXXX, including surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level key → raw value text. String values keep their quotes, so a value
/// can be handed back to json_as_string() or embedded verbatim in new JSON.
using JsonRawMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonRawMap json_parse_object(const std::string &json);

/// Raw text of each top-level element of a JSON array.
[[nodiscard]] std::vector<std::string> json_split_array(const std::string &array_json);

[[nodiscard]] std::optional<std::string> json_as_string(const std::string &raw);
[[nodiscard]] std::optional<bool> json_as_bool(const std::string &raw);
[[nodiscard]] std::optional<double> json_as_number(const std::string &raw);
[[nodiscard]] std::optional<std::int64_t> json_as_int(const std::string &raw);
[[nodiscard]] bool json_is_null(const std::string &raw);

/// Look up `key` in a raw map and decode it; nullopt when absent or mistyped.
[[nodiscard]] std::optional<std::string> json_string_field(const JsonRawMap &map,
                                                           const std::string &key);
[[nodiscard]] std::optional<bool> json_bool_field(const JsonRawMap &map, const std::string &key);
[[nodiscard]] std::optional<double> json_number_field(const JsonRawMap &map,
                                                      const std::string &key);
[[nodiscard]] std::string json_raw_field(const JsonRawMap &map, const std::string &key,
                                         const std::string &fallback = "null");

/// Decode ["a","b"]; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_string_array(const std::string &array_json);

/// Build {"k":raw,...} from already-encoded values, in the given order.
[[nodiscard]] std::string
json_object(std::initializer_list<std::pair<std::string, std::string>> raw_fields);
[[nodiscard]] std::string
json_object(const std::vector<std::pair<std::string, std::string>> &raw_fields);
[[nodiscard]] std::string json_array(const std::vector<std::string> &raw_items);
[[nodiscard]] std::string json_bool(bool value);

} // namespace cdpgate::common
