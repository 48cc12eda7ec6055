#include "cdpgate/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <sstream>

namespace cdpgate::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80u) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6u)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4u;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

bool is_value_terminator(const char ch) {
  return ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// End (exclusive) of the value starting at pos, or npos on malformed input.
std::size_t scan_value_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const char close = (ch == '{') ? '}' : ']';
    const auto end = json_find_matching_token(json, pos, ch, close);
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && !is_value_terminator(json[end])) {
    ++end;
  }
  return end > pos ? end : std::string::npos;
}

std::string trimmed(const std::string &raw) {
  const auto first = json_skip_ws(raw, 0);
  auto last = raw.size();
  while (last > first && std::isspace(static_cast<unsigned char>(raw[last - 1])) != 0) {
    --last;
  }
  return raw.substr(first, last - first);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20u) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800u && cp <= 0xDBFFu && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00u && low <= 0xDFFFu) {
          cp = 0x10000u + ((cp - 0xD800u) << 10u) + (low - 0xDC00u);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

JsonRawMap json_parse_object(const std::string &json) {
  JsonRawMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto value_end = scan_value_end(json, pos);
    if (value_end == std::string::npos) {
      break;
    }
    result[key] = json.substr(pos, value_end - pos);
    pos = value_end;
  }
  return result;
}

std::vector<std::string> json_split_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = scan_value_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::optional<std::string> json_as_string(const std::string &raw) {
  const std::string value = trimmed(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return std::nullopt;
  }
  return json_unescape(value.substr(1, value.size() - 2));
}

std::optional<bool> json_as_bool(const std::string &raw) {
  const std::string value = trimmed(raw);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<double> json_as_number(const std::string &raw) {
  const std::string value = trimmed(raw);
  if (value.empty() || value.front() == '"') {
    return std::nullopt;
  }
  std::istringstream stream(value);
  double parsed = 0.0;
  stream >> parsed;
  if (stream.fail() || !stream.eof()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::int64_t> json_as_int(const std::string &raw) {
  const std::string value = trimmed(raw);
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec == std::errc() && ptr == last) {
    return parsed;
  }
  if (const auto number = json_as_number(value); number.has_value()) {
    return static_cast<std::int64_t>(*number);
  }
  return std::nullopt;
}

bool json_is_null(const std::string &raw) { return trimmed(raw) == "null"; }

std::optional<std::string> json_string_field(const JsonRawMap &map, const std::string &key) {
  const auto it = map.find(key);
  if (it == map.end()) {
    return std::nullopt;
  }
  return json_as_string(it->second);
}

std::optional<bool> json_bool_field(const JsonRawMap &map, const std::string &key) {
  const auto it = map.find(key);
  if (it == map.end()) {
    return std::nullopt;
  }
  return json_as_bool(it->second);
}

std::optional<double> json_number_field(const JsonRawMap &map, const std::string &key) {
  const auto it = map.find(key);
  if (it == map.end()) {
    return std::nullopt;
  }
  return json_as_number(it->second);
}

std::string json_raw_field(const JsonRawMap &map, const std::string &key,
                           const std::string &fallback) {
  const auto it = map.find(key);
  return it == map.end() ? fallback : it->second;
}

std::vector<std::string> json_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  for (const auto &item : json_split_array(array_json)) {
    if (auto value = json_as_string(item); value.has_value()) {
      out.push_back(std::move(*value));
    }
  }
  return out;
}

std::string json_object(std::initializer_list<std::pair<std::string, std::string>> raw_fields) {
  return json_object(std::vector<std::pair<std::string, std::string>>(raw_fields));
}

std::string json_object(const std::vector<std::pair<std::string, std::string>> &raw_fields) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, raw] : raw_fields) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << json_quote(key) << ":" << (raw.empty() ? "null" : raw);
  }
  out << "}";
  return out.str();
}

std::string json_array(const std::vector<std::string> &raw_items) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < raw_items.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << (raw_items[i].empty() ? "null" : raw_items[i]);
  }
  out << "]";
  return out.str();
}

std::string json_bool(const bool value) { return value ? "true" : "false"; }

} // namespace cdpgate::common
