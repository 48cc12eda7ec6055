#include "cdpgate/browser/input.hpp"

#include "cdpgate/common/fs.hpp"

#include <array>
#include <cctype>

namespace cdpgate::browser {

namespace {

struct NamedKey {
  const char *key;
  const char *code;
  int key_code;
  const char *text;
};

constexpr std::array<NamedKey, 14> kNamedKeys = {{
    {"Enter", "Enter", 13, "\r"},
    {"Tab", "Tab", 9, ""},
    {"Escape", "Escape", 27, ""},
    {"Backspace", "Backspace", 8, ""},
    {"Delete", "Delete", 46, ""},
    {"ArrowUp", "ArrowUp", 38, ""},
    {"ArrowDown", "ArrowDown", 40, ""},
    {"ArrowLeft", "ArrowLeft", 37, ""},
    {"ArrowRight", "ArrowRight", 39, ""},
    {"Home", "Home", 36, ""},
    {"End", "End", 35, ""},
    {"PageUp", "PageUp", 33, ""},
    {"PageDown", "PageDown", 34, ""},
    {"Space", "Space", 32, " "},
}};

} // namespace

KeyDefinition key_definition(const std::string &key) {
  for (const auto &named : kNamedKeys) {
    const bool is_space = named.key_code == 32;
    if (key == named.key || (is_space && key == " ")) {
      // The DOM key value of the space bar is a literal space.
      return KeyDefinition{.key = is_space ? " " : named.key,
                           .code = named.code,
                           .key_code = named.key_code,
                           .text = named.text};
    }
  }

  KeyDefinition def{.key = key};
  if (key.size() == 1 && std::isprint(static_cast<unsigned char>(key[0])) != 0) {
    const char ch = key[0];
    def.text = key;
    if (std::isalpha(static_cast<unsigned char>(ch)) != 0) {
      const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
      def.code = std::string("Key") + upper;
      def.key_code = upper;
    } else if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      def.code = std::string("Digit") + ch;
      def.key_code = ch;
    }
  }
  return def;
}

int modifier_bit(const std::string &name) {
  const std::string lower = common::to_lower(common::trim(name));
  if (lower == "ctrl" || lower == "control") {
    return kModifierCtrl;
  }
  if (lower == "shift") {
    return kModifierShift;
  }
  if (lower == "alt" || lower == "option") {
    return kModifierAlt;
  }
  if (lower == "meta" || lower == "cmd" || lower == "command") {
    return kModifierMeta;
  }
  return 0;
}

int modifier_mask(const std::vector<std::string> &names) {
  int mask = 0;
  for (const auto &name : names) {
    mask |= modifier_bit(name);
  }
  return mask;
}

} // namespace cdpgate::browser
