#pragma once

#include <string>
#include <vector>

namespace cdpgate::browser {

inline constexpr int kModifierCtrl = 1;
inline constexpr int kModifierShift = 2;
inline constexpr int kModifierAlt = 4;
inline constexpr int kModifierMeta = 8;

/// Fields for Input.dispatchKeyEvent. `code` and `key_code` are empty/0 for
/// keys without a fixed layout position.
struct KeyDefinition {
  std::string key;
  std::string code;
  int key_code = 0;
  std::string text;
};

[[nodiscard]] KeyDefinition key_definition(const std::string &key);

/// Bit for one modifier name (case-insensitive), 0 when unknown.
[[nodiscard]] int modifier_bit(const std::string &name);
[[nodiscard]] int modifier_mask(const std::vector<std::string> &names);

} // namespace cdpgate::browser
