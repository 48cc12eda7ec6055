#include "cdpgate/browser/selector.hpp"

namespace cdpgate::browser {

bool is_reference(const std::string &selector) { return selector.starts_with('@'); }

std::string resolve_selector(const std::string &selector) {
  if (!is_reference(selector)) {
    return selector;
  }
  return std::string("[") + kRefAttribute + "='" + selector.substr(1) + "']";
}

} // namespace cdpgate::browser
