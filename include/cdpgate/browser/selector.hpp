#pragma once

#include <string>

namespace cdpgate::browser {

/// Attribute stamped on elements that received a snapshot ref.
inline constexpr const char *kRefAttribute = "data-cdpgate-ref";

/// True for "@eN"-style snapshot references.
[[nodiscard]] bool is_reference(const std::string &selector);

/// "@e3" becomes [data-cdpgate-ref='e3']; any other selector is returned unchanged.
[[nodiscard]] std::string resolve_selector(const std::string &selector);

} // namespace cdpgate::browser
