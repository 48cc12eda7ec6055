#pragma once

#include <string>

namespace cdpgate::common {

/// Package version, injected by the build as CDPGATE_VERSION.
inline std::string version() {
#ifdef CDPGATE_VERSION
  return CDPGATE_VERSION;
#else
  return "0.1.0";
#endif
}

} // namespace cdpgate::common
