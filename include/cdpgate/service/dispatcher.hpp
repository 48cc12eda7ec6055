#pragma once

#include "cdpgate/bridge/extension_bridge.hpp"
#include "cdpgate/browser/auth_state.hpp"
#include "cdpgate/browser/context_manager.hpp"
#include "cdpgate/common/json_util.hpp"
#include "cdpgate/common/result.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace cdpgate::service {

using JsonMap = common::JsonRawMap;

struct MethodInfo {
  std::string name;
  std::string description;
};

/// Routes dot-namespaced methods to the browser, the state store or the
/// extension bridge. Results are JSON documents.
class Dispatcher {
public:
  /// `bridge` may be null, in which case extension methods fail with NotConnected.
  Dispatcher(browser::ContextManager &manager, browser::StateStore &store,
             bridge::ExtensionBridge *bridge = nullptr);

  [[nodiscard]] common::Result<std::string> dispatch(const std::string &method,
                                                     const JsonMap &params);

  [[nodiscard]] static const std::vector<MethodInfo> &methods();

private:
  [[nodiscard]] common::Result<std::string> dispatch_browser(const std::string &name,
                                                             const JsonMap &params);
  [[nodiscard]] common::Result<std::string> call_extension(const std::string &name,
                                                           const JsonMap &params);
  [[nodiscard]] common::Result<std::string> handle_health();
  [[nodiscard]] common::Status ensure_started();

  browser::ContextManager &manager_;
  browser::StateStore &store_;
  bridge::ExtensionBridge *bridge_ = nullptr;
  std::mutex dispatch_mutex_;
};

} // namespace cdpgate::service
