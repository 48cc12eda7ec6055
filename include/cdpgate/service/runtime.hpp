#pragma once

#include "cdpgate/bridge/extension_bridge.hpp"
#include "cdpgate/browser/auth_state.hpp"
#include "cdpgate/browser/context_manager.hpp"
#include "cdpgate/common/event_loop.hpp"
#include "cdpgate/common/result.hpp"
#include "cdpgate/config/schema.hpp"
#include "cdpgate/service/dispatcher.hpp"

#include <memory>

namespace cdpgate::service {

/// Everything one gateway process owns, wired from a Config.
class Runtime {
public:
  explicit Runtime(config::Config config, std::unique_ptr<browser::CDPClient> client = nullptr);
  ~Runtime();

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] static common::Result<std::unique_ptr<Runtime>> from_disk();

  /// Installs the observer, starts the event loop and the bridge. With
  /// `prewarm` the browser connection is opened now instead of on first use;
  /// a prewarm failure is logged and retried lazily.
  [[nodiscard]] common::Status start(bool prewarm);
  void stop();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] Dispatcher &dispatcher() { return *dispatcher_; }
  [[nodiscard]] browser::ContextManager &manager() { return *manager_; }
  [[nodiscard]] bridge::ExtensionBridge *bridge() { return bridge_.get(); }

private:
  config::Config config_;
  common::EventLoop loop_;
  std::unique_ptr<browser::ContextManager> manager_;
  std::unique_ptr<browser::StateStore> store_;
  std::unique_ptr<bridge::ExtensionBridge> bridge_;
  std::unique_ptr<Dispatcher> dispatcher_;
  bool started_ = false;
};

} // namespace cdpgate::service
