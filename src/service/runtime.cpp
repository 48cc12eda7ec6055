#include "cdpgate/service/runtime.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/config/config.hpp"
#include "cdpgate/observability/router.hpp"
#include "cdpgate/observability/global.hpp"

namespace cdpgate::service {

Runtime::Runtime(config::Config config, std::unique_ptr<browser::CDPClient> client)
    : config_(std::move(config)) {
  manager_ = std::make_unique<browser::ContextManager>(config_.browser, config_.sessions,
                                                       std::move(client));
  store_ = std::make_unique<browser::StateStore>(common::expand_path(config_.state.dir));
  if (config_.bridge.enabled) {
    bridge_ = std::make_unique<bridge::ExtensionBridge>(
        bridge::BridgeOptions{
            .host = config_.bridge.host,
            .port = config_.bridge.port,
            .request_timeout = std::chrono::milliseconds(config_.bridge.request_timeout_ms)},
        &loop_);
  }
  dispatcher_ = std::make_unique<Dispatcher>(*manager_, *store_, bridge_.get());
}

Runtime::~Runtime() { stop(); }

common::Result<std::unique_ptr<Runtime>> Runtime::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::propagate(loaded);
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::propagate(validated);
  }
  return common::Result<std::unique_ptr<Runtime>>::success(
      std::make_unique<Runtime>(std::move(loaded.value())));
}

common::Status Runtime::start(const bool prewarm) {
  if (started_) {
    return common::Status::success();
  }
  observability::set_global_observer(observability::create_observer(config_));
  if (auto validated = config::validate_config(config_); validated.ok()) {
    for (const auto &warning : validated.value()) {
      observability::record_error("config", warning);
    }
  }
  loop_.start();

  if (bridge_ != nullptr) {
    auto status = bridge_->start();
    if (!status.ok()) {
      loop_.stop();
      return status;
    }
  }
  if (prewarm) {
    if (auto status = manager_->start(); !status.ok()) {
      observability::record_error("browser", "prewarm failed: " + status.error());
    }
  }
  started_ = true;
  return common::Status::success();
}

void Runtime::stop() {
  if (!started_) {
    return;
  }
  started_ = false;
  if (bridge_ != nullptr) {
    bridge_->stop();
  }
  manager_->stop();
  loop_.stop();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

} // namespace cdpgate::service
