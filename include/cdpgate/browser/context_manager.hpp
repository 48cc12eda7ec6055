#pragma once

#include "cdpgate/browser/auth_state.hpp"
#include "cdpgate/browser/cdp.hpp"
#include "cdpgate/browser/page.hpp"
#include "cdpgate/browser/session_registry.hpp"
#include "cdpgate/browser/snapshot.hpp"
#include "cdpgate/config/schema.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cdpgate::browser {

/// Optional session id; nullopt means the default session.
using SessionRef = std::optional<std::string>;

struct NavigationResult {
  std::string url;
  std::string title;
};

struct PageSnapshot {
  std::string url;
  std::string title;
  std::vector<AccessibilityNode> nodes;
  std::string strategy;
};

struct ScreenshotResult {
  std::optional<std::string> data;
  std::optional<std::string> path;
  std::int64_t width = 0;
  std::int64_t height = 0;
};

/// Owns the browser connection and the session registry. Each session other
/// than the default one lives in its own browser context.
class ContextManager {
public:
  ContextManager(config::BrowserConfig browser, config::SessionsConfig sessions,
                 std::unique_ptr<CDPClient> client = nullptr);
  ~ContextManager();

  ContextManager(const ContextManager &) = delete;
  ContextManager &operator=(const ContextManager &) = delete;

  /// Connects and registers the default session. Idempotent.
  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_started() const;

  [[nodiscard]] common::Result<std::string> create_session(const std::string &id);
  [[nodiscard]] common::Status close_session(const std::string &id);
  [[nodiscard]] common::Result<Session> resolve(const SessionRef &id);
  [[nodiscard]] common::Result<std::vector<std::string>> list_sessions();

  [[nodiscard]] common::Result<NavigationResult> navigate(const std::string &url,
                                                          const SessionRef &session = {});
  [[nodiscard]] common::Result<PageSnapshot> snapshot(const SessionRef &session = {});
  [[nodiscard]] common::Result<ScreenshotResult>
  screenshot(const std::optional<std::string> &path, const SessionRef &session = {});

  [[nodiscard]] common::Status click(const std::string &selector, const SessionRef &session = {});
  [[nodiscard]] common::Status fill(const std::string &selector, const std::string &value,
                                    const SessionRef &session = {});
  [[nodiscard]] common::Status select(const std::string &selector, const std::string &value,
                                      const SessionRef &session = {});
  [[nodiscard]] common::Status check(const std::string &selector, bool checked,
                                     const SessionRef &session = {});
  [[nodiscard]] common::Status hover(const std::string &selector, const SessionRef &session = {});
  [[nodiscard]] common::Status scroll(const std::optional<std::string> &selector, std::int64_t x,
                                      std::int64_t y, const SessionRef &session = {});
  [[nodiscard]] common::Status press(const std::string &key, const SessionRef &session = {});
  [[nodiscard]] common::Status press_combo(const std::vector<std::string> &modifiers,
                                           const std::string &key,
                                           const SessionRef &session = {});
  /// Returns the absolute path handed to the file input.
  [[nodiscard]] common::Result<std::string> upload(const std::string &selector,
                                                   const std::string &path,
                                                   const SessionRef &session = {});

  [[nodiscard]] common::Result<std::vector<Cookie>> get_cookies(const SessionRef &session = {});
  [[nodiscard]] common::Status set_cookies(const std::vector<Cookie> &cookies,
                                           const SessionRef &session = {});
  [[nodiscard]] common::Result<LocalStorageState>
  get_local_storage(const SessionRef &session = {});
  /// Replaces the storage of `state.origin`, moving the page to that origin
  /// first when it is elsewhere. Yields the number of keys that
  /// failed to write.
  [[nodiscard]] common::Result<std::size_t> set_local_storage(const LocalStorageState &state,
                                                              const SessionRef &session = {});

  /// Browser product string from Browser.getVersion.
  [[nodiscard]] common::Result<std::string> health();

  [[nodiscard]] const SessionRegistry &registry() const { return registry_; }

private:
  [[nodiscard]] common::Result<PageHandle> page_for(const SessionRef &session);
  [[nodiscard]] common::Result<Session> open_page(const std::string &id,
                                                  const std::string &browser_context_id);
  [[nodiscard]] common::Result<std::pair<double, double>>
  element_center(const PageHandle &page, const std::string &selector);
  [[nodiscard]] common::Status mouse_event(const PageHandle &page, const std::string &type,
                                           double x, double y);
  [[nodiscard]] common::Status dispatch_key(const PageHandle &page, const std::string &key,
                                            int modifiers, bool with_text);
  [[nodiscard]] common::Status load_url(const PageHandle &page, const std::string &url);
  void wait_for_load(const PageHandle &page);
  void publish_session_count();

  config::BrowserConfig browser_config_;
  config::SessionsConfig sessions_config_;
  std::unique_ptr<CDPClient> client_;
  SessionRegistry registry_;
  SnapshotExtractor extractor_;

  mutable std::mutex lifecycle_mutex_;
  bool started_ = false;
};

} // namespace cdpgate::browser
