#include "cdpgate/browser/context_manager.hpp"

#include "cdpgate/browser/input.hpp"
#include "cdpgate/browser/selector.hpp"
#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/http.hpp"
#include "cdpgate/health/health.hpp"
#include "cdpgate/observability/global.hpp"

#include <algorithm>
#include <thread>

#include <openssl/evp.h>

namespace cdpgate::browser {

namespace {

constexpr auto kLoadPollInterval = std::chrono::milliseconds(100);

common::Result<std::string> decode_base64(const std::string &encoded) {
  if (encoded.size() % 4 != 0) {
    return common::Result<std::string>::failure("invalid base64 length");
  }
  std::string out(encoded.size() / 4 * 3, '\0');
  const int written =
      EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                      reinterpret_cast<const unsigned char *>(encoded.data()),
                      static_cast<int>(encoded.size()));
  if (written < 0) {
    return common::Result<std::string>::failure("invalid base64 data");
  }
  std::size_t padding = 0;
  for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '=' && padding < 2; ++it) {
    ++padding;
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return common::Result<std::string>::success(std::move(out));
}

std::string number_text(const double value) {
  return std::to_string(value);
}

} // namespace

ContextManager::ContextManager(config::BrowserConfig browser, config::SessionsConfig sessions,
                               std::unique_ptr<CDPClient> client)
    : browser_config_(std::move(browser)), sessions_config_(std::move(sessions)),
      client_(client != nullptr ? std::move(client) : std::make_unique<CDPClient>()),
      registry_(sessions_config_.default_id) {
  client_->set_default_timeout(std::chrono::milliseconds(browser_config_.command_timeout_ms));
}

ContextManager::~ContextManager() { stop(); }

common::Status ContextManager::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_) {
    return common::Status::success();
  }
  health::mark_starting(health::Component::Browser);

  std::string ws_url = browser_config_.devtools_url;
  if (ws_url.empty()) {
    auto discovered = common::discover_browser_ws_url(
        browser_config_.devtools_host, browser_config_.devtools_port,
        std::min<std::uint64_t>(browser_config_.command_timeout_ms, 10'000));
    if (!discovered.ok()) {
      health::mark_error(health::Component::Browser, discovered.error());
      observability::record_error("browser", discovered.error());
      return common::Status::error(discovered.code(), discovered.error());
    }
    ws_url = discovered.value();
  }

  if (const auto connected = client_->connect(ws_url); !connected.ok()) {
    health::mark_error(health::Component::Browser, connected.error());
    observability::record_error("browser", connected.error());
    return connected;
  }

  auto page = open_page(registry_.default_id(), "");
  if (!page.ok()) {
    client_->disconnect();
    health::mark_error(health::Component::Browser, page.error());
    observability::record_error("browser", page.error());
    return common::Status::error(page.code(), page.error());
  }
  registry_.modify([&page](SessionMap &sessions) {
    sessions[page.value().id] = page.value();
  });
  started_ = true;
  health::mark_ok(health::Component::Browser);
  observability::record_session(registry_.default_id(), "created");
  publish_session_count();
  return common::Status::success();
}

void ContextManager::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!started_) {
    return;
  }
  for (const auto &session : registry_.drain()) {
    if (session.browser_context_id.empty()) {
      continue;
    }
    auto disposed = client_->send_command("Target.disposeBrowserContext",
                                          {{"browserContextId",
                                            common::json_quote(session.browser_context_id)}});
    if (!disposed.ok()) {
      observability::record_error("browser", "dispose " + session.id + ": " + disposed.error());
    }
  }
  client_->disconnect();
  started_ = false;
  health::reset(health::Component::Browser);
  publish_session_count();
}

bool ContextManager::is_started() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return started_;
}

common::Result<Session> ContextManager::open_page(const std::string &id,
                                                  const std::string &browser_context_id) {
  JsonMap params = {{"url", common::json_quote("about:blank")}};
  if (!browser_context_id.empty()) {
    params["browserContextId"] = common::json_quote(browser_context_id);
  }
  auto target = client_->send_command("Target.createTarget", params);
  if (!target.ok()) {
    return common::Result<Session>::propagate(target);
  }
  const auto target_id = common::json_string_field(target.value(), "targetId");
  if (!target_id.has_value()) {
    return common::Result<Session>::failure("Target.createTarget returned no targetId");
  }

  auto attached = client_->send_command(
      "Target.attachToTarget", {{"targetId", common::json_quote(*target_id)}, {"flatten", "true"}});
  if (!attached.ok()) {
    return common::Result<Session>::propagate(attached);
  }
  const auto cdp_session = common::json_string_field(attached.value(), "sessionId");
  if (!cdp_session.has_value()) {
    return common::Result<Session>::failure("Target.attachToTarget returned no sessionId");
  }

  return common::Result<Session>::success(Session{.id = id,
                                                  .browser_context_id = browser_context_id,
                                                  .target_id = *target_id,
                                                  .cdp_session_id = *cdp_session});
}

common::Result<std::string> ContextManager::create_session(const std::string &id) {
  if (common::trim(id).empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "Session id is empty");
  }
  if (const auto started = start(); !started.ok()) {
    return common::Result<std::string>::propagate(started);
  }

  auto created = registry_.modify([&](SessionMap &sessions) -> common::Result<std::string> {
    if (sessions.contains(id)) {
      return common::Result<std::string>::success(id);
    }

    auto context = client_->send_command("Target.createBrowserContext");
    if (!context.ok()) {
      return common::Result<std::string>::failure(
          common::ErrorCode::ContextCreation,
          "Failed to create browser context: " + context.error());
    }
    const auto context_id = common::json_string_field(context.value(), "browserContextId");
    if (!context_id.has_value()) {
      return common::Result<std::string>::failure(
          common::ErrorCode::ContextCreation,
          "Failed to create browser context: no browserContextId");
    }

    auto page = open_page(id, *context_id);
    if (!page.ok()) {
      auto disposed = client_->send_command("Target.disposeBrowserContext",
                                            {{"browserContextId", common::json_quote(*context_id)}});
      if (!disposed.ok()) {
        observability::record_error("browser", "dispose after failed create: " + disposed.error());
      }
      return common::Result<std::string>::propagate(page);
    }
    sessions[id] = page.value();
    observability::record_session(id, "created");
    return common::Result<std::string>::success(id);
  });
  publish_session_count();
  return created;
}

common::Status ContextManager::close_session(const std::string &id) {
  if (registry_.is_default(id)) {
    return common::Status::error(common::ErrorCode::ProtectedSession,
                                 "Cannot close default session");
  }
  if (!is_started()) {
    return common::Status::success();
  }

  auto closed = registry_.modify([&](SessionMap &sessions) -> common::Status {
    const auto it = sessions.find(id);
    if (it == sessions.end()) {
      return common::Status::success();
    }
    if (!it->second.browser_context_id.empty()) {
      auto disposed = client_->send_command(
          "Target.disposeBrowserContext",
          {{"browserContextId", common::json_quote(it->second.browser_context_id)}});
      if (!disposed.ok()) {
        return common::Status::error(disposed.code(), disposed.error());
      }
    }
    sessions.erase(it);
    observability::record_session(id, "closed");
    return common::Status::success();
  });
  publish_session_count();
  return closed;
}

common::Result<Session> ContextManager::resolve(const SessionRef &id) {
  if (const auto started = start(); !started.ok()) {
    return common::Result<Session>::propagate(started);
  }
  const std::string key = id.value_or(registry_.default_id());
  auto session = registry_.get(key);
  if (session.ok() || !sessions_config_.auto_create ||
      session.code() != common::ErrorCode::SessionNotFound) {
    return session;
  }
  if (auto created = create_session(key); !created.ok()) {
    return common::Result<Session>::propagate(created);
  }
  return registry_.get(key);
}

common::Result<std::vector<std::string>> ContextManager::list_sessions() {
  if (const auto started = start(); !started.ok()) {
    return common::Result<std::vector<std::string>>::propagate(started);
  }
  return common::Result<std::vector<std::string>>::success(registry_.ids());
}

common::Result<PageHandle> ContextManager::page_for(const SessionRef &session) {
  auto resolved = resolve(session);
  if (!resolved.ok()) {
    return common::Result<PageHandle>::propagate(resolved);
  }
  return common::Result<PageHandle>::success(
      PageHandle(*client_, resolved.value().cdp_session_id, resolved.value().target_id));
}

void ContextManager::wait_for_load(const PageHandle &page) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(browser_config_.navigation_settle_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    auto state = page.evaluate("document.readyState");
    if (state.ok() && common::json_as_string(state.value()) == "complete") {
      return;
    }
    std::this_thread::sleep_for(kLoadPollInterval);
  }
}

common::Status ContextManager::load_url(const PageHandle &page, const std::string &url) {
  auto navigated = page.send("Page.navigate", {{"url", common::json_quote(url)}});
  if (!navigated.ok()) {
    return common::Status::error(navigated.code(), navigated.error());
  }
  if (const auto error_text = common::json_string_field(navigated.value(), "errorText");
      error_text.has_value() && !error_text->empty()) {
    return common::Status::error("Navigation failed: " + *error_text);
  }
  wait_for_load(page);
  return common::Status::success();
}

common::Result<NavigationResult> ContextManager::navigate(const std::string &url,
                                                          const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<NavigationResult>::propagate(page);
  }
  if (const auto loaded = load_url(page.value(), url); !loaded.ok()) {
    return common::Result<NavigationResult>::failure(loaded.code(), loaded.error());
  }
  return common::Result<NavigationResult>::success(
      NavigationResult{.url = page.value().url(), .title = page.value().title()});
}

common::Result<PageSnapshot> ContextManager::snapshot(const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<PageSnapshot>::propagate(page);
  }
  auto outcome = extractor_.extract(page.value());
  return common::Result<PageSnapshot>::success(PageSnapshot{.url = page.value().url(),
                                                            .title = page.value().title(),
                                                            .nodes = std::move(outcome.nodes),
                                                            .strategy = outcome.strategy});
}

common::Result<ScreenshotResult> ContextManager::screenshot(const std::optional<std::string> &path,
                                                            const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<ScreenshotResult>::propagate(page);
  }
  auto captured = page.value().send(
      "Page.captureScreenshot",
      {{"format", common::json_quote("png")}, {"captureBeyondViewport", "true"}});
  if (!captured.ok()) {
    return common::Result<ScreenshotResult>::propagate(captured);
  }
  const auto data = common::json_string_field(captured.value(), "data");
  if (!data.has_value()) {
    return common::Result<ScreenshotResult>::failure("screenshot data missing");
  }

  ScreenshotResult result;
  if (auto metrics = page.value().send("Page.getLayoutMetrics"); metrics.ok()) {
    std::string size = common::json_raw_field(metrics.value(), "cssContentSize", "");
    if (size.empty()) {
      size = common::json_raw_field(metrics.value(), "contentSize", "{}");
    }
    const auto fields = common::json_parse_object(size);
    result.width = static_cast<std::int64_t>(common::json_number_field(fields, "width").value_or(0));
    result.height =
        static_cast<std::int64_t>(common::json_number_field(fields, "height").value_or(0));
  }

  if (!path.has_value()) {
    result.data = *data;
    return common::Result<ScreenshotResult>::success(std::move(result));
  }
  auto bytes = decode_base64(*data);
  if (!bytes.ok()) {
    return common::Result<ScreenshotResult>::propagate(bytes);
  }
  const auto target = common::absolute_from_cwd(*path);
  if (const auto written = common::write_file_atomic(target, bytes.value()); !written.ok()) {
    return common::Result<ScreenshotResult>::propagate(written);
  }
  result.path = target.string();
  return common::Result<ScreenshotResult>::success(std::move(result));
}

common::Result<std::pair<double, double>>
ContextManager::element_center(const PageHandle &page, const std::string &selector) {
  auto center = page.evaluate_on_element(
      resolve_selector(selector),
      "el.scrollIntoView({block: 'center', inline: 'center'}); "
      "const r = el.getBoundingClientRect(); "
      "return {x: r.left + r.width / 2, y: r.top + r.height / 2};",
      selector);
  if (!center.ok()) {
    return common::Result<std::pair<double, double>>::propagate(center);
  }
  const auto fields = common::json_parse_object(center.value());
  return common::Result<std::pair<double, double>>::success(
      {common::json_number_field(fields, "x").value_or(0),
       common::json_number_field(fields, "y").value_or(0)});
}

common::Status ContextManager::mouse_event(const PageHandle &page, const std::string &type,
                                           const double x, const double y) {
  JsonMap params = {{"type", common::json_quote(type)},
                    {"x", number_text(x)},
                    {"y", number_text(y)}};
  if (type != "mouseMoved") {
    params["button"] = common::json_quote("left");
    params["clickCount"] = "1";
  }
  auto sent = page.send("Input.dispatchMouseEvent", params);
  return sent.ok() ? common::Status::success() : common::Status::error(sent.code(), sent.error());
}

common::Status ContextManager::click(const std::string &selector, const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  auto center = element_center(page.value(), selector);
  if (!center.ok()) {
    return common::Status::error(center.code(), center.error());
  }
  const auto [x, y] = center.value();
  for (const char *type : {"mouseMoved", "mousePressed", "mouseReleased"}) {
    if (const auto sent = mouse_event(page.value(), type, x, y); !sent.ok()) {
      return sent;
    }
  }
  return common::Status::success();
}

common::Status ContextManager::fill(const std::string &selector, const std::string &value,
                                    const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  auto focused = page.value().evaluate_on_element(
      resolve_selector(selector),
      "el.focus(); if ('value' in el) { el.value = ''; } else { el.textContent = ''; } "
      "el.dispatchEvent(new Event('input', {bubbles: true})); return true;",
      selector);
  if (!focused.ok()) {
    return common::Status::error(focused.code(), focused.error());
  }
  auto inserted = page.value().send("Input.insertText", {{"text", common::json_quote(value)}});
  return inserted.ok() ? common::Status::success()
                       : common::Status::error(inserted.code(), inserted.error());
}

common::Status ContextManager::select(const std::string &selector, const std::string &value,
                                      const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  auto selected = page.value().evaluate_on_element(
      resolve_selector(selector),
      "el.value = " + common::json_quote(value) +
          "; el.dispatchEvent(new Event('change', {bubbles: true})); return true;",
      selector);
  return selected.ok() ? common::Status::success()
                       : common::Status::error(selected.code(), selected.error());
}

common::Status ContextManager::check(const std::string &selector, const bool checked,
                                     const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  auto toggled = page.value().evaluate_on_element(
      resolve_selector(selector),
      "if (el.checked !== " + common::json_bool(checked) + ") { el.click(); } return el.checked;",
      selector);
  return toggled.ok() ? common::Status::success()
                      : common::Status::error(toggled.code(), toggled.error());
}

common::Status ContextManager::hover(const std::string &selector, const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  auto center = element_center(page.value(), selector);
  if (!center.ok()) {
    return common::Status::error(center.code(), center.error());
  }
  return mouse_event(page.value(), "mouseMoved", center.value().first, center.value().second);
}

common::Status ContextManager::scroll(const std::optional<std::string> &selector,
                                      const std::int64_t x, const std::int64_t y,
                                      const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  common::Result<std::string> scrolled =
      selector.has_value()
          ? page.value().evaluate_on_element(
                resolve_selector(*selector),
                "el.scrollIntoView({behavior: 'instant', block: 'center'}); return true;",
                *selector)
          : page.value().evaluate("window.scrollBy(" + std::to_string(x) + ", " +
                                  std::to_string(y) + ")");
  return scrolled.ok() ? common::Status::success()
                       : common::Status::error(scrolled.code(), scrolled.error());
}

common::Status ContextManager::dispatch_key(const PageHandle &page, const std::string &key,
                                            const int modifiers, const bool with_text) {
  const KeyDefinition def = key_definition(key);
  for (const char *type : {"keyDown", "keyUp"}) {
    JsonMap params = {{"type", common::json_quote(type)}, {"key", common::json_quote(def.key)}};
    if (!def.code.empty()) {
      params["code"] = common::json_quote(def.code);
    }
    if (def.key_code != 0) {
      params["windowsVirtualKeyCode"] = std::to_string(def.key_code);
    }
    if (modifiers != 0) {
      params["modifiers"] = std::to_string(modifiers);
    }
    if (with_text && !def.text.empty() && std::string(type) == "keyDown") {
      params["text"] = common::json_quote(def.text);
    }
    if (auto sent = page.send("Input.dispatchKeyEvent", params); !sent.ok()) {
      return common::Status::error(sent.code(), sent.error());
    }
  }
  return common::Status::success();
}

common::Status ContextManager::press(const std::string &key, const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  return dispatch_key(page.value(), key, 0, true);
}

common::Status ContextManager::press_combo(const std::vector<std::string> &modifiers,
                                           const std::string &key, const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  const int mask = modifier_mask(modifiers);
  // With a modifier held the key is a shortcut, so it must not insert text.
  return dispatch_key(page.value(), key, mask, mask == 0);
}

common::Result<std::string> ContextManager::upload(const std::string &selector,
                                                   const std::string &path,
                                                   const SessionRef &session) {
  const auto absolute = common::absolute_from_cwd(path);
  std::error_code ec;
  if (!std::filesystem::exists(absolute, ec)) {
    return common::Result<std::string>::failure(common::ErrorCode::FileNotFound,
                                                "File not found: " + absolute.string());
  }

  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<std::string>::propagate(page);
  }
  const std::string css = resolve_selector(selector);
  auto is_file_input = page.value().evaluate_on_element(
      css, "return el.tagName === 'INPUT' && el.type === 'file';", selector);
  if (!is_file_input.ok()) {
    return is_file_input;
  }
  if (!common::json_as_bool(is_file_input.value()).value_or(false)) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "Element is not a file input: " + selector);
  }

  auto document = page.value().send("DOM.getDocument", {{"depth", "0"}});
  if (!document.ok()) {
    return common::Result<std::string>::propagate(document);
  }
  const auto root = common::json_parse_object(common::json_raw_field(document.value(), "root", "{}"));
  const std::string root_id = common::json_raw_field(root, "nodeId", "0");
  auto found = page.value().send("DOM.querySelector",
                                 {{"nodeId", root_id}, {"selector", common::json_quote(css)}});
  if (!found.ok()) {
    return common::Result<std::string>::propagate(found);
  }
  const auto node_id = common::json_as_int(common::json_raw_field(found.value(), "nodeId", "0"));
  if (!node_id.has_value() || *node_id == 0) {
    return common::Result<std::string>::failure(common::ErrorCode::ElementNotFound,
                                                "Element not found: " + selector);
  }
  auto set = page.value().send(
      "DOM.setFileInputFiles",
      {{"files", common::json_array({common::json_quote(absolute.string())})},
       {"nodeId", std::to_string(*node_id)}});
  if (!set.ok()) {
    return common::Result<std::string>::propagate(set);
  }
  return common::Result<std::string>::success(absolute.string());
}

common::Result<std::vector<Cookie>> ContextManager::get_cookies(const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<std::vector<Cookie>>::propagate(page);
  }
  auto response = page.value().send("Network.getCookies");
  if (!response.ok()) {
    return common::Result<std::vector<Cookie>>::propagate(response);
  }
  std::vector<Cookie> cookies;
  for (const auto &raw :
       common::json_split_array(common::json_raw_field(response.value(), "cookies", "[]"))) {
    cookies.push_back(cookie_from_cdp(raw));
  }
  return common::Result<std::vector<Cookie>>::success(std::move(cookies));
}

common::Status ContextManager::set_cookies(const std::vector<Cookie> &cookies,
                                           const SessionRef &session) {
  if (cookies.empty()) {
    return common::Status::success();
  }
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Status::error(page.code(), page.error());
  }
  std::vector<std::string> params;
  params.reserve(cookies.size());
  for (const auto &cookie : cookies) {
    params.push_back(cookie_to_cdp(cookie));
  }
  auto set = page.value().send("Network.setCookies", {{"cookies", common::json_array(params)}});
  return set.ok() ? common::Status::success() : common::Status::error(set.code(), set.error());
}

common::Result<LocalStorageState> ContextManager::get_local_storage(const SessionRef &session) {
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<LocalStorageState>::propagate(page);
  }
  auto value = page.value().evaluate(
      "(() => { let items = {}; "
      "try { items = Object.fromEntries(Object.entries(localStorage)); } catch (_) {} "
      "return {origin: location.origin, items}; })()");
  if (!value.ok()) {
    return common::Result<LocalStorageState>::propagate(value);
  }
  return common::Result<LocalStorageState>::success(local_storage_from_json(value.value()));
}

common::Result<std::size_t> ContextManager::set_local_storage(const LocalStorageState &state,
                                                              const SessionRef &session) {
  if (state.origin.empty() || state.origin == "null") {
    return common::Result<std::size_t>::success(0);
  }
  auto page = page_for(session);
  if (!page.ok()) {
    return common::Result<std::size_t>::propagate(page);
  }
  // DOMStorage only reaches an origin that has a live frame in the page.
  auto current = page.value().evaluate("location.origin");
  if (!current.ok()) {
    return common::Result<std::size_t>::propagate(current);
  }
  if (common::json_as_string(current.value()) != state.origin) {
    if (const auto loaded = load_url(page.value(), state.origin); !loaded.ok()) {
      return common::Result<std::size_t>::failure(loaded.code(), loaded.error());
    }
  }
  const std::string storage_id = common::json_object(
      {{"securityOrigin", common::json_quote(state.origin)}, {"isLocalStorage", "true"}});
  auto cleared = page.value().send("DOMStorage.clear", {{"storageId", storage_id}});
  if (!cleared.ok()) {
    return common::Result<std::size_t>::propagate(cleared);
  }
  std::size_t failed = 0;
  for (const auto &[key, value] : state.items) {
    auto set = page.value().send("DOMStorage.setDOMStorageItem",
                                 {{"storageId", storage_id},
                                  {"key", common::json_quote(key)},
                                  {"value", common::json_quote(value)}});
    if (!set.ok()) {
      ++failed;
    }
  }
  if (failed > 0) {
    observability::record_error("browser", std::to_string(failed) +
                                               " localStorage keys failed to restore for " +
                                               state.origin);
  }
  return common::Result<std::size_t>::success(failed);
}

common::Result<std::string> ContextManager::health() {
  if (!is_started()) {
    return common::Result<std::string>::failure(common::ErrorCode::NotConnected,
                                                "Browser not started");
  }
  auto version = client_->send_command("Browser.getVersion");
  if (!version.ok()) {
    health::mark_error(health::Component::Browser, version.error());
    return common::Result<std::string>::propagate(version);
  }
  health::mark_ok(health::Component::Browser);
  return common::Result<std::string>::success(
      common::json_string_field(version.value(), "product").value_or(""));
}

void ContextManager::publish_session_count() {
  observability::record_metric(observability::ActiveSessionsMetric{.count = registry_.size()});
}

} // namespace cdpgate::browser
