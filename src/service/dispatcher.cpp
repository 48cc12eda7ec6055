#include "cdpgate/service/dispatcher.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/version.hpp"
#include "cdpgate/health/health.hpp"
#include "cdpgate/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <utility>

namespace cdpgate::service {

namespace {

constexpr std::string_view kBrowserPrefix = "browser.";

using StringResult = common::Result<std::string>;

std::string strip_prefix(const std::string &method) {
  if (method.starts_with(kBrowserPrefix)) {
    return method.substr(kBrowserPrefix.size());
  }
  return method;
}

StringResult missing(const std::string &param) {
  return StringResult::failure(common::ErrorCode::InvalidArgument,
                               "Missing '" + param + "' parameter");
}

std::optional<std::string> string_param(const JsonMap &params, const std::string &key) {
  return common::json_string_field(params, key);
}

/// For params already checked present.
std::string text_param(const JsonMap &params, const std::string &key) {
  return string_param(params, key).value_or("");
}

/// `session_id` wins over `session`; non-string values count as absent.
browser::SessionRef session_param(const JsonMap &params) {
  if (auto id = string_param(params, "session_id"); id.has_value()) {
    return id;
  }
  return string_param(params, "session");
}

std::int64_t int_param(const JsonMap &params, const std::string &key) {
  const auto value = common::json_number_field(params, key);
  return value.has_value() ? static_cast<std::int64_t>(std::llround(*value)) : 0;
}

std::string quoted_array(const std::vector<std::string> &values) {
  std::vector<std::string> raw;
  raw.reserve(values.size());
  for (const auto &value : values) {
    raw.push_back(common::json_quote(value));
  }
  return common::json_array(raw);
}

/// Re-encodes params for the extension with keys sorted for stable frames.
std::string encode_params(const JsonMap &params) {
  std::vector<std::pair<std::string, std::string>> fields(params.begin(), params.end());
  std::sort(fields.begin(), fields.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });
  return common::json_object(fields);
}

std::string success_only() { return common::json_object({{"success", "true"}}); }

} // namespace

Dispatcher::Dispatcher(browser::ContextManager &manager, browser::StateStore &store,
                       bridge::ExtensionBridge *bridge)
    : manager_(manager), store_(store), bridge_(bridge) {}

const std::vector<MethodInfo> &Dispatcher::methods() {
  static const std::vector<MethodInfo> list = {
      {"health", "Report browser and component health"},
      {"browser.open", "Navigate to a URL"},
      {"browser.snapshot", "Accessibility snapshot with element refs"},
      {"browser.screenshot", "Capture a PNG of the page"},
      {"browser.click", "Click an element by selector or @ref"},
      {"browser.fill", "Replace the value of an input"},
      {"browser.press", "Press a key"},
      {"browser.select", "Choose an option in a <select>"},
      {"browser.check", "Set a checkbox or radio state"},
      {"browser.hover", "Move the pointer over an element"},
      {"browser.scroll", "Scroll the page or an element into view"},
      {"browser.press_combo", "Press a key with modifiers"},
      {"browser.upload", "Attach a local file to a file input"},
      {"browser.state.save", "Save cookies and localStorage under a name"},
      {"browser.state.load", "Restore a saved state"},
      {"browser.state.list", "List saved states"},
      {"browser.session.new", "Create an isolated session"},
      {"browser.session.list", "List session ids"},
      {"browser.session.close", "Close a session"},
  };
  return list;
}

common::Result<std::string> Dispatcher::dispatch(const std::string &method,
                                                 const JsonMap &params) {
  const auto started = std::chrono::steady_clock::now();
  const std::string name = strip_prefix(method);

  StringResult result = StringResult::failure("not dispatched");
  // Extension methods never touch the session registry.
  if (bridge::is_extension_method(method) || bridge::is_extension_method(name)) {
    result = call_extension(bridge::is_extension_method(method) ? method : name, params);
  } else {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    result = dispatch_browser(name, params);
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_browser_command(method, elapsed, result.ok());
  observability::record_metric(observability::RequestLatencyMetric{.latency = elapsed});
  if (!result.ok()) {
    observability::record_error("dispatcher", method + ": " + result.error());
  }
  return result;
}

common::Result<std::string> Dispatcher::call_extension(const std::string &name,
                                                       const JsonMap &params) {
  if (bridge_ == nullptr) {
    return StringResult::failure(common::ErrorCode::NotConnected, "Extension not connected");
  }
  auto response = bridge_->call_blocking(name, encode_params(params));
  if (!response.ok()) {
    return StringResult::propagate(response);
  }
  return bridge::response_to_value(response.value());
}

common::Status Dispatcher::ensure_started() {
  if (manager_.is_started()) {
    return common::Status::success();
  }
  return manager_.start();
}

common::Result<std::string> Dispatcher::handle_health() {
  bool healthy = true;
  if (manager_.is_started()) {
    // ContextManager::health records the outcome in the component registry.
    healthy = manager_.health().ok();
  }
  return StringResult::success(common::json_object({
      {"healthy", common::json_bool(healthy)},
      {"service", common::json_quote("browser")},
      {"version", common::json_quote(common::version())},
      {"components", health::snapshot_json()},
  }));
}

common::Result<std::string> Dispatcher::dispatch_browser(const std::string &name,
                                                         const JsonMap &params) {
  if (name == "health") {
    return handle_health();
  }

  // Listing needs no browser.
  if (name == "state.list") {
    auto states = store_.list();
    if (!states.ok()) {
      return StringResult::propagate(states);
    }
    std::vector<std::string> items;
    for (const auto &state : states.value()) {
      items.push_back(common::json_object({{"name", common::json_quote(state.name)},
                                           {"domains", quoted_array(state.domains)},
                                           {"saved_at", common::json_quote(state.saved_at)}}));
    }
    return StringResult::success(common::json_array(items));
  }
  if (name == "session.list") {
    std::vector<std::string> ids;
    if (manager_.is_started()) {
      auto listed = manager_.list_sessions();
      if (!listed.ok()) {
        return StringResult::propagate(listed);
      }
      ids = std::move(listed.value());
    }
    return StringResult::success(common::json_object({{"sessions", quoted_array(ids)}}));
  }

  // Required string params per method, checked before the browser starts.
  static const std::vector<std::pair<std::string, std::vector<std::string>>> kRoutes = {
      {"open", {"url"}},
      {"snapshot", {}},
      {"screenshot", {}},
      {"click", {"selector"}},
      {"fill", {"selector", "value"}},
      {"press", {"key"}},
      {"select", {"selector", "value"}},
      {"check", {"selector"}},
      {"hover", {"selector"}},
      {"scroll", {}},
      {"press_combo", {"key"}},
      {"upload", {"selector", "path"}},
      {"state.save", {"name"}},
      {"state.load", {"name"}},
      {"session.new", {}},
      {"session.close", {}},
  };
  const auto route = std::find_if(kRoutes.begin(), kRoutes.end(),
                                   [&name](const auto &entry) { return entry.first == name; });
  if (route == kRoutes.end()) {
    return StringResult::failure(common::ErrorCode::UnknownMethod, "Unknown method: " + name);
  }
  for (const auto &required : route->second) {
    if (!string_param(params, required).has_value()) {
      return missing(required);
    }
  }

  const auto session = session_param(params);
  if (name == "session.new" || name == "session.close") {
    auto id = string_param(params, "id");
    if (!id.has_value()) {
      id = string_param(params, "session_id");
    }
    if (!id.has_value()) {
      return missing("id");
    }
    if (name == "session.close") {
      if (!manager_.is_started()) {
        // Nothing was ever created; only the default id is special.
        if (*id == manager_.registry().default_id()) {
          return StringResult::failure(common::ErrorCode::ProtectedSession,
                                       "Cannot close default session");
        }
      } else if (auto closed = manager_.close_session(*id); !closed.ok()) {
        return StringResult::propagate(closed);
      }
      return StringResult::success(common::json_object(
          {{"success", "true"}, {"session_id", common::json_quote(*id)}}));
    }
    if (auto started = ensure_started(); !started.ok()) {
      return StringResult::propagate(started);
    }
    auto created = manager_.create_session(*id);
    if (!created.ok()) {
      return StringResult::propagate(created);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"}, {"session_id", common::json_quote(created.value())}}));
  }

  if (auto started = ensure_started(); !started.ok()) {
    return StringResult::propagate(started);
  }

  if (name == "open") {
    auto nav = manager_.navigate(text_param(params, "url"), session);
    if (!nav.ok()) {
      return StringResult::propagate(nav);
    }
    return StringResult::success(common::json_object(
        {{"url", common::json_quote(nav.value().url)},
         {"title", common::json_quote(nav.value().title)}}));
  }

  if (name == "snapshot") {
    auto snap = manager_.snapshot(session);
    if (!snap.ok()) {
      return StringResult::propagate(snap);
    }
    const auto &page = snap.value();
    return StringResult::success(common::json_object(
        {{"url", common::json_quote(page.url)},
         {"title", common::json_quote(page.title)},
         {"nodes", browser::nodes_to_json(page.nodes)},
         {"element_count", std::to_string(page.nodes.size())}}));
  }

  if (name == "screenshot") {
    auto shot = manager_.screenshot(string_param(params, "path"), session);
    if (!shot.ok()) {
      return StringResult::propagate(shot);
    }
    std::vector<std::pair<std::string, std::string>> fields;
    if (shot.value().data.has_value()) {
      fields.emplace_back("data", common::json_quote(*shot.value().data));
    }
    if (shot.value().path.has_value()) {
      fields.emplace_back("path", common::json_quote(*shot.value().path));
    }
    fields.emplace_back("width", std::to_string(shot.value().width));
    fields.emplace_back("height", std::to_string(shot.value().height));
    return StringResult::success(common::json_object(fields));
  }

  if (name == "press") {
    if (auto pressed = manager_.press(text_param(params, "key"), session); !pressed.ok()) {
      return StringResult::propagate(pressed);
    }
    return StringResult::success(success_only());
  }

  if (name == "press_combo") {
    const auto key = text_param(params, "key");
    const auto modifiers =
        common::json_string_array(common::json_raw_field(params, "modifiers", "[]"));
    if (auto pressed = manager_.press_combo(modifiers, key, session); !pressed.ok()) {
      return StringResult::propagate(pressed);
    }
    return StringResult::success(common::json_object({{"success", "true"},
                                                      {"key", common::json_quote(key)},
                                                      {"modifiers", quoted_array(modifiers)}}));
  }

  if (name == "scroll") {
    const auto selector = string_param(params, "selector");
    const auto x = int_param(params, "x");
    const auto y = int_param(params, "y");
    if (auto scrolled = manager_.scroll(selector, x, y, session); !scrolled.ok()) {
      return StringResult::propagate(scrolled);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"}, {"x", std::to_string(x)}, {"y", std::to_string(y)}}));
  }

  if (name == "state.save" || name == "state.load") {
    const auto state_name = text_param(params, "name");
    if (name == "state.save") {
      auto cookies = manager_.get_cookies(session);
      if (!cookies.ok()) {
        return StringResult::propagate(cookies);
      }
      auto storage = manager_.get_local_storage(session);
      if (!storage.ok()) {
        return StringResult::propagate(storage);
      }
      browser::AuthState state{.cookies = std::move(cookies.value()),
                               .local_storage = std::move(storage.value()),
                               .saved_at = common::now_rfc3339()};
      auto path = store_.save(state_name, state);
      if (!path.ok()) {
        return StringResult::propagate(path);
      }
      return StringResult::success(common::json_object(
          {{"success", "true"}, {"path", common::json_quote(path.value().string())}}));
    }

    auto state = store_.load(state_name);
    if (!state.ok()) {
      return StringResult::propagate(state);
    }
    if (auto set = manager_.set_cookies(state.value().cookies, session); !set.ok()) {
      return StringResult::propagate(set);
    }
    auto restored = manager_.set_local_storage(state.value().local_storage, session);
    if (!restored.ok()) {
      return StringResult::propagate(restored);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"}, {"name", common::json_quote(state_name)}}));
  }

  // Remaining methods all target an element.
  const auto selector = text_param(params, "selector");

  if (name == "click") {
    if (auto clicked = manager_.click(selector, session); !clicked.ok()) {
      return StringResult::propagate(clicked);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"}, {"element", common::json_quote(selector)}}));
  }
  if (name == "hover") {
    if (auto hovered = manager_.hover(selector, session); !hovered.ok()) {
      return StringResult::propagate(hovered);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"}, {"selector", common::json_quote(selector)}}));
  }
  if (name == "check") {
    const bool checked = common::json_bool_field(params, "checked").value_or(true);
    if (auto set = manager_.check(selector, checked, session); !set.ok()) {
      return StringResult::propagate(set);
    }
    return StringResult::success(common::json_object({{"success", "true"},
                                                      {"selector", common::json_quote(selector)},
                                                      {"checked", common::json_bool(checked)}}));
  }
  if (name == "upload") {
    auto uploaded = manager_.upload(selector, text_param(params, "path"), session);
    if (!uploaded.ok()) {
      return StringResult::propagate(uploaded);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"},
         {"selector", common::json_quote(selector)},
         {"path", common::json_quote(uploaded.value())}}));
  }

  // fill and select both take a value.
  const auto value = text_param(params, "value");
  if (name == "fill") {
    if (auto filled = manager_.fill(selector, value, session); !filled.ok()) {
      return StringResult::propagate(filled);
    }
    return StringResult::success(common::json_object(
        {{"success", "true"}, {"value", common::json_quote(value)}}));
  }
  if (auto selected = manager_.select(selector, value, session); !selected.ok()) {
    return StringResult::propagate(selected);
  }
  return StringResult::success(common::json_object({{"success", "true"},
                                                    {"selector", common::json_quote(selector)},
                                                    {"value", common::json_quote(value)}}));
}

} // namespace cdpgate::service
