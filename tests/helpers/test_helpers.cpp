#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>

namespace cdpgate::testing {

namespace {

std::string ok_empty() { return "{}"; }

} // namespace

// --- ScriptedBrowser --------------------------------------------------------

void ScriptedBrowser::on(const std::string &method, CommandHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[method] = std::move(handler);
}

void ScriptedBrowser::on_evaluate(EvaluateHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  evaluate_handler_ = std::move(handler);
}

void ScriptedBrowser::set_ax_nodes(std::string nodes_json) {
  std::lock_guard<std::mutex> lock(mutex_);
  ax_nodes_ = std::move(nodes_json);
}

std::vector<SentCommand> ScriptedBrowser::sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sent_;
}

std::vector<SentCommand> ScriptedBrowser::sent(const std::string &method) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SentCommand> out;
  for (const auto &command : sent_) {
    if (command.method == method) {
      out.push_back(command);
    }
  }
  return out;
}

std::size_t ScriptedBrowser::count(const std::string &method) const {
  return sent(method).size();
}

std::map<std::string, std::string>
ScriptedBrowser::local_storage(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto page = pages_.find(session_id);
  if (page == pages_.end()) {
    return {};
  }
  const auto storage = page->second.storage.find(page->second.origin);
  return storage == page->second.storage.end() ? std::map<std::string, std::string>{}
                                               : storage->second;
}

std::string ScriptedBrowser::url(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto page = pages_.find(session_id);
  return page == pages_.end() ? "about:blank" : page->second.url;
}

std::string ScriptedBrowser::respond(const SentCommand &command) {
  CommandHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(command);
    if (const auto it = handlers_.find(command.method); it != handlers_.end()) {
      handler = it->second;
    }
  }
  const auto result = handler ? handler(command) : builtin(command);

  std::vector<std::pair<std::string, std::string>> fields = {{"id", std::to_string(command.id)}};
  if (result.ok()) {
    fields.emplace_back("result", result.value());
  } else {
    fields.emplace_back("error", common::json_object({{"code", "-32000"},
                                                      {"message", common::json_quote(
                                                                      result.error())}}));
  }
  if (!command.session_id.empty()) {
    fields.emplace_back("sessionId", common::json_quote(command.session_id));
  }
  return common::json_object(fields);
}

std::string ScriptedBrowser::evaluate(const std::string &expression,
                                      const std::string &session_id) {
  EvaluateHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = evaluate_handler_;
  }
  if (handler) {
    if (auto value = handler(expression); value.has_value()) {
      return *value;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  PageState &page = pages_[session_id];
  if (expression == "document.readyState") {
    return common::json_quote("complete");
  }
  if (expression == "location.href") {
    return common::json_quote(page.url);
  }
  if (expression == "location.origin") {
    return common::json_quote(page.origin);
  }
  if (expression == "document.title") {
    return common::json_quote("Fake Page");
  }
  if (expression.find("getBoundingClientRect") != std::string::npos) {
    return R"({"x":10,"y":20})";
  }
  if (expression.find("el.type === 'file'") != std::string::npos) {
    return "true";
  }
  if (expression.find("Object.entries(localStorage)") != std::string::npos) {
    std::vector<std::pair<std::string, std::string>> items;
    for (const auto &[key, value] : page.storage[page.origin]) {
      items.emplace_back(key, common::json_quote(value));
    }
    return common::json_object(
        {{"origin", common::json_quote(page.origin)}, {"items", common::json_object(items)}});
  }
  if (expression.find("querySelectorAll(") != std::string::npos &&
      expression.find("nodes.push") != std::string::npos) {
    return "[]";
  }
  return "true";
}

common::Result<std::string> ScriptedBrowser::builtin(const SentCommand &command) {
  using Out = common::Result<std::string>;
  const auto &m = command.method;
  if (m == "Target.createBrowserContext") {
    std::lock_guard<std::mutex> lock(mutex_);
    return Out::success(common::json_object(
        {{"browserContextId", common::json_quote("ctx-" + std::to_string(next_context_++))}}));
  }
  if (m == "Target.createTarget") {
    std::lock_guard<std::mutex> lock(mutex_);
    return Out::success(common::json_object(
        {{"targetId", common::json_quote("target-" + std::to_string(next_target_++))}}));
  }
  if (m == "Target.attachToTarget") {
    const auto target = common::json_string_field(command.params, "targetId").value_or("");
    return Out::success(common::json_object({{"sessionId", common::json_quote("s-" + target)}}));
  }
  if (m == "Page.navigate") {
    std::lock_guard<std::mutex> lock(mutex_);
    PageState &page = pages_[command.session_id];
    page.url = common::json_string_field(command.params, "url").value_or("");
    const auto scheme_end = page.url.find("://");
    const auto path_start = scheme_end == std::string::npos
                                ? std::string::npos
                                : page.url.find('/', scheme_end + 3);
    const std::string origin =
        scheme_end == std::string::npos ? "null" : page.url.substr(0, path_start);
    page.origin = origin;
    return Out::success(R"({"frameId":"frame-1"})");
  }
  if (m == "Runtime.evaluate") {
    const auto expression = common::json_string_field(command.params, "expression").value_or("");
    return Out::success(common::json_object(
        {{"result", common::json_object({{"type", common::json_quote("object")},
                                         {"value", evaluate(expression, command.session_id)}})}}));
  }
  if (m == "Accessibility.getFullAXTree") {
    std::lock_guard<std::mutex> lock(mutex_);
    return Out::success(common::json_object({{"nodes", ax_nodes_}}));
  }
  if (m == "DOM.getDocument") {
    return Out::success(R"({"root":{"nodeId":1}})");
  }
  if (m == "DOM.querySelector") {
    return Out::success(R"({"nodeId":7})");
  }
  if (m == "DOM.pushNodesByBackendIdsToFrontend") {
    std::vector<std::string> ids;
    const auto backend = common::json_split_array(
        common::json_raw_field(command.params, "backendNodeIds", "[]"));
    for (std::size_t i = 0; i < backend.size(); ++i) {
      ids.push_back(std::to_string(100 + i));
    }
    return Out::success(common::json_object({{"nodeIds", common::json_array(ids)}}));
  }
  if (m == "Page.captureScreenshot") {
    // "PNG!" in base64.
    return Out::success(R"({"data":"UE5HIQ=="})");
  }
  if (m == "Page.getLayoutMetrics") {
    return Out::success(R"({"cssContentSize":{"x":0,"y":0,"width":1280,"height":2000}})");
  }
  if (m == "Network.getCookies") {
    std::lock_guard<std::mutex> lock(mutex_);
    return Out::success(common::json_object({{"cookies", common::json_array(cookies_)}}));
  }
  if (m == "Network.setCookies") {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &cookie :
         common::json_split_array(common::json_raw_field(command.params, "cookies", "[]"))) {
      cookies_.push_back(cookie);
    }
    return Out::success(ok_empty());
  }
  if (m == "Network.clearBrowserCookies") {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_.clear();
    return Out::success(ok_empty());
  }
  if (m == "DOMStorage.clear" || m == "DOMStorage.setDOMStorageItem") {
    std::lock_guard<std::mutex> lock(mutex_);
    PageState &page = pages_[command.session_id];
    const auto storage_id =
        common::json_parse_object(common::json_raw_field(command.params, "storageId", "{}"));
    if (common::json_string_field(storage_id, "securityOrigin") != page.origin) {
      return Out::failure("Frame not found for the given storage id");
    }
    if (m == "DOMStorage.clear") {
      page.storage[page.origin].clear();
    } else {
      page.storage[page.origin][common::json_string_field(command.params, "key").value_or("")] =
          common::json_string_field(command.params, "value").value_or("");
    }
    return Out::success(ok_empty());
  }
  if (m == "Browser.getVersion") {
    return Out::success(R"({"product":"FakeChrome/1.0","protocolVersion":"1.3"})");
  }
  return Out::success(ok_empty());
}

// --- FakeCDPTransport -------------------------------------------------------

FakeCDPTransport::FakeCDPTransport(std::shared_ptr<ScriptedBrowser> browser)
    : browser_(std::move(browser)) {}

common::Status FakeCDPTransport::connect(const std::string &) {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = true;
  return common::Status::success();
}

void FakeCDPTransport::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = false;
  cv_.notify_all();
}

bool FakeCDPTransport::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

common::Status FakeCDPTransport::send_text(const std::string &payload) {
  const auto message = common::json_parse_object(payload);
  SentCommand command;
  command.id = common::json_as_int(common::json_raw_field(message, "id", "0")).value_or(0);
  command.method = common::json_string_field(message, "method").value_or("");
  command.params = common::json_parse_object(common::json_raw_field(message, "params", "{}"));
  command.session_id = common::json_string_field(message, "sessionId").value_or("");

  const std::string response = browser_->respond(command);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connected_) {
    return common::Status::error("not connected");
  }
  inbound_.push_back(response);
  cv_.notify_all();
  return common::Status::success();
}

common::Result<std::string> FakeCDPTransport::receive_text(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready =
      cv_.wait_for(lock, timeout, [&]() { return !inbound_.empty() || !connected_; });
  if (!ready) {
    return common::Result<std::string>::failure("timeout");
  }
  if (!connected_ && inbound_.empty()) {
    return common::Result<std::string>::failure("closed");
  }
  std::string value = inbound_.front();
  inbound_.pop_front();
  return common::Result<std::string>::success(std::move(value));
}

std::unique_ptr<browser::CDPClient>
make_fake_client(const std::shared_ptr<ScriptedBrowser> &browser) {
  return std::make_unique<browser::CDPClient>(std::make_unique<FakeCDPTransport>(browser));
}

// --- TempDir ----------------------------------------------------------------

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("cdpgate-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

config::Config test_config(const TempDir &dir) {
  config::Config config;
  config.browser.devtools_url = "ws://127.0.0.1:9222/devtools/browser/fake";
  config.browser.command_timeout_ms = 2'000;
  config.browser.navigation_settle_ms = 200;
  config.bridge.enabled = false;
  config.bridge.request_timeout_ms = 300;
  config.state.dir = (dir.path() / "auth").string();
  config.observability.backend = "none";
  return config;
}

} // namespace cdpgate::testing
