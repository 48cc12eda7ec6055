#pragma once

#include "cdpgate/browser/cdp.hpp"
#include "cdpgate/common/json_util.hpp"
#include "cdpgate/common/result.hpp"
#include "cdpgate/config/schema.hpp"

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cdpgate::testing {

/// One command as the fake browser received it.
struct SentCommand {
  std::int64_t id = 0;
  std::string method;
  common::JsonRawMap params;
  std::string session_id;
};

/// Success carries the raw `result` object, failure the CDP error message.
using CommandHandler = std::function<common::Result<std::string>(const SentCommand &)>;
/// Maps a Runtime.evaluate expression to the raw `value` it yields; nullopt
/// falls back to the built-in answers.
using EvaluateHandler = std::function<std::optional<std::string>(const std::string &)>;

/// In-memory browser behind the fake transport. Answers the Target, Page,
/// DOM, Network and DOMStorage commands the context manager issues. Each
/// attached session has its own page URL and localStorage; DOMStorage
/// commands fail for an origin the session's page is not on.
class ScriptedBrowser {
public:
  void on(const std::string &method, CommandHandler handler);
  void on_evaluate(EvaluateHandler handler);
  void set_ax_nodes(std::string nodes_json);

  [[nodiscard]] std::vector<SentCommand> sent() const;
  [[nodiscard]] std::vector<SentCommand> sent(const std::string &method) const;
  [[nodiscard]] std::size_t count(const std::string &method) const;
  /// localStorage of the page behind `session_id`, for its current origin.
  [[nodiscard]] std::map<std::string, std::string>
  local_storage(const std::string &session_id) const;
  [[nodiscard]] std::string url(const std::string &session_id) const;

  [[nodiscard]] std::string respond(const SentCommand &command);

private:
  [[nodiscard]] common::Result<std::string> builtin(const SentCommand &command);
  [[nodiscard]] std::string evaluate(const std::string &expression,
                                     const std::string &session_id);

  mutable std::mutex mutex_;
  std::vector<SentCommand> sent_;
  std::map<std::string, CommandHandler> handlers_;
  EvaluateHandler evaluate_handler_;
  std::string ax_nodes_ = "[]";
  struct PageState {
    std::string url = "about:blank";
    std::string origin = "null";
    std::map<std::string, std::map<std::string, std::string>> storage; // by origin
  };

  std::map<std::string, PageState> pages_; // keyed by CDP session id
  std::vector<std::string> cookies_;
  int next_context_ = 1;
  int next_target_ = 1;
};

class FakeCDPTransport final : public browser::ICDPTransport {
public:
  explicit FakeCDPTransport(std::shared_ptr<ScriptedBrowser> browser);

  [[nodiscard]] common::Status connect(const std::string &ws_url) override;
  void close() override;
  [[nodiscard]] bool is_connected() const override;
  [[nodiscard]] common::Status send_text(const std::string &payload) override;
  [[nodiscard]] common::Result<std::string>
  receive_text(std::chrono::milliseconds timeout) override;

private:
  std::shared_ptr<ScriptedBrowser> browser_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool connected_ = false;
  std::deque<std::string> inbound_;
};

[[nodiscard]] std::unique_ptr<browser::CDPClient>
make_fake_client(const std::shared_ptr<ScriptedBrowser> &browser);

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Config wired for the fake browser: explicit devtools URL, short timeouts,
/// no observability backends, state under `dir`.
[[nodiscard]] config::Config test_config(const TempDir &dir);

} // namespace cdpgate::testing
