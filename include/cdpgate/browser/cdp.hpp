#pragma once

#include "cdpgate/common/json_util.hpp"
#include "cdpgate/common/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cdpgate::browser {

/// Top-level key → raw JSON value text (strings keep their quotes).
using JsonMap = common::JsonRawMap;

inline constexpr std::chrono::milliseconds kDefaultCommandTimeout{30000};

class ICDPTransport {
public:
  virtual ~ICDPTransport() = default;
  [[nodiscard]] virtual common::Status connect(const std::string &ws_url) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  [[nodiscard]] virtual common::Status send_text(const std::string &payload) = 0;
  /// Fails with "timeout" when nothing arrived and "ping" after answering a ping.
  [[nodiscard]] virtual common::Result<std::string>
  receive_text(std::chrono::milliseconds timeout) = 0;
};

/// Plain ws:// client transport over a TCP socket.
[[nodiscard]] std::unique_ptr<ICDPTransport> make_websocket_transport();

class CDPClient {
public:
  CDPClient();
  explicit CDPClient(std::unique_ptr<ICDPTransport> transport);
  ~CDPClient();

  CDPClient(const CDPClient &) = delete;
  CDPClient &operator=(const CDPClient &) = delete;

  [[nodiscard]] common::Status connect(const std::string &ws_url);
  void disconnect();
  [[nodiscard]] bool is_connected() const;

  void set_default_timeout(std::chrono::milliseconds timeout) { default_timeout_ = timeout; }
  [[nodiscard]] std::chrono::milliseconds default_timeout() const { return default_timeout_; }

  /// Sends one command and waits for its response. `params` values are raw
  /// JSON. A non-empty `session_id` addresses a flat-mode target session.
  [[nodiscard]] common::Result<JsonMap>
  send_command(const std::string &method, const JsonMap &params = {},
               const std::string &session_id = "",
               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

private:
  struct PendingRequest {
    std::mutex mutex;
    std::condition_variable cv;
    bool complete = false;
    std::optional<JsonMap> result;
    std::optional<std::string> error;
  };

  void reader_loop();
  void handle_incoming_message(const std::string &json);
  void fail_all_pending(const std::string &reason);

  std::unique_ptr<ICDPTransport> transport_;
  std::atomic<bool> running_{false};
  std::thread reader_thread_;
  std::chrono::milliseconds default_timeout_ = kDefaultCommandTimeout;

  mutable std::mutex state_mutex_;
  int next_id_ = 1;
  std::unordered_map<int, std::shared_ptr<PendingRequest>> pending_requests_;
};

} // namespace cdpgate::browser
