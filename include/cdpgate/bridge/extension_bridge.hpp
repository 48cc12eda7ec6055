#pragma once

#include "cdpgate/bridge/protocol.hpp"
#include "cdpgate/common/event_loop.hpp"
#include "cdpgate/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cdpgate::bridge {

struct BridgeOptions {
  std::string host = "127.0.0.1";
  /// 0 binds an ephemeral port; see ExtensionBridge::port().
  std::uint16_t port = 9223;
  std::chrono::milliseconds request_timeout{30000};
};

enum class ConnectionState { Disconnected, Connected };

using ResponseCallback = std::function<void(common::Result<ExtensionResponse>)>;

/// WebSocket endpoint for the browser extension. The most recent handshaken
/// connection is the active one; requests are correlated by UUID.
class ExtensionBridge {
public:
  /// `loop` is the referenced loop used by the blocking adapter; may be null.
  explicit ExtensionBridge(BridgeOptions options, common::EventLoop *loop = nullptr);
  ~ExtensionBridge();

  ExtensionBridge(const ExtensionBridge &) = delete;
  ExtensionBridge &operator=(const ExtensionBridge &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] std::uint16_t port() const { return bound_port_; }

  [[nodiscard]] ConnectionState state() const;
  [[nodiscard]] bool is_connected() const { return state() == ConnectionState::Connected; }
  [[nodiscard]] std::size_t pending_count() const;
  /// Connection threads not yet joined, live or finished.
  [[nodiscard]] std::size_t connection_thread_count() const;

  /// Sends `method` with raw JSON `params`. `callback` runs exactly once on
  /// `loop`, except when there is no connection, in which case it runs inline.
  void call(common::EventLoop &loop, const std::string &method, const std::string &params,
            ResponseCallback callback);

  [[nodiscard]] common::Result<ExtensionResponse> call_blocking(const std::string &method,
                                                                const std::string &params);
  [[nodiscard]] bool is_connected_blocking();

private:
  struct Connection {
    int fd = -1;
    std::uint64_t serial = 0;
    std::mutex write_mutex;
  };

  struct PendingSlot {
    std::uint64_t connection = 0;
    std::string method;
    std::chrono::steady_clock::time_point started;
    common::EventLoop *loop = nullptr;
    ResponseCallback callback;
  };

  /// Shared with timers so a timer outliving the bridge finds nothing to do.
  struct PendingTable {
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<PendingSlot>> slots;

    void insert(const std::string &id, std::shared_ptr<PendingSlot> slot);
    /// Removes and returns the slot; null when another path already claimed it.
    std::shared_ptr<PendingSlot> take(const std::string &id);
    [[nodiscard]] std::size_t size() const;
  };

  void accept_loop(int listen_fd);
  void connection_loop(std::shared_ptr<Connection> connection);
  [[nodiscard]] bool perform_handshake(int fd) const;
  void handle_message(const std::string &payload);
  void on_connection_closed(const std::shared_ptr<Connection> &connection);
  /// Runs last on a connection thread. Parks its own handle for the next
  /// exiting thread to join and joins the one parked before it.
  void retire_thread(std::uint64_t serial);
  [[nodiscard]] static bool send_text(const std::shared_ptr<Connection> &connection,
                                      const std::string &payload);
  void fail_pending(const std::function<bool(const PendingSlot &)> &predicate);

  static void complete(const std::shared_ptr<PendingSlot> &slot,
                       common::Result<ExtensionResponse> result);

  BridgeOptions options_;
  common::EventLoop *loop_ = nullptr;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::uint16_t bound_port_ = 0;
  std::thread accept_thread_;

  mutable std::mutex connection_mutex_;
  std::shared_ptr<Connection> active_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Connection>> connections_;
  std::uint64_t next_serial_ = 1;
  std::unordered_map<std::uint64_t, std::thread> connection_threads_;
  std::vector<std::thread> finished_threads_;

  std::shared_ptr<PendingTable> pending_ = std::make_shared<PendingTable>();
};

} // namespace cdpgate::bridge
