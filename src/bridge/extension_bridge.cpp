#include "cdpgate/bridge/extension_bridge.hpp"

#include "cdpgate/common/blocking.hpp"
#include "cdpgate/common/fs.hpp"
#include "cdpgate/health/health.hpp"
#include "cdpgate/observability/global.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cdpgate::bridge {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;
constexpr std::size_t kMaxFramePayloadBytes = 1024 * 1024;
constexpr int kListenBacklog = 16;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

bool send_all(const int fd, const std::uint8_t *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool recv_exact(const int fd, std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = recv(fd, data + received, size - received, 0);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

std::string lower_trimmed(const std::string &value) {
  return common::to_lower(common::trim(value));
}

std::unordered_map<std::string, std::string> parse_headers(const std::string &request) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(request);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":request-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
      headers[lower_trimmed(line.substr(0, colon))] = common::trim(line.substr(colon + 1));
    }
  }
  return headers;
}

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());

  std::string output(4 * ((digest.size() + 2) / 3), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), digest.data(),
                  static_cast<int>(digest.size()));
  return output;
}

bool send_http_response(const int fd, const int status, const std::string &status_text,
                        const std::vector<std::pair<std::string, std::string>> &headers,
                        const std::string &body = "") {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << " " << status_text << "\r\n";
  for (const auto &[k, v] : headers) {
    response << k << ": " << v << "\r\n";
  }
  if (status != 101) {
    response << "Content-Length: " << body.size() << "\r\n";
  }
  response << "\r\n" << body;
  const std::string text = response.str();
  return send_all(fd, reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
}

/// Reads one client frame (masked, at most 1 MiB), joining continuations.
bool read_next_message(const int fd, std::uint8_t &opcode, std::string &payload) {
  payload.clear();
  opcode = 0;
  while (true) {
    std::array<std::uint8_t, 2> header{};
    if (!recv_exact(fd, header.data(), header.size())) {
      return false;
    }
    const bool fin = (header[0] & 0x80u) != 0;
    const auto frame_opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
    const bool masked = (header[1] & 0x80u) != 0;
    std::uint64_t payload_len = header[1] & 0x7Fu;

    if (payload_len == 126u) {
      std::array<std::uint8_t, 2> ext{};
      if (!recv_exact(fd, ext.data(), ext.size())) {
        return false;
      }
      payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | ext[1];
    } else if (payload_len == 127u) {
      std::array<std::uint8_t, 8> ext{};
      if (!recv_exact(fd, ext.data(), ext.size())) {
        return false;
      }
      payload_len = 0;
      for (const auto byte : ext) {
        payload_len = (payload_len << 8u) | byte;
      }
    }

    if (!masked || payload_len + payload.size() > kMaxFramePayloadBytes) {
      return false;
    }
    std::array<std::uint8_t, 4> mask{};
    if (!recv_exact(fd, mask.data(), mask.size())) {
      return false;
    }
    std::string chunk(static_cast<std::size_t>(payload_len), '\0');
    if (!chunk.empty() &&
        !recv_exact(fd, reinterpret_cast<std::uint8_t *>(chunk.data()), chunk.size())) {
      return false;
    }
    for (std::size_t i = 0; i < chunk.size(); ++i) {
      chunk[i] = static_cast<char>(static_cast<std::uint8_t>(chunk[i]) ^ mask[i % 4]);
    }

    // Control frames may interleave with a fragmented message.
    if (frame_opcode >= 0x8u) {
      opcode = frame_opcode;
      payload = std::move(chunk);
      return true;
    }
    if (frame_opcode != 0x0u) {
      opcode = frame_opcode;
    }
    payload += chunk;
    if (fin) {
      return true;
    }
  }
}

bool send_frame(const int fd, const std::uint8_t opcode, const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 10);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (opcode & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 65535u) {
    frame.push_back(126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }
  frame.insert(frame.end(), payload.begin(), payload.end());
  return send_all(fd, frame.data(), frame.size());
}

std::string outcome_of(const common::Result<ExtensionResponse> &result) {
  if (result.ok()) {
    return result.value().ok ? "ok" : "error";
  }
  switch (result.code()) {
  case common::ErrorCode::RequestTimeout:
    return "timeout";
  case common::ErrorCode::NotConnected:
    return "not_connected";
  default:
    return "failed";
  }
}

common::Result<ExtensionResponse> not_connected() {
  return common::Result<ExtensionResponse>::failure(common::ErrorCode::NotConnected,
                                                    "Extension not connected");
}

} // namespace

// --- pending table ----------------------------------------------------------

void ExtensionBridge::PendingTable::insert(const std::string &id,
                                           std::shared_ptr<PendingSlot> slot) {
  std::size_t depth = 0;
  {
    std::unique_lock<std::shared_mutex> lock(mutex);
    slots[id] = std::move(slot);
    depth = slots.size();
  }
  observability::record_metric(observability::PendingBridgeRequestsMetric{.depth = depth});
}

std::shared_ptr<ExtensionBridge::PendingSlot>
ExtensionBridge::PendingTable::take(const std::string &id) {
  std::shared_ptr<PendingSlot> slot;
  std::size_t depth = 0;
  {
    std::unique_lock<std::shared_mutex> lock(mutex);
    const auto it = slots.find(id);
    if (it == slots.end()) {
      return nullptr;
    }
    slot = std::move(it->second);
    slots.erase(it);
    depth = slots.size();
  }
  observability::record_metric(observability::PendingBridgeRequestsMetric{.depth = depth});
  return slot;
}

std::size_t ExtensionBridge::PendingTable::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return slots.size();
}

// --- lifecycle --------------------------------------------------------------

ExtensionBridge::ExtensionBridge(BridgeOptions options, common::EventLoop *loop)
    : options_(std::move(options)), loop_(loop) {}

ExtensionBridge::~ExtensionBridge() { stop(); }

common::Status ExtensionBridge::start() {
  if (running_) {
    return common::Status::error("extension bridge already running");
  }
  if (common::trim(options_.host).empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "bridge host is empty");
  }
  health::mark_starting(health::Component::Bridge);

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create bridge listen socket");
  }
  int reuse = 1;
  if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
    observability::record_error("bridge", std::string("SO_REUSEADDR: ") + std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options_.port);
  const std::string host = lower_trimmed(options_.host) == "localhost" ? "127.0.0.1"
                                                                       : common::trim(options_.host);
  const auto fail = [this](const std::string &message) {
    close(listen_fd_);
    listen_fd_ = -1;
    health::mark_error(health::Component::Bridge, message);
    observability::record_error("bridge", message);
    return common::Status::error(message);
  };
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    return fail("invalid bridge bind host: " + options_.host);
  }
  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    return fail("bridge bind failed: " + std::string(std::strerror(errno)));
  }
  if (listen(listen_fd_, kListenBacklog) != 0) {
    return fail("bridge listen failed: " + std::string(std::strerror(errno)));
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  bound_port_ = getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0
                    ? ntohs(actual.sin_port)
                    : options_.port;

  running_ = true;
  accept_thread_ = std::thread([this, fd = listen_fd_]() { accept_loop(fd); });
  health::mark_error(health::Component::Bridge, "extension not connected");
  return common::Status::success();
}

void ExtensionBridge::stop() {
  if (!running_ && listen_fd_ < 0) {
    return;
  }
  running_ = false;

  // Shutdown wakes accept(); the fd is closed only once nothing can use it.
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }

  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    for (const auto &[serial, connection] : connections_) {
      shutdown(connection->fd, SHUT_RDWR);
    }
    for (auto &[serial, thread] : connection_threads_) {
      threads.push_back(std::move(thread));
    }
    connection_threads_.clear();
    for (auto &thread : finished_threads_) {
      threads.push_back(std::move(thread));
    }
    finished_threads_.clear();
  }
  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  fail_pending([](const PendingSlot &) { return true; });
  bound_port_ = 0;
  health::reset(health::Component::Bridge);
}

ConnectionState ExtensionBridge::state() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return active_ != nullptr ? ConnectionState::Connected : ConnectionState::Disconnected;
}

std::size_t ExtensionBridge::pending_count() const { return pending_->size(); }

std::size_t ExtensionBridge::connection_thread_count() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return connection_threads_.size() + finished_threads_.size();
}

// --- connections ------------------------------------------------------------

void ExtensionBridge::accept_loop(const int listen_fd) {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client_fd = accept(listen_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client_fd < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    auto connection = std::make_shared<Connection>();
    connection->fd = client_fd;
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection->serial = next_serial_++;
    connections_[connection->serial] = connection;
    connection_threads_.emplace(connection->serial, std::thread([this, connection]() {
                                  connection_loop(connection);
                                  retire_thread(connection->serial);
                                }));
  }
}

void ExtensionBridge::retire_thread(const std::uint64_t serial) {
  std::vector<std::thread> earlier;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    const auto it = connection_threads_.find(serial);
    if (it == connection_threads_.end()) {
      return; // stop() has taken the handle and joins it
    }
    earlier.swap(finished_threads_);
    finished_threads_.push_back(std::move(it->second));
    connection_threads_.erase(it);
  }
  for (auto &thread : earlier) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

bool ExtensionBridge::perform_handshake(const int fd) const {
  std::string request;
  std::array<char, 1024> buf{};
  while (request.size() < kMaxHandshakeBytes && request.find("\r\n\r\n") == std::string::npos) {
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      return false;
    }
    request.append(buf.data(), static_cast<std::size_t>(n));
  }
  if (request.find("\r\n\r\n") == std::string::npos) {
    (void)send_http_response(fd, 400, "Bad Request", {{"Content-Type", "application/json"}},
                             R"({"error":"invalid_websocket_handshake"})");
    return false;
  }

  const auto headers = parse_headers(request);
  const auto request_line = headers.find(":request-line");
  if (request_line == headers.end() || !request_line->second.starts_with("GET ")) {
    (void)send_http_response(fd, 405, "Method Not Allowed",
                             {{"Content-Type", "application/json"}},
                             R"({"error":"websocket_requires_get"})");
    return false;
  }

  const auto upgrade = headers.find("upgrade");
  const auto connection = headers.find("connection");
  const auto version = headers.find("sec-websocket-version");
  const auto key = headers.find("sec-websocket-key");
  if (upgrade == headers.end() || connection == headers.end() || version == headers.end() ||
      key == headers.end() || lower_trimmed(upgrade->second) != "websocket" ||
      common::to_lower(connection->second).find("upgrade") == std::string::npos ||
      common::trim(version->second) != "13") {
    (void)send_http_response(fd, 400, "Bad Request", {{"Content-Type", "application/json"}},
                             R"({"error":"missing_websocket_headers"})");
    return false;
  }

  return send_http_response(fd, 101, "Switching Protocols",
                            {{"Upgrade", "websocket"},
                             {"Connection", "Upgrade"},
                             {"Sec-WebSocket-Accept", websocket_accept(common::trim(key->second))}});
}

void ExtensionBridge::connection_loop(const std::shared_ptr<Connection> connection) {
  if (!perform_handshake(connection->fd)) {
    on_connection_closed(connection);
    return;
  }

  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (running_) {
      std::shared_ptr<Connection> replaced = std::move(active_);
      active_ = connection;
      accepted = true;
      // The old endpoint's reader sees EOF and fails the calls it still owes.
      if (replaced != nullptr && replaced->fd >= 0) {
        shutdown(replaced->fd, SHUT_RDWR);
      }
    }
  }
  if (!accepted) {
    on_connection_closed(connection);
    return;
  }
  health::mark_ok(health::Component::Bridge);
  observability::record_bridge_state(true);

  while (running_) {
    std::uint8_t opcode = 0;
    std::string payload;
    if (!read_next_message(connection->fd, opcode, payload)) {
      break;
    }
    if (opcode == 0x8u) {
      break;
    }
    if (opcode == 0x9u) {
      std::lock_guard<std::mutex> write_lock(connection->write_mutex);
      (void)send_frame(connection->fd, 0xAu, payload);
      continue;
    }
    if (opcode == 0x1u) {
      handle_message(payload);
    }
  }

  on_connection_closed(connection);
}

void ExtensionBridge::on_connection_closed(const std::shared_ptr<Connection> &connection) {
  bool was_active = false;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connections_.erase(connection->serial);
    if (active_ == connection) {
      active_.reset();
      was_active = true;
    }
    std::lock_guard<std::mutex> write_lock(connection->write_mutex);
    if (connection->fd >= 0) {
      shutdown(connection->fd, SHUT_RDWR);
      close(connection->fd);
      connection->fd = -1;
    }
  }

  const auto serial = connection->serial;
  fail_pending([serial](const PendingSlot &slot) { return slot.connection == serial; });

  if (was_active) {
    if (running_) {
      health::mark_error(health::Component::Bridge, "extension disconnected");
    }
    observability::record_bridge_state(false);
  }
}

bool ExtensionBridge::send_text(const std::shared_ptr<Connection> &connection,
                                const std::string &payload) {
  std::lock_guard<std::mutex> write_lock(connection->write_mutex);
  return connection->fd >= 0 && send_frame(connection->fd, 0x1u, payload);
}

void ExtensionBridge::handle_message(const std::string &payload) {
  auto response = parse_extension_response(payload);
  if (!response.ok()) {
    return;
  }
  // Late answers to timed-out calls land here with no slot and are dropped.
  if (auto slot = pending_->take(response.value().id); slot != nullptr) {
    complete(slot, common::Result<ExtensionResponse>::success(std::move(response.value())));
  }
}

void ExtensionBridge::fail_pending(const std::function<bool(const PendingSlot &)> &predicate) {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock(pending_->mutex);
    for (const auto &[id, slot] : pending_->slots) {
      if (predicate(*slot)) {
        ids.push_back(id);
      }
    }
  }
  for (const auto &id : ids) {
    if (auto slot = pending_->take(id); slot != nullptr) {
      complete(slot, not_connected());
    }
  }
}

// --- calls ------------------------------------------------------------------

void ExtensionBridge::complete(const std::shared_ptr<PendingSlot> &slot,
                               common::Result<ExtensionResponse> result) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - slot->started);
  observability::record_bridge_call(slot->method, elapsed, outcome_of(result));

  if (slot->loop->in_loop_thread()) {
    slot->callback(std::move(result));
    return;
  }
  auto callback = slot->callback;
  auto shared = std::make_shared<common::Result<ExtensionResponse>>(std::move(result));
  if (!slot->loop->post([callback, shared]() { callback(std::move(*shared)); })) {
    // The loop is gone; completing inline beats never completing.
    callback(std::move(*shared));
  }
}

void ExtensionBridge::call(common::EventLoop &loop, const std::string &method,
                           const std::string &params, ResponseCallback callback) {
  std::shared_ptr<Connection> connection;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection = active_;
  }
  if (connection == nullptr) {
    observability::record_bridge_call(method, std::chrono::milliseconds(0), "not_connected");
    callback(not_connected());
    return;
  }

  const ExtensionRequest request{.id = generate_request_id(), .method = method, .params = params};
  auto slot = std::make_shared<PendingSlot>();
  slot->connection = connection->serial;
  slot->method = method;
  slot->started = std::chrono::steady_clock::now();
  slot->loop = &loop;
  slot->callback = std::move(callback);
  pending_->insert(request.id, slot);

  if (!send_text(connection, request.to_json())) {
    if (auto taken = pending_->take(request.id); taken != nullptr) {
      complete(taken, not_connected());
    }
    return;
  }

  const std::weak_ptr<PendingTable> table = pending_;
  const bool armed = loop.post_after(options_.request_timeout, [table, id = request.id]() {
    const auto strong = table.lock();
    if (strong == nullptr) {
      return;
    }
    if (auto taken = strong->take(id); taken != nullptr) {
      complete(taken, common::Result<ExtensionResponse>::failure(
                          common::ErrorCode::RequestTimeout, "Extension request timed out"));
    }
  });
  if (!armed) {
    if (auto taken = pending_->take(request.id); taken != nullptr) {
      complete(taken, common::Result<ExtensionResponse>::failure(
                          common::ErrorCode::Protocol, "event loop is not running"));
    }
  }
}

common::Result<ExtensionResponse> ExtensionBridge::call_blocking(const std::string &method,
                                                                 const std::string &params) {
  return common::run_blocking<ExtensionResponse>(
      loop_, [this, method, params](common::EventLoop &loop,
                                    common::Completion<ExtensionResponse> done) {
        call(loop, method, params, std::move(done));
      });
}

bool ExtensionBridge::is_connected_blocking() {
  auto connected = common::run_blocking<bool>(
      loop_, [this](common::EventLoop &, common::Completion<bool> done) {
        done(common::Result<bool>::success(is_connected()));
      });
  return connected.ok() && connected.value();
}

} // namespace cdpgate::bridge
