#include "cdpgate/browser/cdp.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/observability/global.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <random>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace cdpgate::browser {

namespace {

struct ParsedWsUrl {
  std::string host;
  std::uint16_t port = 0;
  std::string path;
};

std::string encode_params(const JsonMap &params) {
  std::vector<std::pair<std::string, std::string>> fields(params.begin(), params.end());
  return common::json_object(fields);
}

common::Result<ParsedWsUrl> parse_ws_url(const std::string &url) {
  const std::string trimmed = common::trim(url);
  if (!trimmed.starts_with("ws://")) {
    return common::Result<ParsedWsUrl>::failure(common::ErrorCode::InvalidArgument,
                                                "only ws:// URLs are supported: " + trimmed);
  }
  const std::size_t host_start = 5;
  const std::size_t path_start = trimmed.find('/', host_start);
  const std::string host_port = trimmed.substr(
      host_start, path_start == std::string::npos ? std::string::npos : path_start - host_start);

  ParsedWsUrl parsed;
  parsed.port = 80;
  const auto colon = host_port.rfind(':');
  parsed.host = colon == std::string::npos ? host_port : host_port.substr(0, colon);
  if (colon != std::string::npos) {
    try {
      const auto port = std::stoul(host_port.substr(colon + 1));
      if (port == 0 || port > 65535) {
        throw std::out_of_range("port");
      }
      parsed.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception &) {
      return common::Result<ParsedWsUrl>::failure(common::ErrorCode::InvalidArgument,
                                                  "invalid websocket port in " + trimmed);
    }
  }
  if (parsed.host.empty()) {
    return common::Result<ParsedWsUrl>::failure(common::ErrorCode::InvalidArgument,
                                                "missing websocket host in " + trimmed);
  }
  parsed.path = path_start == std::string::npos ? "/" : trimmed.substr(path_start);
  return common::Result<ParsedWsUrl>::success(std::move(parsed));
}

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

std::string random_websocket_key() {
  std::array<std::uint8_t, 16> bytes{};
  std::random_device rd;
  for (auto &byte : bytes) {
    byte = static_cast<std::uint8_t>(rd() & 0xFF);
  }
  std::string key(24, '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(key.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  return key;
}

/// Client frames are always masked.
std::vector<std::uint8_t> build_client_frame(const std::uint8_t opcode,
                                             const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<std::uint8_t>(0x80u | opcode));

  const std::size_t size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(0x80u | size));
  } else if (size <= 65535u) {
    frame.push_back(0x80u | 126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(0x80u | 127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  std::array<std::uint8_t, 4> mask{};
  std::random_device rd;
  for (auto &byte : mask) {
    byte = static_cast<std::uint8_t>(rd() & 0xFF);
  }
  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<std::uint8_t>(payload[i]) ^ mask[i % mask.size()]);
  }
  return frame;
}

class WebSocketTcpTransport final : public ICDPTransport {
public:
  ~WebSocketTcpTransport() override { close(); }

  common::Status connect(const std::string &ws_url) override {
    if (connected_.load()) {
      return common::Status::error("transport already connected");
    }
    auto parsed = parse_ws_url(ws_url);
    if (!parsed.ok()) {
      return common::Status::error(parsed.code(), parsed.error());
    }
    const auto &target = parsed.value();

    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return common::Status::error("failed to create socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(target.port);
    if (inet_pton(AF_INET, target.host.c_str(), &addr.sin_addr) != 1) {
      addrinfo hints{};
      hints.ai_family = AF_INET;
      hints.ai_socktype = SOCK_STREAM;
      addrinfo *info = nullptr;
      if (getaddrinfo(target.host.c_str(), nullptr, &hints, &info) != 0 || info == nullptr) {
        ::close(fd);
        return common::Status::error("failed to resolve websocket host " + target.host);
      }
      addr.sin_addr = reinterpret_cast<sockaddr_in *>(info->ai_addr)->sin_addr;
      freeaddrinfo(info);
    }

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
      const std::string message = std::strerror(errno);
      ::close(fd);
      return common::Status::error("websocket connect failed: " + message);
    }

    std::ostringstream req;
    req << "GET " << target.path << " HTTP/1.1\r\n";
    req << "Host: " << target.host << ":" << target.port << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: " << random_websocket_key() << "\r\n";
    req << "Sec-WebSocket-Version: 13\r\n";
    req << "\r\n";
    const std::string handshake = req.str();
    if (!send_all(fd, reinterpret_cast<const std::uint8_t *>(handshake.data()), handshake.size())) {
      ::close(fd);
      return common::Status::error("websocket handshake send failed");
    }

    // Read byte-wise up to the blank line so no frame bytes are consumed.
    std::string response;
    while (!response.ends_with("\r\n\r\n")) {
      char ch = 0;
      if (recv(fd, &ch, 1, 0) != 1) {
        ::close(fd);
        return common::Status::error("websocket handshake receive failed");
      }
      response.push_back(ch);
      if (response.size() > 16 * 1024) {
        ::close(fd);
        return common::Status::error("websocket handshake too large");
      }
    }
    const auto line_end = response.find("\r\n");
    if (response.substr(0, line_end).find(" 101") == std::string::npos) {
      ::close(fd);
      return common::Status::error("websocket handshake rejected: " +
                                   response.substr(0, line_end));
    }

    {
      std::lock_guard<std::mutex> lock(io_mutex_);
      fd_ = fd;
    }
    connected_.store(true);
    return common::Status::success();
  }

  void close() override {
    int fd = -1;
    {
      std::lock_guard<std::mutex> lock(io_mutex_);
      fd = fd_;
      fd_ = -1;
    }
    connected_.store(false);
    if (fd >= 0) {
      shutdown(fd, SHUT_RDWR);
      ::close(fd);
    }
  }

  bool is_connected() const override { return connected_.load(); }

  common::Status send_text(const std::string &payload) override {
    return send_frame(0x1u, payload);
  }

  common::Result<std::string> receive_text(std::chrono::milliseconds timeout) override {
    const int fd = current_fd();
    if (!connected_.load() || fd < 0) {
      return common::Result<std::string>::failure(common::ErrorCode::NotConnected,
                                                  "transport not connected");
    }

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
    const int ready = select(fd + 1, &read_fds, nullptr, nullptr, &tv);
    if (ready < 0) {
      return common::Result<std::string>::failure("websocket select failed");
    }
    if (ready == 0) {
      return common::Result<std::string>::failure("timeout");
    }

    std::string message;
    while (true) {
      std::array<std::uint8_t, 2> header{};
      if (!recv_exact(fd, header.data(), header.size())) {
        connected_.store(false);
        return common::Result<std::string>::failure("websocket receive failed");
      }
      const bool fin = (header[0] & 0x80u) != 0;
      const auto opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
      std::uint64_t payload_len = header[1] & 0x7Fu;
      const bool masked = (header[1] & 0x80u) != 0;
      if (payload_len == 126u) {
        std::array<std::uint8_t, 2> ext{};
        if (!recv_exact(fd, ext.data(), ext.size())) {
          connected_.store(false);
          return common::Result<std::string>::failure("websocket frame header failed");
        }
        payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | ext[1];
      } else if (payload_len == 127u) {
        std::array<std::uint8_t, 8> ext{};
        if (!recv_exact(fd, ext.data(), ext.size())) {
          connected_.store(false);
          return common::Result<std::string>::failure("websocket frame header failed");
        }
        payload_len = 0;
        for (const auto byte : ext) {
          payload_len = (payload_len << 8u) | byte;
        }
      }

      std::array<std::uint8_t, 4> mask{};
      if (masked && !recv_exact(fd, mask.data(), mask.size())) {
        connected_.store(false);
        return common::Result<std::string>::failure("websocket mask read failed");
      }
      std::string payload(static_cast<std::size_t>(payload_len), '\0');
      if (!payload.empty() &&
          !recv_exact(fd, reinterpret_cast<std::uint8_t *>(payload.data()), payload.size())) {
        connected_.store(false);
        return common::Result<std::string>::failure("websocket payload read failed");
      }
      if (masked) {
        for (std::size_t i = 0; i < payload.size(); ++i) {
          payload[i] = static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]);
        }
      }

      if (opcode == 0x8u) {
        connected_.store(false);
        return common::Result<std::string>::failure("websocket closed");
      }
      if (opcode == 0x9u) {
        const auto pong = send_frame(0xAu, payload);
        if (!pong.ok()) {
          return common::Result<std::string>::failure(pong.error());
        }
        return common::Result<std::string>::failure("ping");
      }
      if (opcode == 0xAu) {
        return common::Result<std::string>::failure("ping");
      }
      if (opcode != 0x1u && opcode != 0x0u) {
        return common::Result<std::string>::failure("unsupported frame opcode");
      }
      message += payload;
      if (fin) {
        return common::Result<std::string>::success(std::move(message));
      }
    }
  }

private:
  int current_fd() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return fd_;
  }

  common::Status send_frame(const std::uint8_t opcode, const std::string &payload) {
    const int fd = current_fd();
    if (!connected_.load() || fd < 0) {
      return common::Status::error(common::ErrorCode::NotConnected, "transport not connected");
    }
    const auto frame = build_client_frame(opcode, payload);
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!send_all(fd, frame.data(), frame.size())) {
      return common::Status::error("websocket send failed");
    }
    return common::Status::success();
  }

  mutable std::mutex io_mutex_;
  std::mutex write_mutex_;
  int fd_ = -1;
  std::atomic<bool> connected_{false};
};

} // namespace

std::unique_ptr<ICDPTransport> make_websocket_transport() {
  return std::make_unique<WebSocketTcpTransport>();
}

CDPClient::CDPClient() : transport_(make_websocket_transport()) {}

CDPClient::CDPClient(std::unique_ptr<ICDPTransport> transport)
    : transport_(std::move(transport)) {}

CDPClient::~CDPClient() { disconnect(); }

common::Status CDPClient::connect(const std::string &ws_url) {
  if (transport_ == nullptr) {
    return common::Status::error(common::ErrorCode::NotConnected, "CDP transport unavailable");
  }
  if (running_.load()) {
    return common::Status::success();
  }
  const auto status = transport_->connect(ws_url);
  if (!status.ok()) {
    return status;
  }
  running_.store(true);
  reader_thread_ = std::thread([this]() { reader_loop(); });
  return common::Status::success();
}

void CDPClient::disconnect() {
  running_.store(false);
  if (transport_ != nullptr) {
    transport_->close();
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  fail_all_pending("CDP client disconnected");
}

bool CDPClient::is_connected() const {
  return transport_ != nullptr && transport_->is_connected();
}

common::Result<JsonMap> CDPClient::send_command(const std::string &method, const JsonMap &params,
                                                const std::string &session_id,
                                                std::optional<std::chrono::milliseconds> timeout) {
  if (common::trim(method).empty()) {
    return common::Result<JsonMap>::failure(common::ErrorCode::InvalidArgument,
                                            "method is required");
  }
  if (!is_connected()) {
    return common::Result<JsonMap>::failure("CDP client is not connected");
  }

  int id = 0;
  auto pending = std::make_shared<PendingRequest>();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    id = next_id_++;
    pending_requests_[id] = pending;
  }

  std::vector<std::pair<std::string, std::string>> fields = {
      {"id", std::to_string(id)},
      {"method", common::json_quote(method)},
      {"params", encode_params(params)},
  };
  if (!session_id.empty()) {
    fields.emplace_back("sessionId", common::json_quote(session_id));
  }

  const auto started = std::chrono::steady_clock::now();
  const auto elapsed = [&started]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
  };

  const auto send_status = transport_->send_text(common::json_object(fields));
  if (!send_status.ok()) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      pending_requests_.erase(id);
    }
    observability::record_browser_command(method, elapsed(), false);
    return common::Result<JsonMap>::failure(send_status.error());
  }

  std::unique_lock<std::mutex> lock(pending->mutex);
  const bool done = pending->cv.wait_for(lock, timeout.value_or(default_timeout_),
                                         [&]() { return pending->complete; });
  if (!done) {
    lock.unlock();
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      pending_requests_.erase(id);
    }
    observability::record_browser_command(method, elapsed(), false);
    return common::Result<JsonMap>::failure("CDP command timeout: " + method);
  }
  observability::record_browser_command(method, elapsed(), !pending->error.has_value());
  if (pending->error.has_value()) {
    return common::Result<JsonMap>::failure(*pending->error);
  }
  if (!pending->result.has_value()) {
    return common::Result<JsonMap>::failure("CDP command returned no result: " + method);
  }
  return common::Result<JsonMap>::success(std::move(*pending->result));
}

void CDPClient::fail_all_pending(const std::string &reason) {
  std::vector<std::shared_ptr<PendingRequest>> pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (auto &[id, request] : pending_requests_) {
      pending.push_back(request);
    }
    pending_requests_.clear();
  }
  for (const auto &request : pending) {
    std::lock_guard<std::mutex> request_lock(request->mutex);
    request->complete = true;
    request->error = reason;
    request->cv.notify_all();
  }
}

void CDPClient::reader_loop() {
  while (running_.load()) {
    if (transport_ == nullptr || !transport_->is_connected()) {
      break;
    }
    auto incoming = transport_->receive_text(std::chrono::milliseconds(200));
    if (!incoming.ok()) {
      const std::string error = incoming.error();
      if (error == "timeout" || error == "ping") {
        continue;
      }
      if (!running_.load()) {
        break;
      }
      observability::record_error("cdp", "receive failed: " + error);
      fail_all_pending("CDP receive failed: " + error);
      break;
    }
    handle_incoming_message(incoming.value());
  }
}

void CDPClient::handle_incoming_message(const std::string &json) {
  const JsonMap message = common::json_parse_object(json);

  // Only command responses matter; events carry no id and are ignored.
  const auto id = common::json_as_int(common::json_raw_field(message, "id", ""));
  if (!id.has_value()) {
    return;
  }
  std::shared_ptr<PendingRequest> pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto it = pending_requests_.find(static_cast<int>(*id));
    if (it == pending_requests_.end()) {
      return;
    }
    pending = it->second;
    pending_requests_.erase(it);
  }

  {
    std::lock_guard<std::mutex> lock(pending->mutex);
    pending->complete = true;
    if (const auto error = message.find("error"); error != message.end()) {
      const JsonMap error_fields = common::json_parse_object(error->second);
      pending->error = common::json_string_field(error_fields, "message")
                           .value_or("CDP error: " + error->second);
    } else {
      pending->result = common::json_parse_object(common::json_raw_field(message, "result", "{}"));
    }
  }
  pending->cv.notify_all();
}

} // namespace cdpgate::browser
