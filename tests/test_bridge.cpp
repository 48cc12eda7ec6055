#include "test_framework.hpp"

#include "cdpgate/bridge/extension_bridge.hpp"
#include "cdpgate/bridge/protocol.hpp"
#include "cdpgate/browser/cdp.hpp"
#include "cdpgate/common/event_loop.hpp"
#include "cdpgate/common/json_util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

namespace bridge = cdpgate::bridge;
namespace common = cdpgate::common;
using namespace std::chrono_literals;

bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

struct BridgeFixture {
  common::EventLoop loop;
  std::unique_ptr<bridge::ExtensionBridge> bridge;

  explicit BridgeFixture(std::chrono::milliseconds timeout = 2000ms) {
    loop.start();
    bridge = std::make_unique<bridge::ExtensionBridge>(
        bridge::BridgeOptions{.host = "127.0.0.1", .port = 0, .request_timeout = timeout}, &loop);
    const auto started = bridge->start();
    if (!started.ok()) {
      throw std::runtime_error("bridge failed to start: " + started.error());
    }
  }

  ~BridgeFixture() {
    bridge->stop();
    loop.stop();
  }

  [[nodiscard]] std::string url() const {
    return "ws://127.0.0.1:" + std::to_string(bridge->port()) + "/";
  }

  /// Connects an extension peer and waits until the bridge has adopted it.
  [[nodiscard]] std::unique_ptr<cdpgate::browser::ICDPTransport> connect_peer() const {
    auto peer = cdpgate::browser::make_websocket_transport();
    const auto connected = peer->connect(url());
    if (!connected.ok()) {
      throw std::runtime_error("peer failed to connect: " + connected.error());
    }
    if (!wait_until([this]() { return bridge->is_connected(); })) {
      throw std::runtime_error("bridge never saw the peer");
    }
    return peer;
  }
};

/// Reads one request frame from the extension side. Safe to call off the
/// test thread: a missing frame is nullopt, never an exception.
std::optional<common::JsonRawMap> read_request(cdpgate::browser::ICDPTransport &peer) {
  auto frame = peer.receive_text(2000ms);
  if (!frame.ok()) {
    return std::nullopt;
  }
  return common::json_parse_object(frame.value());
}

std::string reply(const common::JsonRawMap &request, bool ok, const std::string &body) {
  return common::json_object({{"id", common::json_raw_field(request, "id")},
                              {"ok", common::json_bool(ok)},
                              {ok ? "result" : "error", body}});
}

std::string raw_http_exchange(std::uint16_t port, const std::string &request) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return "";
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  std::string response;
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0 &&
      send(fd, request.data(), request.size(), MSG_NOSIGNAL) ==
          static_cast<ssize_t>(request.size())) {
    std::array<char, 512> buf{};
    ssize_t n = 0;
    while ((n = recv(fd, buf.data(), buf.size(), 0)) > 0) {
      response.append(buf.data(), static_cast<std::size_t>(n));
    }
  }
  close(fd);
  return response;
}

} // namespace

void register_bridge_tests(std::vector<cdpgate::tests::TestCase> &tests) {
  using cdpgate::tests::require;

  tests.push_back({"bridge_protocol_parses_responses", [] {
                     auto ok = bridge::parse_extension_response(
                         R"({"id":"a","ok":true,"result":{"groupId":4}})");
                     require(ok.ok() && ok.value().ok, "ok response");
                     require(ok.value().result == std::optional<std::string>(R"({"groupId":4})"),
                             "raw result kept");
                     auto value = bridge::response_to_value(ok.value());
                     require(value.ok() && value.value() == R"({"groupId":4})", "value");

                     auto failed = bridge::parse_extension_response(
                         R"({"id":"b","ok":false,"error":"No tab with id 9"})");
                     require(failed.ok() && !failed.value().ok, "error response parses");
                     auto error = bridge::response_to_value(failed.value());
                     require(!error.ok() && error.code() == common::ErrorCode::ExtensionError,
                             "ExtensionError");
                     require(error.error() == "Extension error: No tab with id 9", error.error());

                     require(!bridge::parse_extension_response(R"({"ok":true})").ok(),
                             "id is required");
                     require(!bridge::parse_extension_response("[1,2]").ok(), "must be object");

                     bridge::ExtensionResponse bare{.id = "c", .ok = true};
                     require(bridge::response_to_value(bare).value() == "null",
                             "missing result is null");
                   }});

  tests.push_back({"bridge_request_ids_are_uuid_v4", [] {
                     const auto a = bridge::generate_request_id();
                     const auto b = bridge::generate_request_id();
                     require(a.size() == 36 && a[8] == '-' && a[14] == '4', "v4 layout");
                     require(a != b, "ids are unique");
                     require(bridge::is_extension_method("tabs.group") &&
                                 bridge::is_extension_method("storage.set"),
                             "extension methods known");
                     require(!bridge::is_extension_method("browser.click"),
                             "browser methods are not extension methods");
                   }});

  tests.push_back({"bridge_without_extension_fails_fast", [] {
                     BridgeFixture f;
                     require(f.bridge->port() != 0, "ephemeral port bound");
                     require(!f.bridge->is_connected_blocking(), "nobody connected");
                     const auto started = std::chrono::steady_clock::now();
                     auto response = f.bridge->call_blocking("tabs.query", "{}");
                     require(!response.ok() && response.code() == common::ErrorCode::NotConnected,
                             "NotConnected");
                     require(std::chrono::steady_clock::now() - started < 1000ms,
                             "no waiting for the timeout");
                     require(f.bridge->pending_count() == 0, "nothing pending");
                   }});

  tests.push_back({"bridge_rejects_plain_http", [] {
                     BridgeFixture f;
                     const auto response = raw_http_exchange(
                         f.bridge->port(), "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");
                     require(response.starts_with("HTTP/1.1 400"), response);
                     require(response.find("missing_websocket_headers") != std::string::npos,
                             "error body");
                     const auto post = raw_http_exchange(
                         f.bridge->port(), "POST / HTTP/1.1\r\nHost: localhost\r\n\r\n");
                     require(post.starts_with("HTTP/1.1 405"), post);
                     require(!f.bridge->is_connected(), "rejected peers never become active");
                   }});

  tests.push_back({"bridge_routes_response_by_id", [] {
                     BridgeFixture f;
                     auto peer = f.connect_peer();
                     require(f.bridge->is_connected_blocking(), "connected");

                     std::string seen_method;
                     std::string seen_params;
                     std::thread extension([&]() {
                       const auto request = read_request(*peer);
                       if (!request.has_value()) {
                         return;
                       }
                       seen_method = common::json_string_field(*request, "method").value_or("");
                       seen_params = common::json_raw_field(*request, "params");
                       (void)peer->send_text(reply(*request, true, R"({"groupId":12})"));
                     });
                     auto response = f.bridge->call_blocking("tabs.group", R"({"tabIds":[1,2]})");
                     extension.join();

                     require(response.ok(), response.ok() ? "" : response.error());
                     require(response.value().ok, "ok flag");
                     require(response.value().result == std::optional<std::string>(R"({"groupId":12})"),
                             "result routed back");
                     require(seen_method == "tabs.group", "method forwarded");
                     require(seen_params == R"({"tabIds":[1,2]})", "params forwarded raw");
                     require(f.bridge->pending_count() == 0, "slot released");
                   }});

  tests.push_back({"bridge_correlates_out_of_order_answers", [] {
                     BridgeFixture f;
                     auto peer = f.connect_peer();

                     std::thread extension([&]() {
                       const auto first = read_request(*peer);
                       const auto second = read_request(*peer);
                       if (!first.has_value() || !second.has_value()) {
                         return;
                       }
                       for (const auto *request : {&*second, &*first}) {
                         const auto method = common::json_string_field(*request, "method").value_or("");
                         (void)peer->send_text(reply(*request, true, common::json_quote(method)));
                       }
                     });
                     auto a = std::async(std::launch::async, [&]() {
                       return f.bridge->call_blocking("storage.get", "{}");
                     });
                     auto b = std::async(std::launch::async, [&]() {
                       return f.bridge->call_blocking("cookies.getAll", "{}");
                     });
                     const auto ra = a.get();
                     const auto rb = b.get();
                     extension.join();

                     require(ra.ok() && ra.value().result == std::optional<std::string>("\"storage.get\""),
                             "first caller got its own answer");
                     require(rb.ok() &&
                                 rb.value().result == std::optional<std::string>("\"cookies.getAll\""),
                             "second caller got its own answer");
                   }});

  tests.push_back({"bridge_extension_error_surfaces", [] {
                     BridgeFixture f;
                     auto peer = f.connect_peer();
                     std::thread extension([&]() {
                       if (const auto request = read_request(*peer); request.has_value()) {
                         (void)peer->send_text(reply(*request, false, common::json_quote("denied")));
                       }
                     });
                     auto response = f.bridge->call_blocking("cookies.set", R"({"name":"a"})");
                     extension.join();
                     require(response.ok() && !response.value().ok, "delivered as a response");
                     auto value = bridge::response_to_value(response.value());
                     require(!value.ok() && value.code() == common::ErrorCode::ExtensionError,
                             "ExtensionError");
                     require(value.error() == "Extension error: denied", value.error());
                   }});

  tests.push_back({"bridge_times_out_silent_extension", [] {
                     BridgeFixture f(200ms);
                     auto peer = f.connect_peer();
                     const auto started = std::chrono::steady_clock::now();
                     auto response = f.bridge->call_blocking("tabs.group", "{}");
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!response.ok() && response.code() == common::ErrorCode::RequestTimeout,
                             "RequestTimeout");
                     require(response.error() == "Extension request timed out", response.error());
                     require(elapsed >= 150ms, "waited for the timer");
                     require(f.bridge->pending_count() == 0, "timed-out slot removed");

                     // A late answer for the expired id is dropped.
                     const auto request = read_request(*peer);
                     require(request.has_value(), "request reached the extension");
                     (void)peer->send_text(reply(*request, true, "1"));
                     require(f.bridge->is_connected_blocking(), "connection survives late answer");
                   }});

  tests.push_back({"bridge_disconnect_fails_pending_calls", [] {
                     BridgeFixture f(5000ms);
                     auto peer = f.connect_peer();
                     std::thread extension([&]() {
                       (void)read_request(*peer);
                       peer->close();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     auto response = f.bridge->call_blocking("tabs.ungroup", "{}");
                     extension.join();
                     require(!response.ok() && response.code() == common::ErrorCode::NotConnected,
                             "NotConnected on disconnect");
                     require(std::chrono::steady_clock::now() - started < 4000ms,
                             "failed before the timeout");
                     require(wait_until([&]() { return !f.bridge->is_connected(); }),
                             "state back to disconnected");
                   }});

  tests.push_back({"bridge_newest_connection_wins", [] {
                     BridgeFixture f;
                     auto old_peer = f.connect_peer();
                     auto new_peer = cdpgate::browser::make_websocket_transport();
                     require(new_peer->connect(f.url()).ok(), "second peer connects");
                     require(wait_until([&]() {
                               auto frame = old_peer->receive_text(20ms);
                               return !frame.ok() && frame.error() != "timeout";
                             }),
                             "old peer is shut down");

                     std::thread extension([&]() {
                       if (const auto request = read_request(*new_peer); request.has_value()) {
                         (void)new_peer->send_text(reply(*request, true, "true"));
                       }
                     });
                     auto response = f.bridge->call_blocking("notifications.create", "{}");
                     extension.join();
                     require(response.ok() && response.value().result == std::optional<std::string>("true"),
                             "routed to the newest peer");
                   }});
  tests.push_back({"bridge_reconnects_do_not_accumulate_threads", [] {
                     BridgeFixture f;
                     for (int i = 0; i < 40; ++i) {
                       auto peer = f.connect_peer();
                       peer->close();
                       require(wait_until([&]() { return !f.bridge->is_connected(); }),
                               "peer " + std::to_string(i) + " released");
                     }
                     for (int i = 0; i < 5; ++i) {
                       (void)raw_http_exchange(f.bridge->port(), "GET / HTTP/1.1\r\n\r\n");
                     }
                     require(wait_until([&]() { return f.bridge->connection_thread_count() <= 1; }),
                             "finished connection threads are joined");

                     auto peer = f.connect_peer();
                     std::thread extension([&]() {
                       if (const auto request = read_request(*peer); request.has_value()) {
                         (void)peer->send_text(reply(*request, true, "1"));
                       }
                     });
                     auto response = f.bridge->call_blocking("tabGroups.query", "{}");
                     extension.join();
                     require(response.ok(), "bridge still serves after many reconnects");
                     require(f.bridge->connection_thread_count() <= 2, "one live thread plus one parked");
                   }});
  tests.push_back({"bridge_stops_and_restarts_cleanly", [] {
                     common::EventLoop loop;
                     loop.start();
                     bridge::ExtensionBridge bridge(
                         bridge::BridgeOptions{.host = "127.0.0.1", .port = 0,
                                               .request_timeout = 2000ms},
                         &loop);
                     for (int round = 0; round < 5; ++round) {
                       require(bridge.start().ok(), "start round " + std::to_string(round));
                       require(bridge.port() != 0, "bound");
                       if (round % 2 == 1) {
                         auto peer = cdpgate::browser::make_websocket_transport();
                         require(peer->connect("ws://127.0.0.1:" + std::to_string(bridge.port()) +
                                               "/")
                                     .ok(),
                                 "peer connects");
                         require(wait_until([&]() { return bridge.is_connected(); }), "adopted");
                       }
                       bridge.stop();
                       require(!bridge.is_running() && !bridge.is_connected(), "stopped");
                       require(bridge.connection_thread_count() == 0, "threads joined on stop");
                     }
                     loop.stop();
                   }});
}
