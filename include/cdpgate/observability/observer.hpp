#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cdpgate::observability {

struct BrowserCommandEvent {
  std::string method;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct SessionEvent {
  std::string session_id;
  std::string action;
};

struct BridgeStateEvent {
  bool connected = false;
};

struct BridgeCallEvent {
  std::string method;
  std::chrono::milliseconds duration{0};
  std::string outcome;
};

struct SnapshotEvent {
  std::string strategy;
  std::size_t node_count = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<BrowserCommandEvent, SessionEvent, BridgeStateEvent,
                                   BridgeCallEvent, SnapshotEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct PendingBridgeRequestsMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric =
    std::variant<RequestLatencyMetric, ActiveSessionsMetric, PendingBridgeRequestsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cdpgate::observability
