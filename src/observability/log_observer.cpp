#include "cdpgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace cdpgate::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BrowserCommandEvent>) {
          log_line(evt.success ? "DEBUG" : "WARN",
                   "cdp.command method=" + evt.method +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          log_line("INFO", "session." + evt.action + " id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, BridgeStateEvent>) {
          log_line("INFO", evt.connected ? "bridge.connected" : "bridge.disconnected");
        } else if constexpr (std::is_same_v<T, BridgeCallEvent>) {
          log_line(evt.outcome == "ok" ? "DEBUG" : "WARN",
                   "bridge.call method=" + evt.method +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " outcome=" + evt.outcome);
        } else if constexpr (std::is_same_v<T, SnapshotEvent>) {
          log_line("DEBUG", "snapshot strategy=" + evt.strategy +
                                " nodes=" + std::to_string(evt.node_count));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line("DEBUG", "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, PendingBridgeRequestsMetric>) {
          log_line("DEBUG", "metric.pending_bridge_requests=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace cdpgate::observability
