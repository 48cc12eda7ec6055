#include "cdpgate/observability/global.hpp"

#include <mutex>

namespace cdpgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_browser_command(const std::string &method, std::chrono::milliseconds duration,
                            const bool success) {
  record_event(BrowserCommandEvent{.method = method, .duration = duration, .success = success});
}

void record_session(const std::string &session_id, const std::string &action) {
  record_event(SessionEvent{.session_id = session_id, .action = action});
}

void record_bridge_state(const bool connected) {
  record_event(BridgeStateEvent{.connected = connected});
}

void record_bridge_call(const std::string &method, std::chrono::milliseconds duration,
                        const std::string &outcome) {
  record_event(BridgeCallEvent{.method = method, .duration = duration, .outcome = outcome});
}

void record_snapshot(const std::string &strategy, const std::size_t node_count) {
  record_event(SnapshotEvent{.strategy = strategy, .node_count = node_count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace cdpgate::observability
