#include "cdpgate/observability/router.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/observability/log_observer.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <variant>

namespace cdpgate::observability {

namespace {

std::vector<std::string> split_list(const std::string &list) {
  std::vector<std::string> parts;
  std::stringstream stream(common::to_lower(list));
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::trim(part);
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

std::uint32_t kind_from_name(const std::string &name) {
  if (name == "all") {
    return kAllEvents;
  }
  if (name == "commands") {
    return kCommandEvents;
  }
  if (name == "sessions") {
    return kSessionEvents;
  }
  if (name == "bridge") {
    return kBridgeEvents;
  }
  if (name == "snapshots") {
    return kSnapshotEvents;
  }
  if (name == "errors") {
    return kErrorEvents;
  }
  if (name == "metrics") {
    return kMetrics;
  }
  return 0;
}

} // namespace

std::uint32_t event_kind(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::uint32_t {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BrowserCommandEvent>) {
          return kCommandEvents;
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          return kSessionEvents;
        } else if constexpr (std::is_same_v<T, BridgeStateEvent> ||
                             std::is_same_v<T, BridgeCallEvent>) {
          return kBridgeEvents;
        } else if constexpr (std::is_same_v<T, SnapshotEvent>) {
          return kSnapshotEvents;
        } else {
          return kErrorEvents;
        }
      },
      event);
}

common::Result<ObserverPlan> plan_observers(const config::ObservabilityConfig &config) {
  ObserverPlan plan;
  for (const auto &backend : split_list(config.backend)) {
    if (backend == "none" || backend == "noop") {
      continue;
    }
    if (backend != "log") {
      return common::Result<ObserverPlan>::failure(
          common::ErrorCode::InvalidArgument, "Invalid observability.backend: " + config.backend);
    }
    if (std::find(plan.backends.begin(), plan.backends.end(), backend) == plan.backends.end()) {
      plan.backends.push_back(backend);
    }
  }

  const auto kinds = split_list(config.events);
  if (!kinds.empty()) {
    plan.kinds = 0;
  }
  for (const auto &name : kinds) {
    const std::uint32_t kind = kind_from_name(name);
    if (kind == 0) {
      return common::Result<ObserverPlan>::failure(common::ErrorCode::InvalidArgument,
                                                   "Invalid observability.events entry: " + name);
    }
    plan.kinds |= kind;
  }
  return common::Result<ObserverPlan>::success(std::move(plan));
}

void ObserverRouter::add_route(std::unique_ptr<IObserver> observer, const std::uint32_t kinds) {
  if (observer != nullptr && kinds != 0) {
    routes_.push_back(Route{.observer = std::move(observer), .kinds = kinds});
  }
}

void ObserverRouter::record_event(const ObserverEvent &event) {
  const std::uint32_t kind = event_kind(event);
  for (auto &route : routes_) {
    if ((route.kinds & kind) != 0) {
      route.observer->record_event(event);
    }
  }
}

void ObserverRouter::record_metric(const ObserverMetric &metric) {
  for (auto &route : routes_) {
    if ((route.kinds & kMetrics) != 0) {
      route.observer->record_metric(metric);
    }
  }
}

void ObserverRouter::flush() {
  for (auto &route : routes_) {
    route.observer->flush();
  }
}

std::unique_ptr<ObserverRouter> create_observer(const config::Config &config) {
  auto router = std::make_unique<ObserverRouter>();
  auto plan = plan_observers(config.observability);
  if (!plan.ok()) {
    router->add_route(std::make_unique<LogObserver>());
    return router;
  }
  for (const auto &backend : plan.value().backends) {
    if (backend == "log") {
      router->add_route(std::make_unique<LogObserver>(), plan.value().kinds);
    }
  }
  return router;
}

} // namespace cdpgate::observability
