#pragma once

#include "cdpgate/common/result.hpp"
#include "cdpgate/config/schema.hpp"
#include "cdpgate/observability/observer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cdpgate::observability {

/// One bit per event family. `observability.events` names them as
/// commands, sessions, bridge, snapshots, errors and metrics.
enum EventKind : std::uint32_t {
  kCommandEvents = 1u << 0,
  kSessionEvents = 1u << 1,
  kBridgeEvents = 1u << 2,
  kSnapshotEvents = 1u << 3,
  kErrorEvents = 1u << 4,
  kMetrics = 1u << 5,
  kAllEvents = (1u << 6) - 1,
};

[[nodiscard]] std::uint32_t event_kind(const ObserverEvent &event);

/// Parsed `[observability]` section.
struct ObserverPlan {
  /// Deduplicated, in configured order; `none` contributes nothing.
  std::vector<std::string> backends;
  std::uint32_t kinds = kAllEvents;
};

/// Fails with InvalidArgument naming the first unknown backend or event kind.
[[nodiscard]] common::Result<ObserverPlan>
plan_observers(const config::ObservabilityConfig &config);

/// Forwards each event to the observers subscribed to its kind. A router
/// with no routes drops everything.
class ObserverRouter final : public IObserver {
public:
  void add_route(std::unique_ptr<IObserver> observer, std::uint32_t kinds = kAllEvents);
  [[nodiscard]] std::size_t route_count() const { return routes_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "router"; }

private:
  struct Route {
    std::unique_ptr<IObserver> observer;
    std::uint32_t kinds = kAllEvents;
  };

  std::vector<Route> routes_;
};

/// Builds the router for `config.observability`. A setting that does not
/// parse logs every event, so a typo never silences the gateway.
[[nodiscard]] std::unique_ptr<ObserverRouter> create_observer(const config::Config &config);

} // namespace cdpgate::observability
