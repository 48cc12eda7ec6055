#pragma once

#include "cdpgate/observability/observer.hpp"

#include <memory>

namespace cdpgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_browser_command(const std::string &method, std::chrono::milliseconds duration,
                            bool success);
void record_session(const std::string &session_id, const std::string &action);
void record_bridge_state(bool connected);
void record_bridge_call(const std::string &method, std::chrono::milliseconds duration,
                        const std::string &outcome);
void record_snapshot(const std::string &strategy, std::size_t node_count);
void record_error(const std::string &component, const std::string &message);

} // namespace cdpgate::observability
