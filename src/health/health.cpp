#include "cdpgate/health/health.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/json_util.hpp"

#include <array>
#include <mutex>
#include <utility>
#include <vector>

namespace cdpgate::health {

namespace {

constexpr std::array kComponents = {Component::Browser, Component::Bridge,
                                    Component::StateStore};

std::mutex g_mutex;
std::array<std::optional<ComponentStatus>, kComponents.size()> g_components;

std::optional<ComponentStatus> &slot(const Component component) {
  return g_components[static_cast<std::size_t>(component)];
}

ComponentStatus &touch(const Component component, const ComponentState state) {
  auto &entry = slot(component);
  if (!entry.has_value()) {
    entry.emplace();
  }
  entry->state = state;
  entry->updated_at = common::now_rfc3339();
  return *entry;
}

} // namespace

std::string_view component_name(const Component component) {
  switch (component) {
  case Component::Browser:
    return "browser";
  case Component::Bridge:
    return "bridge";
  case Component::StateStore:
    return "state_store";
  }
  return "unknown";
}

std::string_view state_name(const ComponentState state) {
  switch (state) {
  case ComponentState::Starting:
    return "starting";
  case ComponentState::Ok:
    return "ok";
  case ComponentState::Error:
    return "error";
  }
  return "unknown";
}

void mark_starting(const Component component) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &status = touch(component, ComponentState::Starting);
  status.error_count = 0;
  status.last_error.reset();
}

void mark_ok(const Component component) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &status = touch(component, ComponentState::Ok);
  status.last_ok = status.updated_at;
  status.last_error.reset();
}

void mark_error(const Component component, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &status = touch(component, ComponentState::Error);
  status.last_error = error;
  ++status.error_count;
}

void reset(const Component component) {
  std::lock_guard<std::mutex> lock(g_mutex);
  slot(component).reset();
}

std::optional<ComponentStatus> get(const Component component) {
  std::lock_guard<std::mutex> lock(g_mutex);
  return slot(component);
}

std::string snapshot_json() {
  std::vector<std::pair<std::string, std::string>> fields;
  std::lock_guard<std::mutex> lock(g_mutex);
  for (const auto component : kComponents) {
    const auto &status = slot(component);
    if (!status.has_value()) {
      continue;
    }
    std::vector<std::pair<std::string, std::string>> entry = {
        {"status", common::json_quote(std::string(state_name(status->state)))},
        {"error_count", std::to_string(status->error_count)},
        {"updated_at", common::json_quote(status->updated_at)}};
    if (status->last_ok.has_value()) {
      entry.emplace_back("last_ok", common::json_quote(*status->last_ok));
    }
    if (status->last_error.has_value()) {
      entry.emplace_back("last_error", common::json_quote(*status->last_error));
    }
    fields.emplace_back(std::string(component_name(component)), common::json_object(entry));
  }
  return common::json_object(fields);
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto &entry : g_components) {
    entry.reset();
  }
}

} // namespace cdpgate::health
