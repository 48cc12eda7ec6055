#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cdpgate::health {

/// Parts of the gateway that report health. Order is the snapshot order.
enum class Component { Browser, Bridge, StateStore };

enum class ComponentState { Starting, Ok, Error };

struct ComponentStatus {
  ComponentState state = ComponentState::Starting;
  /// Errors reported since the component last started.
  std::size_t error_count = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

[[nodiscard]] std::string_view component_name(Component component);
[[nodiscard]] std::string_view state_name(ComponentState state);

void mark_starting(Component component);
void mark_ok(Component component);
void mark_error(Component component, const std::string &error);
/// Forgets the component; it drops out of the snapshot until reported again.
void reset(Component component);

[[nodiscard]] std::optional<ComponentStatus> get(Component component);
/// JSON object keyed by component name, reported components only.
[[nodiscard]] std::string snapshot_json();
void clear();

} // namespace cdpgate::health
