#pragma once

#include "cdpgate/browser/page.hpp"
#include "cdpgate/common/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cdpgate::browser {

struct AccessibilityNode {
  std::string ref;
  std::string role;
  std::optional<std::string> name;
  std::optional<std::string> value;
  bool focusable = false;
  bool focused = false;

  /// {"ref_id","role","name","value","focusable","focused","children":[]}
  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] std::string nodes_to_json(const std::vector<AccessibilityNode> &nodes);

/// Roles the native strategy always keeps.
[[nodiscard]] const std::vector<std::string> &interactive_roles();
[[nodiscard]] bool is_interactive_role(std::string_view role);
/// False for AX roles backed by text or document nodes, which cannot be tagged.
[[nodiscard]] bool is_element_role(std::string_view role);

/// Elements the DOM walk visits, as one comma-joined CSS selector.
[[nodiscard]] const std::string &dom_walk_selector();

/// One way of producing a flat node list. Refs are numbered from @e1 and the
/// matching elements are tagged in the page.
class ISnapshotStrategy {
public:
  virtual ~ISnapshotStrategy() = default;
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<AccessibilityNode>>
  extract(const PageHandle &page) = 0;
};

/// Accessibility.getFullAXTree, filtered and flattened.
class NativeAccessibilityStrategy final : public ISnapshotStrategy {
public:
  [[nodiscard]] std::string_view name() const override { return "native"; }
  [[nodiscard]] common::Result<std::vector<AccessibilityNode>>
  extract(const PageHandle &page) override;

  /// Filters a raw getFullAXTree node array. Exposed for tests.
  [[nodiscard]] static std::vector<AccessibilityNode>
  convert_nodes(const std::string &nodes_json, std::vector<std::int64_t> *backend_ids = nullptr);

private:
  static void tag_nodes(const PageHandle &page, const std::vector<std::int64_t> &backend_ids,
                        const std::vector<AccessibilityNode> &nodes);
};

/// In-page querySelectorAll walk; the script tags elements itself.
class DomWalkStrategy final : public ISnapshotStrategy {
public:
  [[nodiscard]] std::string_view name() const override { return "dom"; }
  [[nodiscard]] common::Result<std::vector<AccessibilityNode>>
  extract(const PageHandle &page) override;

  [[nodiscard]] static std::string script();
  /// Parses the script's array result. Exposed for tests.
  [[nodiscard]] static std::vector<AccessibilityNode> convert_nodes(const std::string &array_json);
};

struct SnapshotOutcome {
  std::vector<AccessibilityNode> nodes;
  std::string strategy;
};

class SnapshotExtractor {
public:
  /// Native first, then the DOM walk.
  SnapshotExtractor();
  explicit SnapshotExtractor(std::vector<std::unique_ptr<ISnapshotStrategy>> strategies);

  /// First non-empty strategy result wins. Never fails: when every strategy
  /// errors or comes back empty the outcome is an empty list.
  [[nodiscard]] SnapshotOutcome extract(const PageHandle &page);


private:
  std::vector<std::unique_ptr<ISnapshotStrategy>> strategies_;
};

} // namespace cdpgate::browser
