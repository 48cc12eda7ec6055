#include "cdpgate/browser/snapshot.hpp"

#include "cdpgate/browser/selector.hpp"
#include "cdpgate/common/fs.hpp"
#include "cdpgate/observability/global.hpp"

#include <algorithm>
#include <array>

namespace cdpgate::browser {

namespace {

std::optional<std::string> non_blank(const std::optional<std::string> &text) {
  if (!text.has_value()) {
    return std::nullopt;
  }
  std::string trimmed = common::trim(*text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string optional_json(const std::optional<std::string> &text) {
  return text.has_value() ? common::json_quote(*text) : "null";
}

/// AX values are {"type":..., "value":...}; only string payloads are kept.
std::optional<std::string> ax_string(const common::JsonRawMap &node, const std::string &key) {
  const auto it = node.find(key);
  if (it == node.end()) {
    return std::nullopt;
  }
  return common::json_string_field(common::json_parse_object(it->second), "value");
}

bool ax_property(const common::JsonRawMap &node, const std::string &property) {
  const auto props = node.find("properties");
  if (props == node.end()) {
    return false;
  }
  for (const auto &raw : common::json_split_array(props->second)) {
    const auto prop = common::json_parse_object(raw);
    if (common::json_string_field(prop, "name") != property) {
      continue;
    }
    const auto value = common::json_parse_object(common::json_raw_field(prop, "value", "{}"));
    return common::json_bool_field(value, "value").value_or(false);
  }
  return false;
}

constexpr const char *kClearTagsScript =
    "(() => { for (const el of document.querySelectorAll('[data-cdpgate-ref]')) "
    "el.removeAttribute('data-cdpgate-ref'); return true; })()";

} // namespace

std::string AccessibilityNode::to_json() const {
  return common::json_object({
      {"ref_id", common::json_quote(ref)},
      {"role", common::json_quote(role)},
      {"name", optional_json(name)},
      {"value", optional_json(value)},
      {"focusable", common::json_bool(focusable)},
      {"focused", common::json_bool(focused)},
      {"children", "[]"},
  });
}

std::string nodes_to_json(const std::vector<AccessibilityNode> &nodes) {
  std::vector<std::string> items;
  items.reserve(nodes.size());
  for (const auto &node : nodes) {
    items.push_back(node.to_json());
  }
  return common::json_array(items);
}

const std::vector<std::string> &interactive_roles() {
  static const std::vector<std::string> roles = {
      "button",     "link",       "textbox",    "checkbox", "radio",
      "combobox",   "listbox",    "menuitem",   "tab",      "slider",
      "searchbox",  "spinbutton", "switch",     "option",   "menuitemcheckbox",
      "menuitemradio", "treeitem", "heading",   "img",      "navigation",
      "main",       "article",    "section",
  };
  return roles;
}

bool is_interactive_role(std::string_view role) {
  const auto &roles = interactive_roles();
  return std::find(roles.begin(), roles.end(), role) != roles.end();
}

bool is_element_role(std::string_view role) {
  static constexpr std::array<std::string_view, 5> kNonElementRoles = {
      "RootWebArea", "WebArea", "StaticText", "InlineTextBox", "LineBreak"};
  return std::find(kNonElementRoles.begin(), kNonElementRoles.end(), role) ==
         kNonElementRoles.end();
}

const std::string &dom_walk_selector() {
  static const std::string selector =
      "a,button,input,select,textarea,option,[role],img,nav,main,"
      "article,section,h1,h2,h3,h4,h5,h6,[contenteditable]";
  return selector;
}

// --- native -----------------------------------------------------------------

std::vector<AccessibilityNode>
NativeAccessibilityStrategy::convert_nodes(const std::string &nodes_json,
                                           std::vector<std::int64_t> *backend_ids) {
  std::vector<AccessibilityNode> nodes;
  std::size_t counter = 0;
  for (const auto &raw : common::json_split_array(nodes_json)) {
    const auto node = common::json_parse_object(raw);
    if (common::json_bool_field(node, "ignored").value_or(false)) {
      continue;
    }
    const auto role = non_blank(ax_string(node, "role"));
    const auto name = non_blank(ax_string(node, "name"));
    const auto value = non_blank(ax_string(node, "value"));
    const bool focusable = ax_property(node, "focusable");

    const bool interactive = (role.has_value() && is_interactive_role(*role)) || focusable;
    const bool described = role.has_value() || name.has_value() || value.has_value();
    if (!interactive && !described) {
      continue;
    }

    AccessibilityNode out;
    out.ref = "@e" + std::to_string(++counter);
    out.role = role.value_or("unknown");
    out.name = name;
    out.value = value;
    out.focusable = focusable;
    out.focused = ax_property(node, "focused");
    nodes.push_back(std::move(out));

    if (backend_ids != nullptr) {
      // Text runs and the document itself cannot carry an attribute.
      backend_ids->push_back(
          is_element_role(out.role)
              ? common::json_as_int(common::json_raw_field(node, "backendDOMNodeId", "0"))
                    .value_or(0)
              : 0);
    }
  }
  return nodes;
}

void NativeAccessibilityStrategy::tag_nodes(const PageHandle &page,
                                            const std::vector<std::int64_t> &backend_ids,
                                            const std::vector<AccessibilityNode> &nodes) {
  std::vector<std::string> ids;
  std::vector<std::size_t> positions;
  for (std::size_t i = 0; i < backend_ids.size(); ++i) {
    if (backend_ids[i] > 0) {
      ids.push_back(std::to_string(backend_ids[i]));
      positions.push_back(i);
    }
  }
  if (ids.empty()) {
    return;
  }

  // The DOM agent only resolves backend ids after a document request.
  if (!page.send("DOM.getDocument", {{"depth", "0"}}).ok()) {
    return;
  }
  auto pushed =
      page.send("DOM.pushNodesByBackendIdsToFrontend", {{"backendNodeIds", common::json_array(ids)}});
  if (!pushed.ok()) {
    return;
  }
  const auto node_ids = common::json_split_array(common::json_raw_field(pushed.value(), "nodeIds", "[]"));

  std::size_t failed = 0;
  for (std::size_t i = 0; i < node_ids.size() && i < positions.size(); ++i) {
    const auto node_id = common::json_as_int(node_ids[i]).value_or(0);
    if (node_id <= 0) {
      ++failed;
      continue;
    }
    const std::string ref = nodes[positions[i]].ref.substr(1);
    if (!page.send("DOM.setAttributeValue", {{"nodeId", std::to_string(node_id)},
                                             {"name", common::json_quote(kRefAttribute)},
                                             {"value", common::json_quote(ref)}})
             .ok()) {
      ++failed;
    }
  }
  if (failed > 0) {
    observability::record_error("snapshot", "could not tag " + std::to_string(failed) +
                                                " accessibility nodes");
  }
}

common::Result<std::vector<AccessibilityNode>>
NativeAccessibilityStrategy::extract(const PageHandle &page) {
  (void)page.send("Accessibility.enable");
  auto tree = page.send("Accessibility.getFullAXTree");
  if (!tree.ok()) {
    return common::Result<std::vector<AccessibilityNode>>::propagate(tree);
  }
  std::vector<std::int64_t> backend_ids;
  auto nodes = convert_nodes(common::json_raw_field(tree.value(), "nodes", "[]"), &backend_ids);
  if (!nodes.empty()) {
    tag_nodes(page, backend_ids, nodes);
  }
  return common::Result<std::vector<AccessibilityNode>>::success(std::move(nodes));
}

// --- DOM walk ---------------------------------------------------------------

std::string DomWalkStrategy::script() {
  return R"JS((() => {
  const roleFor = (el) => {
    const explicit = el.getAttribute('role');
    if (explicit) return explicit;
    const tag = el.tagName.toLowerCase();
    const byTag = { a: 'link', button: 'button', img: 'img', nav: 'navigation', main: 'main',
                    article: 'article', section: 'section', option: 'option',
                    select: 'combobox', textarea: 'textbox' };
    if (byTag[tag]) return byTag[tag];
    if (tag === 'input') {
      const t = (el.getAttribute('type') || 'text').toLowerCase();
      const byType = { checkbox: 'checkbox', radio: 'radio', range: 'slider',
                       search: 'searchbox', number: 'spinbutton' };
      return byType[t] || 'textbox';
    }
    if (/^h[1-6]$/.test(tag)) return 'heading';
    if (el.isContentEditable) return 'textbox';
    return tag;
  };
  const nameFor = (el) => el.getAttribute('aria-label') || el.getAttribute('alt') ||
      el.getAttribute('title') || (el.textContent || '').trim() || null;
  const nodes = [];
  const seen = new Set();
  let n = 0;
  for (const el of document.querySelectorAll()JS" +
         common::json_quote(dom_walk_selector()) + R"JS()) {
    if (seen.has(el)) continue;
    seen.add(el);
    n += 1;
    el.setAttribute()JS" +
         common::json_quote(kRefAttribute) + R"JS(, 'e' + n);
    nodes.push({
      role: roleFor(el),
      name: nameFor(el),
      value: ('value' in el && el.value != null) ? String(el.value) : null,
      focusable: el.tabIndex >= 0,
      focused: document.activeElement === el,
    });
  }
  return nodes;
})())JS";
}

std::vector<AccessibilityNode> DomWalkStrategy::convert_nodes(const std::string &array_json) {
  std::vector<AccessibilityNode> nodes;
  std::size_t counter = 0;
  for (const auto &raw : common::json_split_array(array_json)) {
    const auto fields = common::json_parse_object(raw);
    AccessibilityNode node;
    node.ref = "@e" + std::to_string(++counter);
    node.role = common::json_string_field(fields, "role").value_or("");
    if (node.role.empty()) {
      node.role = "unknown";
    }
    node.name = non_blank(common::json_string_field(fields, "name"));
    node.value = non_blank(common::json_string_field(fields, "value"));
    node.focusable = common::json_bool_field(fields, "focusable").value_or(false);
    node.focused = common::json_bool_field(fields, "focused").value_or(false);
    nodes.push_back(std::move(node));
  }
  return nodes;
}

common::Result<std::vector<AccessibilityNode>> DomWalkStrategy::extract(const PageHandle &page) {
  auto value = page.evaluate(script());
  if (!value.ok()) {
    return common::Result<std::vector<AccessibilityNode>>::propagate(value);
  }
  return common::Result<std::vector<AccessibilityNode>>::success(convert_nodes(value.value()));
}

// --- extractor --------------------------------------------------------------

SnapshotExtractor::SnapshotExtractor() {
  strategies_.push_back(std::make_unique<NativeAccessibilityStrategy>());
  strategies_.push_back(std::make_unique<DomWalkStrategy>());
}

SnapshotExtractor::SnapshotExtractor(std::vector<std::unique_ptr<ISnapshotStrategy>> strategies)
    : strategies_(std::move(strategies)) {}

SnapshotOutcome SnapshotExtractor::extract(const PageHandle &page) {
  // Stale tags would otherwise alias refs from the previous snapshot.
  (void)page.evaluate(kClearTagsScript);

  for (const auto &strategy : strategies_) {
    auto result = strategy->extract(page);
    if (!result.ok()) {
      observability::record_error("snapshot", std::string(strategy->name()) +
                                                  " strategy failed: " + result.error());
      continue;
    }
    if (result.value().empty()) {
      continue;
    }
    SnapshotOutcome outcome{.nodes = std::move(result.value()),
                            .strategy = std::string(strategy->name())};
    observability::record_snapshot(outcome.strategy, outcome.nodes.size());
    return outcome;
  }
  observability::record_snapshot("none", 0);
  return SnapshotOutcome{.nodes = {}, .strategy = "none"};
}

} // namespace cdpgate::browser
