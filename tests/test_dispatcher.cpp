#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cdpgate/browser/auth_state.hpp"
#include "cdpgate/browser/context_manager.hpp"
#include "cdpgate/cli/commands.hpp"
#include "cdpgate/common/version.hpp"
#include "cdpgate/service/dispatcher.hpp"
#include "cdpgate/service/runtime.hpp"

#include <memory>
#include <set>
#include <sstream>
#include <string>

namespace {

namespace br = cdpgate::browser;
namespace common = cdpgate::common;
namespace service = cdpgate::service;

struct DispatchFixture {
  cdpgate::testing::TempDir dir;
  cdpgate::config::Config config = cdpgate::testing::test_config(dir);
  std::shared_ptr<cdpgate::testing::ScriptedBrowser> browser =
      std::make_shared<cdpgate::testing::ScriptedBrowser>();
  br::ContextManager manager{config.browser, config.sessions,
                             cdpgate::testing::make_fake_client(browser)};
  br::StateStore store{config.state.dir};
  service::Dispatcher dispatcher{manager, store};

  common::Result<std::string> call(const std::string &method,
                                   const common::JsonRawMap &params = {}) {
    return dispatcher.dispatch(method, params);
  }
};

common::JsonRawMap fields_of(const common::Result<std::string> &result) {
  return result.ok() ? common::json_parse_object(result.value()) : common::JsonRawMap{};
}

} // namespace

void register_dispatcher_tests(std::vector<cdpgate::tests::TestCase> &tests) {
  using cdpgate::tests::require;

  tests.push_back({"dispatcher_method_table_is_unique", [] {
                     std::set<std::string> names;
                     for (const auto &method : service::Dispatcher::methods()) {
                       require(!method.description.empty(), "description for " + method.name);
                       require(names.insert(method.name).second, "duplicate " + method.name);
                     }
                     require(names.contains("health") && names.contains("browser.press_combo") &&
                                 names.contains("browser.session.close"),
                             "core methods listed");
                   }});

  tests.push_back({"dispatcher_extension_without_bridge_touches_nothing", [] {
                     DispatchFixture f;
                     auto result = f.call("tabs.group", {{"tabIds", "[1]"}});
                     require(!result.ok() && result.code() == common::ErrorCode::NotConnected,
                             "NotConnected");
                     require(result.error() == "Extension not connected", result.error());
                     auto prefixed = f.call("browser.cookies.getAll", {});
                     require(!prefixed.ok() && prefixed.code() == common::ErrorCode::NotConnected,
                             "browser. prefix accepted for extension methods");
                     require(!f.manager.is_started(), "browser never started");
                     require(f.browser->sent().empty(), "no CDP traffic");
                   }});

  tests.push_back({"dispatcher_unknown_method", [] {
                     DispatchFixture f;
                     auto result = f.call("browser.teleport");
                     require(!result.ok() && result.code() == common::ErrorCode::UnknownMethod,
                             "UnknownMethod");
                     require(result.error() == "Unknown method: teleport", result.error());
                     require(f.browser->sent().empty(), "rejected before starting");
                   }});

  tests.push_back({"dispatcher_missing_param_is_reported_first", [] {
                     DispatchFixture f;
                     auto open = f.call("browser.open");
                     require(!open.ok() && open.code() == common::ErrorCode::InvalidArgument,
                             "InvalidArgument");
                     require(open.error() == "Missing 'url' parameter", open.error());
                     auto fill = f.call("fill", {{"selector", common::json_quote("#q")}});
                     require(fill.error() == "Missing 'value' parameter", fill.error());
                     auto wrong_type = f.call("click", {{"selector", "5"}});
                     require(wrong_type.error() == "Missing 'selector' parameter",
                             "non-string counts as missing");
                     auto session = f.call("browser.session.new");
                     require(session.error() == "Missing 'id' parameter", session.error());
                     require(f.browser->sent().empty(), "validation needs no browser");
                   }});

  tests.push_back({"dispatcher_health_before_start", [] {
                     DispatchFixture f;
                     auto health = f.call("health");
                     require(health.ok(), "health answers");
                     const auto fields = fields_of(health);
                     require(common::json_bool_field(fields, "healthy") == true,
                             "idle gateway is healthy");
                     require(common::json_string_field(fields, "service") == "browser", "service");
                     require(common::json_string_field(fields, "version") == common::version(),
                             "version");
                     require(fields.contains("components"), "component map");
                     require(!f.manager.is_started(), "health does not start the browser");
                   }});

  tests.push_back({"dispatcher_health_after_start_checks_browser", [] {
                     DispatchFixture f;
                     require(f.call("browser.open", {{"url", common::json_quote("https://a.test/")}})
                                 .ok(),
                             "open");
                     auto health = f.call("browser.health");
                     require(common::json_bool_field(fields_of(health), "healthy") == true,
                             "healthy");
                     require(f.browser->count("Browser.getVersion") == 1, "version queried once");

                     f.browser->on("Browser.getVersion", [](const auto &) {
                       return common::Result<std::string>::failure("gone");
                     });
                     auto sick = f.call("health");
                     require(sick.ok(), "health still answers");
                     require(common::json_bool_field(fields_of(sick), "healthy") == false,
                             "unhealthy when the version query fails");
                     const auto components = common::json_parse_object(
                         common::json_raw_field(fields_of(sick), "components", "{}"));
                     const auto browser = common::json_parse_object(
                         common::json_raw_field(components, "browser", "{}"));
                     require(common::json_string_field(browser, "status") == "error" &&
                                 common::json_string_field(browser, "last_error") == "gone",
                             "browser component carries the error");
                     require(common::json_number_field(browser, "error_count") == 1.0,
                             "one failure counted once");
                   }});

  tests.push_back({"dispatcher_session_lifecycle_and_alias", [] {
                     DispatchFixture f;
                     auto listed = f.call("browser.session.list");
                     require(listed.ok() &&
                                 common::json_raw_field(fields_of(listed), "sessions") == "[]",
                             "no sessions before start");

                     auto created = f.call("browser.session.new", {{"id", common::json_quote("w")}});
                     require(created.ok(), created.ok() ? "" : created.error());
                     require(common::json_string_field(fields_of(created), "session_id") == "w",
                             "session id echoed");

                     auto opened = f.call("browser.open", {{"url", common::json_quote("https://w.test/")},
                                                           {"session", common::json_quote("w")}});
                     require(opened.ok(), opened.ok() ? "" : opened.error());
                     const auto navigations = f.browser->sent("Page.navigate");
                     require(navigations.size() == 1 && navigations[0].session_id == "s-target-2",
                             "session alias routes to the session's page");

                     auto ids = common::json_string_array(
                         common::json_raw_field(fields_of(f.call("session.list")), "sessions"));
                     require(ids == std::vector<std::string>({"default", "w"}), "both listed");

                     auto closed = f.call("browser.session.close",
                                          {{"session_id", common::json_quote("w")}});
                     require(closed.ok(), "closed via session_id");
                     auto protected_close =
                         f.call("browser.session.close", {{"id", common::json_quote("default")}});
                     require(!protected_close.ok() &&
                                 protected_close.code() == common::ErrorCode::ProtectedSession,
                             "default is protected");

                     auto gone = f.call("browser.click", {{"selector", common::json_quote("#a")},
                                                          {"session_id", common::json_quote("w")}});
                     require(!gone.ok() && gone.code() == common::ErrorCode::SessionNotFound,
                             "closed session is gone");
                   }});

  tests.push_back({"dispatcher_close_before_start", [] {
                     DispatchFixture f;
                     require(f.call("session.close", {{"id", common::json_quote("x")}}).ok(),
                             "unknown id is a no-op");
                     auto protected_close = f.call("session.close", {{"id", common::json_quote("default")}});
                     require(protected_close.code() == common::ErrorCode::ProtectedSession,
                             "default protected even before start");
                     require(!f.manager.is_started(), "close never starts the browser");
                   }});

  tests.push_back({"dispatcher_result_shapes", [] {
                     DispatchFixture f;
                     auto opened = f.call("browser.open", {{"url", common::json_quote("https://s.test/p")}});
                     require(common::json_string_field(fields_of(opened), "url") == "https://s.test/p" &&
                                 common::json_string_field(fields_of(opened), "title") == "Fake Page",
                             "open shape");

                     auto snap = f.call("browser.snapshot");
                     const auto snap_fields = fields_of(snap);
                     require(common::json_raw_field(snap_fields, "element_count") == "0" &&
                                 common::json_raw_field(snap_fields, "nodes") == "[]",
                             "empty snapshot shape");

                     auto combo = f.call("browser.press_combo",
                                         {{"key", common::json_quote("a")},
                                          {"modifiers", R"(["Control"])"}});
                     require(common::json_string_array(common::json_raw_field(fields_of(combo), "modifiers")) ==
                                 std::vector<std::string>({"Control"}),
                             "modifiers echoed");

                     auto scrolled = f.call("browser.scroll", {{"x", "0"}, {"y", "400.4"}});
                     require(common::json_raw_field(fields_of(scrolled), "y") == "400",
                             "scroll deltas rounded");

                     auto checked = f.call("browser.check", {{"selector", common::json_quote("#c")},
                                                             {"checked", "false"}});
                     require(common::json_bool_field(fields_of(checked), "checked") == false,
                             "check echoes state");

                     auto shot = f.call("browser.screenshot");
                     require(common::json_string_field(fields_of(shot), "data") == "UE5HIQ==",
                             "inline screenshot");
                   }});

  tests.push_back({"request_line_success_and_failure_shapes", [] {
                     DispatchFixture f;
                     const auto ok = common::json_parse_object(cdpgate::cli::handle_request_line(
                         f.dispatcher, R"({"id":7,"method":"health"})"));
                     require(common::json_raw_field(ok, "id") == "7", "numeric id echoed");
                     require(common::json_bool_field(ok, "ok") == true, "ok true");
                     require(common::json_bool_field(
                                 common::json_parse_object(common::json_raw_field(ok, "result")),
                                 "healthy") == true,
                             "result embedded");

                     const auto failed = common::json_parse_object(cdpgate::cli::handle_request_line(
                         f.dispatcher, R"({"id":"r1","method":"browser.fly","params":{}})"));
                     require(common::json_bool_field(failed, "ok") == false, "ok false");
                     require(common::json_string_field(failed, "id") == "r1", "string id echoed");
                     const auto error =
                         common::json_parse_object(common::json_raw_field(failed, "error"));
                     require(common::json_string_field(error, "code") == "unknown_method", "code");
                     require(common::json_string_field(error, "message") == "Unknown method: fly",
                             "message");

                     const auto no_method = common::json_parse_object(
                         cdpgate::cli::handle_request_line(f.dispatcher, R"({"id":1})"));
                     require(common::json_string_field(
                                 common::json_parse_object(common::json_raw_field(no_method, "error")),
                                 "message") == "Missing 'method' field",
                             "missing method");

                     const auto garbage = common::json_parse_object(
                         cdpgate::cli::handle_request_line(f.dispatcher, "hello"));
                     require(common::json_is_null(common::json_raw_field(garbage, "id")),
                             "garbage gets a null id");
                   }});

  tests.push_back({"serve_stream_answers_each_line", [] {
                     DispatchFixture f;
                     std::istringstream in("{\"id\":1,\"method\":\"health\"}\n\n"
                                           "{\"id\":2,\"method\":\"browser.state.list\"}\n");
                     std::ostringstream out;
                     const auto answered = cdpgate::cli::serve_stream(f.dispatcher, in, out);
                     require(answered == 2, "blank lines skipped");
                     std::istringstream lines(out.str());
                     std::string first;
                     std::string second;
                     std::getline(lines, first);
                     std::getline(lines, second);
                     require(common::json_raw_field(common::json_parse_object(first), "id") == "1",
                             "first answer");
                     const auto second_fields = common::json_parse_object(second);
                     require(common::json_raw_field(second_fields, "id") == "2" &&
                                 common::json_raw_field(second_fields, "result") == "[]",
                             "empty state list");
                   }});

  tests.push_back({"runtime_wires_bridge_and_prewarms_browser", [] {
                     cdpgate::testing::TempDir dir;
                     auto config = cdpgate::testing::test_config(dir);
                     config.bridge.enabled = true;
                     config.bridge.host = "127.0.0.1";
                     config.bridge.port = 0;
                     auto browser = std::make_shared<cdpgate::testing::ScriptedBrowser>();
                     service::Runtime runtime(config, cdpgate::testing::make_fake_client(browser));
                     require(runtime.bridge() != nullptr, "bridge built when enabled");

                     auto started = runtime.start(true);
                     require(started.ok(), started.ok() ? "" : started.error());
                     require(runtime.manager().is_started(), "browser prewarmed");
                     require(runtime.bridge()->is_running() && runtime.bridge()->port() != 0,
                             "bridge listening");

                     auto tabs = runtime.dispatcher().dispatch("tabGroups.query", {});
                     require(!tabs.ok() && tabs.code() == common::ErrorCode::NotConnected,
                             "no extension yet");

                     runtime.stop();
                     require(!runtime.manager().is_started(), "browser released");
                     require(!runtime.bridge()->is_running(), "bridge stopped");
                   }});
}
