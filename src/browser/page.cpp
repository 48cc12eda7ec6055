#include "cdpgate/browser/page.hpp"

namespace cdpgate::browser {

namespace {

constexpr const char *kNotFoundMarker = "__cdpgate_not_found__";

} // namespace

PageHandle::PageHandle(CDPClient &client, std::string session_id, std::string target_id)
    : client_(client), session_id_(std::move(session_id)), target_id_(std::move(target_id)) {}

common::Result<JsonMap> PageHandle::send(const std::string &method, const JsonMap &params) const {
  return client_.send_command(method, params, session_id_);
}

common::Result<std::string> PageHandle::evaluate(const std::string &expression) const {
  auto response = send("Runtime.evaluate", {{"expression", common::json_quote(expression)},
                                            {"returnByValue", "true"},
                                            {"awaitPromise", "true"}});
  if (!response.ok()) {
    return common::Result<std::string>::propagate(response);
  }
  const auto &fields = response.value();
  if (const auto details = fields.find("exceptionDetails"); details != fields.end()) {
    const JsonMap detail_fields = common::json_parse_object(details->second);
    const JsonMap exception =
        common::json_parse_object(common::json_raw_field(detail_fields, "exception", "{}"));
    std::string message = common::json_string_field(exception, "description")
                              .value_or(common::json_string_field(detail_fields, "text")
                                            .value_or("script evaluation failed"));
    return common::Result<std::string>::failure("Evaluation failed: " + message);
  }
  const JsonMap remote = common::json_parse_object(common::json_raw_field(fields, "result", "{}"));
  return common::Result<std::string>::success(common::json_raw_field(remote, "value"));
}

common::Result<std::string> PageHandle::evaluate_on_element(const std::string &css,
                                                            const std::string &body,
                                                            const std::string &display) const {
  const std::string script = "(() => { const el = document.querySelector(" +
                             common::json_quote(css) + "); if (!el) return " +
                             common::json_quote(kNotFoundMarker) + "; " + body + " })()";
  auto value = evaluate(script);
  if (!value.ok()) {
    return value;
  }
  if (common::json_as_string(value.value()) == kNotFoundMarker) {
    return common::Result<std::string>::failure(common::ErrorCode::ElementNotFound,
                                                "Element not found: " + display);
  }
  return value;
}

std::string PageHandle::url() const {
  auto value = evaluate("location.href");
  return value.ok() ? common::json_as_string(value.value()).value_or("") : "";
}

std::string PageHandle::title() const {
  auto value = evaluate("document.title");
  return value.ok() ? common::json_as_string(value.value()).value_or("") : "";
}

} // namespace cdpgate::browser
