#pragma once

#include "cdpgate/browser/cdp.hpp"

#include <string>

namespace cdpgate::browser {

/// One attached page target. Every command goes over the shared browser
/// connection with this page's flat sessionId.
class PageHandle {
public:
  PageHandle(CDPClient &client, std::string session_id, std::string target_id = "");

  [[nodiscard]] common::Result<JsonMap> send(const std::string &method,
                                             const JsonMap &params = {}) const;

  /// Runs `expression` with returnByValue and awaitPromise. Yields the raw JSON
  /// of the returned value ("null" for undefined). A thrown exception fails
  /// with its description.
  [[nodiscard]] common::Result<std::string> evaluate(const std::string &expression) const;

  /// Runs `body` with `el` bound to document.querySelector(css). Fails with
  /// ElementNotFound "Element not found: <display>" when nothing matches.
  [[nodiscard]] common::Result<std::string>
  evaluate_on_element(const std::string &css, const std::string &body,
                      const std::string &display) const;

  [[nodiscard]] std::string url() const;
  [[nodiscard]] std::string title() const;

  [[nodiscard]] const std::string &session_id() const { return session_id_; }
  [[nodiscard]] const std::string &target_id() const { return target_id_; }

private:
  CDPClient &client_;
  std::string session_id_;
  std::string target_id_;
};

} // namespace cdpgate::browser
