#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cdpgate::common {

enum class ErrorCode {
  Protocol,
  SessionNotFound,
  ProtectedSession,
  ElementNotFound,
  ContextCreation,
  FileNotFound,
  NotConnected,
  RequestTimeout,
  StateNotFound,
  InvalidArgument,
  ExtensionError,
  UnknownMethod,
};

/// Stable snake_case name used on the wire.
[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Protocol:
    return "protocol_error";
  case ErrorCode::SessionNotFound:
    return "session_not_found";
  case ErrorCode::ProtectedSession:
    return "protected_session";
  case ErrorCode::ElementNotFound:
    return "element_not_found";
  case ErrorCode::ContextCreation:
    return "context_creation_failed";
  case ErrorCode::FileNotFound:
    return "file_not_found";
  case ErrorCode::NotConnected:
    return "not_connected";
  case ErrorCode::RequestTimeout:
    return "request_timeout";
  case ErrorCode::StateNotFound:
    return "state_not_found";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::ExtensionError:
    return "extension_error";
  case ErrorCode::UnknownMethod:
    return "unknown_method";
  }
  return "protocol_error";
}

class Status {
public:
  static Status success() { return Status(true, ErrorCode::Protocol, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorCode::Protocol, std::move(message));
  }
  static Status error(const ErrorCode code, std::string message) {
    return Status(false, code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorCode::Protocol, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorCode::Protocol, std::move(message));
  }
  static Result failure(const ErrorCode code, std::string message) {
    return Result(false, std::nullopt, code, std::move(message));
  }
  /// Carries code and message over from another failed result or status.
  template <typename Other> static Result propagate(const Other &other) {
    return Result(false, std::nullopt, other.code(), other.error());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::optional<T> value, ErrorCode code, std::string error)
      : ok_(ok), value_(std::move(value)), code_(code), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorCode code_;
  std::string error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, ErrorCode::Protocol, ""); }
  static Result failure(std::string message) {
    return Result(false, ErrorCode::Protocol, std::move(message));
  }
  static Result failure(const ErrorCode code, std::string message) {
    return Result(false, code, std::move(message));
  }
  template <typename Other> static Result propagate(const Other &other) {
    return Result(false, other.code(), other.error());
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

} // namespace cdpgate::common
