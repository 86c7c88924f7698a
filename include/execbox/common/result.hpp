#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace execbox::common {

enum class ErrorKind {
  Validation,
  Security,
  Timeout,
  SandboxTimeout,
  Runtime,
  NotFound,
};

[[nodiscard]] constexpr std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "ValidationError";
  case ErrorKind::Security:
    return "SecurityError";
  case ErrorKind::Timeout:
    return "TimeoutError";
  case ErrorKind::SandboxTimeout:
    return "SandboxTimeoutError";
  case ErrorKind::Runtime:
    return "RuntimeError";
  case ErrorKind::NotFound:
    return "NotFoundError";
  }
  return "RuntimeError";
}

class Status {
public:
  static Status success() { return Status(true, ErrorKind::Runtime, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorKind::Runtime, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(false, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(bool ok, ErrorKind kind, std::string error)
      : ok_(ok), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorKind::Runtime, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorKind::Runtime, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, std::nullopt, kind, std::move(message));
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
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::optional<T> value, ErrorKind kind, std::string error)
      : ok_(ok), value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

} // namespace execbox::common
