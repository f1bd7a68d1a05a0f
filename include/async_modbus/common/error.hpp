#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "exception_code.hpp"
#include "function_code.hpp"

namespace asyncmb {

enum class ErrorKind {
  /** Invalid request shape or bounds; nothing was written */
  kEncoding,
  /** Malformed frame or function-code mismatch */
  kProtocol,
  /** Device answered with a Modbus exception response */
  kExceptionResponse,
  /** Deadline elapsed without a matching frame */
  kTimeout,
  /** Transport lost or never established */
  kConnection,
  /** Caller withdrew the request */
  kCancelled
};

[[nodiscard]] constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kEncoding:
      return "encoding error";
    case ErrorKind::kProtocol:
      return "protocol error";
    case ErrorKind::kExceptionResponse:
      return "exception response";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kConnection:
      return "connection error";
    case ErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown error";
}

class Error {
 public:
  Error(ErrorKind kind, std::string message)
      : kind_(kind),
        message_(std::move(message)) {}

  [[nodiscard]] static Error Encoding(std::string message) { return {ErrorKind::kEncoding, std::move(message)}; }
  [[nodiscard]] static Error Protocol(std::string message) { return {ErrorKind::kProtocol, std::move(message)}; }
  [[nodiscard]] static Error Timeout(std::string message) { return {ErrorKind::kTimeout, std::move(message)}; }
  [[nodiscard]] static Error Connection(std::string message) { return {ErrorKind::kConnection, std::move(message)}; }
  [[nodiscard]] static Error Cancelled(std::string message) { return {ErrorKind::kCancelled, std::move(message)}; }
  [[nodiscard]] static Error FromException(FunctionCode function_code, ExceptionCode exception_code);

  [[nodiscard]] ErrorKind GetKind() const noexcept { return kind_; }
  [[nodiscard]] const std::string &GetMessage() const noexcept { return message_; }

  /** Set only for ErrorKind::kExceptionResponse */
  [[nodiscard]] std::optional<ExceptionCode> GetExceptionCode() const noexcept { return exception_code_; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return function_code_; }

  [[nodiscard]] bool Is(ErrorKind kind) const noexcept { return kind_ == kind; }

  [[nodiscard]] std::string ToString() const;

 private:
  ErrorKind kind_;
  std::string message_;
  std::optional<ExceptionCode> exception_code_{};
  FunctionCode function_code_{FunctionCode::kInvalid};
};

}  // namespace asyncmb
