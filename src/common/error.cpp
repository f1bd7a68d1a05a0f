#include <string>
#include "common/error.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"

namespace asyncmb {

Error Error::FromException(FunctionCode function_code, ExceptionCode exception_code) {
  Error error{ErrorKind::kExceptionResponse,
              "device reported " + std::string(asyncmb::ToString(exception_code)) + " for function " +
                  std::to_string(static_cast<int>(function_code))};
  error.exception_code_ = exception_code;
  error.function_code_ = function_code;
  return error;
}

std::string Error::ToString() const {
  std::string text{asyncmb::ToString(kind_)};
  if (!message_.empty()) {
    text += ": ";
    text += message_;
  }
  return text;
}

}  // namespace asyncmb
