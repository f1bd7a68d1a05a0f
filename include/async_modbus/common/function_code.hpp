#pragma once

#include <cstdint>

namespace asyncmb {

enum class FunctionCode : uint8_t {
  kInvalid = 0,
  kReadCoils = 1,
  kReadDI = 2,
  kReadHR = 3,
  kReadIR = 4,
  kWriteSingleCoil = 5,
  kWriteSingleReg = 6,
  kReadExceptionStatus = 7,
  kWriteMultCoils = 15,
  kWriteMultRegs = 16,
  kMaskWriteReg = 22,
  kReadWriteMultRegs = 23
};

static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;
static constexpr uint8_t kFunctionCodeMask = 0x7F;

[[nodiscard]] constexpr bool IsSupportedFunction(uint8_t function_code) {
  switch (static_cast<FunctionCode>(function_code)) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
    case FunctionCode::kReadExceptionStatus:
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
    case FunctionCode::kMaskWriteReg:
    case FunctionCode::kReadWriteMultRegs:
      return true;
    default:
      return false;
  }
}

/**
 * @brief Write requests that may be sent to the broadcast address (unit 0) on a serial line
 */
[[nodiscard]] constexpr bool IsBroadcastableWrite(FunctionCode function_code) {
  return function_code == FunctionCode::kWriteSingleCoil || function_code == FunctionCode::kWriteSingleReg ||
         function_code == FunctionCode::kWriteMultCoils || function_code == FunctionCode::kWriteMultRegs ||
         function_code == FunctionCode::kMaskWriteReg;
}

}  // namespace asyncmb
