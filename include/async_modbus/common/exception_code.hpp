#pragma once

#include <cstdint>
#include <string_view>

namespace asyncmb {

enum class ExceptionCode : uint8_t {
  kInvalidExceptionCode = 0x00,
  kIllegalFunction = 0x01,
  kIllegalDataAddress = 0x02,
  kIllegalDataValue = 0x03,
  kServerDeviceFailure = 0x04,
  kAcknowledge = 0x05,
  kServerDeviceBusy = 0x06,
  kNegativeAcknowledge = 0x07,
  kMemoryParityError = 0x08,
  kGatewayPathUnavailable = 0x0A,
  kGatewayTargetDeviceFailedToRespond = 0x0B
};

[[nodiscard]] constexpr std::string_view ToString(ExceptionCode code) {
  switch (code) {
    case ExceptionCode::kIllegalFunction:
      return "illegal function";
    case ExceptionCode::kIllegalDataAddress:
      return "illegal data address";
    case ExceptionCode::kIllegalDataValue:
      return "illegal data value";
    case ExceptionCode::kServerDeviceFailure:
      return "server device failure";
    case ExceptionCode::kAcknowledge:
      return "acknowledge";
    case ExceptionCode::kServerDeviceBusy:
      return "server device busy";
    case ExceptionCode::kNegativeAcknowledge:
      return "negative acknowledge";
    case ExceptionCode::kMemoryParityError:
      return "memory parity error";
    case ExceptionCode::kGatewayPathUnavailable:
      return "gateway path unavailable";
    case ExceptionCode::kGatewayTargetDeviceFailedToRespond:
      return "gateway target device failed to respond";
    default:
      return "unknown exception";
  }
}

}  // namespace asyncmb
