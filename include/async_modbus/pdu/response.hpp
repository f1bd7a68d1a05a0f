#pragma once

#include <cstdint>
#include <utility>
#include <vector>
#include "../common/function_code.hpp"

namespace asyncmb {

/**
 * @brief Decoded, non-exception Modbus response
 *
 * Which fields are meaningful depends on the function code:
 * - read coils / discrete inputs: GetBits()
 * - read holding / input registers, read/write multiple: GetRegisters()
 * - write single coil / register: GetAddress(), GetValue() (echoed value)
 * - write multiple coils / registers: GetAddress(), GetValue() (echoed quantity)
 * - mask write register: GetAddress(), GetRegisters() = {and_mask, or_mask}
 * - read exception status: GetExceptionStatus()
 */
class Response {
 public:
  Response(uint8_t unit_id, FunctionCode function_code)
      : unit_id_(unit_id),
        function_code_(function_code) {}

  [[nodiscard]] uint8_t GetUnitId() const noexcept { return unit_id_; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return function_code_; }
  [[nodiscard]] const std::vector<uint16_t> &GetRegisters() const noexcept { return registers_; }
  [[nodiscard]] const std::vector<bool> &GetBits() const noexcept { return bits_; }
  [[nodiscard]] uint16_t GetAddress() const noexcept { return address_; }
  [[nodiscard]] uint16_t GetValue() const noexcept { return value_; }
  [[nodiscard]] uint8_t GetExceptionStatus() const noexcept { return exception_status_; }

  void SetRegisters(std::vector<uint16_t> registers) { registers_ = std::move(registers); }
  void SetBits(std::vector<bool> bits) { bits_ = std::move(bits); }
  void SetEcho(uint16_t address, uint16_t value) noexcept {
    address_ = address;
    value_ = value;
  }
  void SetExceptionStatus(uint8_t status) noexcept { exception_status_ = status; }

  bool operator==(const Response &) const = default;

 private:
  uint8_t unit_id_{};
  FunctionCode function_code_{};
  std::vector<uint16_t> registers_{};
  std::vector<bool> bits_{};
  uint16_t address_{0};
  uint16_t value_{0};
  uint8_t exception_status_{0};
};

}  // namespace asyncmb
