#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "../common/address_span.hpp"
#include "../common/clock.hpp"
#include "../common/function_code.hpp"

namespace asyncmb {

/**
 * @brief A structured Modbus request
 *
 * Built through the named constructors, which fill the fields each function
 * code uses. Bounds are not checked here; PduCodec validates before anything
 * is encoded. The engine keeps its own copy once a request is submitted.
 */
class Request {
 public:
  struct Header {
    uint8_t unit_id;
    FunctionCode function_code;

    bool operator==(const Header &) const = default;
  };

  explicit Request(Header header)
      : header_(header) {}

  [[nodiscard]] static Request ReadCoils(uint8_t unit_id, uint16_t start_address, uint16_t count);
  [[nodiscard]] static Request ReadDiscreteInputs(uint8_t unit_id, uint16_t start_address, uint16_t count);
  [[nodiscard]] static Request ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count);
  [[nodiscard]] static Request ReadInputRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count);
  [[nodiscard]] static Request WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value);
  [[nodiscard]] static Request WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value);
  [[nodiscard]] static Request WriteMultipleCoils(uint8_t unit_id, uint16_t start_address, std::vector<bool> values);
  [[nodiscard]] static Request WriteMultipleRegisters(uint8_t unit_id, uint16_t start_address,
                                                      std::vector<uint16_t> values);
  [[nodiscard]] static Request ReadExceptionStatus(uint8_t unit_id);
  [[nodiscard]] static Request MaskWriteRegister(uint8_t unit_id, uint16_t address, uint16_t and_mask,
                                                 uint16_t or_mask);
  [[nodiscard]] static Request ReadWriteMultipleRegisters(uint8_t unit_id, uint16_t read_start, uint16_t read_count,
                                                          uint16_t write_start, std::vector<uint16_t> write_values);

  [[nodiscard]] uint8_t GetUnitId() const noexcept { return header_.unit_id; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return header_.function_code; }

  /**
   * @brief Start address and quantity
   *
   * For single writes the quantity is 1; for read/write multiple registers this is the read span.
   */
  [[nodiscard]] AddressSpan GetAddressSpan() const noexcept { return span_; }

  /** Write start address of a read/write multiple registers request */
  [[nodiscard]] uint16_t GetWriteStart() const noexcept { return write_start_; }

  /**
   * @brief Register values carried by the request
   *
   * Single register: {value}. Multiple registers and read/write: the values to write.
   * Mask write: {and_mask, or_mask}.
   */
  [[nodiscard]] const std::vector<uint16_t> &GetRegisters() const noexcept { return registers_; }

  /** Coil values: {value} for a single coil, the values to write otherwise */
  [[nodiscard]] const std::vector<bool> &GetCoils() const noexcept { return coils_; }

  /** Caller-specified timeout, replacing the connection default for this request */
  [[nodiscard]] std::optional<Duration> GetTimeout() const noexcept { return timeout_; }

  [[nodiscard]] Request WithTimeout(std::optional<Duration> timeout) const;
  [[nodiscard]] Request WithUnitId(uint8_t unit_id) const;

  [[nodiscard]] bool IsBroadcast() const noexcept {
    return header_.unit_id == 0 && IsBroadcastableWrite(header_.function_code);
  }

  bool operator==(const Request &) const = default;

 private:
  Header header_;
  AddressSpan span_{};
  uint16_t write_start_{0};
  std::vector<uint16_t> registers_{};
  std::vector<bool> coils_{};
  std::optional<Duration> timeout_{};
};

}  // namespace asyncmb
