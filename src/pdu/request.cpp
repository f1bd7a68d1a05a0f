#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "common/address_span.hpp"
#include "common/function_code.hpp"
#include "pdu/request.hpp"

namespace asyncmb {

Request Request::ReadCoils(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  Request request({unit_id, FunctionCode::kReadCoils});
  request.span_ = {start_address, count};
  return request;
}

Request Request::ReadDiscreteInputs(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  Request request({unit_id, FunctionCode::kReadDI});
  request.span_ = {start_address, count};
  return request;
}

Request Request::ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  Request request({unit_id, FunctionCode::kReadHR});
  request.span_ = {start_address, count};
  return request;
}

Request Request::ReadInputRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  Request request({unit_id, FunctionCode::kReadIR});
  request.span_ = {start_address, count};
  return request;
}

Request Request::WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value) {
  Request request({unit_id, FunctionCode::kWriteSingleCoil});
  request.span_ = {address, 1};
  request.coils_ = {value};
  return request;
}

Request Request::WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value) {
  Request request({unit_id, FunctionCode::kWriteSingleReg});
  request.span_ = {address, 1};
  request.registers_ = {value};
  return request;
}

Request Request::WriteMultipleCoils(uint8_t unit_id, uint16_t start_address, std::vector<bool> values) {
  Request request({unit_id, FunctionCode::kWriteMultCoils});
  request.span_ = {start_address, static_cast<uint16_t>(values.size())};
  request.coils_ = std::move(values);
  return request;
}

Request Request::WriteMultipleRegisters(uint8_t unit_id, uint16_t start_address, std::vector<uint16_t> values) {
  Request request({unit_id, FunctionCode::kWriteMultRegs});
  request.span_ = {start_address, static_cast<uint16_t>(values.size())};
  request.registers_ = std::move(values);
  return request;
}

Request Request::ReadExceptionStatus(uint8_t unit_id) {
  return Request({unit_id, FunctionCode::kReadExceptionStatus});
}

Request Request::MaskWriteRegister(uint8_t unit_id, uint16_t address, uint16_t and_mask, uint16_t or_mask) {
  Request request({unit_id, FunctionCode::kMaskWriteReg});
  request.span_ = {address, 1};
  request.registers_ = {and_mask, or_mask};
  return request;
}

Request Request::ReadWriteMultipleRegisters(uint8_t unit_id, uint16_t read_start, uint16_t read_count,
                                            uint16_t write_start, std::vector<uint16_t> write_values) {
  Request request({unit_id, FunctionCode::kReadWriteMultRegs});
  request.span_ = {read_start, read_count};
  request.write_start_ = write_start;
  request.registers_ = std::move(write_values);
  return request;
}

Request Request::WithTimeout(std::optional<Duration> timeout) const {
  Request copy = *this;
  copy.timeout_ = timeout;
  return copy;
}

Request Request::WithUnitId(uint8_t unit_id) const {
  Request copy = *this;
  copy.header_.unit_id = unit_id;
  return copy;
}

}  // namespace asyncmb
