#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "engine/modbus_client.hpp"

namespace asyncmb {

Result<Response> ModbusClient::Execute(Request request) {
  ClientEngine &engine = GetEngine();
  return engine.Wait(engine.Submit(std::move(request)));
}

Result<std::vector<bool>> ModbusClient::ReadCoils(uint16_t address, uint16_t count, std::optional<uint8_t> unit_id,
                                                  std::optional<Duration> timeout) {
  auto response = Execute(Request::ReadCoils(UnitOrDefault(unit_id), address, count).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return response->GetBits();
}

Result<std::vector<bool>> ModbusClient::ReadDiscreteInputs(uint16_t address, uint16_t count,
                                                           std::optional<uint8_t> unit_id,
                                                           std::optional<Duration> timeout) {
  auto response = Execute(Request::ReadDiscreteInputs(UnitOrDefault(unit_id), address, count).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return response->GetBits();
}

Result<std::vector<uint16_t>> ModbusClient::ReadHoldingRegisters(uint16_t address, uint16_t count,
                                                                 std::optional<uint8_t> unit_id,
                                                                 std::optional<Duration> timeout) {
  auto response =
      Execute(Request::ReadHoldingRegisters(UnitOrDefault(unit_id), address, count).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return response->GetRegisters();
}

Result<std::vector<uint16_t>> ModbusClient::ReadInputRegisters(uint16_t address, uint16_t count,
                                                               std::optional<uint8_t> unit_id,
                                                               std::optional<Duration> timeout) {
  auto response = Execute(Request::ReadInputRegisters(UnitOrDefault(unit_id), address, count).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return response->GetRegisters();
}

Result<Done> ModbusClient::WriteSingleCoil(uint16_t address, bool value, std::optional<uint8_t> unit_id,
                                           std::optional<Duration> timeout) {
  auto response = Execute(Request::WriteSingleCoil(UnitOrDefault(unit_id), address, value).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return Done{};
}

Result<Done> ModbusClient::WriteSingleRegister(uint16_t address, uint16_t value, std::optional<uint8_t> unit_id,
                                               std::optional<Duration> timeout) {
  auto response = Execute(Request::WriteSingleRegister(UnitOrDefault(unit_id), address, value).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return Done{};
}

Result<Done> ModbusClient::WriteMultipleCoils(uint16_t address, std::vector<bool> values,
                                              std::optional<uint8_t> unit_id, std::optional<Duration> timeout) {
  auto response = Execute(
      Request::WriteMultipleCoils(UnitOrDefault(unit_id), address, std::move(values)).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return Done{};
}

Result<Done> ModbusClient::WriteMultipleRegisters(uint16_t address, std::vector<uint16_t> values,
                                                  std::optional<uint8_t> unit_id, std::optional<Duration> timeout) {
  auto response = Execute(
      Request::WriteMultipleRegisters(UnitOrDefault(unit_id), address, std::move(values)).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return Done{};
}

Result<uint8_t> ModbusClient::ReadExceptionStatus(std::optional<uint8_t> unit_id, std::optional<Duration> timeout) {
  auto response = Execute(Request::ReadExceptionStatus(UnitOrDefault(unit_id)).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return response->GetExceptionStatus();
}

Result<Done> ModbusClient::MaskWriteRegister(uint16_t address, uint16_t and_mask, uint16_t or_mask,
                                             std::optional<uint8_t> unit_id, std::optional<Duration> timeout) {
  auto response = Execute(
      Request::MaskWriteRegister(UnitOrDefault(unit_id), address, and_mask, or_mask).WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return Done{};
}

Result<std::vector<uint16_t>> ModbusClient::ReadWriteMultipleRegisters(uint16_t read_address, uint16_t read_count,
                                                                       uint16_t write_address,
                                                                       std::vector<uint16_t> values,
                                                                       std::optional<uint8_t> unit_id,
                                                                       std::optional<Duration> timeout) {
  auto response = Execute(Request::ReadWriteMultipleRegisters(UnitOrDefault(unit_id), read_address, read_count,
                                                              write_address, std::move(values))
                              .WithTimeout(timeout));
  if (!response) {
    return response.error();
  }
  return response->GetRegisters();
}

}  // namespace asyncmb
