#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "../common/clock.hpp"
#include "../common/result.hpp"
#include "../pdu/request.hpp"
#include "../pdu/response.hpp"
#include "client_engine.hpp"
#include "transaction.hpp"

namespace asyncmb {

/**
 * @brief Transport-independent client surface
 *
 * Submit()/Cancel() expose the engine's asynchronous contract. The typed
 * helpers build a request, submit it and block in ClientEngine::Wait() until
 * it resolves. A missing unit id means the connection's default unit; a
 * missing timeout means the connection's default deadline.
 */
class ModbusClient {
 public:
  explicit ModbusClient(uint8_t default_unit_id)
      : default_unit_id_(default_unit_id) {}
  virtual ~ModbusClient() = default;

  ModbusClient(const ModbusClient &) = delete;
  ModbusClient &operator=(const ModbusClient &) = delete;

  [[nodiscard]] virtual ClientEngine &GetEngine() noexcept = 0;
  [[nodiscard]] virtual const ClientEngine &GetEngine() const noexcept = 0;

  TransactionHandle Submit(Request request, CompletionHandler handler = {}) {
    return GetEngine().Submit(std::move(request), std::move(handler));
  }
  bool Cancel(const TransactionHandle &handle) { return GetEngine().Cancel(handle); }
  void Poll() { GetEngine().Poll(); }
  void Start() { GetEngine().Start(); }
  void Stop() { GetEngine().Stop(); }

  /** Submit and wait */
  Result<Response> Execute(Request request);

  [[nodiscard]] uint8_t GetDefaultUnitId() const noexcept { return default_unit_id_; }
  [[nodiscard]] ConnectionState GetConnectionState() const noexcept { return GetEngine().GetConnectionState(); }

  Result<std::vector<bool>> ReadCoils(uint16_t address, uint16_t count, std::optional<uint8_t> unit_id = {},
                                      std::optional<Duration> timeout = {});
  Result<std::vector<bool>> ReadDiscreteInputs(uint16_t address, uint16_t count, std::optional<uint8_t> unit_id = {},
                                               std::optional<Duration> timeout = {});
  Result<std::vector<uint16_t>> ReadHoldingRegisters(uint16_t address, uint16_t count,
                                                     std::optional<uint8_t> unit_id = {},
                                                     std::optional<Duration> timeout = {});
  Result<std::vector<uint16_t>> ReadInputRegisters(uint16_t address, uint16_t count,
                                                   std::optional<uint8_t> unit_id = {},
                                                   std::optional<Duration> timeout = {});
  Result<Done> WriteSingleCoil(uint16_t address, bool value, std::optional<uint8_t> unit_id = {},
                               std::optional<Duration> timeout = {});
  Result<Done> WriteSingleRegister(uint16_t address, uint16_t value, std::optional<uint8_t> unit_id = {},
                                   std::optional<Duration> timeout = {});
  Result<Done> WriteMultipleCoils(uint16_t address, std::vector<bool> values, std::optional<uint8_t> unit_id = {},
                                  std::optional<Duration> timeout = {});
  Result<Done> WriteMultipleRegisters(uint16_t address, std::vector<uint16_t> values,
                                      std::optional<uint8_t> unit_id = {}, std::optional<Duration> timeout = {});
  Result<uint8_t> ReadExceptionStatus(std::optional<uint8_t> unit_id = {}, std::optional<Duration> timeout = {});
  Result<Done> MaskWriteRegister(uint16_t address, uint16_t and_mask, uint16_t or_mask,
                                 std::optional<uint8_t> unit_id = {}, std::optional<Duration> timeout = {});
  Result<std::vector<uint16_t>> ReadWriteMultipleRegisters(uint16_t read_address, uint16_t read_count,
                                                           uint16_t write_address, std::vector<uint16_t> values,
                                                           std::optional<uint8_t> unit_id = {},
                                                           std::optional<Duration> timeout = {});

 private:
  [[nodiscard]] uint8_t UnitOrDefault(std::optional<uint8_t> unit_id) const noexcept {
    return unit_id.value_or(default_unit_id_);
  }

  uint8_t default_unit_id_;
};

}  // namespace asyncmb
