#pragma once

#include <memory>
#include "../common/clock.hpp"
#include "../engine/client_engine.hpp"
#include "../engine/modbus_client.hpp"
#include "../transport/connectable_transport.hpp"
#include "rtu_framer.hpp"
#include "rtu_timing.hpp"
#include "serial_config.hpp"
#include "turnaround_deadline_policy.hpp"

namespace asyncmb {

/**
 * @brief Modbus RTU client for one serial line
 *
 * The line is half-duplex: one request at a time, answered in order, with
 * t3.5 of silence between exchanges. Deadlines follow the turnaround model
 * of RtuTiming. Writes to unit 0 are broadcasts and complete once sent.
 */
class RtuClient : public ModbusClient {
 public:
  /** Open config.device through termios */
  explicit RtuClient(SerialConfig config);

  /**
   * @brief Run over a caller-provided transport and clock
   *
   * Both must outlive the client.
   */
  RtuClient(SerialConfig config, ConnectableTransport &transport, const Clock &clock);

  [[nodiscard]] ClientEngine &GetEngine() noexcept override { return engine_; }
  [[nodiscard]] const ClientEngine &GetEngine() const noexcept override { return engine_; }
  [[nodiscard]] const SerialConfig &GetConfig() const noexcept { return config_; }
  [[nodiscard]] const RtuTiming &GetTiming() const noexcept { return framer_.GetTiming(); }

  [[nodiscard]] static EngineOptions ToEngineOptions(const SerialConfig &config);

 private:
  RtuClient(SerialConfig config, std::unique_ptr<ConnectableTransport> owned_transport,
            ConnectableTransport *transport, const Clock *clock);

  SerialConfig config_;
  SteadyClock steady_clock_{};
  std::unique_ptr<ConnectableTransport> owned_transport_;
  RtuFramer framer_;
  TurnaroundDeadlinePolicy deadlines_;
  ClientEngine engine_;
};

}  // namespace asyncmb
