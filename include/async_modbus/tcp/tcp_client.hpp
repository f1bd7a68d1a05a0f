#pragma once

#include <memory>
#include "../common/clock.hpp"
#include "../engine/client_engine.hpp"
#include "../engine/deadline_policy.hpp"
#include "../engine/modbus_client.hpp"
#include "../transport/connectable_transport.hpp"
#include "tcp_config.hpp"
#include "tcp_framer.hpp"

namespace asyncmb {

/**
 * @brief Modbus TCP client
 *
 * Requests are matched to responses by MBAP transaction id, so up to
 * max_active_requests may be in flight at once. Connecting starts on
 * construction and completes inside the first polls.
 */
class TcpClient : public ModbusClient {
 public:
  /** Connect to config.host:config.port over a POSIX socket */
  explicit TcpClient(TcpConfig config);

  /**
   * @brief Run over a caller-provided transport and clock (e.g. MemoryTransport and ManualClock)
   *
   * Both must outlive the client.
   */
  TcpClient(TcpConfig config, ConnectableTransport &transport, const Clock &clock);

  [[nodiscard]] ClientEngine &GetEngine() noexcept override { return engine_; }
  [[nodiscard]] const ClientEngine &GetEngine() const noexcept override { return engine_; }
  [[nodiscard]] const TcpConfig &GetConfig() const noexcept { return config_; }

  /** Map the TCP settings onto the transport-independent engine options */
  [[nodiscard]] static EngineOptions ToEngineOptions(const TcpConfig &config);

 private:
  TcpClient(TcpConfig config, std::unique_ptr<ConnectableTransport> owned_transport, ConnectableTransport *transport,
            const Clock *clock);

  TcpConfig config_;
  SteadyClock steady_clock_{};
  std::unique_ptr<ConnectableTransport> owned_transport_;
  TcpFramer framer_{};
  FixedDeadlinePolicy deadlines_;
  ClientEngine engine_;
};

}  // namespace asyncmb
