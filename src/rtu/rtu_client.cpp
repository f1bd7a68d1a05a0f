#include <memory>
#include <utility>
#include "engine/client_engine.hpp"
#include "rtu/rtu_client.hpp"
#include "transport/serial_transport.hpp"

namespace asyncmb {

static RtuTiming MakeTiming(const SerialConfig &config) {
  return RtuTiming(config.baud_rate, config.data_bits, config.parity, config.stop_bits);
}

EngineOptions RtuClient::ToEngineOptions(const SerialConfig &config) {
  EngineOptions options;
  options.retries = config.retries;
  options.concurrency_limit = 1;
  options.lifecycle.auto_reconnect_after = config.auto_reconnect_after;
  options.lifecycle.hold_open = true;
  return options;
}

RtuClient::RtuClient(SerialConfig config)
    : RtuClient(config,
                std::make_unique<SerialTransport>(config.device, config.baud_rate, config.parity, config.data_bits,
                                                  config.stop_bits),
                nullptr, nullptr) {}

RtuClient::RtuClient(SerialConfig config, ConnectableTransport &transport, const Clock &clock)
    : RtuClient(std::move(config), nullptr, &transport, &clock) {}

RtuClient::RtuClient(SerialConfig config, std::unique_ptr<ConnectableTransport> owned_transport,
                     ConnectableTransport *transport, const Clock *clock)
    : ModbusClient(config.default_unit_id),
      config_(std::move(config)),
      owned_transport_(std::move(owned_transport)),
      framer_(MakeTiming(config_)),
      deadlines_(MakeTiming(config_), config_.turnaround_extra_wait),
      engine_(transport != nullptr ? *transport : *owned_transport_, framer_, deadlines_,
              clock != nullptr ? *clock : steady_clock_, ToEngineOptions(config_)) {
  engine_.Start();
}

}  // namespace asyncmb
