#include <memory>
#include <utility>
#include "engine/client_engine.hpp"
#include "tcp/tcp_client.hpp"
#include "transport/tcp_client_transport.hpp"

namespace asyncmb {

EngineOptions TcpClient::ToEngineOptions(const TcpConfig &config) {
  EngineOptions options;
  options.retries = config.retries;
  options.concurrency_limit = config.max_active_requests;
  options.queue_while_disconnected = config.queue_while_disconnected;
  options.connect_wait_timeout = config.connect_wait_timeout;
  options.lifecycle.connect_timeout = config.connect_timeout;
  options.lifecycle.auto_reconnect_after = config.auto_reconnect_after;
  options.lifecycle.hold_open = false;
  return options;
}

TcpClient::TcpClient(TcpConfig config)
    : TcpClient(config, std::make_unique<TcpClientTransport>(config.host, config.port, config.local_port), nullptr,
                nullptr) {}

TcpClient::TcpClient(TcpConfig config, ConnectableTransport &transport, const Clock &clock)
    : TcpClient(std::move(config), nullptr, &transport, &clock) {}

TcpClient::TcpClient(TcpConfig config, std::unique_ptr<ConnectableTransport> owned_transport,
                     ConnectableTransport *transport, const Clock *clock)
    : ModbusClient(config.default_unit_id),
      config_(std::move(config)),
      owned_transport_(std::move(owned_transport)),
      deadlines_(config_.default_timeout),
      engine_(transport != nullptr ? *transport : *owned_transport_, framer_, deadlines_,
              clock != nullptr ? *clock : steady_clock_, ToEngineOptions(config_)) {
  engine_.Start();
}

}  // namespace asyncmb
