#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "../common/clock.hpp"

namespace asyncmb {

struct TcpConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{502};
  /** Fixed client port, 0 for an ephemeral one */
  uint16_t local_port{0};
  uint8_t default_unit_id{0};
  /** Response deadline for requests without their own timeout */
  Duration default_timeout{std::chrono::milliseconds(200)};
  Duration connect_timeout{std::chrono::seconds(2)};
  /** Reconnect this long after the connection drops; unset leaves it down */
  std::optional<Duration> auto_reconnect_after{};
  /** Requests in flight at once, 0 for unbounded */
  size_t max_active_requests{0};
  int retries{0};
  bool queue_while_disconnected{true};
  Duration connect_wait_timeout{std::chrono::seconds(2)};
};

}  // namespace asyncmb
