#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "../common/clock.hpp"
#include "../common/parity.hpp"

namespace asyncmb {

struct SerialConfig {
  std::string device{};
  uint32_t baud_rate{9600};
  Parity parity{Parity::kNone};
  uint8_t data_bits{8};
  uint8_t stop_bits{1};
  uint8_t default_unit_id{0};
  /** Device processing allowance added to the computed transmission time */
  Duration turnaround_extra_wait{std::chrono::milliseconds(100)};
  /** Reopen the port this long after it fails; unset leaves it closed */
  std::optional<Duration> auto_reconnect_after{};
  int retries{0};
};

}  // namespace asyncmb
