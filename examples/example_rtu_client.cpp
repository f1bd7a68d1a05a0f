/**
 * @file example_rtu_client.cpp
 * @brief Example Modbus RTU client on a serial port
 *
 * Usage: example_rtu_client <device> [baud] [unit_id]
 *
 * To try it without hardware, create a virtual serial pair with
 *   socat -d -d pty,raw,echo=0 pty,raw,echo=0
 * and run a Modbus RTU slave simulator on the other end.
 */

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>
#include "async_modbus/common/log.hpp"
#include "async_modbus/pdu/request.hpp"
#include "async_modbus/rtu/rtu_client.hpp"

int main(int argc, char **argv) {
  using asyncmb::Parity;
  using asyncmb::Request;
  using asyncmb::RtuClient;
  using asyncmb::SerialConfig;

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <device> [baud] [unit_id]\n";
    return 1;
  }

  asyncmb::SetLogLevel("debug");

  SerialConfig config;
  config.device = argv[1];
  config.baud_rate = argc > 2 ? static_cast<uint32_t>(std::atoi(argv[2])) : 9600;
  config.parity = Parity::kEven;
  config.default_unit_id = argc > 3 ? static_cast<uint8_t>(std::atoi(argv[3])) : 1;
  config.auto_reconnect_after = std::chrono::seconds(2);
  config.retries = 2;

  RtuClient client(config);
  const auto &timing = client.GetTiming();
  std::cout << "Line " << config.device << " at " << config.baud_rate << " baud: t1.5 = "
            << timing.InterCharacterTimeout().count() << " us, t3.5 = " << timing.InterFrameDelay().count()
            << " us\n";

  // Example 1: Read holding registers
  std::cout << "\nExample 1: Reading holding registers 0..9...\n";
  auto registers = client.ReadHoldingRegisters(0, 10);
  if (registers.has_value()) {
    for (size_t i = 0; i < registers->size(); ++i) {
      std::cout << "    Register[" << i << "] = " << (*registers)[i] << "\n";
    }
  } else {
    std::cout << "  Failed: " << registers.error().ToString() << "\n";
  }

  // Example 2: Write multiple registers
  std::cout << "\nExample 2: Writing registers 10..13...\n";
  std::vector<uint16_t> values{100, 200, 300, 400};
  auto written = client.WriteMultipleRegisters(10, values);
  if (written.has_value()) {
    std::cout << "  Successfully wrote " << values.size() << " registers\n";
  } else {
    std::cout << "  Failed: " << written.error().ToString() << "\n";
  }

  // Example 3: Broadcast, completes as soon as the frame is sent
  std::cout << "\nExample 3: Broadcasting coil 0 = ON...\n";
  auto broadcast = client.Execute(Request::WriteSingleCoil(0, 0, true));
  std::cout << (broadcast.has_value() ? "  Broadcast sent\n" : "  Broadcast failed\n");

  // Example 4: Queue several requests; the line serves them one at a time
  std::cout << "\nExample 4: Queueing 3 reads...\n";
  int remaining = 3;
  for (uint16_t i = 0; i < 3; ++i) {
    client.Submit(Request::ReadInputRegisters(config.default_unit_id, i, 1), [i, &remaining](const auto &result) {
      --remaining;
      if (result.has_value()) {
        std::cout << "  Input[" << i << "] = " << result->GetRegisters().front() << "\n";
      } else {
        std::cout << "  Input[" << i << "] failed: " << result.error().ToString() << "\n";
      }
    });
  }
  client.GetEngine().RunUntil([&remaining] { return remaining == 0; }, std::chrono::seconds(10));

  client.Stop();
  std::cout << "\nDone.\n";
  return 0;
}
