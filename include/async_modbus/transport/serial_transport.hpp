#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include "../common/parity.hpp"
#include "connectable_transport.hpp"

namespace asyncmb {

/**
 * @brief POSIX serial port transport
 *
 * Uses termios in raw, non-blocking mode. Connect() opens and configures the
 * port; it is held open until Close(). Works with real ports and with virtual
 * ones (socat pty pairs).
 */
class SerialTransport : public ConnectableTransport {
 public:
  /**
   * @param device Serial port path (e.g., "/dev/ttyUSB0", "/dev/pts/2")
   * @param baud_rate Baud rate (e.g., 9600, 19200, 38400, 115200)
   * @param parity Parity setting
   * @param data_bits Data bits (5 to 8)
   * @param stop_bits Stop bits (1 or 2)
   */
  SerialTransport(std::string device, uint32_t baud_rate, Parity parity = Parity::kNone, uint8_t data_bits = 8,
                  uint8_t stop_bits = 1)
      : device_(std::move(device)),
        baud_rate_(baud_rate),
        parity_(parity),
        data_bits_(data_bits),
        stop_bits_(stop_bits) {}

  ~SerialTransport() override { Close(); }

  SerialTransport(const SerialTransport &) = delete;
  SerialTransport &operator=(const SerialTransport &) = delete;

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;

  /** Block until the output queue has drained (tcdrain) */
  [[nodiscard]] bool Flush() override;

  // ConnectableTransport interface
  [[nodiscard]] ConnectStatus Connect() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override { return fd_ >= 0; }
  void DiscardInput() override;

  [[nodiscard]] const std::string &GetDevice() const noexcept { return device_; }

 private:
  [[nodiscard]] bool Open();

  std::string device_;
  uint32_t baud_rate_;
  Parity parity_;
  uint8_t data_bits_;
  uint8_t stop_bits_;
  int fd_{-1};
};

}  // namespace asyncmb
