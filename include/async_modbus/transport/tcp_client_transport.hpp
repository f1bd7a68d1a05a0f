#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include "connectable_transport.hpp"

namespace asyncmb {

/**
 * @brief Non-blocking POSIX TCP client socket
 *
 * Connect() resolves the host and starts a non-blocking connect; later calls
 * report whether it finished. A fixed local port can be requested for
 * devices that filter on the client port; the socket then uses SO_REUSEADDR
 * and a zero linger so the port can be rebound right after a reconnect.
 * A peer close shows up as a failed Read().
 */
class TcpClientTransport : public ConnectableTransport {
 public:
  /**
   * @param host Host name or address
   * @param port Remote port (502 for Modbus TCP)
   * @param local_port Local port to bind, 0 for an ephemeral one
   */
  TcpClientTransport(std::string host, uint16_t port, uint16_t local_port = 0)
      : host_(std::move(host)),
        port_(port),
        local_port_(local_port) {}

  ~TcpClientTransport() override { Close(); }

  TcpClientTransport(const TcpClientTransport &) = delete;
  TcpClientTransport &operator=(const TcpClientTransport &) = delete;

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override;

  // ConnectableTransport interface
  [[nodiscard]] ConnectStatus Connect() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override { return fd_ >= 0 && connected_; }
  void DiscardInput() override;

  [[nodiscard]] const std::string &GetHost() const noexcept { return host_; }
  [[nodiscard]] uint16_t GetPort() const noexcept { return port_; }

 private:
  [[nodiscard]] ConnectStatus StartConnect();
  [[nodiscard]] ConnectStatus FinishConnect();

  std::string host_;
  uint16_t port_;
  uint16_t local_port_;
  int fd_{-1};
  bool connected_{false};
};

}  // namespace asyncmb
