#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include "async_modbus/common/parity.hpp"
#include "async_modbus/transport/serial_transport.hpp"

using asyncmb::ConnectStatus;
using asyncmb::Parity;
using asyncmb::SerialTransport;

namespace {

// Pseudo terminal pair; the transport opens the slave side
class PseudoTerminal {
 public:
  PseudoTerminal() {
    master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master_ >= 0 && ::grantpt(master_) == 0 && ::unlockpt(master_) == 0) {
      const char *name = ::ptsname(master_);
      if (name != nullptr) {
        slave_path_ = name;
      }
    }
  }

  ~PseudoTerminal() {
    if (master_ >= 0) {
      ::close(master_);
    }
  }

  [[nodiscard]] bool IsValid() const noexcept { return master_ >= 0 && !slave_path_.empty(); }
  [[nodiscard]] int GetMaster() const noexcept { return master_; }
  [[nodiscard]] const std::string &GetSlavePath() const noexcept { return slave_path_; }

 private:
  int master_{-1};
  std::string slave_path_{};
};

std::vector<uint8_t> ReadMaster(int fd, size_t count) {
  std::vector<uint8_t> received;
  while (received.size() < count) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 2000) <= 0) {
      break;
    }
    uint8_t buffer[64];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n <= 0) {
      break;
    }
    received.insert(received.end(), buffer, buffer + n);
  }
  return received;
}

}  // namespace

TEST(SerialTransport, MissingDeviceFails) {
  SerialTransport transport("/dev/async_modbus_no_such_port", 9600);

  EXPECT_EQ(transport.Connect(), ConnectStatus::kFailed);
  EXPECT_FALSE(transport.IsOpen());
}

TEST(SerialTransport, UnsupportedBaudRateFails) {
  PseudoTerminal pty;
  ASSERT_TRUE(pty.IsValid());
  SerialTransport transport(pty.GetSlavePath(), 12345);

  EXPECT_EQ(transport.Connect(), ConnectStatus::kFailed);
  EXPECT_FALSE(transport.IsOpen());
}

TEST(SerialTransport, ClosedTransportRejectsIo) {
  SerialTransport transport("/dev/null", 9600);
  std::vector<uint8_t> buffer(4);

  EXPECT_EQ(transport.Read(buffer), -1);
  EXPECT_EQ(transport.Write(buffer), -1);
  EXPECT_FALSE(transport.Flush());
  EXPECT_EQ(transport.GetDevice(), "/dev/null");
}

TEST(SerialTransport, WriteAndReadThroughPty) {
  PseudoTerminal pty;
  ASSERT_TRUE(pty.IsValid());
  SerialTransport transport(pty.GetSlavePath(), 19200, Parity::kEven);

  ASSERT_EQ(transport.Connect(), ConnectStatus::kConnected);
  EXPECT_TRUE(transport.IsOpen());
  EXPECT_EQ(transport.Connect(), ConnectStatus::kConnected);

  // Raw mode: 0x0A and 0x0D pass through untouched
  std::vector<uint8_t> request{0x01, 0x03, 0x00, 0x0A, 0x00, 0x0D, 0xA4, 0x0F};
  ASSERT_EQ(transport.Write(request), static_cast<int>(request.size()));
  EXPECT_EQ(ReadMaster(pty.GetMaster(), request.size()), request);

  std::vector<uint8_t> reply{0x01, 0x03, 0x02, 0x00, 0x0D, 0x79, 0x84};
  ASSERT_EQ(::write(pty.GetMaster(), reply.data(), reply.size()), static_cast<ssize_t>(reply.size()));

  std::vector<uint8_t> received;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (received.size() < reply.size() && std::chrono::steady_clock::now() < deadline) {
    std::vector<uint8_t> buffer(32);
    int n = transport.Read(buffer);
    ASSERT_GE(n, 0);
    received.insert(received.end(), buffer.begin(), buffer.begin() + n);
    if (n == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  EXPECT_EQ(received, reply);

  transport.Close();
  EXPECT_FALSE(transport.IsOpen());
}

TEST(SerialTransport, DiscardInputDropsPendingBytes) {
  PseudoTerminal pty;
  ASSERT_TRUE(pty.IsValid());
  SerialTransport transport(pty.GetSlavePath(), 9600);
  ASSERT_EQ(transport.Connect(), ConnectStatus::kConnected);

  std::vector<uint8_t> stale{0x11, 0x22, 0x33};
  ASSERT_EQ(::write(pty.GetMaster(), stale.data(), stale.size()), static_cast<ssize_t>(stale.size()));
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!transport.HasData() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_TRUE(transport.HasData());

  transport.DiscardInput();

  std::vector<uint8_t> buffer(16);
  EXPECT_EQ(transport.Read(buffer), 0);
}
