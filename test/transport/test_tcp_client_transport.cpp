#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include "async_modbus/transport/tcp_client_transport.hpp"

using asyncmb::ConnectStatus;
using asyncmb::TcpClientTransport;

namespace {

// Loopback listener on an ephemeral port
class Listener {
 public:
  Listener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr *>(&address), sizeof(address));
    ::listen(fd_, 4);
    socklen_t size = sizeof(address);
    ::getsockname(fd_, reinterpret_cast<sockaddr *>(&address), &size);
    port_ = ntohs(address.sin_port);
  }

  ~Listener() {
    if (peer_ >= 0) {
      ::close(peer_);
    }
    ::close(fd_);
  }

  [[nodiscard]] uint16_t GetPort() const noexcept { return port_; }

  int Accept() {
    peer_ = ::accept(fd_, nullptr, nullptr);
    return peer_;
  }

  void ClosePeer() {
    ::close(peer_);
    peer_ = -1;
  }

 private:
  int fd_{-1};
  int peer_{-1};
  uint16_t port_{0};
};

ConnectStatus ConnectWithin(TcpClientTransport &transport, std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  ConnectStatus status = transport.Connect();
  while (status == ConnectStatus::kInProgress && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    status = transport.Connect();
  }
  return status;
}

int ReadWithin(TcpClientTransport &transport, std::vector<uint8_t> &buffer, std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  int n = transport.Read(buffer);
  while (n == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    n = transport.Read(buffer);
  }
  return n;
}

}  // namespace

TEST(TcpClientTransport, ConnectWriteAndRead) {
  Listener listener;
  TcpClientTransport transport("127.0.0.1", listener.GetPort());

  ASSERT_EQ(ConnectWithin(transport, std::chrono::seconds(2)), ConnectStatus::kConnected);
  EXPECT_TRUE(transport.IsOpen());
  int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  std::vector<uint8_t> request{0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03};
  ASSERT_EQ(transport.Write(request), static_cast<int>(request.size()));

  std::vector<uint8_t> received(request.size());
  size_t got = 0;
  while (got < received.size()) {
    ssize_t n = ::recv(peer, received.data() + got, received.size() - got, 0);
    ASSERT_GT(n, 0);
    got += static_cast<size_t>(n);
  }
  EXPECT_EQ(received, request);

  std::vector<uint8_t> reply{0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x11, 0x83, 0x02};
  ASSERT_EQ(::send(peer, reply.data(), reply.size(), 0), static_cast<ssize_t>(reply.size()));

  std::vector<uint8_t> buffer(64);
  int n = ReadWithin(transport, buffer, std::chrono::seconds(2));
  ASSERT_EQ(n, static_cast<int>(reply.size()));
  buffer.resize(static_cast<size_t>(n));
  EXPECT_EQ(buffer, reply);
}

TEST(TcpClientTransport, PeerCloseIsReadError) {
  Listener listener;
  TcpClientTransport transport("127.0.0.1", listener.GetPort());
  ASSERT_EQ(ConnectWithin(transport, std::chrono::seconds(2)), ConnectStatus::kConnected);
  ASSERT_GE(listener.Accept(), 0);

  listener.ClosePeer();

  std::vector<uint8_t> buffer(16);
  EXPECT_EQ(ReadWithin(transport, buffer, std::chrono::seconds(2)), -1);
}

TEST(TcpClientTransport, RefusedConnectionFails) {
  uint16_t port = 0;
  {
    // Reserve an ephemeral port and release it without listening
    Listener listener;
    port = listener.GetPort();
  }
  TcpClientTransport transport("127.0.0.1", port);

  EXPECT_EQ(ConnectWithin(transport, std::chrono::seconds(2)), ConnectStatus::kFailed);
  EXPECT_FALSE(transport.IsOpen());
}

TEST(TcpClientTransport, ClosedTransportRejectsIo) {
  TcpClientTransport transport("127.0.0.1", 502);
  std::vector<uint8_t> buffer(4);

  EXPECT_FALSE(transport.IsOpen());
  EXPECT_EQ(transport.Read(buffer), -1);
  EXPECT_EQ(transport.Write(buffer), -1);
  EXPECT_EQ(transport.AvailableBytes(), 0U);
  EXPECT_EQ(transport.GetHost(), "127.0.0.1");
  EXPECT_EQ(transport.GetPort(), 502);
}

TEST(TcpClientTransport, DiscardInputDropsPendingBytes) {
  Listener listener;
  TcpClientTransport transport("127.0.0.1", listener.GetPort());
  ASSERT_EQ(ConnectWithin(transport, std::chrono::seconds(2)), ConnectStatus::kConnected);
  int peer = listener.Accept();
  ASSERT_GE(peer, 0);

  std::vector<uint8_t> stale{0x01, 0x02, 0x03};
  ASSERT_EQ(::send(peer, stale.data(), stale.size(), 0), static_cast<ssize_t>(stale.size()));
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (transport.AvailableBytes() < stale.size() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_TRUE(transport.HasData());

  transport.DiscardInput();

  std::vector<uint8_t> buffer(16);
  EXPECT_EQ(transport.Read(buffer), 0);
}
