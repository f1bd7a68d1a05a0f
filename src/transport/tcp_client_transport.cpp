#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include "common/log.hpp"
#include "transport/tcp_client_transport.hpp"

namespace asyncmb {

static constexpr int kWriteWaitMs = 100;

ConnectStatus TcpClientTransport::Connect() {
  if (fd_ < 0) {
    return StartConnect();
  }
  if (!connected_) {
    return FinishConnect();
  }
  return ConnectStatus::kConnected;
}

ConnectStatus TcpClientTransport::StartConnect() {
  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *addresses = nullptr;
  std::string service = std::to_string(port_);
  int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &addresses);
  if (rc != 0 || addresses == nullptr) {
    Logger()->warn("cannot resolve {}:{}: {}", host_, port_, ::gai_strerror(rc));
    return ConnectStatus::kFailed;
  }

  ConnectStatus status = ConnectStatus::kFailed;
  for (struct addrinfo *address = addresses; address != nullptr; address = address->ai_next) {
    int fd = ::socket(address->ai_family, address->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, address->ai_protocol);
    if (fd < 0) {
      continue;
    }

    int opt = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != 0) {
      Logger()->debug("TCP_NODELAY not set: {}", std::strerror(errno));
    }

    if (local_port_ != 0) {
      struct linger no_linger {
        1, 0
      };
      struct sockaddr_storage local {};
      socklen_t local_size = 0;
      if (address->ai_family == AF_INET6) {
        auto *in6 = reinterpret_cast<struct sockaddr_in6 *>(&local);
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(local_port_);
        in6->sin6_addr = in6addr_any;
        local_size = sizeof(struct sockaddr_in6);
      } else {
        auto *in4 = reinterpret_cast<struct sockaddr_in *>(&local);
        in4->sin_family = AF_INET;
        in4->sin_port = htons(local_port_);
        in4->sin_addr.s_addr = htonl(INADDR_ANY);
        local_size = sizeof(struct sockaddr_in);
      }
      if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0 ||
          ::setsockopt(fd, SOL_SOCKET, SO_LINGER, &no_linger, sizeof(no_linger)) != 0 ||
          ::bind(fd, reinterpret_cast<struct sockaddr *>(&local), local_size) != 0) {
        Logger()->warn("cannot bind local port {}: {}", local_port_, std::strerror(errno));
        ::close(fd);
        continue;
      }
    }

    if (::connect(fd, address->ai_addr, address->ai_addrlen) == 0) {
      fd_ = fd;
      connected_ = true;
      status = ConnectStatus::kConnected;
      break;
    }
    if (errno == EINPROGRESS) {
      fd_ = fd;
      connected_ = false;
      status = ConnectStatus::kInProgress;
      break;
    }
    Logger()->debug("connect to {}:{} failed: {}", host_, port_, std::strerror(errno));
    ::close(fd);
  }

  ::freeaddrinfo(addresses);
  return status;
}

ConnectStatus TcpClientTransport::FinishConnect() {
  struct pollfd pfd {
    fd_, POLLOUT, 0
  };
  int ready = ::poll(&pfd, 1, 0);
  if (ready == 0) {
    return ConnectStatus::kInProgress;
  }
  if (ready < 0) {
    Close();
    return ConnectStatus::kFailed;
  }

  int error = 0;
  socklen_t error_size = sizeof(error);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &error_size) != 0 || error != 0) {
    Logger()->debug("connect to {}:{} failed: {}", host_, port_, std::strerror(error != 0 ? error : errno));
    Close();
    return ConnectStatus::kFailed;
  }

  connected_ = true;
  return ConnectStatus::kConnected;
}

void TcpClientTransport::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  connected_ = false;
}

int TcpClientTransport::Read(std::span<uint8_t> buffer) {
  if (!IsOpen()) {
    return -1;
  }
  ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    return -1;
  }
  if (n == 0 && !buffer.empty()) {
    return -1;  // Peer closed the connection
  }
  return static_cast<int>(n);
}

bool TcpClientTransport::HasData() const {
  return AvailableBytes() > 0;
}

size_t TcpClientTransport::AvailableBytes() const {
  if (!IsOpen()) {
    return 0;
  }
  int n = 0;
  if (::ioctl(fd_, FIONREAD, &n) == 0 && n > 0) {
    return static_cast<size_t>(n);
  }
  return 0;
}

int TcpClientTransport::Write(std::span<const uint8_t> data) {
  if (!IsOpen()) {
    return -1;
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
    if (n >= 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return -1;
    }
    // Socket buffer full; an ADU is small, so wait briefly for room
    struct pollfd pfd {
      fd_, POLLOUT, 0
    };
    if (::poll(&pfd, 1, kWriteWaitMs) <= 0) {
      return static_cast<int>(written);
    }
  }
  return static_cast<int>(written);
}

bool TcpClientTransport::Flush() {
  return IsOpen();  // TCP stream has no application-level flush
}

void TcpClientTransport::DiscardInput() {
  if (!IsOpen()) {
    return;
  }
  uint8_t scratch[256];
  while (::recv(fd_, scratch, sizeof(scratch), 0) > 0) {
  }
}

}  // namespace asyncmb
