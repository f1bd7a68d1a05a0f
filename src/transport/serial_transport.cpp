#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include "common/log.hpp"
#include "transport/serial_transport.hpp"

namespace asyncmb {

namespace {

struct BaudRateEntry {
  uint32_t baud;
  speed_t speed;
};

constexpr std::array<BaudRateEntry, 9> kBaudRates{{{1200, B1200},
                                                   {2400, B2400},
                                                   {4800, B4800},
                                                   {9600, B9600},
                                                   {19200, B19200},
                                                   {38400, B38400},
                                                   {57600, B57600},
                                                   {115200, B115200},
                                                   {230400, B230400}}};

std::optional<speed_t> ToSpeed(uint32_t baud) {
  for (const auto &entry : kBaudRates) {
    if (entry.baud == baud) {
      return entry.speed;
    }
  }
  return {};
}

tcflag_t CharacterSize(uint8_t data_bits) {
  switch (data_bits) {
    case 5:
      return CS5;
    case 6:
      return CS6;
    case 7:
      return CS7;
    default:
      return CS8;
  }
}

// Raw 8-bit line: no echo, no translation, no flow control, reads never wait
void MakeRaw(termios &tty, uint8_t data_bits, Parity parity, uint8_t stop_bits) {
  tty.c_iflag &= ~static_cast<tcflag_t>(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF);
  tty.c_oflag &= ~static_cast<tcflag_t>(OPOST);
  tty.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
  tty.c_cflag &= ~static_cast<tcflag_t>(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS);

  tty.c_cflag |= CharacterSize(data_bits) | CLOCAL | CREAD;
  if (parity != Parity::kNone) {
    tty.c_cflag |= PARENB;
    if (parity == Parity::kOdd) {
      tty.c_cflag |= PARODD;
    }
  }
  if (stop_bits == 2) {
    tty.c_cflag |= CSTOPB;
  }
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;
}

}  // namespace

ConnectStatus SerialTransport::Connect() {
  if (IsOpen()) {
    return ConnectStatus::kConnected;
  }
  return Open() ? ConnectStatus::kConnected : ConnectStatus::kFailed;
}

bool SerialTransport::Open() {
  auto speed = ToSpeed(baud_rate_);
  if (!speed.has_value()) {
    Logger()->error("unsupported baud rate {}", baud_rate_);
    return false;
  }

  int fd = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    Logger()->warn("cannot open {}: {}", device_, std::strerror(errno));
    return false;
  }

  struct termios tty {};
  if (::tcgetattr(fd, &tty) != 0 || ::cfsetispeed(&tty, *speed) != 0 || ::cfsetospeed(&tty, *speed) != 0) {
    Logger()->warn("cannot configure {}: {}", device_, std::strerror(errno));
    ::close(fd);
    return false;
  }

  MakeRaw(tty, data_bits_, parity_, stop_bits_);
  if (::tcsetattr(fd, TCSANOW, &tty) != 0) {
    Logger()->warn("cannot configure {}: {}", device_, std::strerror(errno));
    ::close(fd);
    return false;
  }

  if (::tcflush(fd, TCIOFLUSH) != 0) {
    Logger()->debug("cannot flush {}: {}", device_, std::strerror(errno));
  }
  fd_ = fd;
  return true;
}

void SerialTransport::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

int SerialTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }

  ssize_t n = ::read(fd_, buffer.data(), buffer.size());
  if (n >= 0) {
    return static_cast<int>(n);
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
    return 0;
  }
  Logger()->warn("read from {} failed: {}", device_, std::strerror(errno));
  return -1;
}

bool SerialTransport::HasData() const { return AvailableBytes() > 0; }

size_t SerialTransport::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  int bytes_available = 0;
  if (::ioctl(fd_, FIONREAD, &bytes_available) == 0 && bytes_available > 0) {
    return static_cast<size_t>(bytes_available);
  }
  return 0;
}

int SerialTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    return -1;
  }

  ssize_t n = ::write(fd_, data.data(), data.size());
  if (n >= 0) {
    return static_cast<int>(n);
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK) {
    return 0;
  }
  Logger()->warn("write to {} failed: {}", device_, std::strerror(errno));
  return -1;
}

bool SerialTransport::Flush() {
  if (fd_ < 0) {
    return false;
  }
  return ::tcdrain(fd_) == 0;
}

void SerialTransport::DiscardInput() {
  if (fd_ >= 0 && ::tcflush(fd_, TCIFLUSH) != 0) {
    Logger()->debug("cannot discard input on {}: {}", device_, std::strerror(errno));
  }
}

}  // namespace asyncmb
