#pragma once

#include "byte_writer.hpp"

namespace asyncmb {

enum class ConnectStatus { kConnected, kInProgress, kFailed };

/**
 * @brief A byte transport with an explicit open/close lifecycle
 *
 * Connect() never blocks. It starts an attempt when the transport is closed
 * and reports progress of a pending attempt on later calls. A failed attempt
 * leaves the transport closed.
 */
class ConnectableTransport : public ByteTransport {
 public:
  ~ConnectableTransport() override = default;

  [[nodiscard]] virtual ConnectStatus Connect() = 0;
  virtual void Close() = 0;
  [[nodiscard]] virtual bool IsOpen() const = 0;

  /** Drop received bytes nobody has read yet */
  virtual void DiscardInput() = 0;
};

}  // namespace asyncmb
