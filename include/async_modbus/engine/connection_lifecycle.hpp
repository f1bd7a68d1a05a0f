#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include "../common/clock.hpp"
#include "../transport/connectable_transport.hpp"

namespace asyncmb {

enum class ConnectionState { kDisconnected, kConnecting, kConnected };

[[nodiscard]] constexpr std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
  }
  return "unknown";
}

struct LifecycleOptions {
  /** Give up on a connect attempt that has not completed after this long */
  Duration connect_timeout{std::chrono::seconds(2)};
  /** Delay before reconnecting after a loss or failed attempt; unset means stay down */
  std::optional<Duration> auto_reconnect_after{};
  /**
   * Keep the transport open across I/O errors (serial ports). Only the
   * transaction in flight fails; the state stays Connected.
   */
  bool hold_open{false};
};

/**
 * @brief Disconnected -> Connecting -> Connected state machine of one transport
 *
 * Driven from the engine's poll loop. When the connection is lost the loss
 * handler runs before any reconnect is scheduled, so outstanding work has
 * already failed by the time a new attempt starts.
 */
class ConnectionLifecycle {
 public:
  enum class Event { kNone, kConnected, kConnectFailed };

  using LossHandler = std::function<void()>;

  ConnectionLifecycle(ConnectableTransport &transport, LifecycleOptions options)
      : transport_(transport),
        options_(options) {}

  void SetLossHandler(LossHandler handler) { on_loss_ = std::move(handler); }

  /** Schedule the first connect attempt for now */
  void Start(TimePoint now);

  /**
   * @brief Advance the state machine
   *
   * Starts due attempts, checks pending ones and enforces the connect timeout.
   */
  Event Poll(TimePoint now);

  /**
   * @brief Report a failed read or write
   * @return true if the connection was dropped, false if the transport is held open
   */
  bool OnIoError(TimePoint now);

  /** Close the transport and disable reconnection */
  void Stop();

  [[nodiscard]] ConnectionState GetState() const noexcept { return state_; }
  [[nodiscard]] bool IsConnected() const noexcept { return state_ == ConnectionState::kConnected; }

  /** Disconnected with nothing scheduled: requests cannot be served until Start() */
  [[nodiscard]] bool IsDown() const noexcept {
    return state_ == ConnectionState::kDisconnected && !next_attempt_at_.has_value();
  }

  [[nodiscard]] std::optional<TimePoint> NextAttemptAt() const noexcept { return next_attempt_at_; }
  [[nodiscard]] std::optional<TimePoint> AttemptDeadline() const noexcept;
  [[nodiscard]] const LifecycleOptions &GetOptions() const noexcept { return options_; }

 private:
  void SetState(ConnectionState state);
  void ScheduleReconnect(TimePoint now);
  Event Attempt(TimePoint now);

  ConnectableTransport &transport_;
  LifecycleOptions options_;
  LossHandler on_loss_{};
  ConnectionState state_{ConnectionState::kDisconnected};
  std::optional<TimePoint> next_attempt_at_{};
  TimePoint attempt_started_at_{};
};

}  // namespace asyncmb
