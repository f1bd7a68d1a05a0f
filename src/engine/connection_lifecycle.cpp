#include <optional>
#include "common/log.hpp"
#include "engine/connection_lifecycle.hpp"

namespace asyncmb {

void ConnectionLifecycle::SetState(ConnectionState state) {
  if (state_ != state) {
    Logger()->debug("connection {} -> {}", ToString(state_), ToString(state));
    state_ = state;
  }
}

void ConnectionLifecycle::Start(TimePoint now) {
  if (state_ == ConnectionState::kDisconnected) {
    next_attempt_at_ = now;
  }
}

void ConnectionLifecycle::ScheduleReconnect(TimePoint now) {
  if (options_.auto_reconnect_after.has_value()) {
    next_attempt_at_ = now + *options_.auto_reconnect_after;
    Logger()->warn("reconnecting in {} ms",
                   std::chrono::duration_cast<std::chrono::milliseconds>(*options_.auto_reconnect_after).count());
  } else {
    next_attempt_at_.reset();
  }
}

ConnectionLifecycle::Event ConnectionLifecycle::Attempt(TimePoint now) {
  switch (transport_.Connect()) {
    case ConnectStatus::kConnected:
      SetState(ConnectionState::kConnected);
      Logger()->info("connection established");
      return Event::kConnected;
    case ConnectStatus::kInProgress:
      SetState(ConnectionState::kConnecting);
      return Event::kNone;
    case ConnectStatus::kFailed:
      break;
  }
  Logger()->warn("connect attempt failed");
  transport_.Close();
  SetState(ConnectionState::kDisconnected);
  ScheduleReconnect(now);
  return Event::kConnectFailed;
}

ConnectionLifecycle::Event ConnectionLifecycle::Poll(TimePoint now) {
  switch (state_) {
    case ConnectionState::kConnected:
      return Event::kNone;
    case ConnectionState::kConnecting:
      if (now - attempt_started_at_ >= options_.connect_timeout) {
        Logger()->warn("connect attempt timed out");
        transport_.Close();
        SetState(ConnectionState::kDisconnected);
        ScheduleReconnect(now);
        return Event::kConnectFailed;
      }
      return Attempt(now);
    case ConnectionState::kDisconnected:
      if (!next_attempt_at_.has_value() || now < *next_attempt_at_) {
        return Event::kNone;
      }
      next_attempt_at_.reset();
      attempt_started_at_ = now;
      return Attempt(now);
  }
  return Event::kNone;
}

bool ConnectionLifecycle::OnIoError(TimePoint now) {
  if (options_.hold_open && transport_.IsOpen()) {
    return false;
  }
  if (state_ != ConnectionState::kConnected) {
    return true;
  }

  transport_.Close();
  SetState(ConnectionState::kDisconnected);
  Logger()->info("connection closed");
  if (on_loss_) {
    on_loss_();
  }
  ScheduleReconnect(now);
  return true;
}

void ConnectionLifecycle::Stop() {
  next_attempt_at_.reset();
  bool was_connected = state_ == ConnectionState::kConnected;
  transport_.Close();
  SetState(ConnectionState::kDisconnected);
  if (was_connected) {
    Logger()->info("connection closed");
  }
}

std::optional<TimePoint> ConnectionLifecycle::AttemptDeadline() const noexcept {
  if (state_ != ConnectionState::kConnecting) {
    return {};
  }
  return attempt_started_at_ + options_.connect_timeout;
}

}  // namespace asyncmb
