#pragma once

#include <chrono>

namespace asyncmb {

using Duration = std::chrono::microseconds;
using TimePoint = std::chrono::steady_clock::time_point;

/**
 * @brief Time source for the engine
 *
 * Production code uses SteadyClock; tests drive a ManualClock so deadlines are deterministic.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SteadyClock : public Clock {
 public:
  [[nodiscard]] TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};

class ManualClock : public Clock {
 public:
  [[nodiscard]] TimePoint Now() const override { return now_; }

  void Advance(Duration delta) { now_ += delta; }
  void Set(TimePoint now) { now_ = now; }

 private:
  TimePoint now_{};
};

}  // namespace asyncmb
